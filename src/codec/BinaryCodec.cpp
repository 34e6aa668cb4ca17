#include "codec/BinaryCodec.hpp"

using namespace stash::codec;

std::vector<uint8_t> CborCodec::encode(const nlohmann::json& document) const {
    return nlohmann::json::to_cbor(document);
}

nlohmann::json CborCodec::decode(const std::vector<uint8_t>& bytes) const {
    try {
        return nlohmann::json::from_cbor(bytes);
    } catch (const nlohmann::json::exception& e) {
        throw DecodeError(e.what());
    }
}

std::vector<uint8_t> MsgPackCodec::encode(const nlohmann::json& document) const {
    return nlohmann::json::to_msgpack(document);
}

nlohmann::json MsgPackCodec::decode(const std::vector<uint8_t>& bytes) const {
    try {
        return nlohmann::json::from_msgpack(bytes);
    } catch (const nlohmann::json::exception& e) {
        throw DecodeError(e.what());
    }
}
