#include "codec/JsonCodec.hpp"
#include "logging/LogRegistry.hpp"

#include <cmath>
#include <string>

using namespace stash::codec;
using namespace stash::logging;

namespace {

// JSON has no spelling for NaN or infinity; nlohmann would emit null.
bool hasNonFinite(const nlohmann::json& j) {
    if (j.is_number_float()) return !std::isfinite(j.get<double>());
    if (j.is_structured())
        for (const auto& child : j)
            if (hasNonFinite(child)) return true;
    return false;
}

}

std::vector<uint8_t> JsonCodec::encode(const nlohmann::json& document) const {
    if (!options_.allowFragments && !document.is_structured())
        throw EncodeError(std::string("JSON root must be an object or array, got ") + document.type_name());

    if (hasNonFinite(document)) throw EncodeError("JSON cannot represent NaN or infinite numbers");

    try {
        const auto text = document.dump(options_.pretty ? 2 : -1);
        return {text.begin(), text.end()};
    } catch (const nlohmann::json::exception& e) {
        LogRegistry::codec()->warn("[JsonCodec] Failed to serialize document: {}", e.what());
        throw EncodeError(e.what());
    }
}

nlohmann::json JsonCodec::decode(const std::vector<uint8_t>& bytes) const {
    nlohmann::json document;
    try {
        document = nlohmann::json::parse(bytes.begin(), bytes.end());
    } catch (const nlohmann::json::parse_error& e) {
        throw DecodeError(e.what());
    }

    if (!options_.allowFragments && !document.is_structured())
        throw DecodeError(std::string("JSON root must be an object or array, got ") + document.type_name());

    return document;
}
