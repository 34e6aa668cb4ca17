#pragma once

#include "codec/Codec.hpp"

namespace stash::codec {

// Binary formats accept any value at the root, so values never need a wrapper.

class CborCodec final : public Codec {
public:
    [[nodiscard]] std::vector<uint8_t> encode(const nlohmann::json& document) const override;
    [[nodiscard]] nlohmann::json decode(const std::vector<uint8_t>& bytes) const override;
    [[nodiscard]] std::string_view name() const noexcept override { return "cbor"; }
};

class MsgPackCodec final : public Codec {
public:
    [[nodiscard]] std::vector<uint8_t> encode(const nlohmann::json& document) const override;
    [[nodiscard]] nlohmann::json decode(const std::vector<uint8_t>& bytes) const override;
    [[nodiscard]] std::string_view name() const noexcept override { return "msgpack"; }
};

}
