#pragma once

#include "codec/Codec.hpp"

namespace stash::codec {

// UTF-8 JSON text. Unless fragments are allowed, only objects and arrays are
// accepted at the root, in both directions.
class JsonCodec final : public Codec {
public:
    JsonCodec() = default;
    explicit JsonCodec(const CodecOptions& options) : options_(options) {}

    [[nodiscard]] std::vector<uint8_t> encode(const nlohmann::json& document) const override;
    [[nodiscard]] nlohmann::json decode(const std::vector<uint8_t>& bytes) const override;
    [[nodiscard]] std::string_view name() const noexcept override { return "json"; }

    [[nodiscard]] const CodecOptions& options() const noexcept { return options_; }

private:
    CodecOptions options_;
};

}
