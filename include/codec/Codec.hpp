#pragma once

#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string_view>
#include <vector>
#include <nlohmann/json.hpp>

namespace stash::codec {

class EncodeError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class DecodeError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Byte format for documents. Values are mapped to documents through the
// nlohmann::json to_json/from_json customization points.
//
// Implementations must reject bytes they did not produce by throwing
// DecodeError; they never return a partially parsed document.
class Codec {
public:
    virtual ~Codec() = default;

    // Throws EncodeError if the document cannot be represented at the root.
    [[nodiscard]] virtual std::vector<uint8_t> encode(const nlohmann::json& document) const = 0;

    // Throws DecodeError.
    [[nodiscard]] virtual nlohmann::json decode(const std::vector<uint8_t>& bytes) const = 0;

    [[nodiscard]] virtual std::string_view name() const noexcept = 0;
};

struct CodecOptions {
    bool pretty = false;          // json only
    bool allowFragments = false;  // json only: accept scalars at the document root
};

// "json", "cbor" or "msgpack"; throws std::invalid_argument otherwise.
std::shared_ptr<const Codec> makeCodec(std::string_view name, const CodecOptions& options = {});

}
