#include "codec/Codec.hpp"
#include "codec/JsonCodec.hpp"
#include "codec/BinaryCodec.hpp"

#include <string>

namespace stash::codec {

std::shared_ptr<const Codec> makeCodec(const std::string_view name, const CodecOptions& options) {
    if (name == "json") return std::make_shared<JsonCodec>(options);
    if (name == "cbor") return std::make_shared<CborCodec>();
    if (name == "msgpack") return std::make_shared<MsgPackCodec>();
    throw std::invalid_argument("Unknown codec: " + std::string(name));
}

}
