#pragma once

#include "media/Image.hpp"

#include <optional>

namespace stash::media {

class ImageCodec {
public:
    virtual ~ImageCodec() = default;

    // std::nullopt when the image cannot be represented in this format.
    [[nodiscard]] virtual std::optional<std::vector<uint8_t>> encode(const Image& image) const = 0;

    // std::nullopt when the bytes are not an image this codec understands.
    [[nodiscard]] virtual std::optional<Image> decode(const std::vector<uint8_t>& bytes) const = 0;
};

}
