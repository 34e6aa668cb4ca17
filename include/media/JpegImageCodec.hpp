#pragma once

#include "media/ImageCodec.hpp"

#include <string>

namespace stash::media {

// Encodes with libjpeg-turbo, decodes anything stb_image understands (JPEG, PNG, BMP, ...).
class JpegImageCodec final : public ImageCodec {
public:
    static constexpr int DEFAULT_QUALITY = 90;

    explicit JpegImageCodec(int quality = DEFAULT_QUALITY);

    [[nodiscard]] std::optional<std::vector<uint8_t>> encode(const Image& image) const override;
    [[nodiscard]] std::optional<Image> decode(const std::vector<uint8_t>& bytes) const override;

    [[nodiscard]] int quality() const noexcept { return quality_; }

private:
    int quality_;
};

void compress_to_jpeg(const Image& image, std::vector<uint8_t>& out_buf, int quality = JpegImageCodec::DEFAULT_QUALITY);

}
