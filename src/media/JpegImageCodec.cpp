#define STB_IMAGE_IMPLEMENTATION

#include "media/JpegImageCodec.hpp"
#include "logging/LogRegistry.hpp"

#include <stb/stb_image.h>
#include <turbojpeg.h>
#include <algorithm>
#include <limits>
#include <stdexcept>
#include <string>

using namespace stash::logging;

namespace stash::media {

namespace {

int pixel_format(const int channels) {
    switch (channels) {
        case 1: return TJPF_GRAY;
        case 3: return TJPF_RGB;
        case 4: return TJPF_RGBA;
        default: throw std::invalid_argument("Unsupported channel count: " + std::to_string(channels));
    }
}

}

JpegImageCodec::JpegImageCodec(const int quality) : quality_(std::clamp(quality, 1, 100)) {}

void compress_to_jpeg(const Image& image, std::vector<uint8_t>& out_buf, const int quality) {
    if (!image.valid()) throw std::invalid_argument("Image dimensions do not match its pixel buffer");

    const int format = pixel_format(image.channels);

    tjhandle tj = tjInitCompress();
    if (!tj) throw std::runtime_error("Failed to initialize TurboJPEG compressor");

    unsigned char* jpeg_buf = nullptr;
    unsigned long jpeg_size = 0;

    constexpr int flags = 0;
    const int subsampling = image.channels == 1 ? TJSAMP_GRAY : TJSAMP_444;

    if (tjCompress2(
            tj,
            image.pixels.data(),
            image.width,
            0, // pitch (0 = auto)
            image.height,
            format,
            &jpeg_buf,
            &jpeg_size,
            subsampling,
            quality,
            flags) != 0) {
        const std::string err = tjGetErrorStr();
        tjFree(jpeg_buf);
        tjDestroy(tj);
        throw std::runtime_error("JPEG compression failed: " + err);
    }

    out_buf.assign(jpeg_buf, jpeg_buf + jpeg_size);
    tjFree(jpeg_buf);
    tjDestroy(tj);
}

std::optional<std::vector<uint8_t>> JpegImageCodec::encode(const Image& image) const {
    try {
        std::vector<uint8_t> out;
        compress_to_jpeg(image, out, quality_);
        return out;
    } catch (const std::exception& e) {
        LogRegistry::codec()->warn("[JpegImageCodec] Encode failed ({}x{}x{}): {}",
                                   image.width, image.height, image.channels, e.what());
        return std::nullopt;
    }
}

std::optional<Image> JpegImageCodec::decode(const std::vector<uint8_t>& bytes) const {
    if (bytes.size() < 4 || bytes.size() > static_cast<size_t>(std::numeric_limits<int>::max())) {
        LogRegistry::codec()->warn("[JpegImageCodec] Buffer of {} bytes cannot be an image", bytes.size());
        return std::nullopt;
    }

    const auto len = static_cast<int>(bytes.size());
    int width = 0, height = 0, channels = 0;

    // Gray + alpha has no JPEG pixel format; expand it to RGBA.
    int desired = 0;
    if (stbi_info_from_memory(bytes.data(), len, &width, &height, &channels) && channels == 2)
        desired = 4;

    unsigned char* decoded = stbi_load_from_memory(bytes.data(), len, &width, &height, &channels, desired);
    if (!decoded) {
        const char* reason = stbi_failure_reason();
        LogRegistry::codec()->warn("[JpegImageCodec] Failed to decode image from memory: {}",
                                   reason ? reason : "unknown error");
        return std::nullopt;
    }

    Image image;
    image.width = width;
    image.height = height;
    image.channels = desired ? desired : channels;
    image.pixels.assign(decoded, decoded + image.expectedSize());
    stbi_image_free(decoded);
    return image;
}

}
