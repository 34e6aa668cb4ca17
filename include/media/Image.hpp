#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace stash::media {

// Decoded raster, rows top to bottom, channels interleaved (1 = gray, 3 = RGB, 4 = RGBA).
struct Image {
    int width = 0;
    int height = 0;
    int channels = 3;
    std::vector<uint8_t> pixels;

    [[nodiscard]] std::size_t expectedSize() const noexcept {
        if (width <= 0 || height <= 0 || channels <= 0) return 0;
        return static_cast<std::size_t>(width) * static_cast<std::size_t>(height) * static_cast<std::size_t>(channels);
    }

    [[nodiscard]] bool valid() const noexcept { return expectedSize() != 0 && pixels.size() == expectedSize(); }
};

}
