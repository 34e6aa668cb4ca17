#include <gtest/gtest.h>
#include "media/JpegImageCodec.hpp"

#include <cstdint>
#include <vector>

using namespace stash::media;

namespace {

// 2x2 PNG, 8-bit gray + alpha; each row is (10, 255) (200, 128).
const std::vector<uint8_t> kGrayAlphaPng = {
    0x89, 0x50, 0x4e, 0x47, 0x0d, 0x0a, 0x1a, 0x0a, 0x00, 0x00, 0x00, 0x0d, 0x49, 0x48, 0x44, 0x52,
    0x00, 0x00, 0x00, 0x02, 0x00, 0x00, 0x00, 0x02, 0x08, 0x04, 0x00, 0x00, 0x00, 0xd8, 0xbf, 0xc5,
    0xaf, 0x00, 0x00, 0x00, 0x10, 0x49, 0x44, 0x41, 0x54, 0x78, 0x9c, 0x63, 0xe0, 0xfa, 0x7f, 0xa2,
    0x81, 0x01, 0x44, 0x00, 0x00, 0x16, 0x09, 0x04, 0xa3, 0x85, 0x6c, 0xae, 0x51, 0x00, 0x00, 0x00,
    0x00, 0x49, 0x45, 0x4e, 0x44, 0xae, 0x42, 0x60, 0x82
};

Image solid(const int width, const int height, const int channels, const uint8_t value) {
    Image image{.width = width, .height = height, .channels = channels};
    image.pixels.assign(image.expectedSize(), value);
    return image;
}

}

TEST(JpegImageCodecTest, GrayAlphaIsExpandedToRgba) {
    const JpegImageCodec codec;
    const auto image = codec.decode(kGrayAlphaPng);
    ASSERT_TRUE(image.has_value());

    EXPECT_EQ(image->width, 2);
    EXPECT_EQ(image->height, 2);
    EXPECT_EQ(image->channels, 4);
    ASSERT_TRUE(image->valid());

    const std::vector<uint8_t> firstRow = {10, 10, 10, 255, 200, 200, 200, 128};
    EXPECT_EQ(std::vector<uint8_t>(image->pixels.begin(), image->pixels.begin() + 8), firstRow);

    EXPECT_TRUE(codec.encode(*image).has_value());
}

TEST(JpegImageCodecTest, RgbRoundTripKeepsShape) {
    const JpegImageCodec codec;
    const auto bytes = codec.encode(solid(8, 4, 3, 90));
    ASSERT_TRUE(bytes.has_value());

    const auto image = codec.decode(*bytes);
    ASSERT_TRUE(image.has_value());
    EXPECT_EQ(image->width, 8);
    EXPECT_EQ(image->height, 4);
    EXPECT_EQ(image->channels, 3);
}

TEST(JpegImageCodecTest, GrayscaleStaysSingleChannel) {
    const JpegImageCodec codec;
    const auto bytes = codec.encode(solid(4, 4, 1, 200));
    ASSERT_TRUE(bytes.has_value());

    const auto image = codec.decode(*bytes);
    ASSERT_TRUE(image.has_value());
    EXPECT_EQ(image->channels, 1);
}

TEST(JpegImageCodecTest, UnsupportedInputYieldsNothing) {
    const JpegImageCodec codec;
    EXPECT_FALSE(codec.encode(solid(2, 2, 2, 0)).has_value());
    EXPECT_FALSE(codec.decode({0x00, 0x01, 0x02, 0x03, 0x04}).has_value());
}

TEST(JpegImageCodecTest, QualityIsClamped) {
    EXPECT_EQ(JpegImageCodec(0).quality(), 1);
    EXPECT_EQ(JpegImageCodec(250).quality(), 100);
}
