#include <gtest/gtest.h>

#include <stdexcept>
#include <vector>
#include "ImageConverter.hpp"

TEST(ImageConverterTest, RGBBufferMatchesPerPixelSet) {
    // 3x2, R G B
    std::vector<unsigned char> rgb = {
        255, 0, 0,     0, 255, 0,     0, 0, 255,
        0, 0, 0,       255, 255, 255, 10, 200, 50
    };
    CMYKAImage img = ImageConverter::RGBtoCMYKA(rgb.data(), 3, 2, 3);

    EXPECT_EQ(img.bounds(), Rectangle::rect(0, 0, 3, 2));
    EXPECT_EQ(img.cmykAt(0, 0), CMYKA(0, 255, 255, 0, 255));
    EXPECT_EQ(img.cmykAt(1, 0), CMYKA(255, 0, 255, 0, 255));
    EXPECT_EQ(img.cmykAt(2, 0), CMYKA(255, 255, 0, 0, 255));
    EXPECT_EQ(img.cmykAt(0, 1), CMYKA(0, 0, 0, 255, 255));
    EXPECT_EQ(img.cmykAt(1, 1), CMYKA(0, 0, 0, 0, 255));
    EXPECT_EQ(img.cmykAt(2, 1), CMYKA(242, 0, 191, 55, 255));
}

TEST(ImageConverterTest, RGBAInputAlphaIsForcedOpaque) {
    std::vector<unsigned char> rgba = { 128, 0, 0, 128,   0, 0, 0, 0 };
    CMYKAImage img = ImageConverter::RGBtoCMYKA(rgba.data(), 2, 1, 4);

    EXPECT_EQ(img.cmykAt(0, 0), CMYKA(0, 255, 255, 127, 255));
    EXPECT_EQ(img.cmykAt(1, 0), CMYKA(0, 0, 0, 255, 255));
}

TEST(ImageConverterTest, RejectsBadInput) {
    std::vector<unsigned char> gray(4, 0);
    EXPECT_THROW(ImageConverter::RGBtoCMYKA(gray.data(), 2, 2, 1), std::invalid_argument);
    EXPECT_THROW(ImageConverter::RGBtoCMYKA(nullptr, 2, 2, 3), std::invalid_argument);
    EXPECT_THROW(ImageConverter::RGBtoCMYKA(gray.data(), -1, 2, 3), std::invalid_argument);
}

TEST(ImageConverterTest, CMYKAtoRGBAUsesHighBytes) {
    CMYKAImage img(Rectangle::rect(0, 0, 2, 1));
    img.setCMYKA(0, 0, CMYKA(0, 0, 0, 0, 255));
    img.setCMYKA(1, 0, CMYKA(100, 0, 0, 50, 10));

    std::vector<unsigned char> out = ImageConverter::CMYKAtoRGBA(img);
    std::vector<unsigned char> expected = {
        255, 255, 255, 255,
        32024 >> 8, 52685 >> 8, 52685 >> 8, 14917 >> 8
    };
    EXPECT_EQ(out, expected);
}

TEST(ImageConverterTest, CMYKAtoRGBAFollowsSubImageBounds) {
    CMYKAImage img(Rectangle::rect(0, 0, 4, 4));
    img.setCMYKA(2, 2, CMYKA(0, 0, 0, 255, 0));

    std::vector<unsigned char> out = ImageConverter::CMYKAtoRGBA(img.subImage(Rectangle::rect(2, 2, 3, 3)));
    std::vector<unsigned char> expected = { 0, 0, 0, 255 };
    EXPECT_EQ(out, expected);

    EXPECT_TRUE(ImageConverter::CMYKAtoRGBA(CMYKAImage()).empty());
}

TEST(ImageConverterTest, NaivePrimitives) {
    uint32_t r, g, b;
    ImageConverter::cmykToRGB(0, 0, 0, 128, r, g, b);
    EXPECT_EQ(r, 32639u);
    EXPECT_EQ(g, 32639u);
    EXPECT_EQ(b, 32639u);

    uint8_t c, m, y, k;
    ImageConverter::rgbToCMYK(0x12, 0x34, 0x56, c, m, y, k);
    EXPECT_EQ(c, 201);
    EXPECT_EQ(m, 100);
    EXPECT_EQ(y, 0);
    EXPECT_EQ(k, 169);
}
