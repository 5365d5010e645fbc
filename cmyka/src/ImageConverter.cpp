#include "ImageConverter.hpp"
#include <algorithm>
#include <stdexcept>
#include <string>

CMYKAImage ImageConverter::RGBtoCMYKA(const unsigned char* rgbData, int width, int height, int channels) {
    if (!rgbData)
        throw std::invalid_argument("ImageConverter: null pixel data");
    if (channels != 3 && channels != 4)
        throw std::invalid_argument("ImageConverter: unsupported channel count " + std::to_string(channels));

    CMYKAImage img(Rectangle{{0, 0}, {width, height}});

    for (int y = 0; y < height; ++y) {
        for (int x = 0; x < width; ++x) {
            std::size_t i = (static_cast<std::size_t>(y) * width + x) * channels;
            uint8_t a = channels == 4 ? rgbData[i + 3] : 0xff;

            // Goes through the color model, so alpha ends up 255 either way
            img.set(x, y, RGBA8(rgbData[i], rgbData[i + 1], rgbData[i + 2], a));
        }
    }
    return img;
}

std::vector<unsigned char> ImageConverter::CMYKAtoRGBA(const CMYKAImage& img) {
    Rectangle b = img.bounds();
    std::vector<unsigned char> out;
    if (b.empty()) return out;

    out.reserve(static_cast<std::size_t>(b.dx()) * b.dy() * 4);
    for (int y = b.min.y; y < b.max.y; ++y) {
        for (int x = b.min.x; x < b.max.x; ++x) {
            RGBA64 c = img.rgba64At(x, y);
            out.push_back(static_cast<unsigned char>(c.R >> 8));
            out.push_back(static_cast<unsigned char>(c.G >> 8));
            out.push_back(static_cast<unsigned char>(c.B >> 8));
            out.push_back(static_cast<unsigned char>(c.A >> 8));
        }
    }
    return out;
}

void ImageConverter::cmykToRGB(uint8_t c, uint8_t m, uint8_t y, uint8_t k,
                               uint32_t& r, uint32_t& g, uint32_t& b) {
    // Each ink scaled by whatever the black leaves, in 16-bit
    uint32_t w = 0xffff - uint32_t(k) * 0x101;
    r = (0xffff - uint32_t(c) * 0x101) * w / 0xffff;
    g = (0xffff - uint32_t(m) * 0x101) * w / 0xffff;
    b = (0xffff - uint32_t(y) * 0x101) * w / 0xffff;
}

void ImageConverter::rgbToCMYK(uint8_t r, uint8_t g, uint8_t b,
                               uint8_t& c, uint8_t& m, uint8_t& y, uint8_t& k) {
    uint32_t rr = r;
    uint32_t gg = g;
    uint32_t bb = b;
    uint32_t w = std::max(rr, std::max(gg, bb));
    if (w == 0) {
        c = 0; m = 0; y = 0; k = 0xff;
        return;
    }
    c = static_cast<uint8_t>((w - rr) * 0xff / w);
    m = static_cast<uint8_t>((w - gg) * 0xff / w);
    y = static_cast<uint8_t>((w - bb) * 0xff / w);
    k = static_cast<uint8_t>(0xff - w);
}
