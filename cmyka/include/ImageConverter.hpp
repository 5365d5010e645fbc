#pragma once
#ifndef IMAGE_CONVERTER_HPP
#define IMAGE_CONVERTER_HPP

#include <cstdint>
#include <vector>
#include "CMYKAImage.hpp"

class ImageConverter {
public:
    // Interleaved 8-bit R, G, B[, A] -> CMYKA image at (0, 0, width, height)
    static CMYKAImage RGBtoCMYKA(const unsigned char* rgbData, int width, int height, int channels);

    // Row-major 8-bit RGBA over img.bounds(), 4 bytes per pixel
    static std::vector<unsigned char> CMYKAtoRGBA(const CMYKAImage& img);

    static void cmykToRGB(uint8_t c, uint8_t m, uint8_t y, uint8_t k,
                          uint32_t& r, uint32_t& g, uint32_t& b);
    static void rgbToCMYK(uint8_t r, uint8_t g, uint8_t b,
                          uint8_t& c, uint8_t& m, uint8_t& y, uint8_t& k);
};

#endif
