#pragma once
#ifndef CMYKA_HPP
#define CMYKA_HPP

#include <cstdint>
#include <memory>
#include "Color.hpp"

// Cyan, magenta, yellow, black ink coverage plus alpha, 8 bits each.
// Ink: 0 = none, 255 = full. Alpha: 0 = transparent, 255 = opaque.
// Not associated with any color profile.
struct CMYKA : public Color {
    uint8_t C, M, Y, K, A;

    CMYKA() : C(0), M(0), Y(0), K(0), A(0) {}
    CMYKA(uint8_t c, uint8_t m, uint8_t y, uint8_t k, uint8_t a)
        : C(c), M(m), Y(y), K(k), A(a) {}

    // RGB from the naive CMYK formula. The black channel also scales the
    // alpha, so full K reads as opaque whatever A holds.
    void RGBA(uint32_t& r, uint32_t& g, uint32_t& b, uint32_t& a) const override;

    bool operator==(const CMYKA& o) const {
        return C == o.C && M == o.M && Y == o.Y && K == o.K && A == o.A;
    }
    bool operator!=(const CMYKA& o) const { return !(*this == o); }
};

// The color model for CMYKA. CMYKA values pass through untouched; anything
// else is converted from its 8-bit RGB and comes out with A = 255, the
// source alpha is dropped.
class CMYKAModel : public ColorModel {
public:
    std::unique_ptr<Color> convert(const Color& c) const override;

    static CMYKA toCMYKA(const Color& c);

    static const CMYKAModel& instance();
};

#endif
