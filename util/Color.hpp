#pragma once
#ifndef COLOR_HPP
#define COLOR_HPP

#include <cstdint>
#include <memory>

// Anything that can express itself as 16-bit premultiplied RGBA.
// Each output is in [0, 0xffff].
class Color {
public:
    virtual ~Color() = default;
    virtual void RGBA(uint32_t& r, uint32_t& g, uint32_t& b, uint32_t& a) const = 0;
};

// Converts an arbitrary color into the color type of a specific format
class ColorModel {
public:
    virtual ~ColorModel() = default;
    virtual std::unique_ptr<Color> convert(const Color& c) const = 0;
};


// ── Interchange colors ──────────────────────────────────────────────────────

// 16 bits per channel, alpha premultiplied
struct RGBA64 : public Color {
    uint16_t R, G, B, A;

    RGBA64() : R(0), G(0), B(0), A(0) {}
    RGBA64(uint16_t r, uint16_t g, uint16_t b, uint16_t a) : R(r), G(g), B(b), A(a) {}

    void RGBA(uint32_t& r, uint32_t& g, uint32_t& b, uint32_t& a) const override {
        r = R;
        g = G;
        b = B;
        a = A;
    }

    bool operator==(const RGBA64& o) const {
        return R == o.R && G == o.G && B == o.B && A == o.A;
    }
    bool operator!=(const RGBA64& o) const { return !(*this == o); }
};

// 8 bits per channel, alpha premultiplied
struct RGBA8 : public Color {
    uint8_t R, G, B, A;

    RGBA8() : R(0), G(0), B(0), A(0) {}
    RGBA8(uint8_t r, uint8_t g, uint8_t b, uint8_t a) : R(r), G(g), B(b), A(a) {}

    // 0x101 replicates the byte into both halves, so 0xff -> 0xffff
    void RGBA(uint32_t& r, uint32_t& g, uint32_t& b, uint32_t& a) const override {
        r = uint32_t(R) * 0x101;
        g = uint32_t(G) * 0x101;
        b = uint32_t(B) * 0x101;
        a = uint32_t(A) * 0x101;
    }
};

#endif
