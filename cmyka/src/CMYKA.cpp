#include "CMYKA.hpp"
#include "ImageConverter.hpp"

void CMYKA::RGBA(uint32_t& r, uint32_t& g, uint32_t& b, uint32_t& a) const {
    ImageConverter::cmykToRGB(C, M, Y, K, r, g, b);

    // 0x101 maps an 8-bit channel onto the 16-bit range
    uint32_t w = 0xffff - uint32_t(K) * 0x101;
    uint32_t ia = (0xffff - uint32_t(A) * 0x101) * w / 0xffff;
    a = 0xffff - ia;
}


std::unique_ptr<Color> CMYKAModel::convert(const Color& c) const {
    return std::make_unique<CMYKA>(toCMYKA(c));
}

CMYKA CMYKAModel::toCMYKA(const Color& c) {
    if (const CMYKA* native = dynamic_cast<const CMYKA*>(&c)) {
        return *native;
    }

    uint32_t r, g, b, a;
    c.RGBA(r, g, b, a);

    uint8_t cc, mm, yy, kk;
    ImageConverter::rgbToCMYK(uint8_t(r >> 8), uint8_t(g >> 8), uint8_t(b >> 8), cc, mm, yy, kk);
    return CMYKA(cc, mm, yy, kk, 0xff);
}

const CMYKAModel& CMYKAModel::instance() {
    static const CMYKAModel model{};
    return model;
}
