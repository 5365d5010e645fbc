#include "CMYKAImage.hpp"
#include <climits>
#include <stdexcept>
#include <utility>

CMYKAImage::CMYKAImage()
    : pix_(std::make_shared<std::vector<uint8_t>>()), offset_(0), stride_(0), rect_()
{
}

CMYKAImage::CMYKAImage(const Rectangle& r)
    : offset_(0), stride_(0), rect_(r)
{
    int w = r.dx();
    int h = r.dy();
    if (w < 0 || h < 0)
        throw std::invalid_argument("CMYKAImage: rectangle has negative dimensions");

    long long bytes = 5LL * w * h;
    if (bytes > INT_MAX)
        throw std::invalid_argument("CMYKAImage: rectangle is too large");

    pix_ = std::make_shared<std::vector<uint8_t>>(static_cast<std::size_t>(bytes), 0);
    stride_ = 5 * w;
}

CMYKAImage::CMYKAImage(std::shared_ptr<std::vector<uint8_t>> pix, std::size_t offset,
                       int stride, const Rectangle& r)
    : pix_(std::move(pix)), offset_(offset), stride_(stride), rect_(r)
{
}

const ColorModel& CMYKAImage::colorModel() const {
    return CMYKAModel::instance();
}

std::unique_ptr<Color> CMYKAImage::at(int x, int y) const {
    return std::make_unique<CMYKA>(cmykAt(x, y));
}

RGBA64 CMYKAImage::rgba64At(int x, int y) const {
    uint32_t r, g, b, a;
    cmykAt(x, y).RGBA(r, g, b, a);
    return RGBA64(uint16_t(r), uint16_t(g), uint16_t(b), uint16_t(a));
}

CMYKA CMYKAImage::cmykAt(int x, int y) const {
    if (!rect_.contains(x, y)) {
        return CMYKA();
    }
    const uint8_t* s = pix() + pixOffset(x, y);
    return CMYKA(s[0], s[1], s[2], s[3], s[4]);
}

void CMYKAImage::set(int x, int y, const Color& c) {
    if (!rect_.contains(x, y)) {
        return;
    }
    setCMYKA(x, y, CMYKAModel::toCMYKA(c));
}

void CMYKAImage::setCMYKA(int x, int y, const CMYKA& c) {
    if (!rect_.contains(x, y)) {
        return;
    }
    uint8_t* s = pix() + pixOffset(x, y);
    s[0] = c.C;
    s[1] = c.M;
    s[2] = c.Y;
    s[3] = c.K;
    s[4] = c.A;
}

CMYKAImage CMYKAImage::subImage(const Rectangle& r) const {
    Rectangle ir = r.intersect(rect_);
    // An empty intersection is not guaranteed to lie inside rect_, so its
    // offset could point outside the buffer
    if (ir.empty()) {
        return CMYKAImage();
    }
    std::size_t i = offset_ + static_cast<std::size_t>(pixOffset(ir.min.x, ir.min.y));
    return CMYKAImage(pix_, i, stride_, ir);
}
