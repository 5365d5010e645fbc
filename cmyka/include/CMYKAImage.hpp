#pragma once
#ifndef CMYKA_IMAGE_HPP
#define CMYKA_IMAGE_HPP

#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>
#include "Image.hpp"
#include "CMYKA.hpp"

// In-memory image of CMYKA pixels.
//
// The pixel at (x, y) starts at pix()[(y - rect.min.y) * stride + (x - rect.min.x) * 5]
// and holds C, M, Y, K, A in that order. Copies and sub-images share the
// same buffer; the buffer lives as long as any of them.
class CMYKAImage : public SettableImage {
public:
    // Empty image: zero rectangle, no pixels
    CMYKAImage();

    // Zero-filled image covering r. Throws std::invalid_argument when r has
    // negative or oversized dimensions.
    explicit CMYKAImage(const Rectangle& r);

    const ColorModel& colorModel() const override;
    Rectangle bounds() const override { return rect_; }

    std::unique_ptr<Color> at(int x, int y) const override;
    RGBA64 rgba64At(int x, int y) const;
    CMYKA cmykAt(int x, int y) const;

    // Offset into pix() of the first byte of (x, y). Not bounds checked.
    int pixOffset(int x, int y) const {
        return (y - rect_.min.y) * stride_ + (x - rect_.min.x) * 5;
    }

    void set(int x, int y, const Color& c) override;
    void setCMYKA(int x, int y, const CMYKA& c);

    // The part of this image visible through r, sharing its pixels
    CMYKAImage subImage(const Rectangle& r) const;

    // Always false, the pixels are not scanned
    bool opaque() const override { return false; }

    uint8_t* pix() { return pix_->data() + offset_; }
    const uint8_t* pix() const { return pix_->data() + offset_; }
    // Bytes from pix() to the end of the shared buffer
    std::size_t pixSize() const { return pix_->size() - offset_; }
    int stride() const { return stride_; }
    const Rectangle& rect() const { return rect_; }

private:
    CMYKAImage(std::shared_ptr<std::vector<uint8_t>> pix, std::size_t offset,
               int stride, const Rectangle& r);

    std::shared_ptr<std::vector<uint8_t>> pix_;
    std::size_t offset_;
    int stride_;
    Rectangle rect_;
};

#endif
