#pragma once
#ifndef IMAGE_HPP
#define IMAGE_HPP

#include <memory>
#include "Color.hpp"
#include "Geometry.hpp"

// A rectangular grid of colors. Coordinates outside bounds() are valid to
// query and yield the format's zero color.
class Image {
public:
    virtual ~Image() = default;

    virtual const ColorModel& colorModel() const = 0;
    virtual Rectangle bounds() const = 0;
    virtual std::unique_ptr<Color> at(int x, int y) const = 0;

    // True only if every pixel is known to be fully opaque
    virtual bool opaque() const = 0;
};

// An Image whose pixels can be written. Writes outside bounds() are ignored.
class SettableImage : public Image {
public:
    virtual void set(int x, int y, const Color& c) = 0;
};

#endif
