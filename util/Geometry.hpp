#pragma once
#ifndef GEOMETRY_HPP
#define GEOMETRY_HPP

#include <algorithm>
#include <utility>

struct Point {
    int x, y;

    bool operator==(const Point& other) const {
        return x == other.x && y == other.y;
    }
    bool operator!=(const Point& other) const { return !(*this == other); }
};

// Half-open rectangle: contains (x, y) for min.x <= x < max.x, min.y <= y < max.y
struct Rectangle {
    Point min{0, 0};
    Point max{0, 0};

    // Builds a well-formed rectangle, swapping the coordinates if needed
    static Rectangle rect(int x0, int y0, int x1, int y1) {
        if (x0 > x1) std::swap(x0, x1);
        if (y0 > y1) std::swap(y0, y1);
        return Rectangle{{x0, y0}, {x1, y1}};
    }

    int dx() const { return max.x - min.x; }
    int dy() const { return max.y - min.y; }

    bool empty() const { return min.x >= max.x || min.y >= max.y; }

    bool contains(int x, int y) const {
        return min.x <= x && x < max.x && min.y <= y && y < max.y;
    }
    bool contains(const Point& p) const { return contains(p.x, p.y); }

    // The largest rectangle inside both. If they don't overlap the zero
    // rectangle is returned, never a "negative" one.
    Rectangle intersect(const Rectangle& s) const {
        Rectangle r = *this;
        r.min.x = std::max(r.min.x, s.min.x);
        r.min.y = std::max(r.min.y, s.min.y);
        r.max.x = std::min(r.max.x, s.max.x);
        r.max.y = std::min(r.max.y, s.max.y);
        if (r.empty()) return Rectangle{};
        return r;
    }

    // All empty rectangles are considered equal
    bool operator==(const Rectangle& other) const {
        return (min == other.min && max == other.max) || (empty() && other.empty());
    }
    bool operator!=(const Rectangle& other) const { return !(*this == other); }
};

#endif
