#pragma once

#include "tangram/geom/Point.h"
#include <algorithm>

namespace tangram {
namespace geom {

/**
 * Axis-aligned rectangle, origin at the minimum corner.
 */
struct Rectangle {
    double x = 0;
    double y = 0;
    double width = 0;
    double height = 0;

    Rectangle() = default;
    Rectangle(double x, double y, double width, double height)
        : x(x), y(y), width(width), height(height) {}

    static Rectangle fromBounds(double minX, double minY, double maxX, double maxY) {
        return Rectangle(minX, minY, maxX - minX, maxY - minY);
    }

    // Zero-size rectangle at a point
    static Rectangle at(const Point& p) {
        return Rectangle(p.x(), p.y(), 0, 0);
    }

    double minX() const { return x; }
    double minY() const { return y; }
    double maxX() const { return x + width; }
    double maxY() const { return y + height; }

    Point origin() const { return Point(x, y); }
    Point center() const { return Point(x + width / 2.0, y + height / 2.0); }

    bool isEmpty() const { return width <= 0 || height <= 0; }

    // Overlap with positive area. Rectangles that only share an edge do not intersect.
    bool intersects(const Rectangle& other) const {
        return minX() < other.maxX() && other.minX() < maxX() &&
               minY() < other.maxY() && other.minY() < maxY();
    }

    bool contains(const Point& p) const {
        return p.x() >= minX() && p.x() <= maxX() && p.y() >= minY() && p.y() <= maxY();
    }

    Rectangle united(const Rectangle& other) const {
        return fromBounds(std::min(minX(), other.minX()), std::min(minY(), other.minY()),
                          std::max(maxX(), other.maxX()), std::max(maxY(), other.maxY()));
    }
};

}  // namespace geom
}  // namespace tangram
