#pragma once

#include "tangram/Configuration.h"
#include <glm/glm.hpp>
#include <cmath>
#include <cstddef>
#include <functional>
#include <string>
#include <vector>

namespace tangram {
namespace geom {

/**
 * Immutable 2D point in kernel space.
 *
 * Angles are counterclockwise in the usual math convention (y up). A
 * screen-space consumer with y pointing down sees them as clockwise; that
 * flip belongs to the renderer.
 *
 * There is no operator==: point equality always takes a tolerance, see
 * matches() and PointEqual.
 */
class Point {
public:
    Point() : x_(0), y_(0) {}
    Point(double x, double y) : x_(x), y_(y) {}
    explicit Point(const glm::dvec2& v) : x_(v.x), y_(v.y) {}
    explicit Point(const glm::vec2& v) : x_(v.x), y_(v.y) {}

    double x() const { return x_; }
    double y() const { return y_; }

    // Translation
    Point translated(double dx, double dy) const {
        return Point(x_ + dx, y_ + dy);
    }

    Point translated(const Point& offset) const {
        return Point(x_ + offset.x_, y_ + offset.y_);
    }

    /**
     * Rotate around a pivot point.
     * x' = (x-px)cos - (y-py)sin + px
     * y' = (x-px)sin + (y-py)cos + py
     */
    Point rotatedAround(const Point& pivot, double angle) const {
        double c = std::cos(angle);
        double s = std::sin(angle);
        double dx = x_ - pivot.x_;
        double dy = y_ - pivot.y_;
        return Point(dx * c - dy * s + pivot.x_, dx * s + dy * c + pivot.y_);
    }

    // Rotate around the origin
    Point rotated(double angle) const {
        return rotatedAround(Point(), angle);
    }

    Point scaledAbout(const Point& origin, double factor) const {
        return Point(origin.x_ + (x_ - origin.x_) * factor,
                     origin.y_ + (y_ - origin.y_) * factor);
    }

    // Distances
    double distanceTo(const Point& other) const {
        return std::sqrt(squaredDistanceTo(other));
    }

    double squaredDistanceTo(const Point& other) const {
        double dx = other.x_ - x_;
        double dy = other.y_ - y_;
        return dx * dx + dy * dy;
    }

    static double distance(const Point& p1, const Point& p2) {
        return p1.distanceTo(p2);
    }

    Point midpointWith(const Point& other) const {
        return Point((x_ + other.x_) / 2.0, (y_ + other.y_) / 2.0);
    }

    double length() const {
        return std::sqrt(x_ * x_ + y_ * y_);
    }

    bool isWithinDistance(double threshold, const Point& other) const {
        return distanceTo(other) <= threshold;
    }

    // Per-axis tolerance equality: |dx| <= tol and |dy| <= tol
    bool matches(const Point& other, double tolerance) const {
        return std::abs(x_ - other.x_) <= tolerance && std::abs(y_ - other.y_) <= tolerance;
    }

    bool matchesWithin(const Point& other, const Configuration& config) const {
        return matches(other, config.vertexTolerance);
    }

    // Renderer interop
    glm::dvec2 toVec2() const { return glm::dvec2(x_, y_); }
    glm::vec2 toFloatVec2() const { return glm::vec2(static_cast<float>(x_), static_cast<float>(y_)); }

    // "Point(x: 1.00, y: 2.00)"
    std::string toString() const;

    // Arithmetic (returns new Point)
    Point operator+(const Point& other) const { return Point(x_ + other.x_, y_ + other.y_); }
    Point operator-(const Point& other) const { return Point(x_ - other.x_, y_ - other.y_); }
    Point operator*(double f) const { return Point(x_ * f, y_ * f); }

    // Unit vector at the given angle (0 = +x, pi/2 = +y)
    static Point unitVector(double angle) {
        return Point(std::cos(angle), std::sin(angle));
    }

    // Vertices of a regular polygon centered on the origin. Empty when sides < 3.
    static std::vector<Point> regularPolygon(int sides, double radius, double startAngle = 0.0);

private:
    double x_;
    double y_;
};

/**
 * Hash consistent with Point::matches for unordered containers.
 * Coordinates are rounded to the tolerance grid before hashing.
 */
struct PointHash {
    double tolerance = 1e-9;

    size_t operator()(const Point& p) const {
        if (tolerance <= 0.0) {
            size_t h1 = std::hash<double>{}(p.x());
            size_t h2 = std::hash<double>{}(p.y());
            return h1 ^ (h2 << 1);
        }
        size_t h1 = std::hash<long long>{}(std::llround(p.x() / tolerance));
        size_t h2 = std::hash<long long>{}(std::llround(p.y() / tolerance));
        return h1 ^ (h2 << 1);
    }
};

struct PointEqual {
    double tolerance = 1e-9;

    bool operator()(const Point& a, const Point& b) const {
        return a.matches(b, tolerance);
    }
};

}  // namespace geom
}  // namespace tangram
