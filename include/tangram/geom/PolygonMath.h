#pragma once

#include "tangram/Configuration.h"
#include "tangram/geom/GeometryError.h"
#include "tangram/geom/Point.h"
#include "tangram/geom/Rectangle.h"
#include <vector>

namespace tangram {
namespace geom {

/**
 * PolygonMath - stateless polygon helpers.
 *
 * Vertex lists are closed loops (the last vertex connects back to the
 * first). Malformed input never fails: each function documents the value it
 * returns for too few vertices or zero area.
 */
class PolygonMath {
public:
    /**
     * Shoelace area, always non-negative. Returns 0 for fewer than 3 vertices.
     */
    static double area(const std::vector<Point>& vertices);

    /**
     * Signed shoelace area, positive for counterclockwise winding.
     */
    static double signedArea(const std::vector<Point>& vertices);

    /**
     * Area-weighted centroid.
     * 0 vertices -> origin, 1 -> that vertex, 2 -> midpoint,
     * zero area -> vertexAverage().
     */
    static Point centroid(const std::vector<Point>& vertices);

    // Arithmetic mean of the vertices (origin when empty)
    static Point vertexAverage(const std::vector<Point>& vertices);

    // Axis-aligned bounds. Empty input gives a zero rectangle at the origin.
    static Rectangle boundingBox(const std::vector<Point>& vertices);

    static std::vector<Point> rotateAll(const std::vector<Point>& vertices, const Point& pivot, double angle);
    static std::vector<Point> scaleAll(const std::vector<Point>& vertices, const Point& origin, double factor);
    static std::vector<Point> translateAll(const std::vector<Point>& vertices, const Point& offset);

    /**
     * Composite transform: translate, then rotate about the centroid of the
     * translated loop, then scale about the centroid of the rotated loop.
     * Rotation is skipped when 0 and scaling when the factor is 1.
     */
    static std::vector<Point> transform(
        const std::vector<Point>& vertices,
        const Point& translation,
        double rotation,
        double scale
    );

    /**
     * Sanity check for a vertex loop: at least 3 vertices, consecutive
     * vertices at least config.minVertexSeparation apart, area >= 1.
     */
    static ValidationResult validatePolygon(const std::vector<Point>& vertices, const Configuration& config);

    static constexpr double MIN_VALID_AREA = 1.0;
};

}  // namespace geom
}  // namespace tangram
