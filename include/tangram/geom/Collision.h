#pragma once

#include "tangram/Configuration.h"
#include "tangram/geom/Point.h"
#include "tangram/geom/Rectangle.h"
#include <vector>

namespace tangram {
namespace model {
class Piece;
}

namespace geom {

/**
 * Collision - point and shape hit tests used for picking and drop targets.
 */
class Collision {
public:
    /**
     * Ray casting toward +x: inside iff the number of crossed edges is odd.
     * An edge counts when exactly one endpoint lies strictly above the
     * point's y and the crossing lies strictly to the right of the point.
     * Fewer than 3 vertices is never inside.
     */
    static bool pointInPolygon(const Point& point, const std::vector<Point>& vertices);

    /**
     * Shortest distance from a point to the segment [segStart, segEnd].
     * Segments no longer than config.minVertexSeparation are treated as the
     * point segStart.
     */
    static double segmentDistance(const Point& point, const Point& segStart, const Point& segEnd,
                                  const Configuration& config);

    static bool boxesIntersect(const Rectangle& a, const Rectangle& b);

    // True when the center is inside the polygon or any edge is within radius
    static bool circleIntersectsPolygon(const Point& center, double radius,
                                        const std::vector<Point>& vertices,
                                        const Configuration& config);

    /**
     * Broad-phase filter: pieces whose position (not outline) lies within
     * maxDistance of the point. Returned pointers refer into `pieces`.
     */
    static std::vector<const model::Piece*> piecesNearPoint(
        const std::vector<model::Piece>& pieces,
        const Point& point,
        double maxDistance
    );
};

}  // namespace geom
}  // namespace tangram
