#pragma once

#include "tangram/geom/Point.h"
#include <vector>

namespace tangram {
namespace geom {

/**
 * ShapeComparator - similarity, overlap and alignment between vertex loops.
 *
 * Sized for tangram pieces (3 or 4 vertices): a brute force cyclic search
 * for similarity and grid sampling for overlap, not exact polygon clipping.
 */
class ShapeComparator {
public:
    struct Alignment {
        double angle = 0.0;    // radians in [0, 2pi)
        double overlap = 0.0;  // fraction of shape 1 covered at that angle
    };

    /**
     * True when the loops have the same shape up to translation, rotation and
     * uniform scale.
     *
     * Both loops are centered on their centroid and scaled to unit area, then
     * every cyclic starting offset of the second loop is tried. For each
     * offset the second loop is rotated so its starting vertex lines up with
     * the first loop's, and all vertex pairs must lie within `tolerance`.
     * Mirror images do not match. Requires equal vertex counts >= 3 and both
     * areas > tolerance.
     */
    static bool shapesSimilar(const std::vector<Point>& v1, const std::vector<Point>& v2, double tolerance);

    /**
     * Approximate fraction of shape 1's area covered by shape 2.
     *
     * Samples a regular grid of cell centers over the union bounding box.
     * sampleDensity is the approximate total number of samples; columns and
     * rows follow the box aspect ratio with a 10x10 minimum. The error is
     * bounded by the grid cell size. Returns 0 when no sample falls in shape 1.
     */
    static double shapeOverlap(const std::vector<Point>& v1, const std::vector<Point>& v2, int sampleDensity);

    /**
     * Try angleSteps rotations of shape 2 evenly spaced over [0, 2pi), each
     * about its own centroid and moved so its centroid sits on shape 1's.
     * Returns the angle with the highest overlap (the first one on ties),
     * or 0 when angleSteps <= 0.
     */
    static double findOptimalAlignment(const std::vector<Point>& v1, const std::vector<Point>& v2,
                                       int angleSteps, int sampleDensity = DEFAULT_ALIGNMENT_DENSITY);

    // Same search, also reporting the winning overlap
    static Alignment findBestAlignment(const std::vector<Point>& v1, const std::vector<Point>& v2,
                                       int angleSteps, int sampleDensity = DEFAULT_ALIGNMENT_DENSITY);

    static constexpr int MIN_GRID_RESOLUTION = 10;
    static constexpr int DEFAULT_ALIGNMENT_DENSITY = 400;

private:
    // Center on the centroid and scale to unit area
    static std::vector<Point> normalize(const std::vector<Point>& vertices, double area);
};

}  // namespace geom
}  // namespace tangram
