#pragma once

#include "tangram/Configuration.h"
#include "tangram/geom/GeometryError.h"
#include "tangram/geom/Point.h"
#include <glm/glm.hpp>
#include <array>
#include <optional>
#include <string>
#include <vector>

namespace tangram {
namespace model {

/**
 * The seven tangram shapes. A kind carries no state beyond its tag.
 */
enum class ShapeKind {
    LargeTriangleA,
    LargeTriangleB,
    MediumTriangle,
    SmallTriangleA,
    SmallTriangleB,
    Square,
    Parallelogram
};

/**
 * ShapeCatalog - canonical local-space geometry for each ShapeKind.
 *
 * Every loop is counterclockwise. The first vertex is the shape's anchor
 * (the right angle for triangles, the bottom-left corner of the
 * parallelogram) and doubles as the pivot a Piece rotates about. The square
 * is a diamond centered on the origin.
 */
class ShapeCatalog {
public:
    static constexpr size_t KIND_COUNT = 7;

    // Sum of the seven canonical areas in units of unit^2
    static constexpr double CANONICAL_AREA_FACTOR = 8.0;

    // Sanity bounds for a single shape, in units of unit^2
    static constexpr double MIN_AREA_FACTOR = 0.1;
    static constexpr double MAX_AREA_FACTOR = 10.0;

    static const std::array<ShapeKind, KIND_COUNT>& allKinds();

    static std::vector<geom::Point> localVertices(ShapeKind kind, double unit);
    static size_t vertexCount(ShapeKind kind);
    static double area(ShapeKind kind, double unit);

    // Width and height of the local-space bounding box
    static glm::dvec2 frameSize(ShapeKind kind, double unit);

    /**
     * Reject malformed shape definitions: fewer than 3 vertices, area at or
     * below a small epsilon, or area outside [0.1, 10] * unit^2.
     */
    static geom::ValidationResult validate(ShapeKind kind, const Configuration& config);

    static double totalArea(double unit);

    // Validate every kind plus the canonical total area
    static geom::ValidationResult validateCatalog(const Configuration& config);

    // Local-space loops of all seven shapes, in allKinds() order
    static std::vector<std::vector<geom::Point>> canonicalSet(const Configuration& config);

    // "Large Triangle 1"
    static const char* displayName(ShapeKind kind);

    // Persisted name, "large_triangle_1"
    static const char* toString(ShapeKind kind);
    static std::optional<ShapeKind> fromString(const std::string& name);
};

}  // namespace model
}  // namespace tangram
