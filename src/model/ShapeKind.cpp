#include "tangram/model/ShapeKind.h"
#include "tangram/geom/PolygonMath.h"
#include "tangram/utils/Log.h"

#include <cmath>
#include <cstdio>

namespace tangram {
namespace model {

using geom::GeometryError;
using geom::Point;
using geom::PolygonMath;
using geom::ValidationResult;

namespace {

constexpr double AREA_EPSILON = 1e-9;

struct KindNames {
    ShapeKind kind;
    const char* name;
    const char* display;
};

constexpr KindNames KIND_NAMES[] = {
    {ShapeKind::LargeTriangleA, "large_triangle_1", "Large Triangle 1"},
    {ShapeKind::LargeTriangleB, "large_triangle_2", "Large Triangle 2"},
    {ShapeKind::MediumTriangle, "medium_triangle", "Medium Triangle"},
    {ShapeKind::SmallTriangleA, "small_triangle_1", "Small Triangle 1"},
    {ShapeKind::SmallTriangleB, "small_triangle_2", "Small Triangle 2"},
    {ShapeKind::Square, "square", "Square"},
    {ShapeKind::Parallelogram, "parallelogram", "Parallelogram"},
};

const KindNames& namesFor(ShapeKind kind) {
    for (const auto& entry : KIND_NAMES) {
        if (entry.kind == kind) return entry;
    }
    return KIND_NAMES[0];
}

// Right triangle with the right angle at the origin
std::vector<Point> rightTriangle(double leg) {
    return {
        Point(0.0, 0.0),
        Point(leg, 0.0),
        Point(0.0, leg)
    };
}

}  // namespace

const std::array<ShapeKind, ShapeCatalog::KIND_COUNT>& ShapeCatalog::allKinds() {
    static const std::array<ShapeKind, KIND_COUNT> kinds = {
        ShapeKind::LargeTriangleA,
        ShapeKind::LargeTriangleB,
        ShapeKind::MediumTriangle,
        ShapeKind::SmallTriangleA,
        ShapeKind::SmallTriangleB,
        ShapeKind::Square,
        ShapeKind::Parallelogram
    };
    return kinds;
}

std::vector<Point> ShapeCatalog::localVertices(ShapeKind kind, double unit) {
    switch (kind) {
        case ShapeKind::LargeTriangleA:
        case ShapeKind::LargeTriangleB:
            return rightTriangle(2.0 * unit);

        case ShapeKind::MediumTriangle:
            return rightTriangle(unit * std::sqrt(2.0));

        case ShapeKind::SmallTriangleA:
        case ShapeKind::SmallTriangleB:
            return rightTriangle(unit);

        case ShapeKind::Square: {
            // Diamond: side = unit, so the half diagonal is unit * sqrt(2) / 2
            double h = unit * std::sqrt(2.0) / 2.0;
            return {
                Point(0.0, -h),
                Point(h, 0.0),
                Point(0.0, h),
                Point(-h, 0.0)
            };
        }

        case ShapeKind::Parallelogram: {
            // Long edges sqrt(2) * unit, slanted short edges of length unit at 45 degrees
            double longEdge = unit * std::sqrt(2.0);
            double slant = unit / std::sqrt(2.0);
            return {
                Point(0.0, 0.0),
                Point(longEdge, 0.0),
                Point(longEdge + slant, slant),
                Point(slant, slant)
            };
        }
    }
    return {};
}

size_t ShapeCatalog::vertexCount(ShapeKind kind) {
    switch (kind) {
        case ShapeKind::LargeTriangleA:
        case ShapeKind::LargeTriangleB:
        case ShapeKind::MediumTriangle:
        case ShapeKind::SmallTriangleA:
        case ShapeKind::SmallTriangleB:
            return 3;
        case ShapeKind::Square:
        case ShapeKind::Parallelogram:
            return 4;
    }
    return 0;
}

double ShapeCatalog::area(ShapeKind kind, double unit) {
    return PolygonMath::area(localVertices(kind, unit));
}

glm::dvec2 ShapeCatalog::frameSize(ShapeKind kind, double unit) {
    geom::Rectangle bounds = PolygonMath::boundingBox(localVertices(kind, unit));
    return glm::dvec2(std::abs(bounds.width), std::abs(bounds.height));
}

ValidationResult ShapeCatalog::validate(ShapeKind kind, const Configuration& config) {
    std::vector<Point> vertices = localVertices(kind, config.unit);
    char buf[160];

    if (vertices.size() < 3) {
        std::snprintf(buf, sizeof(buf), "%s: need at least 3 vertices, got %zu", displayName(kind), vertices.size());
        return ValidationResult::failure(GeometryError::InvalidShape, buf);
    }

    double a = PolygonMath::area(vertices);
    if (a <= AREA_EPSILON) {
        std::snprintf(buf, sizeof(buf), "%s: non-positive area %.6f", displayName(kind), a);
        return ValidationResult::failure(GeometryError::InvalidShape, buf);
    }

    double unitSq = config.unit * config.unit;
    if (a < MIN_AREA_FACTOR * unitSq || a > MAX_AREA_FACTOR * unitSq) {
        std::snprintf(buf, sizeof(buf), "%s: area %.3f outside [%.3f, %.3f]", displayName(kind), a,
                      MIN_AREA_FACTOR * unitSq, MAX_AREA_FACTOR * unitSq);
        return ValidationResult::failure(GeometryError::InvalidShape, buf);
    }

    return ValidationResult::success();
}

double ShapeCatalog::totalArea(double unit) {
    double total = 0.0;
    for (ShapeKind kind : allKinds()) {
        total += area(kind, unit);
    }
    return total;
}

ValidationResult ShapeCatalog::validateCatalog(const Configuration& config) {
    for (ShapeKind kind : allKinds()) {
        ValidationResult result = validate(kind, config);
        if (!result) {
            SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "ShapeCatalog: %s", result.message.c_str());
            return result;
        }
    }

    double unitSq = config.unit * config.unit;
    double total = totalArea(config.unit);
    double expected = CANONICAL_AREA_FACTOR * unitSq;
    if (std::abs(total - expected) > 0.01 * unitSq) {
        char buf[128];
        std::snprintf(buf, sizeof(buf), "canonical set area %.3f, expected %.3f", total, expected);
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "ShapeCatalog: %s", buf);
        return ValidationResult::failure(GeometryError::InvalidShape, buf);
    }

    SDL_LogDebug(LOG_CATEGORY_GEOMETRY, "ShapeCatalog: %zu shapes valid, total area %.2f", KIND_COUNT, total);
    return ValidationResult::success();
}

std::vector<std::vector<Point>> ShapeCatalog::canonicalSet(const Configuration& config) {
    std::vector<std::vector<Point>> result;
    result.reserve(KIND_COUNT);
    for (ShapeKind kind : allKinds()) {
        result.push_back(localVertices(kind, config.unit));
    }
    return result;
}

const char* ShapeCatalog::displayName(ShapeKind kind) {
    return namesFor(kind).display;
}

const char* ShapeCatalog::toString(ShapeKind kind) {
    return namesFor(kind).name;
}

std::optional<ShapeKind> ShapeCatalog::fromString(const std::string& name) {
    for (const auto& entry : KIND_NAMES) {
        if (name == entry.name) return entry.kind;
    }
    return std::nullopt;
}

}  // namespace model
}  // namespace tangram
