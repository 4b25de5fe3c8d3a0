#include "tangram/geom/PolygonMath.h"
#include "tangram/utils/Log.h"

#include <algorithm>
#include <cmath>
#include <cstdio>

namespace tangram {
namespace geom {

namespace {
// Below this the polygon is treated as collinear
constexpr double AREA_EPSILON = 1e-12;
}

double PolygonMath::signedArea(const std::vector<Point>& vertices) {
    if (vertices.size() < 3) return 0;
    double sum = 0;
    size_t n = vertices.size();
    for (size_t i = 0; i < n; ++i) {
        const Point& p1 = vertices[i];
        const Point& p2 = vertices[(i + 1) % n];
        sum += p1.x() * p2.y() - p2.x() * p1.y();
    }
    return sum * 0.5;
}

double PolygonMath::area(const std::vector<Point>& vertices) {
    if (vertices.size() < 3) {
        SDL_LogDebug(LOG_CATEGORY_GEOMETRY, "PolygonMath::area: need at least 3 vertices, got %zu", vertices.size());
        return 0;
    }
    return std::abs(signedArea(vertices));
}

Point PolygonMath::vertexAverage(const std::vector<Point>& vertices) {
    if (vertices.empty()) return Point();
    double sumX = 0;
    double sumY = 0;
    for (const auto& v : vertices) {
        sumX += v.x();
        sumY += v.y();
    }
    double count = static_cast<double>(vertices.size());
    return Point(sumX / count, sumY / count);
}

Point PolygonMath::centroid(const std::vector<Point>& vertices) {
    if (vertices.empty()) {
        SDL_LogDebug(LOG_CATEGORY_GEOMETRY, "PolygonMath::centroid: empty vertex list");
        return Point();
    }
    if (vertices.size() == 1) return vertices[0];
    if (vertices.size() == 2) return vertices[0].midpointWith(vertices[1]);

    // Signed area keeps the formula valid for either winding
    double a = signedArea(vertices);
    if (std::abs(a) <= AREA_EPSILON) {
        SDL_LogDebug(LOG_CATEGORY_GEOMETRY, "PolygonMath::centroid: zero area, using vertex average");
        return vertexAverage(vertices);
    }

    double cx = 0;
    double cy = 0;
    size_t n = vertices.size();
    for (size_t i = 0; i < n; ++i) {
        const Point& p1 = vertices[i];
        const Point& p2 = vertices[(i + 1) % n];
        double cross = p1.x() * p2.y() - p2.x() * p1.y();
        cx += (p1.x() + p2.x()) * cross;
        cy += (p1.y() + p2.y()) * cross;
    }

    double factor = 1.0 / (6.0 * a);
    return Point(cx * factor, cy * factor);
}

Rectangle PolygonMath::boundingBox(const std::vector<Point>& vertices) {
    if (vertices.empty()) {
        SDL_LogDebug(LOG_CATEGORY_GEOMETRY, "PolygonMath::boundingBox: empty vertex list");
        return Rectangle();
    }

    double minX = vertices[0].x();
    double maxX = minX;
    double minY = vertices[0].y();
    double maxY = minY;
    for (const auto& v : vertices) {
        minX = std::min(minX, v.x());
        maxX = std::max(maxX, v.x());
        minY = std::min(minY, v.y());
        maxY = std::max(maxY, v.y());
    }
    return Rectangle::fromBounds(minX, minY, maxX, maxY);
}

std::vector<Point> PolygonMath::rotateAll(const std::vector<Point>& vertices, const Point& pivot, double angle) {
    std::vector<Point> result;
    result.reserve(vertices.size());
    for (const auto& v : vertices) {
        result.push_back(v.rotatedAround(pivot, angle));
    }
    return result;
}

std::vector<Point> PolygonMath::scaleAll(const std::vector<Point>& vertices, const Point& origin, double factor) {
    std::vector<Point> result;
    result.reserve(vertices.size());
    for (const auto& v : vertices) {
        result.push_back(v.scaledAbout(origin, factor));
    }
    return result;
}

std::vector<Point> PolygonMath::translateAll(const std::vector<Point>& vertices, const Point& offset) {
    std::vector<Point> result;
    result.reserve(vertices.size());
    for (const auto& v : vertices) {
        result.push_back(v.translated(offset));
    }
    return result;
}

std::vector<Point> PolygonMath::transform(
    const std::vector<Point>& vertices,
    const Point& translation,
    double rotation,
    double scale
) {
    std::vector<Point> result = translateAll(vertices, translation);

    if (rotation != 0.0) {
        result = rotateAll(result, centroid(result), rotation);
    }

    if (scale != 1.0) {
        result = scaleAll(result, centroid(result), scale);
    }

    return result;
}

ValidationResult PolygonMath::validatePolygon(const std::vector<Point>& vertices, const Configuration& config) {
    char buf[128];

    if (vertices.size() < 3) {
        std::snprintf(buf, sizeof(buf), "need at least 3 vertices, got %zu", vertices.size());
        return ValidationResult::failure(GeometryError::InvalidShape, buf);
    }

    size_t n = vertices.size();
    for (size_t i = 0; i < n; ++i) {
        if (vertices[i].distanceTo(vertices[(i + 1) % n]) < config.minVertexSeparation) {
            std::snprintf(buf, sizeof(buf), "vertices too close at index %zu", i);
            return ValidationResult::failure(GeometryError::DegenerateGeometry, buf);
        }
    }

    double a = area(vertices);
    if (a < MIN_VALID_AREA) {
        std::snprintf(buf, sizeof(buf), "area too small (%.3f)", a);
        return ValidationResult::failure(GeometryError::InvalidShape, buf);
    }

    return ValidationResult::success();
}

}  // namespace geom
}  // namespace tangram
