#include "tangram/geom/ShapeComparator.h"
#include "tangram/geom/Collision.h"
#include "tangram/geom/PolygonMath.h"
#include "tangram/utils/Log.h"

#include <glm/gtc/constants.hpp>
#include <algorithm>
#include <cmath>

namespace tangram {
namespace geom {

std::vector<Point> ShapeComparator::normalize(const std::vector<Point>& vertices, double area) {
    Point c = PolygonMath::centroid(vertices);
    double factor = 1.0 / std::sqrt(area);
    std::vector<Point> result;
    result.reserve(vertices.size());
    for (const auto& v : vertices) {
        result.push_back((v - c) * factor);
    }
    return result;
}

bool ShapeComparator::shapesSimilar(const std::vector<Point>& v1, const std::vector<Point>& v2, double tolerance) {
    if (v1.size() != v2.size() || v1.size() < 3) {
        return false;
    }

    double area1 = PolygonMath::area(v1);
    double area2 = PolygonMath::area(v2);
    if (area1 <= tolerance || area2 <= tolerance) {
        SDL_LogDebug(LOG_CATEGORY_GEOMETRY, "ShapeComparator::shapesSimilar: degenerate area (%.4f, %.4f)",
                     area1, area2);
        return false;
    }

    std::vector<Point> a = normalize(v1, area1);
    std::vector<Point> b = normalize(v2, area2);
    size_t n = a.size();

    for (size_t offset = 0; offset < n; ++offset) {
        // Rotate b so its starting vertex points the same way as a's
        const Point& start = b[offset];
        double angle = std::atan2(a[0].y(), a[0].x()) - std::atan2(start.y(), start.x());
        std::vector<Point> aligned = PolygonMath::rotateAll(b, Point(), angle);

        bool allMatch = true;
        for (size_t i = 0; i < n; ++i) {
            if (a[i].distanceTo(aligned[(i + offset) % n]) > tolerance) {
                allMatch = false;
                break;
            }
        }
        if (allMatch) {
            return true;
        }
    }
    return false;
}

double ShapeComparator::shapeOverlap(const std::vector<Point>& v1, const std::vector<Point>& v2, int sampleDensity) {
    if (v1.size() < 3) {
        return 0.0;
    }

    Rectangle bounds = PolygonMath::boundingBox(v1);
    if (!v2.empty()) {
        bounds = bounds.united(PolygonMath::boundingBox(v2));
    }
    if (bounds.isEmpty()) {
        SDL_LogDebug(LOG_CATEGORY_GEOMETRY, "ShapeComparator::shapeOverlap: empty sampling box");
        return 0.0;
    }

    double density = std::max(sampleDensity, 0);
    double aspect = bounds.width / bounds.height;
    int cols = std::max(MIN_GRID_RESOLUTION, static_cast<int>(std::lround(std::sqrt(density * aspect))));
    int rows = std::max(MIN_GRID_RESOLUTION, static_cast<int>(std::lround(std::sqrt(density / aspect))));

    double stepX = bounds.width / cols;
    double stepY = bounds.height / rows;

    int inFirst = 0;
    int inBoth = 0;
    for (int row = 0; row < rows; ++row) {
        double y = bounds.minY() + (row + 0.5) * stepY;
        for (int col = 0; col < cols; ++col) {
            Point sample(bounds.minX() + (col + 0.5) * stepX, y);
            if (!Collision::pointInPolygon(sample, v1)) {
                continue;
            }
            ++inFirst;
            if (Collision::pointInPolygon(sample, v2)) {
                ++inBoth;
            }
        }
    }

    if (inFirst == 0) {
        return 0.0;
    }
    return static_cast<double>(inBoth) / static_cast<double>(inFirst);
}

ShapeComparator::Alignment ShapeComparator::findBestAlignment(const std::vector<Point>& v1,
                                                              const std::vector<Point>& v2,
                                                              int angleSteps, int sampleDensity) {
    Alignment best;
    if (angleSteps <= 0) {
        return best;
    }

    Point target = PolygonMath::centroid(v1);
    Point pivot = PolygonMath::centroid(v2);
    bool first = true;

    for (int step = 0; step < angleSteps; ++step) {
        double angle = glm::two_pi<double>() * step / angleSteps;
        std::vector<Point> rotated = PolygonMath::rotateAll(v2, pivot, angle);
        std::vector<Point> moved = PolygonMath::translateAll(rotated, target - PolygonMath::centroid(rotated));

        double overlap = shapeOverlap(v1, moved, sampleDensity);
        if (first || overlap > best.overlap) {
            best.angle = angle;
            best.overlap = overlap;
            first = false;
        }
    }

    SDL_LogDebug(LOG_CATEGORY_GEOMETRY, "ShapeComparator: best alignment %.3f rad, overlap %.3f over %d steps",
                 best.angle, best.overlap, angleSteps);
    return best;
}

double ShapeComparator::findOptimalAlignment(const std::vector<Point>& v1, const std::vector<Point>& v2,
                                             int angleSteps, int sampleDensity) {
    return findBestAlignment(v1, v2, angleSteps, sampleDensity).angle;
}

}  // namespace geom
}  // namespace tangram
