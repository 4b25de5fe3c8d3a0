#include "tangram/geom/Collision.h"
#include "tangram/model/Piece.h"
#include "tangram/utils/Log.h"

#include <algorithm>

namespace tangram {
namespace geom {

namespace {

// Does a ray from `origin` toward +x cross the edge (a, b)?
bool rayCrossesEdge(const Point& origin, const Point& a, const Point& b) {
    if ((a.y() > origin.y()) == (b.y() > origin.y())) {
        return false;
    }
    double crossingX = a.x() + (origin.y() - a.y()) * (b.x() - a.x()) / (b.y() - a.y());
    return crossingX > origin.x();
}

}  // namespace

bool Collision::pointInPolygon(const Point& point, const std::vector<Point>& vertices) {
    if (vertices.size() < 3) {
        SDL_LogDebug(LOG_CATEGORY_GEOMETRY, "Collision::pointInPolygon: need at least 3 vertices, got %zu",
                     vertices.size());
        return false;
    }

    int crossings = 0;
    size_t n = vertices.size();
    for (size_t i = 0; i < n; ++i) {
        if (rayCrossesEdge(point, vertices[i], vertices[(i + 1) % n])) {
            ++crossings;
        }
    }
    return (crossings % 2) == 1;
}

double Collision::segmentDistance(const Point& point, const Point& segStart, const Point& segEnd,
                                  const Configuration& config) {
    double segLength = segStart.distanceTo(segEnd);
    if (segLength <= config.minVertexSeparation) {
        return point.distanceTo(segStart);
    }

    double dx = segEnd.x() - segStart.x();
    double dy = segEnd.y() - segStart.y();
    double t = ((point.x() - segStart.x()) * dx + (point.y() - segStart.y()) * dy) / (segLength * segLength);
    t = std::clamp(t, 0.0, 1.0);

    Point closest(segStart.x() + t * dx, segStart.y() + t * dy);
    return point.distanceTo(closest);
}

bool Collision::boxesIntersect(const Rectangle& a, const Rectangle& b) {
    return a.intersects(b);
}

bool Collision::circleIntersectsPolygon(const Point& center, double radius,
                                        const std::vector<Point>& vertices,
                                        const Configuration& config) {
    if (pointInPolygon(center, vertices)) {
        return true;
    }

    size_t n = vertices.size();
    for (size_t i = 0; i < n; ++i) {
        if (segmentDistance(center, vertices[i], vertices[(i + 1) % n], config) <= radius) {
            return true;
        }
    }
    return false;
}

std::vector<const model::Piece*> Collision::piecesNearPoint(
    const std::vector<model::Piece>& pieces,
    const Point& point,
    double maxDistance
) {
    std::vector<const model::Piece*> result;
    for (const auto& piece : pieces) {
        double d = point.distanceTo(piece.position());
        if (d <= maxDistance) {
            SDL_LogVerbose(LOG_CATEGORY_GEOMETRY, "Collision::piecesNearPoint: %s within %.1f",
                           model::ShapeCatalog::toString(piece.kind()), d);
            result.push_back(&piece);
        }
    }
    return result;
}

}  // namespace geom
}  // namespace tangram
