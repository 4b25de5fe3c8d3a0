#include "tangram/model/Piece.h"
#include "tangram/geom/Collision.h"
#include "tangram/geom/PolygonMath.h"
#include "tangram/utils/Log.h"

#include <glm/glm.hpp>
#include <cmath>
#include <cstdio>
#include <sstream>

namespace tangram {
namespace model {

using geom::Point;
using geom::PolygonMath;

Piece::Piece(ShapeKind kind, const Point& position, double rotation, PieceColor color, double unit)
    : Piece(PieceId::generate(), kind, position, rotation, color, unit) {}

Piece::Piece(const PieceId& id, ShapeKind kind, const Point& position, double rotation,
             PieceColor color, double unit)
    : id_(id), kind_(kind), position_(position), rotation_(rotation), color_(color), unit_(unit) {}

std::vector<Point> Piece::localVertices() const {
    return ShapeCatalog::localVertices(kind_, unit_);
}

std::vector<Point> Piece::worldVertices() const {
    std::vector<Point> result = localVertices();
    for (auto& v : result) {
        v = v.rotatedAround(Point(), rotation_).translated(position_.x(), position_.y());
    }
    return result;
}

geom::Rectangle Piece::boundingBox() const {
    std::vector<Point> vertices = worldVertices();
    if (vertices.empty()) {
        return geom::Rectangle::at(position_);
    }
    return PolygonMath::boundingBox(vertices);
}

Point Piece::centroid() const {
    return PolygonMath::centroid(worldVertices());
}

double Piece::area() const {
    return ShapeCatalog::area(kind_, unit_);
}

bool Piece::containsPoint(const Point& p) const {
    return geom::Collision::pointInPolygon(p, worldVertices());
}

Piece Piece::translated(double dx, double dy) const {
    return Piece(id_, kind_, position_.translated(dx, dy), rotation_, color_, unit_);
}

Piece Piece::movedTo(const Point& newPosition) const {
    return Piece(id_, kind_, newPosition, rotation_, color_, unit_);
}

Piece Piece::rotatedBy(double angle) const {
    return Piece(id_, kind_, position_, rotation_ + angle, color_, unit_);
}

Piece Piece::rotatedTo(double angle) const {
    return Piece(id_, kind_, position_, angle, color_, unit_);
}

Piece Piece::reset(const std::optional<Point>& newPosition) const {
    return Piece(id_, kind_, newPosition.value_or(position_), 0.0, color_, unit_);
}

Piece Piece::snappedRotation(double snapAngle) const {
    if (snapAngle <= 0.0) {
        SDL_LogDebug(LOG_CATEGORY_GEOMETRY, "Piece::snappedRotation: non-positive snap angle %.4f", snapAngle);
        return *this;
    }

    double snapped = std::round(rotation_ / snapAngle) * snapAngle;
    if (std::abs(rotation_ - snapped) <= SNAP_EPSILON) {
        return *this;
    }

    SDL_LogDebug(LOG_CATEGORY_GEOMETRY, "Snapping %s rotation from %.3f to %.3f",
                 ShapeCatalog::toString(kind_), rotation_, snapped);
    return rotatedTo(snapped);
}

Piece Piece::snappedRotation(const Configuration& config) const {
    return snappedRotation(config.rotationSnap);
}

Piece Piece::withColor(PieceColor color) const {
    return Piece(id_, kind_, position_, rotation_, color, unit_);
}

bool Piece::sameState(const Piece& other, const Configuration& config) const {
    return id_ == other.id_ &&
           kind_ == other.kind_ &&
           position_.matches(other.position_, config.vertexTolerance) &&
           std::abs(rotation_ - other.rotation_) < config.vertexTolerance / 1000.0;
}

bool Piece::operator==(const Piece& other) const {
    return id_ == other.id_ &&
           kind_ == other.kind_ &&
           position_.x() == other.position_.x() &&
           position_.y() == other.position_.y() &&
           rotation_ == other.rotation_ &&
           color_ == other.color_ &&
           unit_ == other.unit_;
}

std::string Piece::describe() const {
    char buf[160];
    std::snprintf(buf, sizeof(buf), "%s at (%.1f, %.1f), rotated %.1f°",
                  ShapeCatalog::displayName(kind_), position_.x(), position_.y(), glm::degrees(rotation_));
    return buf;
}

std::string Piece::statusString() const {
    char buf[160];
    std::snprintf(buf, sizeof(buf), "%s | pos: (%.0f,%.0f) | rot: %.1f°",
                  ShapeCatalog::toString(kind_), position_.x(), position_.y(), glm::degrees(rotation_));
    return buf;
}

std::string Piece::debugDescription() const {
    std::vector<Point> vertices = worldVertices();
    geom::Rectangle bounds = boundingBox();

    char line[160];
    std::ostringstream out;
    out << describe();
    out << "\n  ID: " << id_.toString();
    out << "\n  Color: " << colorToString(color_);
    out << "\n  Base Vertices: " << ShapeCatalog::vertexCount(kind_);
    out << "\n  Current Vertices: " << vertices.size();
    std::snprintf(line, sizeof(line), "\n  Bounding Box: (%.1f, %.1f) - %.1fx%.1f",
                  bounds.x, bounds.y, bounds.width, bounds.height);
    out << line;

    if (!vertices.empty()) {
        out << "\n  Vertices:";
        for (size_t i = 0; i < vertices.size(); ++i) {
            std::snprintf(line, sizeof(line), "\n    [%zu]: (%.2f, %.2f)", i, vertices[i].x(), vertices[i].y());
            out << line;
        }
    }
    return out.str();
}

}  // namespace model
}  // namespace tangram
