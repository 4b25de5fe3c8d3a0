#pragma once

#include "tangram/Configuration.h"
#include "tangram/geom/Point.h"
#include "tangram/geom/Rectangle.h"
#include "tangram/model/PieceColor.h"
#include "tangram/model/PieceId.h"
#include "tangram/model/ShapeKind.h"
#include <optional>
#include <string>
#include <vector>

namespace tangram {
namespace model {

/**
 * A placed tangram piece: shape kind plus pose plus color tag.
 *
 * Value type. Every transform returns a new Piece carrying the same id and
 * kind; nothing mutates in place, so a Piece can be shared read-only across
 * threads.
 *
 * World vertices are derived on demand from (kind, unit, position, rotation)
 * and never cached. The local loop is rotated about the local origin (the
 * shape's anchor vertex) first, then translated to `position`.
 */
class Piece {
public:
    // Mints a fresh id
    Piece(ShapeKind kind, const geom::Point& position, double rotation, PieceColor color, double unit);

    // Restores a known id (persistence)
    Piece(const PieceId& id, ShapeKind kind, const geom::Point& position, double rotation,
          PieceColor color, double unit);

    const PieceId& id() const { return id_; }
    ShapeKind kind() const { return kind_; }
    const geom::Point& position() const { return position_; }
    double rotation() const { return rotation_; }
    PieceColor color() const { return color_; }
    double unit() const { return unit_; }

    // Geometry
    std::vector<geom::Point> localVertices() const;
    std::vector<geom::Point> worldVertices() const;
    geom::Rectangle boundingBox() const;
    geom::Point centroid() const;
    double area() const;
    bool containsPoint(const geom::Point& p) const;

    // Transforms
    Piece translated(double dx, double dy) const;
    Piece movedTo(const geom::Point& newPosition) const;
    Piece rotatedBy(double angle) const;
    Piece rotatedTo(double angle) const;

    // Rotation back to 0; position replaced when given
    Piece reset(const std::optional<geom::Point>& newPosition = std::nullopt) const;

    /**
     * Round rotation to the nearest multiple of snapAngle. Returns an
     * unchanged copy when the rotation is already within SNAP_EPSILON of
     * the snapped value, so snapping twice is the same as snapping once.
     */
    Piece snappedRotation(double snapAngle) const;
    Piece snappedRotation(const Configuration& config) const;

    Piece withColor(PieceColor color) const;

    // Same id and kind, positions matching within config.vertexTolerance,
    // rotations within config.vertexTolerance / 1000
    bool sameState(const Piece& other, const Configuration& config) const;

    // Exact field-wise equality
    bool operator==(const Piece& other) const;
    bool operator!=(const Piece& other) const { return !(*this == other); }

    // "Large Triangle 1 at (10.0, 20.0), rotated 45.0°"
    std::string describe() const;

    // "large_triangle_1 | pos: (10,20) | rot: 45.0°"
    std::string statusString() const;

    // Multi-line dump with id, bounds and every world vertex
    std::string debugDescription() const;

    // Fixed threshold, independent of Configuration
    static constexpr double SNAP_EPSILON = 0.001;

private:
    PieceId id_;
    ShapeKind kind_;
    geom::Point position_;
    double rotation_;
    PieceColor color_;
    double unit_;
};

}  // namespace model
}  // namespace tangram
