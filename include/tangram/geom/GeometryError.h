#pragma once

#include <string>
#include <utility>

namespace tangram {
namespace geom {

enum class GeometryError {
    None,
    InvalidShape,        // too few vertices, or area non-positive / out of bounds
    DegenerateGeometry   // zero-length segment, coincident vertices
};

const char* geometryErrorName(GeometryError error);

/**
 * Outcome of a validation entry point. Geometry functions themselves never
 * fail; they return documented degenerate defaults instead.
 */
struct ValidationResult {
    GeometryError error = GeometryError::None;
    std::string message;

    bool ok() const { return error == GeometryError::None; }
    explicit operator bool() const { return ok(); }

    static ValidationResult success() { return ValidationResult{}; }
    static ValidationResult failure(GeometryError error, std::string message) {
        return ValidationResult{error, std::move(message)};
    }
};

}  // namespace geom
}  // namespace tangram
