#pragma once

#include <glm/glm.hpp>
#include <string>

namespace tangram {
namespace model {

// Display color tag. Opaque to the kernel; the renderer maps it to RGB.
enum class PieceColor {
    Red,
    Blue,
    Green,
    Yellow,
    Orange,
    Purple,
    Cyan,
    Black,
    White,
    Gray,
    Pink,
    Brown
};

// Used when a persisted name is not recognised
constexpr PieceColor FALLBACK_COLOR = PieceColor::Blue;

const char* colorToString(PieceColor color);

// Unknown names map to FALLBACK_COLOR, never an error
PieceColor colorFromString(const std::string& name);

// Linear RGB in [0,1] for the renderer
glm::vec3 colorToRgb(PieceColor color);

}  // namespace model
}  // namespace tangram
