#include "tangram/model/PieceColor.h"

#include <SDL3/SDL_log.h>

namespace tangram {
namespace model {

namespace {

struct ColorEntry {
    PieceColor color;
    const char* name;
    glm::vec3 rgb;
};

const ColorEntry COLOR_TABLE[] = {
    {PieceColor::Red,    "red",    glm::vec3(1.0f, 0.23f, 0.19f)},
    {PieceColor::Blue,   "blue",   glm::vec3(0.0f, 0.48f, 1.0f)},
    {PieceColor::Green,  "green",  glm::vec3(0.2f, 0.78f, 0.35f)},
    {PieceColor::Yellow, "yellow", glm::vec3(1.0f, 0.8f, 0.0f)},
    {PieceColor::Orange, "orange", glm::vec3(1.0f, 0.58f, 0.0f)},
    {PieceColor::Purple, "purple", glm::vec3(0.69f, 0.32f, 0.87f)},
    {PieceColor::Cyan,   "cyan",   glm::vec3(0.2f, 0.68f, 0.9f)},
    {PieceColor::Black,  "black",  glm::vec3(0.0f, 0.0f, 0.0f)},
    {PieceColor::White,  "white",  glm::vec3(1.0f, 1.0f, 1.0f)},
    {PieceColor::Gray,   "gray",   glm::vec3(0.56f, 0.56f, 0.58f)},
    {PieceColor::Pink,   "pink",   glm::vec3(1.0f, 0.18f, 0.33f)},
    {PieceColor::Brown,  "brown",  glm::vec3(0.64f, 0.52f, 0.37f)},
};

const ColorEntry& entryFor(PieceColor color) {
    for (const auto& entry : COLOR_TABLE) {
        if (entry.color == color) return entry;
    }
    return entryFor(FALLBACK_COLOR);
}

}  // namespace

const char* colorToString(PieceColor color) {
    return entryFor(color).name;
}

PieceColor colorFromString(const std::string& name) {
    for (const auto& entry : COLOR_TABLE) {
        if (name == entry.name) return entry.color;
    }
    SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "PieceColor: Unknown color '%s', using %s",
                name.c_str(), colorToString(FALLBACK_COLOR));
    return FALLBACK_COLOR;
}

glm::vec3 colorToRgb(PieceColor color) {
    return entryFor(color).rgb;
}

}  // namespace model
}  // namespace tangram
