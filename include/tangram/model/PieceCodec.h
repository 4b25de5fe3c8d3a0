#pragma once

#include "tangram/Configuration.h"
#include "tangram/model/Piece.h"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace tangram {
namespace model {

/**
 * JSON persistence for pieces.
 *
 * Layout:
 *   { "id": "…uuid…", "type": "large_triangle_1",
 *     "position": { "x": 10.0, "y": 20.0 }, "rotation": 0.785,
 *     "colorData": "red", "unit": 50.0 }
 *
 * The persisted id is restored when it parses; a missing or malformed id
 * gets a fresh one. Unknown colorData decodes to FALLBACK_COLOR. An unknown
 * type or missing position makes the piece unrecoverable (nullopt).
 */
namespace PieceCodec {

nlohmann::json toJson(const Piece& piece);

// `config.unit` is used when the document carries no "unit"
std::optional<Piece> fromJson(const nlohmann::json& j, const Configuration& config);

std::string toJsonString(const Piece& piece, int indent = -1);
std::optional<Piece> fromJsonString(const std::string& text, const Configuration& config);

nlohmann::json setToJson(const std::vector<Piece>& pieces);

// Skips (and logs) entries that cannot be decoded
std::vector<Piece> setFromJson(const nlohmann::json& j, const Configuration& config);

}  // namespace PieceCodec

}  // namespace model
}  // namespace tangram
