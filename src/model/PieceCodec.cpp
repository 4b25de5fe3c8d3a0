#include "tangram/model/PieceCodec.h"

#include <SDL3/SDL_log.h>

using json = nlohmann::json;

namespace tangram {
namespace model {
namespace PieceCodec {

json toJson(const Piece& piece) {
    json j;
    j["id"] = piece.id().toString();
    j["type"] = ShapeCatalog::toString(piece.kind());
    j["position"] = {{"x", piece.position().x()}, {"y", piece.position().y()}};
    j["rotation"] = piece.rotation();
    j["colorData"] = colorToString(piece.color());
    j["unit"] = piece.unit();
    return j;
}

std::optional<Piece> fromJson(const json& j, const Configuration& config) {
    try {
        std::string typeStr = j.at("type").get<std::string>();
        std::optional<ShapeKind> kind = ShapeCatalog::fromString(typeStr);
        if (!kind) {
            SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "PieceCodec: Unknown piece type '%s'", typeStr.c_str());
            return std::nullopt;
        }

        const auto& pos = j.at("position");
        geom::Point position(pos.at("x").get<double>(), pos.at("y").get<double>());
        double rotation = j.value("rotation", 0.0);
        double unit = j.value("unit", config.unit);
        PieceColor color = FALLBACK_COLOR;
        if (j.contains("colorData") && j["colorData"].is_string()) {
            color = colorFromString(j["colorData"].get<std::string>());
        } else {
            SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "PieceCodec: Missing or non-string colorData for %s, using %s",
                        typeStr.c_str(), colorToString(FALLBACK_COLOR));
        }

        std::optional<PieceId> id;
        if (j.contains("id") && j["id"].is_string()) {
            id = PieceId::fromString(j["id"].get<std::string>());
        }
        if (!id) {
            SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "PieceCodec: Missing or malformed id for %s, assigning a new one",
                        typeStr.c_str());
            id = PieceId::generate();
        }

        return Piece(*id, *kind, position, rotation, color, unit);

    } catch (const json::exception& e) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "PieceCodec: Failed to decode piece: %s", e.what());
        return std::nullopt;
    }
}

std::string toJsonString(const Piece& piece, int indent) {
    return toJson(piece).dump(indent);
}

std::optional<Piece> fromJsonString(const std::string& text, const Configuration& config) {
    json j = json::parse(text, nullptr, false);
    if (j.is_discarded()) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "PieceCodec: JSON parse error");
        return std::nullopt;
    }
    return fromJson(j, config);
}

json setToJson(const std::vector<Piece>& pieces) {
    json arr = json::array();
    for (const auto& piece : pieces) {
        arr.push_back(toJson(piece));
    }
    return arr;
}

std::vector<Piece> setFromJson(const json& j, const Configuration& config) {
    std::vector<Piece> pieces;
    if (!j.is_array()) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "PieceCodec: Expected an array of pieces");
        return pieces;
    }

    for (size_t i = 0; i < j.size(); ++i) {
        std::optional<Piece> piece = fromJson(j[i], config);
        if (piece) {
            pieces.push_back(*piece);
        } else {
            SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "PieceCodec: Skipping piece %zu", i);
        }
    }
    return pieces;
}

}  // namespace PieceCodec
}  // namespace model
}  // namespace tangram
