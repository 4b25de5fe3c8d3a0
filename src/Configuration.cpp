#include "tangram/Configuration.h"

#include <SDL3/SDL_log.h>
#include <glm/glm.hpp>
#include <nlohmann/json.hpp>
#include <cmath>
#include <fstream>
#include <iterator>

using json = nlohmann::json;

namespace tangram {

Configuration Configuration::loadFromJson(const std::string& jsonPath) {
    std::ifstream file(jsonPath);
    if (!file.is_open()) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Configuration: Failed to open file: %s", jsonPath.c_str());
        return defaults();
    }

    std::string content((std::istreambuf_iterator<char>(file)),
                         std::istreambuf_iterator<char>());
    return loadFromJsonString(content);
}

Configuration Configuration::loadFromJsonString(const std::string& jsonString) {
    Configuration config;

    try {
        json j = json::parse(jsonString);

        config.unit = j.value("unit", config.unit);
        config.vertexTolerance = j.value("vertexTolerance", config.vertexTolerance);
        config.minVertexSeparation = j.value("minVertexSeparation", config.minVertexSeparation);

        // "rotationSnap" (radians) wins over "rotationSnapDegrees" when both are present
        if (j.contains("rotationSnapDegrees")) {
            config.rotationSnap = glm::radians(j["rotationSnapDegrees"].get<double>());
        }
        config.rotationSnap = j.value("rotationSnap", config.rotationSnap);

    } catch (const json::exception& e) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Configuration: JSON parse error: %s", e.what());
        return defaults();
    }

    if (!config.isValid()) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION,
                     "Configuration: Rejected invalid values (unit=%.3f, tolerance=%.3f, separation=%.3f, snap=%.4f), using defaults",
                     config.unit, config.vertexTolerance, config.minVertexSeparation, config.rotationSnap);
        return defaults();
    }

    return config;
}

std::string Configuration::toJsonString() const {
    json j;
    j["unit"] = unit;
    j["vertexTolerance"] = vertexTolerance;
    j["minVertexSeparation"] = minVertexSeparation;
    j["rotationSnap"] = rotationSnap;
    return j.dump(2);
}

bool Configuration::isValid() const {
    return std::isfinite(unit) && unit > 0.0 &&
           std::isfinite(vertexTolerance) && vertexTolerance >= 0.0 &&
           std::isfinite(minVertexSeparation) && minVertexSeparation >= 0.0 &&
           std::isfinite(rotationSnap) && rotationSnap > 0.0;
}

void Configuration::log() const {
    SDL_Log("Configuration: unit=%.2f vertexTolerance=%.2f minVertexSeparation=%.2f rotationSnap=%.4f rad (%.1f deg)",
            unit, vertexTolerance, minVertexSeparation, rotationSnap, glm::degrees(rotationSnap));
}

}  // namespace tangram
