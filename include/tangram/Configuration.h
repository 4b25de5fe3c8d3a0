#pragma once

#include <string>

namespace tangram {

/**
 * Tolerances and scale shared by shape generation and every
 * tolerance-sensitive kernel operation.
 *
 * Passed explicitly to the functions that need it; there is no global
 * instance.
 */
struct Configuration {
    // Side length of the small triangle's legs, in points
    double unit = 50.0;

    // Per-axis tolerance for vertex matching
    double vertexTolerance = 8.0;

    // Segments shorter than this are treated as points
    double minVertexSeparation = 3.0;

    // Rotation snapping increment in radians (15 degrees)
    double rotationSnap = 0.26179938779914943;

    static Configuration defaults() { return Configuration{}; }

    // Load from a JSON file. Falls back to defaults() on any error.
    static Configuration loadFromJson(const std::string& jsonPath);

    // Parse a JSON document. Missing keys keep their default values;
    // a parse error or an invalid result yields defaults().
    static Configuration loadFromJsonString(const std::string& jsonString);

    std::string toJsonString() const;

    bool isValid() const;

    // Print the active values on the application log category
    void log() const;
};

}  // namespace tangram
