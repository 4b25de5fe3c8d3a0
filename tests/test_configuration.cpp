#include <doctest/doctest.h>
#include "tangram/Configuration.h"
#include <glm/gtc/constants.hpp>

using namespace tangram;

TEST_SUITE("Configuration") {
    TEST_CASE("Defaults") {
        Configuration config = Configuration::defaults();
        CHECK(config.unit == 50.0);
        CHECK(config.vertexTolerance == 8.0);
        CHECK(config.minVertexSeparation == 3.0);
        CHECK(config.rotationSnap == doctest::Approx(glm::pi<double>() / 12.0));
        CHECK(config.isValid());
    }

    TEST_CASE("Missing keys keep defaults") {
        Configuration config = Configuration::loadFromJsonString(R"({"unit": 20.0})");
        CHECK(config.unit == 20.0);
        CHECK(config.vertexTolerance == 8.0);
        CHECK(config.minVertexSeparation == 3.0);
    }

    TEST_CASE("Snap angle in degrees") {
        Configuration config = Configuration::loadFromJsonString(R"({"rotationSnapDegrees": 45})");
        CHECK(config.rotationSnap == doctest::Approx(glm::quarter_pi<double>()));
    }

    TEST_CASE("Snap angle in radians wins over degrees") {
        Configuration config = Configuration::loadFromJsonString(
            R"({"rotationSnapDegrees": 45, "rotationSnap": 0.5})");
        CHECK(config.rotationSnap == doctest::Approx(0.5));
    }

    TEST_CASE("Malformed JSON falls back to defaults") {
        Configuration config = Configuration::loadFromJsonString("{ unit: ");
        CHECK(config.unit == 50.0);
    }

    TEST_CASE("Wrong value type falls back to defaults") {
        Configuration config = Configuration::loadFromJsonString(R"({"unit": "large"})");
        CHECK(config.unit == 50.0);
    }

    TEST_CASE("Invalid values fall back to defaults") {
        Configuration config = Configuration::loadFromJsonString(R"({"unit": -5.0, "vertexTolerance": 1.0})");
        CHECK(config.unit == 50.0);
        CHECK(config.vertexTolerance == 8.0);
    }

    TEST_CASE("Missing file falls back to defaults") {
        Configuration config = Configuration::loadFromJson("/nonexistent/tangram_config.json");
        CHECK(config.unit == 50.0);
    }

    TEST_CASE("toJsonString reloads to the same values") {
        Configuration original;
        original.unit = 12.5;
        original.vertexTolerance = 0.25;
        original.minVertexSeparation = 0.5;
        original.rotationSnap = 0.1;

        Configuration reloaded = Configuration::loadFromJsonString(original.toJsonString());
        CHECK(reloaded.unit == original.unit);
        CHECK(reloaded.vertexTolerance == original.vertexTolerance);
        CHECK(reloaded.minVertexSeparation == original.minVertexSeparation);
        CHECK(reloaded.rotationSnap == original.rotationSnap);
    }

    TEST_CASE("isValid") {
        Configuration config;
        config.rotationSnap = 0.0;
        CHECK_FALSE(config.isValid());

        config = Configuration{};
        config.vertexTolerance = -1.0;
        CHECK_FALSE(config.isValid());
    }
}
