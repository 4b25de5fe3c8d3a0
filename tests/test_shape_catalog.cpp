#include <doctest/doctest.h>
#include "tangram/geom/PolygonMath.h"
#include "tangram/model/ShapeKind.h"
#include <cmath>

using namespace tangram;
using namespace tangram::geom;
using namespace tangram::model;

TEST_SUITE("ShapeCatalog vertices") {
    TEST_CASE("Vertex counts") {
        CHECK(ShapeCatalog::vertexCount(ShapeKind::LargeTriangleA) == 3);
        CHECK(ShapeCatalog::vertexCount(ShapeKind::MediumTriangle) == 3);
        CHECK(ShapeCatalog::vertexCount(ShapeKind::SmallTriangleB) == 3);
        CHECK(ShapeCatalog::vertexCount(ShapeKind::LargeTriangleB) == 3);
        CHECK(ShapeCatalog::vertexCount(ShapeKind::SmallTriangleA) == 3);
        CHECK(ShapeCatalog::vertexCount(ShapeKind::Square) == 4);
        CHECK(ShapeCatalog::vertexCount(ShapeKind::Parallelogram) == 4);

        for (ShapeKind kind : ShapeCatalog::allKinds()) {
            CHECK(ShapeCatalog::localVertices(kind, 1.0).size() == ShapeCatalog::vertexCount(kind));
        }
    }

    TEST_CASE("Large triangle has its right angle at the origin") {
        auto v = ShapeCatalog::localVertices(ShapeKind::LargeTriangleB, 50.0);
        REQUIRE(v.size() == 3);
        CHECK(v[0].matches(Point(0, 0), 1e-12));
        CHECK(v[1].matches(Point(100, 0), 1e-12));
        CHECK(v[2].matches(Point(0, 100), 1e-12));
    }

    TEST_CASE("Square is a diamond around the origin") {
        double h = 50.0 * std::sqrt(2.0) / 2.0;
        auto v = ShapeCatalog::localVertices(ShapeKind::Square, 50.0);
        REQUIRE(v.size() == 4);
        CHECK(v[0].matches(Point(0, -h), 1e-9));
        CHECK(v[1].matches(Point(h, 0), 1e-9));
        CHECK(v[2].matches(Point(0, h), 1e-9));
        CHECK(v[3].matches(Point(-h, 0), 1e-9));

        // Side length equals the unit
        CHECK(v[0].distanceTo(v[1]) == doctest::Approx(50.0));
    }

    TEST_CASE("Parallelogram edges") {
        auto v = ShapeCatalog::localVertices(ShapeKind::Parallelogram, 1.0);
        REQUIRE(v.size() == 4);
        CHECK(v[0].distanceTo(v[1]) == doctest::Approx(std::sqrt(2.0)));
        CHECK(v[1].distanceTo(v[2]) == doctest::Approx(1.0));
        CHECK(v[2].distanceTo(v[3]) == doctest::Approx(std::sqrt(2.0)));
        CHECK(v[3].distanceTo(v[0]) == doctest::Approx(1.0));
    }

    TEST_CASE("All loops are counterclockwise") {
        for (ShapeKind kind : ShapeCatalog::allKinds()) {
            CHECK(PolygonMath::signedArea(ShapeCatalog::localVertices(kind, 10.0)) > 0.0);
        }
    }

    TEST_CASE("Generation is deterministic") {
        auto a = ShapeCatalog::localVertices(ShapeKind::MediumTriangle, 7.0);
        auto b = ShapeCatalog::localVertices(ShapeKind::MediumTriangle, 7.0);
        REQUIRE(a.size() == b.size());
        for (size_t i = 0; i < a.size(); ++i) {
            CHECK(a[i].matches(b[i], 0.0));
        }
    }
}

TEST_SUITE("ShapeCatalog areas") {
    TEST_CASE("Large triangle at unit 50") {
        CHECK(std::abs(ShapeCatalog::area(ShapeKind::LargeTriangleA, 50.0) - 5000.0) < 0.01);
    }

    TEST_CASE("Square at unit 50") {
        CHECK(std::abs(ShapeCatalog::area(ShapeKind::Square, 50.0) - 2500.0) < 0.01);
    }

    TEST_CASE("Remaining shapes at unit 50") {
        CHECK(ShapeCatalog::area(ShapeKind::MediumTriangle, 50.0) == doctest::Approx(2500.0));
        CHECK(ShapeCatalog::area(ShapeKind::SmallTriangleA, 50.0) == doctest::Approx(1250.0));
        CHECK(ShapeCatalog::area(ShapeKind::Parallelogram, 50.0) == doctest::Approx(2500.0));
    }

    TEST_CASE("Canonical set total") {
        CHECK(std::abs(ShapeCatalog::totalArea(1.0) - ShapeCatalog::CANONICAL_AREA_FACTOR) < 0.01);
        CHECK(ShapeCatalog::totalArea(50.0) == doctest::Approx(8.0 * 2500.0));
    }

    TEST_CASE("Large triangles cover half of the set") {
        double large = ShapeCatalog::area(ShapeKind::LargeTriangleA, 1.0) +
                       ShapeCatalog::area(ShapeKind::LargeTriangleB, 1.0);
        CHECK(large == doctest::Approx(ShapeCatalog::totalArea(1.0) / 2.0));
    }

    TEST_CASE("frameSize") {
        glm::dvec2 square = ShapeCatalog::frameSize(ShapeKind::Square, 50.0);
        CHECK(square.x == doctest::Approx(50.0 * std::sqrt(2.0)));
        CHECK(square.y == doctest::Approx(50.0 * std::sqrt(2.0)));

        glm::dvec2 large = ShapeCatalog::frameSize(ShapeKind::LargeTriangleA, 50.0);
        CHECK(large.x == doctest::Approx(100.0));
        CHECK(large.y == doctest::Approx(100.0));
    }
}

TEST_SUITE("ShapeCatalog validation") {
    TEST_CASE("Every shape validates with the default configuration") {
        Configuration config = Configuration::defaults();
        for (ShapeKind kind : ShapeCatalog::allKinds()) {
            ValidationResult result = ShapeCatalog::validate(kind, config);
            CHECK_MESSAGE(result.ok(), result.message);
        }
    }

    TEST_CASE("Catalog validates at several scales") {
        for (double unit : {0.5, 1.0, 50.0, 1000.0}) {
            Configuration config;
            config.unit = unit;
            CHECK(ShapeCatalog::validateCatalog(config).ok());
        }
    }

    TEST_CASE("Zero unit is rejected as InvalidShape") {
        Configuration config;
        config.unit = 0.0;
        ValidationResult result = ShapeCatalog::validate(ShapeKind::Square, config);
        CHECK_FALSE(result.ok());
        CHECK(result.error == GeometryError::InvalidShape);
        CHECK_FALSE(ShapeCatalog::validateCatalog(config).ok());
    }

    TEST_CASE("canonicalSet") {
        auto set = ShapeCatalog::canonicalSet(Configuration::defaults());
        REQUIRE(set.size() == ShapeCatalog::KIND_COUNT);
        CHECK(set[5].size() == 4);
        CHECK(set[0].size() == 3);
    }
}

TEST_SUITE("ShapeCatalog names") {
    TEST_CASE("Persisted names round trip") {
        for (ShapeKind kind : ShapeCatalog::allKinds()) {
            auto parsed = ShapeCatalog::fromString(ShapeCatalog::toString(kind));
            REQUIRE(parsed.has_value());
            CHECK(*parsed == kind);
        }
        CHECK(std::string(ShapeCatalog::toString(ShapeKind::SmallTriangleB)) == "small_triangle_2");
    }

    TEST_CASE("Unknown name") {
        CHECK_FALSE(ShapeCatalog::fromString("triangle").has_value());
        CHECK_FALSE(ShapeCatalog::fromString("").has_value());
    }

    TEST_CASE("Display names") {
        CHECK(std::string(ShapeCatalog::displayName(ShapeKind::LargeTriangleA)) == "Large Triangle 1");
        CHECK(std::string(ShapeCatalog::displayName(ShapeKind::Parallelogram)) == "Parallelogram");
    }
}
