#include <doctest/doctest.h>
#include "tangram/geom/Collision.h"
#include "tangram/model/Piece.h"
#include <cmath>

using namespace tangram;
using namespace tangram::geom;
using namespace tangram::model;

TEST_SUITE("Collision pointInPolygon") {
    const std::vector<Point> square = {Point(0, 0), Point(2, 0), Point(2, 2), Point(0, 2)};

    TEST_CASE("Inside and outside the square") {
        CHECK(Collision::pointInPolygon(Point(1, 1), square));
        CHECK_FALSE(Collision::pointInPolygon(Point(3, 3), square));
        CHECK_FALSE(Collision::pointInPolygon(Point(-0.5, 1), square));
        CHECK_FALSE(Collision::pointInPolygon(Point(1, 2.5), square));
    }

    TEST_CASE("Winding does not matter") {
        std::vector<Point> cw(square.rbegin(), square.rend());
        CHECK(Collision::pointInPolygon(Point(1, 1), cw));
        CHECK_FALSE(Collision::pointInPolygon(Point(3, 1), cw));
    }

    TEST_CASE("Concave notch is outside") {
        // L shape with the top-right quadrant removed
        std::vector<Point> ell = {Point(0, 0), Point(4, 0), Point(4, 2), Point(2, 2), Point(2, 4), Point(0, 4)};
        CHECK(Collision::pointInPolygon(Point(1, 3), ell));
        CHECK(Collision::pointInPolygon(Point(3, 1), ell));
        CHECK_FALSE(Collision::pointInPolygon(Point(3, 3), ell));
    }

    TEST_CASE("Fewer than 3 vertices is never inside") {
        CHECK_FALSE(Collision::pointInPolygon(Point(0, 0), {}));
        CHECK_FALSE(Collision::pointInPolygon(Point(1, 0), {Point(0, 0), Point(2, 0)}));
    }
}

TEST_SUITE("Collision segmentDistance") {
    const Configuration config = Configuration::defaults();

    TEST_CASE("Perpendicular projection") {
        CHECK(Collision::segmentDistance(Point(5, 5), Point(0, 0), Point(10, 0), config) == doctest::Approx(5.0));
    }

    TEST_CASE("Clamped to the endpoints") {
        CHECK(Collision::segmentDistance(Point(15, 0), Point(0, 0), Point(10, 0), config) == doctest::Approx(5.0));
        CHECK(Collision::segmentDistance(Point(-3, -4), Point(0, 0), Point(10, 0), config) == doctest::Approx(5.0));
    }

    TEST_CASE("Short segments degrade to point distance") {
        // Length 2 is below the default 3.0 separation
        double d = Collision::segmentDistance(Point(1, 5), Point(0, 0), Point(2, 0), config);
        CHECK(d == doctest::Approx(std::sqrt(26.0)));

        Configuration tight;
        tight.minVertexSeparation = 0.0;
        CHECK(Collision::segmentDistance(Point(1, 5), Point(0, 0), Point(2, 0), tight) == doctest::Approx(5.0));
    }

    TEST_CASE("Zero-length segment") {
        Configuration tight;
        tight.minVertexSeparation = 0.0;
        CHECK(Collision::segmentDistance(Point(3, 4), Point(0, 0), Point(0, 0), tight) == doctest::Approx(5.0));
    }
}

TEST_SUITE("Collision boxes and circles") {
    const Configuration config = Configuration::defaults();

    TEST_CASE("boxesIntersect") {
        Rectangle a(0, 0, 10, 10);
        CHECK(Collision::boxesIntersect(a, Rectangle(5, 5, 10, 10)));
        CHECK(Collision::boxesIntersect(a, Rectangle(2, 2, 1, 1)));
        CHECK_FALSE(Collision::boxesIntersect(a, Rectangle(20, 0, 5, 5)));
        CHECK_FALSE(Collision::boxesIntersect(a, Rectangle(0, 11, 5, 5)));
    }

    TEST_CASE("Boxes sharing only an edge do not intersect") {
        CHECK_FALSE(Collision::boxesIntersect(Rectangle(0, 0, 10, 10), Rectangle(10, 0, 5, 5)));
    }

    TEST_CASE("Circle centered inside") {
        std::vector<Point> square = {Point(0, 0), Point(100, 0), Point(100, 100), Point(0, 100)};
        CHECK(Collision::circleIntersectsPolygon(Point(50, 50), 1.0, square, config));
    }

    TEST_CASE("Circle reaching an edge from outside") {
        std::vector<Point> square = {Point(0, 0), Point(100, 0), Point(100, 100), Point(0, 100)};
        CHECK(Collision::circleIntersectsPolygon(Point(50, -10), 10.0, square, config));
        CHECK(Collision::circleIntersectsPolygon(Point(110, 110), 15.0, square, config));
        CHECK_FALSE(Collision::circleIntersectsPolygon(Point(50, -10), 9.0, square, config));
        CHECK_FALSE(Collision::circleIntersectsPolygon(Point(110, 110), 14.0, square, config));
    }
}

TEST_SUITE("Collision piecesNearPoint") {
    TEST_CASE("Filters by distance to piece position") {
        std::vector<Piece> pieces = {
            Piece(ShapeKind::LargeTriangleA, Point(0, 0), 0.0, PieceColor::Red, 50.0),
            Piece(ShapeKind::Square, Point(100, 0), 0.0, PieceColor::Blue, 50.0),
            Piece(ShapeKind::SmallTriangleA, Point(30, 40), 0.0, PieceColor::Green, 50.0)
        };

        auto near = Collision::piecesNearPoint(pieces, Point(0, 0), 50.0);
        REQUIRE(near.size() == 2);
        CHECK(near[0] == &pieces[0]);
        CHECK(near[1] == &pieces[2]);
    }

    TEST_CASE("Outline does not count, only position") {
        // The large triangle's outline reaches (100, 0) but its anchor is 100 away
        std::vector<Piece> pieces = {
            Piece(ShapeKind::LargeTriangleA, Point(0, 0), 0.0, PieceColor::Red, 50.0)
        };
        CHECK(Collision::piecesNearPoint(pieces, Point(100, 0), 10.0).empty());
    }

    TEST_CASE("Empty input") {
        CHECK(Collision::piecesNearPoint({}, Point(0, 0), 100.0).empty());
    }
}
