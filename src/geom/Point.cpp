#include "tangram/geom/Point.h"
#include "tangram/utils/Log.h"

#include <glm/gtc/constants.hpp>
#include <cstdio>

namespace tangram {
namespace geom {

std::string Point::toString() const {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "Point(x: %.2f, y: %.2f)", x_, y_);
    return buf;
}

std::vector<Point> Point::regularPolygon(int sides, double radius, double startAngle) {
    if (sides < 3) {
        SDL_LogDebug(LOG_CATEGORY_GEOMETRY, "regularPolygon: sides must be >= 3, got %d", sides);
        return {};
    }

    double step = glm::two_pi<double>() / sides;
    std::vector<Point> result;
    result.reserve(sides);
    for (int i = 0; i < sides; ++i) {
        double angle = startAngle + i * step;
        result.emplace_back(radius * std::cos(angle), radius * std::sin(angle));
    }
    return result;
}

}  // namespace geom
}  // namespace tangram
