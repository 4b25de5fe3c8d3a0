#include "tangram/geom/GeometryError.h"

namespace tangram {
namespace geom {

const char* geometryErrorName(GeometryError error) {
    switch (error) {
        case GeometryError::None: return "None";
        case GeometryError::InvalidShape: return "InvalidShape";
        case GeometryError::DegenerateGeometry: return "DegenerateGeometry";
    }
    return "Unknown";
}

}  // namespace geom
}  // namespace tangram
