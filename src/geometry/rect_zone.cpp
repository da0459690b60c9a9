#include "geometry/rect_zone.h"
#include "errors.h"

namespace zc {

RectZone::RectZone(const Point& topLeft, const Point& bottomRight, const ReferenceSpace& space)
    : topLeft_(topLeft), bottomRight_(bottomRight) {
    space.requireInside(topLeft, "top_left");
    space.requireInside(bottomRight, "bottom_right");

    if (topLeft.x >= bottomRight.x || topLeft.y >= bottomRight.y) {
        throw ValidationError("Zone rectangle must have top_left strictly above and left of bottom_right");
    }
}

} // namespace zc
