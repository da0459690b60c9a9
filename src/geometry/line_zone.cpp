#include "geometry/line_zone.h"
#include "errors.h"

namespace zc {

LineZone::LineZone(const Point& start, const Point& end, const ReferenceSpace& space)
    : line_(start, end) {
    space.requireInside(start, "start");
    space.requireInside(end, "end");

    if (line_.Magnitude() == 0.0f) {
        throw ValidationError("Line start and end must be distinct points");
    }
}

int LineZone::sideOf(const Point& p) const {
    float crossProduct = line_.CrossProduct(p);
    if (crossProduct > 0.0f) {
        return 1;
    }
    if (crossProduct < 0.0f) {
        return -1;
    }
    return 0;
}

CrossingDirection LineZone::classify(int previousSide, int currentSide) {
    if (previousSide > 0 && currentSide < 0) {
        return CrossingDirection::IN;
    }
    if (previousSide < 0 && currentSide > 0) {
        return CrossingDirection::OUT;
    }
    return CrossingDirection::NONE;
}

} // namespace zc
