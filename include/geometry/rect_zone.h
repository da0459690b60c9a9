#pragma once

#include "geometry/geometry.h"

namespace zc {

/**
 * @brief Axis-aligned rectangular zone geometry
 *
 * Stored in the reference space. The rectangle is closed: points on the
 * border are inside.
 */
class RectZone {
public:
    /**
     * @brief Construct and validate a rectangle
     *
     * @param topLeft Top-left corner
     * @param bottomRight Bottom-right corner
     * @param space Reference space both corners must lie in
     * @throws ValidationError if a corner is outside the space or the
     *         rectangle has zero or negative width or height
     */
    RectZone(const Point& topLeft, const Point& bottomRight, const ReferenceSpace& space);

    const Point& topLeft() const { return topLeft_; }
    const Point& bottomRight() const { return bottomRight_; }

    bool contains(const Point& p) const {
        return p.x >= topLeft_.x && p.x <= bottomRight_.x &&
               p.y >= topLeft_.y && p.y <= bottomRight_.y;
    }

private:
    Point topLeft_;
    Point bottomRight_;
};

} // namespace zc
