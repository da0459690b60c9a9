#pragma once

#include <cmath>
#include <string>

namespace zc {

/**
 * @brief Point in the reference coordinate space
 */
struct Point {
    float x;
    float y;

    Point() : x(0), y(0) {}
    Point(float x, float y) : x(x), y(y) {}

    bool operator==(const Point& other) const { return x == other.x && y == other.y; }
    bool operator!=(const Point& other) const { return !(*this == other); }
};

/**
 * @brief Directed segment used for side-of-line tests
 */
struct Vector {
    Point start;
    Point end;

    Vector() : start(0, 0), end(0, 0) {}
    Vector(const Point& start, const Point& end) : start(start), end(end) {}

    float Magnitude() const {
        float dx = end.x - start.x;
        float dy = end.y - start.y;
        return std::sqrt(dx*dx + dy*dy);
    }

    /**
     * @brief Cross product (point - start) x (end - start)
     *
     * Positive for points above a left-to-right segment when y grows downward.
     */
    float CrossProduct(const Point& point) const {
        return (point.x - start.x) * (end.y - start.y) - (point.y - start.y) * (end.x - start.x);
    }
};

/**
 * @brief Axis-aligned bounding box as delivered by a tracker
 */
struct BoundingBox {
    float x1;
    float y1;
    float x2;
    float y2;
};

/**
 * @brief Anchor used to reduce a bounding box to a single point
 */
enum class Position {
    TOP_LEFT,
    TOP_RIGHT,
    BOTTOM_LEFT,
    BOTTOM_RIGHT,
    CENTER,
    TOP_CENTER,
    BOTTOM_CENTER,
    CENTER_LEFT,
    CENTER_RIGHT
};

/**
 * @brief Parse an anchor name, e.g. "BOTTOM_CENTER"
 *
 * @param posStr Anchor name
 * @param pos Receives the parsed anchor
 * @return true if the name is a known anchor
 */
bool StringToPosition(const std::string& posStr, Position& pos);

/**
 * @brief Convert Position enum to string
 */
std::string PositionToString(Position pos);

/**
 * @brief Anchor point of a bounding box
 */
Point anchorPoint(const BoundingBox& bbox, Position anchor);

/**
 * @brief The fixed logical coordinate system all geometry is expressed in
 *
 * Positions and definitions outside [0, width] x [0, height] are invalid.
 */
class ReferenceSpace {
public:
    ReferenceSpace(float width, float height);

    float width() const { return width_; }
    float height() const { return height_; }

    /**
     * @brief Check that a point is finite and inside the space (bounds inclusive)
     */
    bool contains(const Point& p) const;

    /**
     * @brief Throw ValidationError if the point is outside the space
     *
     * @param p Point to check
     * @param what Name of the point used in the error message
     */
    void requireInside(const Point& p, const std::string& what) const;

private:
    float width_;
    float height_;
};

} // namespace zc
