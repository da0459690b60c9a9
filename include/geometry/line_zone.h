#pragma once

#include "geometry/geometry.h"

namespace zc {

/**
 * @brief Direction of a line crossing
 */
enum class CrossingDirection {
    NONE,
    IN,   ///< positive side -> negative side
    OUT   ///< negative side -> positive side
};

/**
 * @brief Directed line geometry for crossing detection
 *
 * The side of a point is the sign of (p - start) x (end - start). With image
 * coordinates (y down) and a line drawn left to right, points above the line
 * are on the positive side, so walking downward across it is IN.
 */
class LineZone {
public:
    /**
     * @brief Construct and validate a line
     *
     * @param start Line start point
     * @param end Line end point
     * @param space Reference space both endpoints must lie in
     * @throws ValidationError if an endpoint is outside the space or the
     *         endpoints coincide
     */
    LineZone(const Point& start, const Point& end, const ReferenceSpace& space);

    const Point& start() const { return line_.start; }
    const Point& end() const { return line_.end; }

    /**
     * @brief Side of the line a point lies on
     *
     * @return +1, -1, or 0 when the point is exactly on the (infinite) line
     */
    int sideOf(const Point& p) const;

    /**
     * @brief Classify a change of side between two consecutive samples
     *
     * Zero sides never produce a crossing.
     */
    static CrossingDirection classify(int previousSide, int currentSide);

private:
    Vector line_;
};

} // namespace zc
