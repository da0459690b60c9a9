#pragma once

#include "geometry/rect_zone.h"
#include "geometry/line_zone.h"
#include "state/history_log.h"
#include <set>

namespace zc {

/**
 * @brief Live state of a zone, owned by its CameraState
 */
struct ZoneRecord {
    RectZone geometry;
    int inCount;
    int outCount;
    std::set<int> insideIds;
    HistoryLog history;

    ZoneRecord(const RectZone& geometry, size_t historyCapacity)
        : geometry(geometry), inCount(0), outCount(0), history(historyCapacity) {}
};

/**
 * @brief Live state of a line, owned by its CameraState
 */
struct LineRecord {
    LineZone geometry;
    int inCount;
    int outCount;
    HistoryLog history;

    LineRecord(const LineZone& geometry, size_t historyCapacity)
        : geometry(geometry), inCount(0), outCount(0), history(historyCapacity) {}
};

} // namespace zc
