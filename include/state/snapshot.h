#pragma once

#include "geometry/geometry.h"
#include "state/history_log.h"
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace zc {

/**
 * @brief Point-in-time copy of a zone
 */
struct ZoneSnapshot {
    Point topLeft;
    Point bottomRight;
    int inCount = 0;
    int outCount = 0;
    std::vector<int> insideIds;          ///< Ascending track ids
    std::vector<HistoryEntry> history;   ///< Newest first
};

/**
 * @brief Point-in-time copy of a line
 */
struct LineSnapshot {
    Point start;
    Point end;
    int inCount = 0;
    int outCount = 0;
    std::vector<HistoryEntry> history;   ///< Newest first
};

/**
 * @brief Immutable copy of one camera's full zone/line state
 *
 * version increases by one with every state change of the camera, so two
 * snapshots of the same camera can be ordered.
 */
struct CameraSnapshot {
    std::string cameraId;
    uint64_t version = 0;
    std::map<std::string, ZoneSnapshot> zones;
    std::map<std::string, LineSnapshot> lines;
};

enum class EntityKind {
    ZONE,
    LINE
};

std::string entityKindToString(EntityKind kind);

/**
 * @brief History entry tagged with the zone or line it belongs to
 */
struct HistoryRecord {
    EntityKind kind;
    std::string entityName;
    HistoryEntry entry;
};

/**
 * @brief Filter for combined history queries
 *
 * Unset fields match everything.
 */
struct HistoryQuery {
    uint64_t afterSequence = 0;             ///< Cursor: only entries with a larger sequence
    std::optional<int64_t> since;           ///< Only entries with timestamp >= since
    std::optional<std::string> entityName;
    std::optional<EntityKind> kind;
    std::optional<HistoryAction> action;
    std::optional<int> trackId;
    size_t limit = 0;                       ///< 0 for no limit; keeps the oldest matches
};

/**
 * @brief Result of a combined history query, sorted by (timestamp, sequence)
 */
struct HistoryPage {
    std::vector<HistoryRecord> records;
    uint64_t nextCursor = 0;   ///< Highest sequence returned, or the input cursor
};

} // namespace zc
