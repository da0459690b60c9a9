#pragma once

#include "errors.h"
#include "geometry/geometry.h"
#include "session/notification.h"
#include "session/session_coordinator.h"
#include "state/snapshot.h"
#include <nlohmann/json.hpp>
#include <string>

namespace zc {

/**
 * @brief JSON encoding of engine values
 *
 * Points are `[x, y]` arrays in the reference space. Field names are
 * snake_case on the wire.
 */
namespace json_codec {

nlohmann::json pointToJson(const Point& point);

/**
 * @brief Read a point from `[x, y]` or `{"x": .., "y": ..}`
 *
 * @param value JSON value
 * @param field Field name used in the error message
 * @throws ValidationError if the value is not a point of two finite numbers
 */
Point pointFromJson(const nlohmann::json& value, const std::string& field);

nlohmann::json historyEntryToJson(const HistoryEntry& entry);
nlohmann::json zoneSnapshotToJson(const ZoneSnapshot& zone);
nlohmann::json lineSnapshotToJson(const LineSnapshot& line);
nlohmann::json cameraSnapshotToJson(const CameraSnapshot& snapshot);

/**
 * @brief Zones of a snapshot keyed by name
 */
nlohmann::json zonesToJson(const CameraSnapshot& snapshot);

/**
 * @brief Line definitions of a snapshot keyed by name, without counts or history
 */
nlohmann::json lineDefinitionsToJson(const CameraSnapshot& snapshot);

nlohmann::json historyPageToJson(const HistoryPage& page);
nlohmann::json cameraListingToJson(const CameraListing& listing);
nlohmann::json notificationToJson(const Notification& notification);
nlohmann::json mutationResultToJson(const MutationResult& result);
nlohmann::json errorToJson(const CounterError& error);

} // namespace json_codec
} // namespace zc
