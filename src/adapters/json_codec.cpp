#include "adapters/json_codec.h"
#include <cmath>

namespace zc {
namespace json_codec {

namespace {

float coordinate(const nlohmann::json& value, const std::string& field) {
    if (!value.is_number()) {
        throw ValidationError(field + " coordinates must be numbers");
    }
    double number = value.get<double>();
    if (!std::isfinite(number)) {
        throw ValidationError(field + " coordinates must be finite");
    }
    return static_cast<float>(number);
}

} // namespace

nlohmann::json pointToJson(const Point& point) {
    return nlohmann::json::array({point.x, point.y});
}

Point pointFromJson(const nlohmann::json& value, const std::string& field) {
    if (value.is_array()) {
        if (value.size() != 2) {
            throw ValidationError(field + " must be [x, y]");
        }
        return Point(coordinate(value[0], field), coordinate(value[1], field));
    }

    if (value.is_object() && value.contains("x") && value.contains("y")) {
        return Point(coordinate(value["x"], field), coordinate(value["y"], field));
    }

    throw ValidationError(field + " must be [x, y]");
}

nlohmann::json historyEntryToJson(const HistoryEntry& entry) {
    nlohmann::json json;
    json["track_id"] = entry.trackId;
    json["action"] = historyActionToString(entry.action);
    json["timestamp"] = entry.timestamp;
    json["sequence"] = entry.sequence;
    return json;
}

static nlohmann::json historyToJson(const std::vector<HistoryEntry>& history) {
    nlohmann::json entries = nlohmann::json::array();
    for (const auto& entry : history) {
        entries.push_back(historyEntryToJson(entry));
    }
    return entries;
}

nlohmann::json zoneSnapshotToJson(const ZoneSnapshot& zone) {
    nlohmann::json json;
    json["top_left"] = pointToJson(zone.topLeft);
    json["bottom_right"] = pointToJson(zone.bottomRight);
    json["in_count"] = zone.inCount;
    json["out_count"] = zone.outCount;
    json["inside_ids"] = zone.insideIds;
    json["history"] = historyToJson(zone.history);
    return json;
}

nlohmann::json lineSnapshotToJson(const LineSnapshot& line) {
    nlohmann::json json;
    json["start"] = pointToJson(line.start);
    json["end"] = pointToJson(line.end);
    json["in_count"] = line.inCount;
    json["out_count"] = line.outCount;
    json["history"] = historyToJson(line.history);
    return json;
}

nlohmann::json zonesToJson(const CameraSnapshot& snapshot) {
    nlohmann::json zones = nlohmann::json::object();
    for (const auto& [name, zone] : snapshot.zones) {
        zones[name] = zoneSnapshotToJson(zone);
    }
    return zones;
}

nlohmann::json lineDefinitionsToJson(const CameraSnapshot& snapshot) {
    nlohmann::json lines = nlohmann::json::object();
    for (const auto& [name, line] : snapshot.lines) {
        lines[name] = {
            {"start", pointToJson(line.start)},
            {"end", pointToJson(line.end)}
        };
    }
    return lines;
}

nlohmann::json cameraSnapshotToJson(const CameraSnapshot& snapshot) {
    nlohmann::json json;
    json["camera_id"] = snapshot.cameraId;
    json["version"] = snapshot.version;
    json["zones"] = zonesToJson(snapshot);

    nlohmann::json lines = nlohmann::json::object();
    for (const auto& [name, line] : snapshot.lines) {
        lines[name] = lineSnapshotToJson(line);
    }
    json["lines"] = lines;
    return json;
}

nlohmann::json historyPageToJson(const HistoryPage& page) {
    nlohmann::json entries = nlohmann::json::array();
    for (const auto& record : page.records) {
        nlohmann::json entry = historyEntryToJson(record.entry);
        entry["kind"] = entityKindToString(record.kind);
        entry["name"] = record.entityName;
        entries.push_back(entry);
    }

    nlohmann::json json;
    json["entries"] = entries;
    json["next_cursor"] = page.nextCursor;
    return json;
}

nlohmann::json cameraListingToJson(const CameraListing& listing) {
    nlohmann::json json;
    json["cameras"] = listing.cameras;
    json["active_camera"] = listing.activeCamera.empty() ? nlohmann::json() : nlohmann::json(listing.activeCamera);
    return json;
}

nlohmann::json notificationToJson(const Notification& notification) {
    nlohmann::json json;
    json["event"] = notificationKindToString(notification.kind);
    json["sequence"] = notification.sequence;
    json["camera"] = notification.cameraId;
    json["active_camera"] = notification.activeCamera;

    if (notification.kind == NotificationKind::ERROR) {
        json["message"] = notification.message;
        json["code"] = errorCodeToString(notification.errorCode);
        return json;
    }

    if (!notification.entityName.empty()) {
        json["name"] = notification.entityName;
    }
    if (notification.snapshot) {
        json["data"] = cameraSnapshotToJson(*notification.snapshot);
    } else {
        json["data"] = nullptr;
    }
    if (!notification.cameras.empty() ||
        notification.kind == NotificationKind::INITIAL_DATA ||
        notification.kind == NotificationKind::CAMERA_CHANGED) {
        json["cameras"] = notification.cameras;
    }
    return json;
}

nlohmann::json mutationResultToJson(const MutationResult& result) {
    nlohmann::json json;
    json["success"] = result.success;
    if (result.success) {
        json["data"] = result.snapshot ? cameraSnapshotToJson(*result.snapshot) : nlohmann::json();
    } else {
        json["code"] = errorCodeToString(result.code);
        json["message"] = result.message;
    }
    return json;
}

nlohmann::json errorToJson(const CounterError& error) {
    nlohmann::json json;
    json["code"] = errorCodeToString(error.code());
    json["message"] = error.what();
    return json;
}

} // namespace json_codec
} // namespace zc
