#include "adapters/command_adapter.h"
#include "adapters/json_codec.h"
#include "errors.h"
#include "logger.h"
#include <initializer_list>

namespace zc {

namespace {

std::string requireString(const nlohmann::json& payload, std::initializer_list<const char*> keys) {
    for (const char* key : keys) {
        if (payload.contains(key) && payload[key].is_string()) {
            return payload[key].get<std::string>();
        }
    }
    throw ValidationError(std::string("Missing required key: ") + *keys.begin());
}

std::string optionalString(const nlohmann::json& payload, const char* key) {
    if (payload.contains(key) && payload[key].is_string()) {
        return payload[key].get<std::string>();
    }
    return "";
}

const nlohmann::json& requireField(const nlohmann::json& payload, const char* key) {
    if (!payload.contains(key)) {
        throw ValidationError(std::string("Missing required key: ") + key);
    }
    return payload[key];
}

nlohmann::json reply(const std::string& command) {
    nlohmann::json json;
    json["command"] = command;
    json["status"] = "success";
    json["error"] = nullptr;
    return json;
}

nlohmann::json failure(const std::string& command, ErrorCode code, const std::string& message) {
    nlohmann::json json;
    json["command"] = command;
    json["status"] = "failed";
    json["error"] = message;
    json["code"] = errorCodeToString(code);
    return json;
}

nlohmann::json fromMutation(const std::string& command, const MutationResult& result) {
    if (!result.success) {
        return failure(command, result.code, result.message);
    }

    nlohmann::json response = reply(command);
    if (result.snapshot) {
        response["data"] = json_codec::cameraSnapshotToJson(*result.snapshot);
    }
    return response;
}

} // namespace

CommandAdapter::CommandAdapter(SessionCoordinator& coordinator, const SampleAdapter& samples)
    : coordinator_(coordinator),
      samples_(samples) {
}

nlohmann::json CommandAdapter::handleText(const std::string& text, const SubscriptionPtr& requester) {
    nlohmann::json command;
    try {
        command = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        LOG_WARN("CommandAdapter", std::string("Could not decode command JSON: ") + e.what());
        return failure("", ErrorCode::VALIDATION, "Could not decode JSON from command message");
    }
    return handle(command, requester);
}

nlohmann::json CommandAdapter::handle(const nlohmann::json& command, const SubscriptionPtr& requester) {
    if (!command.is_object() || !command.contains("command") || !command["command"].is_string()) {
        return failure("", ErrorCode::VALIDATION, "Command must be an object with a 'command' string");
    }

    const std::string name = command["command"].get<std::string>();
    const nlohmann::json& payload =
        (command.contains("payload") && command["payload"].is_object()) ? command["payload"] : command;

    try {
        return dispatch(name, payload, requester);
    } catch (const CounterError& e) {
        LOG_WARN("CommandAdapter", "Command '" + name + "' failed: " + e.what());
        return failure(name, e.code(), e.what());
    } catch (const nlohmann::json::exception& e) {
        LOG_WARN("CommandAdapter", "Command '" + name + "' has malformed fields: " + e.what());
        return failure(name, ErrorCode::VALIDATION, std::string("Malformed command: ") + e.what());
    }
}

nlohmann::json CommandAdapter::dispatch(const std::string& name, const nlohmann::json& payload,
                                        const SubscriptionPtr& requester) {
    if (name == "define_zone" || name == "set_zone") {
        std::string cameraId = requireString(payload, {"camera_id"});
        std::string zone = requireString(payload, {"zone", "name"});
        Point topLeft = json_codec::pointFromJson(requireField(payload, "top_left"), "top_left");
        Point bottomRight = json_codec::pointFromJson(requireField(payload, "bottom_right"), "bottom_right");
        return fromMutation(name, coordinator_.defineZone(cameraId, zone, topLeft, bottomRight, requester));
    }

    if (name == "define_line" || name == "set_line") {
        std::string cameraId = requireString(payload, {"camera_id"});
        std::string line = requireString(payload, {"line", "line_name", "name"});
        Point start = json_codec::pointFromJson(requireField(payload, "start"), "start");
        Point end = json_codec::pointFromJson(requireField(payload, "end"), "end");
        return fromMutation(name, coordinator_.defineLine(cameraId, line, start, end, requester));
    }

    if (name == "reset_zone" || name == "reset_zone_counts") {
        std::string cameraId = requireString(payload, {"camera_id"});
        std::string zone = requireString(payload, {"zone", "name"});
        return fromMutation(name, coordinator_.resetZone(cameraId, zone, requester));
    }

    if (name == "reset_line" || name == "reset_line_counts") {
        std::string cameraId = requireString(payload, {"camera_id"});
        std::string line = requireString(payload, {"line", "line_name", "name"});
        return fromMutation(name, coordinator_.resetLine(cameraId, line, requester));
    }

    if (name == "delete_zone") {
        std::string cameraId = requireString(payload, {"camera_id"});
        std::string zone = requireString(payload, {"zone", "name"});
        return fromMutation(name, coordinator_.deleteZone(cameraId, zone, requester));
    }

    if (name == "delete_line") {
        std::string cameraId = requireString(payload, {"camera_id"});
        std::string line = requireString(payload, {"line", "line_name", "name"});
        return fromMutation(name, coordinator_.deleteLine(cameraId, line, requester));
    }

    if (name == "set_active_camera") {
        coordinator_.setActiveCamera(requireString(payload, {"camera_id"}));
        nlohmann::json response = reply(name);
        response["data"] = json_codec::cameraListingToJson(coordinator_.listCameras());
        return response;
    }

    if (name == "register_camera") {
        bool added = coordinator_.registerCamera(requireString(payload, {"camera_id"}));
        nlohmann::json response = reply(name);
        response["created"] = added;
        response["data"] = json_codec::cameraListingToJson(coordinator_.listCameras());
        return response;
    }

    if (name == "list_cameras" || name == "get_active_cameras") {
        nlohmann::json response = reply(name);
        response["data"] = json_codec::cameraListingToJson(coordinator_.listCameras());
        return response;
    }

    if (name == "view_camera") {
        if (!requester) {
            throw ValidationError("view_camera needs a subscription");
        }
        coordinator_.setViewedCamera(requester, optionalString(payload, "camera_id"));
        return reply(name);
    }

    if (name == "get_current_data") {
        if (!requester) {
            throw ValidationError("get_current_data needs a subscription");
        }
        std::string cameraId = optionalString(payload, "camera_id");
        if (!coordinator_.sendCurrentData(requester, cameraId)) {
            throw UnknownEntityError("Unknown camera: " + cameraId);
        }
        return reply(name);
    }

    if (name == "ingest") {
        const nlohmann::json& body = payload.contains("samples") ? payload["samples"] : requireField(payload, "sample");
        size_t rejected = 0;
        std::vector<TrackSample> samples = samples_.parseBatch(body, rejected);

        size_t accepted = 0;
        size_t events = 0;
        for (const auto& sample : samples) {
            IngestResult result = coordinator_.ingest(sample);
            if (result.accepted) {
                accepted++;
                events += result.events;
            } else {
                rejected++;
            }
        }

        nlohmann::json response = reply(name);
        response["accepted"] = accepted;
        response["rejected"] = rejected;
        response["events"] = events;
        return response;
    }

    throw ValidationError("Unknown command: " + name);
}

} // namespace zc
