#include "adapters/sample_adapter.h"
#include "errors.h"
#include "logger.h"
#include <cmath>
#include <limits>

namespace zc {

namespace {

float number(const nlohmann::json& json, const char* field) {
    if (!json.contains(field) || !json[field].is_number()) {
        throw TransientIngestError(std::string("Sample field '") + field + "' must be a number");
    }
    double value = json[field].get<double>();
    if (!std::isfinite(value)) {
        throw TransientIngestError(std::string("Sample field '") + field + "' must be finite");
    }
    return static_cast<float>(value);
}

} // namespace

SampleAdapter::SampleAdapter(Position anchor)
    : anchor_(anchor) {
}

TrackSample SampleAdapter::parse(const nlohmann::json& json) const {
    if (!json.is_object()) {
        throw TransientIngestError("Sample must be a JSON object");
    }

    TrackSample sample;

    if (json.contains("camera_id") && !json["camera_id"].is_null()) {
        if (!json["camera_id"].is_string()) {
            throw TransientIngestError("Sample field 'camera_id' must be a string");
        }
        sample.cameraId = json["camera_id"].get<std::string>();
    }

    if (!json.contains("track_id") || !json["track_id"].is_number_integer()) {
        throw TransientIngestError("Sample field 'track_id' must be an integer");
    }
    const auto& trackId = json["track_id"];
    bool inRange = trackId.is_number_unsigned()
        ? trackId.get<uint64_t>() <= static_cast<uint64_t>(std::numeric_limits<int>::max())
        : trackId.get<int64_t>() >= std::numeric_limits<int>::min() &&
          trackId.get<int64_t>() <= std::numeric_limits<int>::max();
    if (!inRange) {
        throw TransientIngestError("Sample field 'track_id' is out of range: " + trackId.dump());
    }
    sample.trackId = trackId.get<int>();

    if (!json.contains("timestamp") || !json["timestamp"].is_number_integer()) {
        throw TransientIngestError("Sample field 'timestamp' must be an integer (milliseconds)");
    }
    sample.timestamp = json["timestamp"].get<int64_t>();

    if (json.contains("bbox")) {
        const auto& bbox = json["bbox"];
        if (!bbox.is_array() || bbox.size() != 4) {
            throw TransientIngestError("Sample field 'bbox' must be [x1, y1, x2, y2]");
        }
        BoundingBox box;
        float values[4];
        for (size_t i = 0; i < 4; ++i) {
            if (!bbox[i].is_number() || !std::isfinite(bbox[i].get<double>())) {
                throw TransientIngestError("Sample field 'bbox' must hold finite numbers");
            }
            values[i] = bbox[i].get<float>();
        }
        box.x1 = values[0];
        box.y1 = values[1];
        box.x2 = values[2];
        box.y2 = values[3];
        sample.position = anchorPoint(box, anchor_);
    } else {
        sample.position = Point(number(json, "x"), number(json, "y"));
    }

    return sample;
}

std::vector<TrackSample> SampleAdapter::parseBatch(const nlohmann::json& json, size_t& rejected) const {
    std::vector<TrackSample> samples;
    rejected = 0;

    if (json.is_object()) {
        samples.push_back(parse(json));
        return samples;
    }

    if (!json.is_array()) {
        throw TransientIngestError("Samples must be an object or an array of objects");
    }

    for (const auto& item : json) {
        try {
            samples.push_back(parse(item));
        } catch (const TransientIngestError& e) {
            rejected++;
            LOG_WARN("SampleAdapter", std::string("Dropped malformed sample: ") + e.what());
        }
    }

    return samples;
}

} // namespace zc
