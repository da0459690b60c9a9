#pragma once

#include "detector/crossing_detector.h"
#include "geometry/geometry.h"
#include <nlohmann/json.hpp>
#include <vector>

namespace zc {

/**
 * @brief Converts inbound detection JSON into track samples
 *
 * Accepted shapes:
 *   {"camera_id"?, "track_id", "x", "y", "timestamp"}
 *   {"camera_id"?, "track_id", "bbox": [x1, y1, x2, y2], "timestamp"}
 * A bounding box is reduced to one point by the configured anchor.
 */
class SampleAdapter {
public:
    explicit SampleAdapter(Position anchor = Position::BOTTOM_CENTER);

    /**
     * @brief Parse one sample
     *
     * @throws TransientIngestError on a malformed sample
     */
    TrackSample parse(const nlohmann::json& json) const;

    /**
     * @brief Parse a single sample object or an array of samples
     *
     * Malformed entries of an array are skipped and counted in `rejected`.
     *
     * @throws TransientIngestError if the body is neither an object nor an array
     */
    std::vector<TrackSample> parseBatch(const nlohmann::json& json, size_t& rejected) const;

private:
    Position anchor_;
};

} // namespace zc
