#pragma once

#include "geometry/geometry.h"
#include "state/entities.h"
#include "state/snapshot.h"
#include <cstdint>
#include <map>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace zc {

/**
 * @brief Position report of one tracked object on one camera
 *
 * An empty cameraId routes the sample to the active camera.
 */
struct TrackSample {
    std::string cameraId;
    int trackId = 0;
    Point position;
    int64_t timestamp = 0;   ///< Milliseconds
};

/**
 * @brief Zone or line transition derived from a sample
 */
struct CrossingEvent {
    EntityKind kind;
    std::string entityName;
    int trackId;
    HistoryAction action;
    int64_t timestamp;
};

/**
 * @brief Per camera + track memory needed to detect transitions
 */
struct TrackState {
    Point lastPosition;
    int64_t lastSeen = 0;
    std::unordered_set<std::string> zones;              ///< Zones the track is counted inside
    std::unordered_map<std::string, int> lineSides;     ///< Last non-zero side per line
};

/**
 * @brief Turns track samples into ENTER/EXIT and IN/OUT events
 *
 * Stateless: all memory lives in the TrackState passed in, which the
 * detector updates in place. Counters and history are applied by the caller.
 */
class CrossingDetector {
public:
    /**
     * @brief Evaluate one sample against every zone and line of a camera
     *
     * Zone events come first (in zone name order), then line events (in line
     * name order). Every event carries the sample timestamp.
     *
     * @param sample The new sample
     * @param zones Zones of the camera
     * @param lines Lines of the camera
     * @param state Crossing state of the track, updated in place
     * @return Events produced by this sample
     */
    std::vector<CrossingEvent> process(const TrackSample& sample,
                                       const std::map<std::string, ZoneRecord>& zones,
                                       const std::map<std::string, LineRecord>& lines,
                                       TrackState& state) const;
};

} // namespace zc
