#pragma once

#include "detector/crossing_detector.h"
#include "geometry/geometry.h"
#include "state/entities.h"
#include "state/snapshot.h"
#include <cstdint>
#include <map>
#include <string>
#include <unordered_map>
#include <vector>

namespace zc {

/**
 * @brief Settings shared by every camera's state
 */
struct CameraStateOptions {
    ReferenceSpace space{1300.0f, 720.0f};
    size_t historyCapacity = 500;
    bool syntheticExitOnTimeout = false;
};

/**
 * @brief Outcome of an idle-track sweep on one camera
 */
struct EvictionResult {
    size_t evictedTracks = 0;
    bool occupancyChanged = false;           ///< Some zone's inside_ids changed
    std::vector<CrossingEvent> syntheticExits;
};

/**
 * @brief Authoritative zone/line state of one camera
 *
 * Owns zone and line definitions, counters, history and per-track crossing
 * state. Not thread-safe: every call must go through the camera's exclusive
 * mutation path (CameraChannel).
 */
class CameraState {
public:
    CameraState(const std::string& cameraId, const CameraStateOptions& options);

    const std::string& getCameraId() const { return cameraId_; }

    /**
     * @brief Create a zone or replace the geometry of an existing one
     *
     * Counters and history are kept on replacement; inside_ids is recomputed
     * from the last known track positions without emitting events.
     * A newly created zone starts with empty inside_ids: a track already
     * standing in it is added, with an ENTER, on its next sample.
     *
     * @return true if the zone was created, false if it was replaced
     * @throws ValidationError on an empty name or invalid rectangle
     */
    bool defineZone(const std::string& name, const Point& topLeft, const Point& bottomRight);

    /**
     * @brief Create a line or replace the geometry of an existing one
     *
     * Counters and history are kept; every track re-establishes its side
     * baseline on its next sample.
     *
     * @return true if the line was created, false if it was replaced
     * @throws ValidationError on an empty name or invalid segment
     */
    bool defineLine(const std::string& name, const Point& start, const Point& end);

    /**
     * @brief Zero a zone's counters and forget who is inside
     *
     * Geometry and history are untouched.
     *
     * @throws UnknownEntityError if the zone does not exist
     */
    void resetZone(const std::string& name);

    /**
     * @brief Zero a line's counters; geometry and history are untouched
     *
     * @throws UnknownEntityError if the line does not exist
     */
    void resetLine(const std::string& name);

    /// @throws UnknownEntityError if the zone does not exist
    void deleteZone(const std::string& name);

    /// @throws UnknownEntityError if the line does not exist
    void deleteLine(const std::string& name);

    /**
     * @brief Apply one track sample
     *
     * Runs the crossing detector, then applies counters, inside_ids and
     * history for every event.
     *
     * @return Events produced by the sample
     * @throws TransientIngestError if the position is outside the reference space
     */
    std::vector<CrossingEvent> ingest(const TrackSample& sample);

    /**
     * @brief Drop crossing state of tracks not seen for longer than idleTimeoutMs
     *
     * @param now Current time on the camera's sample clock (milliseconds)
     * @param idleTimeoutMs Idle period after which a track is gone
     */
    EvictionResult evictIdleTracks(int64_t now, int64_t idleTimeoutMs);

    CameraSnapshot snapshot() const;

    /// @throws UnknownEntityError if the zone does not exist
    ZoneSnapshot zoneSnapshot(const std::string& name) const;

    /// @throws UnknownEntityError if the line does not exist
    LineSnapshot lineSnapshot(const std::string& name) const;

    /**
     * @brief Combined history of all zones and lines, filtered
     */
    HistoryPage history(const HistoryQuery& query) const;

    bool hasZone(const std::string& name) const { return zones_.count(name) > 0; }
    bool hasLine(const std::string& name) const { return lines_.count(name) > 0; }
    size_t trackCount() const { return tracks_.size(); }
    uint64_t getVersion() const { return version_; }

    /**
     * @brief Newest sample timestamp seen on this camera, 0 before the first sample
     */
    int64_t latestSampleTimestamp() const { return latestSampleTimestamp_; }

private:
    void applyEvent(const CrossingEvent& event);
    void appendHistory(HistoryLog& log, int trackId, HistoryAction action, int64_t timestamp);
    void requireName(const std::string& name, const char* what) const;

    std::string cameraId_;
    CameraStateOptions options_;
    CrossingDetector detector_;

    std::map<std::string, ZoneRecord> zones_;
    std::map<std::string, LineRecord> lines_;
    std::unordered_map<int, TrackState> tracks_;

    uint64_t nextSequence_;
    uint64_t version_;
    int64_t latestSampleTimestamp_;
};

} // namespace zc
