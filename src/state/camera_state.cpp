#include "state/camera_state.h"
#include "errors.h"
#include "logger.h"
#include <algorithm>
#include <sstream>

namespace zc {

std::string entityKindToString(EntityKind kind) {
    return kind == EntityKind::ZONE ? "zone" : "line";
}

CameraState::CameraState(const std::string& cameraId, const CameraStateOptions& options)
    : cameraId_(cameraId),
      options_(options),
      nextSequence_(1),
      version_(0),
      latestSampleTimestamp_(0) {
}

void CameraState::requireName(const std::string& name, const char* what) const {
    if (name.empty()) {
        throw ValidationError(std::string(what) + " name must not be empty");
    }
}

bool CameraState::defineZone(const std::string& name, const Point& topLeft, const Point& bottomRight) {
    requireName(name, "Zone");
    RectZone geometry(topLeft, bottomRight, options_.space);

    auto it = zones_.find(name);
    if (it == zones_.end()) {
        // A new zone starts empty; tracks already standing in it enter on their next sample
        zones_.emplace(name, ZoneRecord(geometry, options_.historyCapacity));
        version_++;
        LOG_INFO("CameraState", "Camera " + cameraId_ + ": created zone '" + name + "'");
        return true;
    }

    ZoneRecord& zone = it->second;
    zone.geometry = geometry;

    // Keep inside_ids equal to the tracks whose last position is in the new rectangle
    zone.insideIds.clear();
    for (auto& [trackId, track] : tracks_) {
        if (geometry.contains(track.lastPosition)) {
            zone.insideIds.insert(trackId);
            track.zones.insert(name);
        } else {
            track.zones.erase(name);
        }
    }

    version_++;
    LOG_INFO("CameraState", "Camera " + cameraId_ + ": replaced geometry of zone '" + name + "'");
    return false;
}

bool CameraState::defineLine(const std::string& name, const Point& start, const Point& end) {
    requireName(name, "Line");
    LineZone geometry(start, end, options_.space);

    for (auto& entry : tracks_) {
        entry.second.lineSides.erase(name);
    }

    auto it = lines_.find(name);
    if (it == lines_.end()) {
        lines_.emplace(name, LineRecord(geometry, options_.historyCapacity));
        version_++;
        LOG_INFO("CameraState", "Camera " + cameraId_ + ": created line '" + name + "'");
        return true;
    }

    it->second.geometry = geometry;
    version_++;
    LOG_INFO("CameraState", "Camera " + cameraId_ + ": replaced geometry of line '" + name + "'");
    return false;
}

void CameraState::resetZone(const std::string& name) {
    auto it = zones_.find(name);
    if (it == zones_.end()) {
        throw UnknownEntityError("Zone " + name + " in camera " + cameraId_ + " not found");
    }

    ZoneRecord& zone = it->second;
    for (int trackId : zone.insideIds) {
        auto track = tracks_.find(trackId);
        if (track != tracks_.end()) {
            track->second.zones.erase(name);
        }
    }
    zone.insideIds.clear();
    zone.inCount = 0;
    zone.outCount = 0;

    version_++;
    LOG_INFO("CameraState", "Camera " + cameraId_ + ": reset zone '" + name + "'");
}

void CameraState::resetLine(const std::string& name) {
    auto it = lines_.find(name);
    if (it == lines_.end()) {
        throw UnknownEntityError("Line " + name + " not found in camera " + cameraId_);
    }

    it->second.inCount = 0;
    it->second.outCount = 0;

    version_++;
    LOG_INFO("CameraState", "Camera " + cameraId_ + ": reset line '" + name + "'");
}

void CameraState::deleteZone(const std::string& name) {
    auto it = zones_.find(name);
    if (it == zones_.end()) {
        throw UnknownEntityError("Zone " + name + " in camera " + cameraId_ + " not found");
    }

    for (auto& entry : tracks_) {
        entry.second.zones.erase(name);
    }
    zones_.erase(it);

    version_++;
    LOG_INFO("CameraState", "Camera " + cameraId_ + ": deleted zone '" + name + "'");
}

void CameraState::deleteLine(const std::string& name) {
    auto it = lines_.find(name);
    if (it == lines_.end()) {
        throw UnknownEntityError("Line " + name + " not found in camera " + cameraId_);
    }

    for (auto& entry : tracks_) {
        entry.second.lineSides.erase(name);
    }
    lines_.erase(it);

    version_++;
    LOG_INFO("CameraState", "Camera " + cameraId_ + ": deleted line '" + name + "'");
}

std::vector<CrossingEvent> CameraState::ingest(const TrackSample& sample) {
    if (!options_.space.contains(sample.position)) {
        std::ostringstream msg;
        msg << "Sample for track " << sample.trackId << " at [" << sample.position.x << ", "
            << sample.position.y << "] is outside the reference space";
        throw TransientIngestError(msg.str());
    }

    TrackState& track = tracks_[sample.trackId];
    std::vector<CrossingEvent> events = detector_.process(sample, zones_, lines_, track);

    for (const auto& event : events) {
        applyEvent(event);
    }

    latestSampleTimestamp_ = std::max(latestSampleTimestamp_, sample.timestamp);

    if (!events.empty()) {
        version_++;
    }
    return events;
}

void CameraState::applyEvent(const CrossingEvent& event) {
    if (event.kind == EntityKind::ZONE) {
        ZoneRecord& zone = zones_.at(event.entityName);
        if (event.action == HistoryAction::ENTER) {
            zone.inCount++;
            zone.insideIds.insert(event.trackId);
        } else {
            zone.outCount++;
            zone.insideIds.erase(event.trackId);
        }
        appendHistory(zone.history, event.trackId, event.action, event.timestamp);
    } else {
        LineRecord& line = lines_.at(event.entityName);
        if (event.action == HistoryAction::IN) {
            line.inCount++;
        } else {
            line.outCount++;
        }
        appendHistory(line.history, event.trackId, event.action, event.timestamp);
    }

    LOG_DEBUG("CameraState", "Camera " + cameraId_ + ": track " + std::to_string(event.trackId) + " " +
              historyActionToString(event.action) + " " + entityKindToString(event.kind) +
              " '" + event.entityName + "'");
}

void CameraState::appendHistory(HistoryLog& log, int trackId, HistoryAction action, int64_t timestamp) {
    HistoryEntry entry;
    entry.trackId = trackId;
    entry.action = action;
    entry.timestamp = timestamp;
    entry.sequence = nextSequence_++;
    log.append(entry);
}

EvictionResult CameraState::evictIdleTracks(int64_t now, int64_t idleTimeoutMs) {
    EvictionResult result;

    for (auto it = tracks_.begin(); it != tracks_.end();) {
        const TrackState& track = it->second;
        if (now - track.lastSeen <= idleTimeoutMs) {
            ++it;
            continue;
        }

        int trackId = it->first;
        for (const auto& zoneName : track.zones) {
            auto zone = zones_.find(zoneName);
            if (zone == zones_.end()) {
                continue;
            }
            zone->second.insideIds.erase(trackId);
            result.occupancyChanged = true;

            if (options_.syntheticExitOnTimeout) {
                CrossingEvent exitEvent;
                exitEvent.kind = EntityKind::ZONE;
                exitEvent.entityName = zoneName;
                exitEvent.trackId = trackId;
                exitEvent.action = HistoryAction::EXIT;
                exitEvent.timestamp = track.lastSeen;

                zone->second.outCount++;
                appendHistory(zone->second.history, trackId, HistoryAction::EXIT, track.lastSeen);
                result.syntheticExits.push_back(exitEvent);
            }
        }

        LOG_DEBUG("CameraState", "Camera " + cameraId_ + ": evicted idle track " + std::to_string(trackId));
        it = tracks_.erase(it);
        result.evictedTracks++;
    }

    if (result.occupancyChanged) {
        version_++;
    }
    return result;
}

ZoneSnapshot CameraState::zoneSnapshot(const std::string& name) const {
    auto it = zones_.find(name);
    if (it == zones_.end()) {
        throw UnknownEntityError("Zone " + name + " in camera " + cameraId_ + " not found");
    }

    const ZoneRecord& zone = it->second;
    ZoneSnapshot snap;
    snap.topLeft = zone.geometry.topLeft();
    snap.bottomRight = zone.geometry.bottomRight();
    snap.inCount = zone.inCount;
    snap.outCount = zone.outCount;
    snap.insideIds.assign(zone.insideIds.begin(), zone.insideIds.end());
    snap.history = zone.history.newestFirst();
    return snap;
}

LineSnapshot CameraState::lineSnapshot(const std::string& name) const {
    auto it = lines_.find(name);
    if (it == lines_.end()) {
        throw UnknownEntityError("Line " + name + " not found in camera " + cameraId_);
    }

    const LineRecord& line = it->second;
    LineSnapshot snap;
    snap.start = line.geometry.start();
    snap.end = line.geometry.end();
    snap.inCount = line.inCount;
    snap.outCount = line.outCount;
    snap.history = line.history.newestFirst();
    return snap;
}

CameraSnapshot CameraState::snapshot() const {
    CameraSnapshot snap;
    snap.cameraId = cameraId_;
    snap.version = version_;

    for (const auto& entry : zones_) {
        snap.zones.emplace(entry.first, zoneSnapshot(entry.first));
    }
    for (const auto& entry : lines_) {
        snap.lines.emplace(entry.first, lineSnapshot(entry.first));
    }
    return snap;
}

HistoryPage CameraState::history(const HistoryQuery& query) const {
    HistoryPage page;
    page.nextCursor = query.afterSequence;

    auto matches = [&query](EntityKind kind, const std::string& name, const HistoryEntry& entry) {
        if (entry.sequence <= query.afterSequence) return false;
        if (query.since && entry.timestamp < *query.since) return false;
        if (query.kind && *query.kind != kind) return false;
        if (query.entityName && *query.entityName != name) return false;
        if (query.action && *query.action != entry.action) return false;
        if (query.trackId && *query.trackId != entry.trackId) return false;
        return true;
    };

    for (const auto& [name, zone] : zones_) {
        for (const auto& entry : zone.history.entries()) {
            if (matches(EntityKind::ZONE, name, entry)) {
                page.records.push_back(HistoryRecord{EntityKind::ZONE, name, entry});
            }
        }
    }
    for (const auto& [name, line] : lines_) {
        for (const auto& entry : line.history.entries()) {
            if (matches(EntityKind::LINE, name, entry)) {
                page.records.push_back(HistoryRecord{EntityKind::LINE, name, entry});
            }
        }
    }

    // Truncate by append order so the cursor never skips an entry
    if (query.limit > 0 && page.records.size() > query.limit) {
        std::sort(page.records.begin(), page.records.end(),
                  [](const HistoryRecord& a, const HistoryRecord& b) {
                      return a.entry.sequence < b.entry.sequence;
                  });
        page.records.resize(query.limit);
    }

    std::sort(page.records.begin(), page.records.end(),
              [](const HistoryRecord& a, const HistoryRecord& b) {
                  if (a.entry.timestamp != b.entry.timestamp) {
                      return a.entry.timestamp < b.entry.timestamp;
                  }
                  return a.entry.sequence < b.entry.sequence;
              });

    for (const auto& record : page.records) {
        page.nextCursor = std::max(page.nextCursor, record.entry.sequence);
    }
    return page;
}

} // namespace zc
