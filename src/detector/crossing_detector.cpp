#include "detector/crossing_detector.h"

namespace zc {

std::vector<CrossingEvent> CrossingDetector::process(const TrackSample& sample,
                                                     const std::map<std::string, ZoneRecord>& zones,
                                                     const std::map<std::string, LineRecord>& lines,
                                                     TrackState& state) const {
    std::vector<CrossingEvent> events;
    const Point& position = sample.position;

    for (const auto& [name, zone] : zones) {
        bool wasInside = state.zones.count(name) > 0;
        bool isInside = zone.geometry.contains(position);

        if (isInside == wasInside) {
            continue;
        }

        CrossingEvent event;
        event.kind = EntityKind::ZONE;
        event.entityName = name;
        event.trackId = sample.trackId;
        event.timestamp = sample.timestamp;

        if (isInside) {
            event.action = HistoryAction::ENTER;
            state.zones.insert(name);
        } else {
            event.action = HistoryAction::EXIT;
            state.zones.erase(name);
        }
        events.push_back(event);
    }

    for (const auto& [name, line] : lines) {
        int side = line.geometry.sideOf(position);
        if (side == 0) {
            // On the line: keep the last known side
            continue;
        }

        auto it = state.lineSides.find(name);
        if (it == state.lineSides.end()) {
            // First observation is the baseline
            state.lineSides.emplace(name, side);
            continue;
        }

        CrossingDirection direction = LineZone::classify(it->second, side);
        it->second = side;

        if (direction == CrossingDirection::NONE) {
            continue;
        }

        CrossingEvent event;
        event.kind = EntityKind::LINE;
        event.entityName = name;
        event.trackId = sample.trackId;
        event.action = direction == CrossingDirection::IN ? HistoryAction::IN : HistoryAction::OUT;
        event.timestamp = sample.timestamp;
        events.push_back(event);
    }

    state.lastPosition = position;
    state.lastSeen = sample.timestamp;

    return events;
}

} // namespace zc
