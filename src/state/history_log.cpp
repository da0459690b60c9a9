#include "state/history_log.h"
#include <algorithm>
#include <cctype>

namespace zc {

std::string historyActionToString(HistoryAction action) {
    switch (action) {
        case HistoryAction::ENTER: return "ENTER";
        case HistoryAction::EXIT: return "EXIT";
        case HistoryAction::IN: return "IN";
        case HistoryAction::OUT: return "OUT";
        default: return "UNKNOWN";
    }
}

bool historyActionFromString(const std::string& name, HistoryAction& action) {
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper == "ENTER") { action = HistoryAction::ENTER; return true; }
    if (upper == "EXIT") { action = HistoryAction::EXIT; return true; }
    if (upper == "IN") { action = HistoryAction::IN; return true; }
    if (upper == "OUT") { action = HistoryAction::OUT; return true; }
    return false;
}

HistoryLog::HistoryLog(size_t capacity)
    : capacity_(std::max<size_t>(1, capacity)),
      evicted_(0) {
}

void HistoryLog::append(const HistoryEntry& entry) {
    entries_.push_back(entry);
    while (entries_.size() > capacity_) {
        entries_.pop_front();
        evicted_++;
    }
}

std::vector<HistoryEntry> HistoryLog::newestFirst(size_t limit) const {
    size_t count = entries_.size();
    if (limit > 0 && limit < count) {
        count = limit;
    }

    std::vector<HistoryEntry> result;
    result.reserve(count);
    for (auto it = entries_.rbegin(); it != entries_.rend() && result.size() < count; ++it) {
        result.push_back(*it);
    }
    return result;
}

} // namespace zc
