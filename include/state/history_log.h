#pragma once

#include <cstdint>
#include <cstddef>
#include <deque>
#include <string>
#include <vector>

namespace zc {

/**
 * @brief Actions recorded in zone and line history
 *
 * ENTER/EXIT belong to zones, IN/OUT to lines.
 */
enum class HistoryAction {
    ENTER,
    EXIT,
    IN,
    OUT
};

std::string historyActionToString(HistoryAction action);

/**
 * @brief Parse an action name ("ENTER", "EXIT", "IN", "OUT"), case-insensitive
 *
 * @return true if the name is a known action
 */
bool historyActionFromString(const std::string& name, HistoryAction& action);

/**
 * @brief One immutable history record
 */
struct HistoryEntry {
    int trackId;
    HistoryAction action;
    int64_t timestamp;   ///< Sample timestamp in milliseconds
    uint64_t sequence;   ///< Per-camera append sequence, tiebreak for equal timestamps
};

/**
 * @brief Bounded append-only log of history entries
 *
 * Once capacity is reached every append evicts the oldest entry. Remaining
 * entries keep their insertion order.
 */
class HistoryLog {
public:
    /**
     * @param capacity Maximum number of retained entries, at least 1
     */
    explicit HistoryLog(size_t capacity);

    /**
     * @brief Append an entry, evicting the oldest one when full
     */
    void append(const HistoryEntry& entry);

    /**
     * @brief Entries newest first
     *
     * @param limit Maximum number of entries to return, 0 for all
     */
    std::vector<HistoryEntry> newestFirst(size_t limit = 0) const;

    /**
     * @brief Entries in insertion order (oldest first)
     */
    const std::deque<HistoryEntry>& entries() const { return entries_; }

    size_t size() const { return entries_.size(); }
    size_t capacity() const { return capacity_; }

    /**
     * @brief Number of entries dropped by eviction over the log's lifetime
     */
    uint64_t evictedCount() const { return evicted_; }

private:
    std::deque<HistoryEntry> entries_;
    size_t capacity_;
    uint64_t evicted_;
};

} // namespace zc
