#include <gtest/gtest.h>
#include "state/history_log.h"

using namespace zc;

namespace {

HistoryEntry entry(int trackId, HistoryAction action, int64_t timestamp, uint64_t sequence) {
    HistoryEntry e;
    e.trackId = trackId;
    e.action = action;
    e.timestamp = timestamp;
    e.sequence = sequence;
    return e;
}

} // namespace

TEST(HistoryLogTest, EvictsOldestPastCapacity) {
    HistoryLog log(3);
    for (int i = 1; i <= 5; ++i) {
        log.append(entry(i, HistoryAction::ENTER, i * 10, static_cast<uint64_t>(i)));
    }

    EXPECT_EQ(log.size(), 3u);
    EXPECT_EQ(log.evictedCount(), 2u);
    EXPECT_EQ(log.entries().front().trackId, 3);
    EXPECT_EQ(log.entries().back().trackId, 5);
}

TEST(HistoryLogTest, NewestFirstKeepsAppendOrderForEqualTimestamps) {
    HistoryLog log(10);
    log.append(entry(1, HistoryAction::ENTER, 100, 1));
    log.append(entry(2, HistoryAction::ENTER, 100, 2));
    log.append(entry(1, HistoryAction::EXIT, 100, 3));

    auto all = log.newestFirst();
    ASSERT_EQ(all.size(), 3u);
    EXPECT_EQ(all[0].sequence, 3u);
    EXPECT_EQ(all[1].sequence, 2u);
    EXPECT_EQ(all[2].sequence, 1u);

    auto limited = log.newestFirst(2);
    ASSERT_EQ(limited.size(), 2u);
    EXPECT_EQ(limited[0].action, HistoryAction::EXIT);
}

TEST(HistoryLogTest, CapacityIsAtLeastOne) {
    HistoryLog log(0);
    EXPECT_EQ(log.capacity(), 1u);

    log.append(entry(1, HistoryAction::IN, 1, 1));
    log.append(entry(2, HistoryAction::OUT, 2, 2));
    ASSERT_EQ(log.size(), 1u);
    EXPECT_EQ(log.entries().front().trackId, 2);
}

TEST(HistoryLogTest, ActionNames) {
    HistoryAction action;
    ASSERT_TRUE(historyActionFromString("exit", action));
    EXPECT_EQ(action, HistoryAction::EXIT);
    ASSERT_TRUE(historyActionFromString("In", action));
    EXPECT_EQ(action, HistoryAction::IN);
    EXPECT_FALSE(historyActionFromString("LEAVE", action));

    EXPECT_EQ(historyActionToString(HistoryAction::OUT), "OUT");
    EXPECT_EQ(historyActionToString(HistoryAction::ENTER), "ENTER");
}
