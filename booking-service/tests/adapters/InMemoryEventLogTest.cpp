/**
 * @file InMemoryEventLogTest.cpp
 * @brief Unit tests for InMemoryEventLog
 */

#include <gtest/gtest.h>
#include "adapters/secondary/persistence/InMemoryEventLog.hpp"
#include <atomic>
#include <thread>

using namespace booking;
using namespace booking::adapters::secondary;

namespace {

domain::EventDraft draft(const std::string& type, const std::string& commandId = "") {
    domain::EventDraft d;
    d.eventType = type;
    d.payload = {{"note", type}};
    d.commandId = commandId;
    return d;
}

} // namespace

class InMemoryEventLogTest : public ::testing::Test {
protected:
    InMemoryEventLog log_;
};

// ============================================================================
// APPEND
// ============================================================================

TEST_F(InMemoryEventLogTest, Append_AssignsConsecutiveVersions) {
    auto first = log_.append("agg-1", 0, {draft("A"), draft("B")});
    auto second = log_.append("agg-1", 2, {draft("C", "cmd-7")});

    ASSERT_EQ(first.size(), 2u);
    EXPECT_EQ(first[0].version, 1);
    EXPECT_EQ(first[1].version, 2);
    ASSERT_EQ(second.size(), 1u);
    EXPECT_EQ(second[0].version, 3);
    EXPECT_EQ(second[0].commandId, "cmd-7");
    EXPECT_EQ(second[0].aggregateId, "agg-1");
    EXPECT_NE(first[0].eventId, first[1].eventId);
    EXPECT_EQ(log_.currentVersion("agg-1"), 3);
}

TEST_F(InMemoryEventLogTest, Append_StaleVersionConflictsAndLeavesLogUnchanged) {
    log_.append("agg-1", 0, {draft("A")});

    try {
        log_.append("agg-1", 0, {draft("B"), draft("C")});
        FAIL() << "Expected ConcurrencyConflictError";
    } catch (const domain::ConcurrencyConflictError& e) {
        EXPECT_EQ(e.aggregateId(), "agg-1");
        EXPECT_EQ(e.expectedVersion(), 0);
        EXPECT_EQ(e.actualVersion(), 1);
        EXPECT_TRUE(e.isRetryable());
    }

    EXPECT_EQ(log_.count(), 1);
    EXPECT_EQ(log_.currentVersion("agg-1"), 1);
    EXPECT_EQ(log_.read("agg-1", 1).size(), 1u);
}

TEST_F(InMemoryEventLogTest, Append_FutureVersionConflicts) {
    EXPECT_THROW(log_.append("agg-1", 5, {draft("A")}), domain::ConcurrencyConflictError);
    EXPECT_EQ(log_.count(), 0);
}

TEST_F(InMemoryEventLogTest, Append_TimestampsNonDecreasingWithinAggregate) {
    log_.append("agg-1", 0, {draft("A"), draft("B"), draft("C")});
    log_.append("agg-1", 3, {draft("D")});

    auto events = log_.read("agg-1", 1);
    for (size_t i = 1; i < events.size(); ++i) {
        EXPECT_GE(events[i].timestamp, events[i - 1].timestamp);
    }
}

// ============================================================================
// READ
// ============================================================================

TEST_F(InMemoryEventLogTest, Read_UnknownAggregateIsEmpty) {
    EXPECT_TRUE(log_.read("missing", 1).empty());
    EXPECT_EQ(log_.currentVersion("missing"), 0);
}

TEST_F(InMemoryEventLogTest, Read_FromVersion) {
    log_.append("agg-1", 0, {draft("A"), draft("B"), draft("C")});

    auto tail = log_.read("agg-1", 2);
    ASSERT_EQ(tail.size(), 2u);
    EXPECT_EQ(tail[0].eventType, "B");
    EXPECT_EQ(tail[1].eventType, "C");
}

TEST_F(InMemoryEventLogTest, ReadAll_GlobalOrderAndResumableOffset) {
    log_.append("agg-1", 0, {draft("A1")});
    log_.append("agg-2", 0, {draft("B1")});
    log_.append("agg-1", 1, {draft("A2")});

    auto all = log_.readAll(1, 0);
    ASSERT_EQ(all.size(), 3u);
    EXPECT_EQ(all[0].position, 1);
    EXPECT_EQ(all[1].position, 2);
    EXPECT_EQ(all[2].position, 3);
    EXPECT_EQ(all[1].aggregateId, "agg-2");

    auto page = log_.readAll(1, 2);
    ASSERT_EQ(page.size(), 2u);
    auto rest = log_.readAll(page.back().position + 1, 2);
    ASSERT_EQ(rest.size(), 1u);
    EXPECT_EQ(rest[0].eventType, "A2");

    EXPECT_TRUE(log_.readAll(4, 0).empty());
}

// ============================================================================
// CONCURRENCY
// ============================================================================

TEST_F(InMemoryEventLogTest, ConcurrentAppends_DifferentAggregates_NoGaps) {
    const int THREADS = 8;
    const int EVENTS_PER_THREAD = 50;

    std::vector<std::thread> threads;
    for (int t = 0; t < THREADS; ++t) {
        threads.emplace_back([this, t]() {
            std::string aggregateId = "agg-" + std::to_string(t);
            for (int i = 0; i < EVENTS_PER_THREAD; ++i) {
                log_.append(aggregateId, i, {draft("E")});
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    auto all = log_.readAll(1, 0);
    ASSERT_EQ(all.size(), static_cast<size_t>(THREADS * EVENTS_PER_THREAD));
    for (size_t i = 0; i < all.size(); ++i) {
        EXPECT_EQ(all[i].position, static_cast<int64_t>(i + 1));
    }
    for (int t = 0; t < THREADS; ++t) {
        EXPECT_EQ(log_.currentVersion("agg-" + std::to_string(t)), EVENTS_PER_THREAD);
    }
}

TEST_F(InMemoryEventLogTest, ConcurrentAppends_SameVersion_ExactlyOneWins) {
    log_.append("agg-1", 0, {draft("A")});

    std::atomic<int> wins{0};
    std::atomic<int> conflicts{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < 6; ++t) {
        threads.emplace_back([this, &wins, &conflicts]() {
            try {
                log_.append("agg-1", 1, {draft("B")});
                ++wins;
            } catch (const domain::ConcurrencyConflictError&) {
                ++conflicts;
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(wins, 1);
    EXPECT_EQ(conflicts, 5);
    EXPECT_EQ(log_.currentVersion("agg-1"), 2);
}
