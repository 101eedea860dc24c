/**
 * @file ConcurrencyTest.cpp
 * @brief Concurrent commands against one and many aggregates
 */

#include <gtest/gtest.h>
#include "BookingTestContext.hpp"
#include "../mocks/GatedEventLog.hpp"
#include <atomic>
#include <thread>

using namespace booking;
using namespace booking::tests;

class ConcurrencyTest : public ::testing::Test {
protected:
    BookingTestContext ctx_;

    void SetUp() override {
        ctx_.mockProvider->setOffer("OFR-1", 250.0, 9);
        ctx_.build();
    }

    /**
     * @brief Второй стек поверх того же журнала, где append ждёт двух участников
     */
    BookingTestContext gatedContext() {
        BookingTestContext gated;
        gated.eventLog = std::make_shared<GatedEventLog>(ctx_.eventLog, 2);
        gated.repository = ctx_.repository;
        gated.mockProvider = ctx_.mockProvider;
        gated.provider = ctx_.provider;
        gated.build();
        return gated;
    }
};

TEST_F(ConcurrencyTest, TwoCancels_ExactlyOneWins) {
    auto created = ctx_.commands->bookFlight(flightCommand());
    auto gated = gatedContext();

    std::atomic<int> accepted{0};
    std::atomic<int> conflicts{0};
    auto cancel = [&]() {
        try {
            auto result = gated.commands->cancelBooking(cancelCommand(created.bookingId));
            if (result.accepted()) ++accepted;
        } catch (const domain::ConcurrencyConflictError&) {
            ++conflicts;
        }
    };

    std::thread t1(cancel);
    std::thread t2(cancel);
    t1.join();
    t2.join();

    EXPECT_EQ(accepted, 1);
    EXPECT_EQ(conflicts, 1);
    EXPECT_EQ(ctx_.eventLog->currentVersion(created.aggregateId), 2);

    auto row = ctx_.queries->getBooking(created.bookingId);
    ASSERT_TRUE(row.has_value());
    EXPECT_EQ(row->status, domain::BookingStatus::CANCELLED);
    EXPECT_EQ(row->lastVersion, 2);
}

TEST_F(ConcurrencyTest, SameCommandIdTwice_OneEventBothSucceed) {
    auto gated = gatedContext();
    auto command = flightCommand();
    command.commandId = "cmd-42";

    domain::CommandResult results[2];
    std::thread t1([&]() { results[0] = gated.commands->bookFlight(command); });
    std::thread t2([&]() { results[1] = gated.commands->bookFlight(command); });
    t1.join();
    t2.join();

    EXPECT_EQ(ctx_.eventLog->count(), 1);
    EXPECT_TRUE(results[0].accepted());
    EXPECT_TRUE(results[1].accepted());
    EXPECT_EQ(results[0].bookingId, results[1].bookingId);
    EXPECT_EQ(results[0].aggregateId, "agg-cmd-42");
    EXPECT_NE(results[0].duplicate, results[1].duplicate);
}

TEST_F(ConcurrencyTest, ManyAggregatesInParallel) {
    const int THREADS = 8;
    const int BOOKINGS_PER_THREAD = 10;

    std::atomic<int> accepted{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < THREADS; ++t) {
        threads.emplace_back([this, t, &accepted]() {
            for (int i = 0; i < BOOKINGS_PER_THREAD; ++i) {
                auto created = ctx_.commands->bookFlight(flightCommand("OFR-1", "user-" + std::to_string(t)));
                auto cancelled = ctx_.commands->cancelBooking(cancelCommand(created.bookingId));
                if (created.accepted() && cancelled.accepted()) ++accepted;
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(accepted, THREADS * BOOKINGS_PER_THREAD);
    EXPECT_EQ(ctx_.eventLog->count(), THREADS * BOOKINGS_PER_THREAD * 2);
    EXPECT_EQ(ctx_.repository->count(), THREADS * BOOKINGS_PER_THREAD);
    for (const auto& row : ctx_.repository->findAll()) {
        EXPECT_EQ(row.status, domain::BookingStatus::CANCELLED);
        EXPECT_EQ(row.lastVersion, 2);
    }
}
