/**
 * @file BookingProjectorTest.cpp
 * @brief Unit tests for BookingProjector (pure fold)
 */

#include <gtest/gtest.h>
#include "domain/BookingProjector.hpp"
#include "domain/events/BookingEvent.hpp"
#include "domain/errors/BookingErrors.hpp"

using namespace booking;
using namespace booking::domain;

namespace {

Event makeEvent(const BookingEvent& body, int64_t version, int64_t micros,
                const std::string& aggregateId = "agg-1") {
    EventDraft draft = toDraft(body, "");
    Event event;
    event.eventId = "evt-" + std::to_string(version);
    event.aggregateId = aggregateId;
    event.eventType = draft.eventType;
    event.version = version;
    event.timestamp = Timestamp::fromUnixMicros(micros);
    event.schemaVersion = draft.schemaVersion;
    event.payload = draft.payload;
    event.position = version;
    return event;
}

BookingConfirmed confirmed() {
    BookingConfirmed e;
    e.bookingId = "bkg-1";
    e.bookingType = BookingType::FLIGHT;
    e.offerId = "OFR-1";
    e.userId = "user-1";
    e.userEmail = "user-1@example.com";
    e.departure = "Paris";
    e.destination = "London";
    e.departDate = "2099-06-01";
    e.returnDate = "2099-06-10";
    e.price = Money(250, 0, "EUR");
    e.adults = 2;
    return e;
}

BookingAmended amended() {
    BookingAmended e;
    e.departDate = std::string("2099-06-02");
    e.adults = 3;
    e.reason = "one more passenger";
    return e;
}

BookingCancelled cancelled() {
    BookingCancelled e;
    e.reason = "change of plans";
    e.refundAmount = Money(250, 0, "EUR");
    return e;
}

} // namespace

// ============================================================================
// СОЗДАНИЕ
// ============================================================================

TEST(BookingProjectorTest, Confirmed_CreatesRow) {
    auto event = makeEvent(confirmed(), 1, 1000);

    auto row = BookingProjector::apply(std::nullopt, event);

    EXPECT_EQ(row.bookingId, "bkg-1");
    EXPECT_EQ(row.aggregateId, "agg-1");
    EXPECT_EQ(row.status, BookingStatus::CONFIRMED);
    EXPECT_EQ(row.price, Money(250, 0, "EUR"));
    EXPECT_EQ(row.adults, 2);
    EXPECT_EQ(row.lastVersion, 1);
    EXPECT_EQ(row.lastEventId, "evt-1");
    EXPECT_EQ(row.createdAt, Timestamp::fromUnixMicros(1000));
    EXPECT_EQ(row.updatedAt, Timestamp::fromUnixMicros(1000));
    EXPECT_EQ(row.refundAmount, Money(0, 0, "EUR"));
}

TEST(BookingProjectorTest, DuplicateConfirmed_Fails) {
    auto row = BookingProjector::apply(std::nullopt, makeEvent(confirmed(), 1, 1000));

    EXPECT_THROW(BookingProjector::apply(row, makeEvent(confirmed(), 2, 2000)),
                 ProjectionFailureError);
}

TEST(BookingProjectorTest, StreamNotStartingWithCreation_Fails) {
    EXPECT_THROW(BookingProjector::apply(std::nullopt, makeEvent(cancelled(), 1, 1000)),
                 ProjectionFailureError);
}

// ============================================================================
// ИЗМЕНЕНИЕ И ОТМЕНА
// ============================================================================

TEST(BookingProjectorTest, Amended_ChangesOnlyPresentFields) {
    auto row = BookingProjector::apply(std::nullopt, makeEvent(confirmed(), 1, 1000));
    row = BookingProjector::apply(row, makeEvent(amended(), 2, 2000));

    EXPECT_EQ(row.departDate, "2099-06-02");
    EXPECT_EQ(row.returnDate, "2099-06-10");
    EXPECT_EQ(row.adults, 3);
    EXPECT_EQ(row.amendmentCount, 1);
    EXPECT_EQ(row.price, Money(250, 0, "EUR"));
    EXPECT_EQ(row.lastVersion, 2);
    EXPECT_EQ(row.createdAt, Timestamp::fromUnixMicros(1000));
    EXPECT_EQ(row.updatedAt, Timestamp::fromUnixMicros(2000));
}

TEST(BookingProjectorTest, Cancelled_SetsTerminalStatusAndRefund) {
    auto row = BookingProjector::apply(std::nullopt, makeEvent(confirmed(), 1, 1000));
    row = BookingProjector::apply(row, makeEvent(cancelled(), 2, 2000));

    EXPECT_EQ(row.status, BookingStatus::CANCELLED);
    EXPECT_EQ(row.cancellationReason, "change of plans");
    EXPECT_EQ(row.refundAmount, Money(250, 0, "EUR"));
    EXPECT_EQ(row.lastVersion, 2);
    EXPECT_EQ(row.lastEventId, "evt-2");
}

TEST(BookingProjectorTest, EventAfterCancellation_Fails) {
    auto row = BookingProjector::fold(std::nullopt, {
        makeEvent(confirmed(), 1, 1000),
        makeEvent(cancelled(), 2, 2000)
    });

    EXPECT_THROW(BookingProjector::apply(row, makeEvent(amended(), 3, 3000)),
                 ProjectionFailureError);
}

// ============================================================================
// ИДЕМПОТЕНТНОСТЬ И ПОРЯДОК
// ============================================================================

TEST(BookingProjectorTest, ReapplyingSameEvent_IsNoOp) {
    auto created = makeEvent(confirmed(), 1, 1000);
    auto amend = makeEvent(amended(), 2, 2000);

    auto once = BookingProjector::apply(BookingProjector::apply(std::nullopt, created), amend);
    auto twice = BookingProjector::apply(once, amend);
    auto stale = BookingProjector::apply(twice, created);

    EXPECT_EQ(once, twice);
    EXPECT_EQ(once, stale);
    EXPECT_EQ(twice.amendmentCount, 1);
}

TEST(BookingProjectorTest, VersionGap_Fails) {
    auto row = BookingProjector::apply(std::nullopt, makeEvent(confirmed(), 1, 1000));

    try {
        BookingProjector::apply(row, makeEvent(cancelled(), 3, 3000));
        FAIL() << "Expected ProjectionFailureError";
    } catch (const ProjectionFailureError& e) {
        EXPECT_EQ(e.aggregateId(), "agg-1");
        EXPECT_EQ(e.eventId(), "evt-3");
        EXPECT_EQ(e.kind(), ErrorKind::PROJECTION_FAILURE);
    }
}

TEST(BookingProjectorTest, UnknownEventType_Throws) {
    auto row = BookingProjector::apply(std::nullopt, makeEvent(confirmed(), 1, 1000));
    auto unknown = makeEvent(cancelled(), 2, 2000);
    unknown.eventType = "BookingTeleported";

    EXPECT_THROW(BookingProjector::apply(row, unknown), UnknownEventTypeError);
}

TEST(BookingProjectorTest, FoldEqualsIncrementalApplication) {
    std::vector<Event> events = {
        makeEvent(confirmed(), 1, 1000),
        makeEvent(amended(), 2, 2000),
        makeEvent(cancelled(), 3, 3000)
    };

    std::optional<BookingRow> incremental;
    for (const auto& e : events) {
        incremental = BookingProjector::apply(incremental, e);
    }
    auto folded = BookingProjector::fold(std::nullopt, events);

    ASSERT_TRUE(folded.has_value());
    EXPECT_EQ(*folded, *incremental);
}

TEST(BookingProjectorTest, FoldOfEmptyStream_KeepsCurrent) {
    EXPECT_FALSE(BookingProjector::fold(std::nullopt, {}).has_value());
}
