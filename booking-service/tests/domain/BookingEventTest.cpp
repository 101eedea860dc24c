/**
 * @file BookingEventTest.cpp
 * @brief Unit tests for event payload encoding, decoding and upcasting
 */

#include <gtest/gtest.h>
#include "domain/events/BookingEvent.hpp"
#include "domain/errors/BookingErrors.hpp"

using namespace booking;
using namespace booking::domain;

TEST(BookingEventTest, ToDraft_CarriesTypeSchemaAndCommandId) {
    BookingCancelled cancelled;
    cancelled.reason = "sick";
    cancelled.refundAmount = Money(120, 500000000, "EUR");

    auto draft = toDraft(cancelled, "cmd-42");

    EXPECT_EQ(draft.eventType, "BookingCancelled");
    EXPECT_EQ(draft.schemaVersion, BookingCancelled::SCHEMA_VERSION);
    EXPECT_EQ(draft.commandId, "cmd-42");
    EXPECT_EQ(draft.payload["reason"], "sick");
    EXPECT_EQ(draft.payload["refund_amount"]["units"], 120);
    EXPECT_EQ(draft.payload["refund_amount"]["nano"], 500000000);
}

TEST(BookingEventTest, EventTypeOf_MatchesAlternative) {
    EXPECT_EQ(eventTypeOf(BookingConfirmed{}), "BookingConfirmed");
    EXPECT_EQ(eventTypeOf(BookingAmended{}), "BookingAmended");
    EXPECT_EQ(eventTypeOf(BookingCancelled{}), "BookingCancelled");
}

TEST(BookingEventTest, Decode_ConfirmedV2) {
    BookingConfirmed original;
    original.bookingId = "bkg-1";
    original.bookingType = BookingType::HOTEL;
    original.offerId = "HTL-1";
    original.userId = "user-1";
    original.hotelName = "Grand Hotel";
    original.hotelCity = "Rome";
    original.checkIn = "2099-07-01";
    original.checkOut = "2099-07-05";
    original.price = Money(480, 250000000, "EUR");
    original.adults = 2;

    Event event;
    auto draft = toDraft(original);
    event.eventType = draft.eventType;
    event.schemaVersion = draft.schemaVersion;
    event.payload = draft.payload;

    auto decoded = std::get<BookingConfirmed>(decodeEvent(event));
    EXPECT_EQ(decoded.bookingId, "bkg-1");
    EXPECT_EQ(decoded.bookingType, BookingType::HOTEL);
    EXPECT_EQ(decoded.hotelName, "Grand Hotel");
    EXPECT_EQ(decoded.checkOut, "2099-07-05");
    EXPECT_EQ(decoded.price, Money(480, 250000000, "EUR"));
    EXPECT_EQ(decoded.adults, 2);
}

TEST(BookingEventTest, Decode_ConfirmedV1_UpcastsDecimalPrice) {
    Event event;
    event.eventType = "BookingConfirmed";
    event.schemaVersion = 1;
    event.payload = {
        {"booking_id", "bkg-legacy"},
        {"booking_type", "FLIGHT"},
        {"offer_id", "PAR-LON-20990601-3"},
        {"user_id", "user-1"},
        {"departure", "Paris"},
        {"destination", "London"},
        {"depart_date", "2099-06-01"},
        {"price", 312.5},
        {"currency", "EUR"},
        {"adults", 1}
    };

    auto decoded = std::get<BookingConfirmed>(decodeEvent(event));
    EXPECT_EQ(decoded.bookingId, "bkg-legacy");
    EXPECT_EQ(decoded.price, Money(312, 500000000, "EUR"));
}

TEST(BookingEventTest, Decode_AmendedKeepsAbsentFieldsEmpty) {
    BookingAmended amended;
    amended.checkOut = std::string("2099-07-06");
    amended.reason = "late checkout";

    Event event;
    auto draft = toDraft(amended);
    event.eventType = draft.eventType;
    event.payload = draft.payload;

    EXPECT_FALSE(draft.payload.contains("check_in"));

    auto decoded = std::get<BookingAmended>(decodeEvent(event));
    ASSERT_TRUE(decoded.checkOut.has_value());
    EXPECT_EQ(*decoded.checkOut, "2099-07-06");
    EXPECT_FALSE(decoded.checkIn.has_value());
    EXPECT_FALSE(decoded.adults.has_value());
    EXPECT_EQ(decoded.reason, "late checkout");
}

TEST(BookingEventTest, Decode_UnknownTypeThrows) {
    Event event;
    event.eventType = "BookingTeleported";

    try {
        decodeEvent(event);
        FAIL() << "Expected UnknownEventTypeError";
    } catch (const UnknownEventTypeError& e) {
        EXPECT_EQ(e.eventType(), "BookingTeleported");
        EXPECT_EQ(e.kind(), ErrorKind::UNKNOWN_EVENT_TYPE);
    }
}

TEST(BookingEventTest, Money_FromDoubleRoundsToNano) {
    EXPECT_EQ(Money::fromDouble(250.0), Money(250, 0, "EUR"));
    EXPECT_EQ(Money::fromDouble(19.99).units, 19);
    EXPECT_EQ(Money::fromDouble(19.99).nano, 990000000);
    EXPECT_NE(Money(1, 0, "EUR"), Money(1, 0, "USD"));
}
