/**
 * @file CommandValidationTest.cpp
 * @brief Unit tests for command shape validation
 */

#include <gtest/gtest.h>
#include "domain/commands/BookFlightCommand.hpp"
#include "domain/commands/BookHotelCommand.hpp"
#include "domain/commands/AmendBookingCommand.hpp"
#include "domain/commands/CancelBookingCommand.hpp"

using namespace booking;
using namespace booking::domain;

namespace {

const std::string TODAY = "2030-01-15";

BookFlightCommand validFlight() {
    BookFlightCommand cmd;
    cmd.offerId = "OFR-1";
    cmd.userId = "user-1";
    cmd.departure = "Paris";
    cmd.destination = "London";
    cmd.departDate = "2030-02-01";
    cmd.returnDate = "2030-02-10";
    cmd.adults = 2;
    return cmd;
}

} // namespace

// ============================================================================
// ДАТЫ
// ============================================================================

TEST(CommandValidationTest, IsIsoDate) {
    EXPECT_TRUE(validation::isIsoDate("2030-02-01"));
    EXPECT_TRUE(validation::isIsoDate("2028-02-29"));
    EXPECT_FALSE(validation::isIsoDate("2030-02-29"));
    EXPECT_FALSE(validation::isIsoDate("2100-02-29"));
    EXPECT_FALSE(validation::isIsoDate("2030-13-01"));
    EXPECT_FALSE(validation::isIsoDate("2030-04-31"));
    EXPECT_FALSE(validation::isIsoDate("2030/02/01"));
    EXPECT_FALSE(validation::isIsoDate("30-02-01"));
    EXPECT_FALSE(validation::isIsoDate(""));
}

// ============================================================================
// ПЕРЕЛЁТ
// ============================================================================

TEST(CommandValidationTest, Flight_Valid) {
    EXPECT_NO_THROW(validFlight().validate(TODAY));
}

TEST(CommandValidationTest, Flight_OneWayIsValid) {
    auto cmd = validFlight();
    cmd.returnDate.clear();
    EXPECT_NO_THROW(cmd.validate(TODAY));
}

TEST(CommandValidationTest, Flight_DepartureTodayIsValid) {
    auto cmd = validFlight();
    cmd.departDate = TODAY;
    EXPECT_NO_THROW(cmd.validate(TODAY));
}

TEST(CommandValidationTest, Flight_RejectsPastDeparture) {
    auto cmd = validFlight();
    cmd.departDate = "2030-01-14";
    EXPECT_THROW(cmd.validate(TODAY), ValidationError);
}

TEST(CommandValidationTest, Flight_RejectsReturnBeforeDeparture) {
    auto cmd = validFlight();
    cmd.returnDate = "2030-02-01";
    EXPECT_THROW(cmd.validate(TODAY), ValidationError);
}

TEST(CommandValidationTest, Flight_RejectsAdultsOutOfRange) {
    auto cmd = validFlight();
    cmd.adults = 0;
    EXPECT_THROW(cmd.validate(TODAY), ValidationError);
    cmd.adults = 10;
    EXPECT_THROW(cmd.validate(TODAY), ValidationError);
    cmd.adults = 9;
    EXPECT_NO_THROW(cmd.validate(TODAY));
}

TEST(CommandValidationTest, Flight_RejectsShortAirport) {
    auto cmd = validFlight();
    cmd.destination = "L";
    EXPECT_THROW(cmd.validate(TODAY), ValidationError);
}

TEST(CommandValidationTest, Flight_RejectsMissingOffer) {
    auto cmd = validFlight();
    cmd.offerId.clear();
    EXPECT_THROW(cmd.validate(TODAY), ValidationError);
}

TEST(CommandValidationTest, Flight_RejectsNonPositiveExpectedPrice) {
    auto cmd = validFlight();
    cmd.expectedPrice = 0.0;
    EXPECT_THROW(cmd.validate(TODAY), ValidationError);
}

TEST(CommandValidationTest, Flight_FromJson) {
    auto cmd = BookFlightCommand::fromJson({
        {"command_id", "cmd-1"},
        {"offer_id", "OFR-1"},
        {"user_id", "user-1"},
        {"departure", "Paris"},
        {"destination", "London"},
        {"depart_date", "2030-02-01"},
        {"adults", 3},
        {"expected_price", 250.0}
    });

    EXPECT_EQ(cmd.commandId, "cmd-1");
    EXPECT_EQ(cmd.adults, 3);
    ASSERT_TRUE(cmd.expectedPrice.has_value());
    EXPECT_DOUBLE_EQ(*cmd.expectedPrice, 250.0);
    EXPECT_TRUE(cmd.returnDate.empty());
    EXPECT_EQ(cmd.paymentMethod, "credit_card");
}

TEST(CommandValidationTest, Flight_WithoutUserIdIsAnonymous) {
    auto cmd = BookFlightCommand::fromJson({
        {"offer_id", "OFR-1"},
        {"departure", "Paris"},
        {"destination", "London"},
        {"depart_date", "2030-02-01"}
    });

    EXPECT_TRUE(cmd.userId.empty());
    EXPECT_NO_THROW(cmd.validate(TODAY));
}

TEST(CommandValidationTest, Flight_NumericUserIdBecomesStringKey) {
    auto cmd = BookFlightCommand::fromJson({
        {"offer_id", "OFR-1"},
        {"user_id", 42},
        {"departure", "Paris"},
        {"destination", "London"},
        {"depart_date", "2030-02-01"}
    });

    EXPECT_EQ(cmd.userId, "42");
    EXPECT_NO_THROW(cmd.validate(TODAY));
}

TEST(CommandValidationTest, Flight_NullUserIdIsAnonymous) {
    auto cmd = BookFlightCommand::fromJson({{"offer_id", "OFR-1"}, {"user_id", nullptr}});
    EXPECT_TRUE(cmd.userId.empty());
}

TEST(CommandValidationTest, Flight_UserIdOfOtherTypeRejected) {
    EXPECT_THROW(BookFlightCommand::fromJson({{"offer_id", "OFR-1"}, {"user_id", 4.5}}), ValidationError);
    EXPECT_THROW(BookFlightCommand::fromJson({{"offer_id", "OFR-1"}, {"user_id", {1, 2}}}), ValidationError);
}

TEST(CommandValidationTest, Flight_RejectsFieldsLongerThanStorage) {
    auto cmd = validFlight();
    cmd.departure = std::string(validation::MAX_PLACE_LENGTH, 'P');
    EXPECT_NO_THROW(cmd.validate(TODAY));
    cmd.departure += "P";
    EXPECT_THROW(cmd.validate(TODAY), ValidationError);

    cmd = validFlight();
    cmd.destination = std::string(validation::MAX_PLACE_LENGTH + 1, 'L');
    EXPECT_THROW(cmd.validate(TODAY), ValidationError);

    cmd = validFlight();
    cmd.aggregateId = std::string(validation::MAX_ID_LENGTH + 1, 'a');
    EXPECT_THROW(cmd.validate(TODAY), ValidationError);

    cmd = validFlight();
    cmd.userId = std::string(validation::MAX_ID_LENGTH + 1, 'u');
    EXPECT_THROW(cmd.validate(TODAY), ValidationError);

    cmd = validFlight();
    cmd.paymentMethod = std::string(validation::MAX_PAYMENT_METHOD_LENGTH + 1, 'c');
    EXPECT_THROW(cmd.validate(TODAY), ValidationError);
}

TEST(CommandValidationTest, Flight_CommandIdLeavesRoomForDerivedAggregate) {
    auto cmd = validFlight();
    cmd.commandId = std::string(validation::MAX_COMMAND_ID_LENGTH, 'c');
    EXPECT_NO_THROW(cmd.validate(TODAY));
    EXPECT_LE(("agg-" + cmd.commandId).size(), validation::MAX_ID_LENGTH);

    cmd.commandId += "c";
    EXPECT_THROW(cmd.validate(TODAY), ValidationError);
}

TEST(CommandValidationTest, MaxLengthCountsCharactersNotBytes) {
    std::string city;
    for (size_t i = 0; i < validation::MAX_PLACE_LENGTH; ++i) {
        city += "\xC3\xA9";
    }
    EXPECT_EQ(validation::characterCount(city), validation::MAX_PLACE_LENGTH);

    auto cmd = validFlight();
    cmd.destination = city;
    EXPECT_NO_THROW(cmd.validate(TODAY));
}

// ============================================================================
// ОТЕЛЬ
// ============================================================================

TEST(CommandValidationTest, Hotel_RejectsCheckOutNotAfterCheckIn) {
    BookHotelCommand cmd;
    cmd.offerId = "HTL-1";
    cmd.userId = "user-1";
    cmd.hotelName = "Grand Hotel";
    cmd.hotelCity = "Rome";
    cmd.checkIn = "2030-03-05";
    cmd.checkOut = "2030-03-05";
    EXPECT_THROW(cmd.validate(TODAY), ValidationError);

    cmd.checkOut = "2030-03-06";
    EXPECT_NO_THROW(cmd.validate(TODAY));
}

TEST(CommandValidationTest, Hotel_RejectsNameLongerThanStorage) {
    BookHotelCommand cmd;
    cmd.offerId = "HTL-1";
    cmd.hotelName = std::string(validation::MAX_NAME_LENGTH, 'H');
    cmd.hotelCity = "Rome";
    cmd.checkIn = "2030-03-05";
    cmd.checkOut = "2030-03-06";
    EXPECT_NO_THROW(cmd.validate(TODAY));

    cmd.hotelName += "H";
    EXPECT_THROW(cmd.validate(TODAY), ValidationError);

    cmd.hotelName = "Grand Hotel";
    cmd.hotelCity = std::string(validation::MAX_CITY_LENGTH + 1, 'R');
    EXPECT_THROW(cmd.validate(TODAY), ValidationError);
}

TEST(CommandValidationTest, Hotel_NumericUserIdFromJson) {
    auto cmd = BookHotelCommand::fromJson({{"offer_id", "HTL-1"}, {"user_id", 7}});
    EXPECT_EQ(cmd.userId, "7");
}

// ============================================================================
// ИЗМЕНЕНИЕ И ОТМЕНА
// ============================================================================

TEST(CommandValidationTest, Amend_RequiresAtLeastOneChange) {
    AmendBookingCommand cmd;
    cmd.bookingId = "bkg-1";
    EXPECT_THROW(cmd.validate(TODAY), ValidationError);

    cmd.adults = 2;
    EXPECT_NO_THROW(cmd.validate(TODAY));
}

TEST(CommandValidationTest, Amend_RejectsBadDate) {
    AmendBookingCommand cmd;
    cmd.bookingId = "bkg-1";
    cmd.returnDate = std::string("2030-02-30");
    EXPECT_THROW(cmd.validate(TODAY), ValidationError);
}

TEST(CommandValidationTest, Cancel_RequiresBookingId) {
    CancelBookingCommand cmd;
    EXPECT_THROW(cmd.validate(), ValidationError);

    cmd.bookingId = "bkg-1";
    cmd.expectedVersion = 0;
    EXPECT_THROW(cmd.validate(), ValidationError);

    cmd.expectedVersion = 1;
    EXPECT_NO_THROW(cmd.validate());
}

TEST(CommandValidationTest, Cancel_RejectsIdsLongerThanStorage) {
    CancelBookingCommand cmd;
    cmd.bookingId = std::string(validation::MAX_BOOKING_ID_LENGTH + 1, 'b');
    EXPECT_THROW(cmd.validate(), ValidationError);

    cmd.bookingId = "bkg-1";
    cmd.commandId = std::string(validation::MAX_ID_LENGTH + 1, 'c');
    EXPECT_THROW(cmd.validate(), ValidationError);
}
