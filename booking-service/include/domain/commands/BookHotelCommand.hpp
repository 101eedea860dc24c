#pragma once

#include "domain/commands/CommandValidation.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <cstdint>

namespace booking::domain {

/**
 * @brief Команда: забронировать отель
 */
class BookHotelCommand {
public:
    std::string commandId;
    std::string aggregateId;
    std::string offerId;
    std::string userId;
    std::string userEmail;
    std::string hotelName;
    std::string hotelCity;
    std::string checkIn;
    std::string checkOut;
    int32_t adults = 1;
    std::optional<double> expectedPrice;
    std::string paymentMethod = "credit_card";

    BookHotelCommand() = default;

    static BookHotelCommand fromJson(const nlohmann::json& body) {
        BookHotelCommand cmd;
        cmd.commandId = body.value("command_id", "");
        cmd.aggregateId = body.value("aggregate_id", "");
        cmd.offerId = body.value("offer_id", "");
        cmd.userId = validation::userIdField(body);
        cmd.userEmail = body.value("user_email", "");
        cmd.hotelName = body.value("hotel_name", "");
        cmd.hotelCity = body.value("hotel_city", "");
        cmd.checkIn = body.value("check_in", "");
        cmd.checkOut = body.value("check_out", "");
        cmd.adults = body.value("adults", int32_t{1});
        cmd.expectedPrice = validation::optionalField<double>(body, "expected_price");
        cmd.paymentMethod = body.value("payment_method", "credit_card");
        return cmd;
    }

    void validate(const std::string& today) const {
        validation::requireMaxLength("command_id", commandId, validation::MAX_COMMAND_ID_LENGTH);
        validation::requireMaxLength("aggregate_id", aggregateId, validation::MAX_ID_LENGTH);
        validation::requireNonEmpty("offer_id", offerId);
        validation::requireMaxLength("offer_id", offerId, validation::MAX_ID_LENGTH);
        validation::requireMaxLength("user_id", userId, validation::MAX_ID_LENGTH);
        validation::requireMaxLength("user_email", userEmail, validation::MAX_NAME_LENGTH);
        validation::requireLength("hotel_name", hotelName, 2, validation::MAX_NAME_LENGTH);
        validation::requireLength("hotel_city", hotelCity, 2, validation::MAX_CITY_LENGTH);
        validation::requireNotPast("check_in", checkIn, today);
        validation::requireAfter("check_out", checkOut, "check_in", checkIn);
        validation::requireAdults(adults);
        validation::requirePositivePrice(expectedPrice);
        validation::requireMaxLength("payment_method", paymentMethod, validation::MAX_PAYMENT_METHOD_LENGTH);
    }
};

} // namespace booking::domain
