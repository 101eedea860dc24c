#pragma once

#include "domain/commands/CommandValidation.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <cstdint>

namespace booking::domain {

/**
 * @brief Команда: забронировать перелёт по предложению провайдера
 */
class BookFlightCommand {
public:
    std::string commandId;
    std::string aggregateId;      // Пусто — будет сгенерирован
    std::string offerId;
    std::string userId;
    std::string userEmail;
    std::string departure;
    std::string destination;
    std::string departDate;
    std::string returnDate;       // Пусто — в одну сторону
    int32_t adults = 1;
    std::optional<double> expectedPrice;
    std::string paymentMethod = "credit_card";

    BookFlightCommand() = default;

    static BookFlightCommand fromJson(const nlohmann::json& body) {
        BookFlightCommand cmd;
        cmd.commandId = body.value("command_id", "");
        cmd.aggregateId = body.value("aggregate_id", "");
        cmd.offerId = body.value("offer_id", "");
        cmd.userId = validation::userIdField(body);
        cmd.userEmail = body.value("user_email", "");
        cmd.departure = body.value("departure", "");
        cmd.destination = body.value("destination", "");
        cmd.departDate = body.value("depart_date", "");
        cmd.returnDate = body.value("return_date", "");
        cmd.adults = body.value("adults", int32_t{1});
        cmd.expectedPrice = validation::optionalField<double>(body, "expected_price");
        cmd.paymentMethod = body.value("payment_method", "credit_card");
        return cmd;
    }

    /**
     * @brief Проверить форму команды
     * @param today текущая дата UTC (YYYY-MM-DD)
     * @throws ValidationError
     */
    void validate(const std::string& today) const {
        validation::requireMaxLength("command_id", commandId, validation::MAX_COMMAND_ID_LENGTH);
        validation::requireMaxLength("aggregate_id", aggregateId, validation::MAX_ID_LENGTH);
        validation::requireNonEmpty("offer_id", offerId);
        validation::requireMaxLength("offer_id", offerId, validation::MAX_ID_LENGTH);
        validation::requireMaxLength("user_id", userId, validation::MAX_ID_LENGTH);
        validation::requireMaxLength("user_email", userEmail, validation::MAX_NAME_LENGTH);
        validation::requireLength("departure", departure, 2, validation::MAX_PLACE_LENGTH);
        validation::requireLength("destination", destination, 2, validation::MAX_PLACE_LENGTH);
        validation::requireNotPast("depart_date", departDate, today);
        if (!returnDate.empty()) {
            validation::requireAfter("return_date", returnDate, "depart_date", departDate);
        }
        validation::requireAdults(adults);
        validation::requirePositivePrice(expectedPrice);
        validation::requireMaxLength("payment_method", paymentMethod, validation::MAX_PAYMENT_METHOD_LENGTH);
    }
};

} // namespace booking::domain
