#pragma once

#include "domain/commands/CommandValidation.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <cstdint>

namespace booking::domain {

/**
 * @brief Команда: изменить даты или число пассажиров подтверждённой брони
 *
 * Цена не меняется. Поля, которых нет в команде, остаются прежними.
 */
class AmendBookingCommand {
public:
    std::string commandId;
    std::string bookingId;
    std::optional<int64_t> expectedVersion;   // По умолчанию — lastVersion строки
    std::optional<std::string> departDate;
    std::optional<std::string> returnDate;
    std::optional<std::string> checkIn;
    std::optional<std::string> checkOut;
    std::optional<int32_t> adults;
    std::string reason;

    AmendBookingCommand() = default;

    static AmendBookingCommand fromJson(const nlohmann::json& body) {
        AmendBookingCommand cmd;
        cmd.commandId = body.value("command_id", "");
        cmd.bookingId = body.value("booking_id", "");
        cmd.expectedVersion = validation::optionalField<int64_t>(body, "expected_version");
        cmd.departDate = validation::optionalField<std::string>(body, "depart_date");
        cmd.returnDate = validation::optionalField<std::string>(body, "return_date");
        cmd.checkIn = validation::optionalField<std::string>(body, "check_in");
        cmd.checkOut = validation::optionalField<std::string>(body, "check_out");
        cmd.adults = validation::optionalField<int32_t>(body, "adults");
        cmd.reason = body.value("reason", "");
        return cmd;
    }

    bool hasChanges() const {
        return departDate || returnDate || checkIn || checkOut || adults;
    }

    /**
     * @brief Проверка формы без учёта текущего состояния брони
     *
     * Порядок дат относительно существующих значений проверяет обработчик.
     */
    void validate(const std::string& today) const {
        validation::requireNonEmpty("booking_id", bookingId);
        validation::requireMaxLength("booking_id", bookingId, validation::MAX_BOOKING_ID_LENGTH);
        validation::requireMaxLength("command_id", commandId, validation::MAX_ID_LENGTH);
        if (!hasChanges()) {
            throw ValidationError("amend requires at least one field to change");
        }
        if (expectedVersion && *expectedVersion < 1) {
            throw ValidationError("expected_version must be positive");
        }
        if (departDate) validation::requireNotPast("depart_date", *departDate, today);
        if (returnDate) validation::requireDate("return_date", *returnDate);
        if (checkIn) validation::requireNotPast("check_in", *checkIn, today);
        if (checkOut) validation::requireDate("check_out", *checkOut);
        if (adults) validation::requireAdults(*adults);
    }
};

} // namespace booking::domain
