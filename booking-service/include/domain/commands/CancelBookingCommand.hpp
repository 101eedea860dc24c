#pragma once

#include "domain/commands/CommandValidation.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <cstdint>

namespace booking::domain {

/**
 * @brief Команда: отменить подтверждённую бронь
 */
class CancelBookingCommand {
public:
    std::string commandId;
    std::string bookingId;
    std::optional<int64_t> expectedVersion;
    std::string reason;

    CancelBookingCommand() = default;

    static CancelBookingCommand fromJson(const nlohmann::json& body) {
        CancelBookingCommand cmd;
        cmd.commandId = body.value("command_id", "");
        cmd.bookingId = body.value("booking_id", "");
        cmd.expectedVersion = validation::optionalField<int64_t>(body, "expected_version");
        cmd.reason = body.value("reason", "");
        return cmd;
    }

    void validate() const {
        validation::requireNonEmpty("booking_id", bookingId);
        validation::requireMaxLength("booking_id", bookingId, validation::MAX_BOOKING_ID_LENGTH);
        validation::requireMaxLength("command_id", commandId, validation::MAX_ID_LENGTH);
        if (expectedVersion && *expectedVersion < 1) {
            throw ValidationError("expected_version must be positive");
        }
    }
};

} // namespace booking::domain
