#pragma once

#include "domain/BookingRow.hpp"
#include "domain/errors/BookingErrors.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <cstdint>

namespace booking::domain {

/**
 * @brief Итог команды
 *
 * ACCEPTED — событие записано и строка read model актуальна.
 * DEGRADED — событие записано, но проекция не удалась (строка устарела до rebuild).
 * REJECTED — ничего не записано.
 */
enum class CommandOutcome {
    ACCEPTED,
    DEGRADED,
    REJECTED
};

inline std::string toString(CommandOutcome outcome) {
    switch (outcome) {
        case CommandOutcome::ACCEPTED: return "ACCEPTED";
        case CommandOutcome::DEGRADED: return "DEGRADED";
        case CommandOutcome::REJECTED: return "REJECTED";
        default: return "UNKNOWN";
    }
}

class CommandResult {
public:
    CommandOutcome outcome = CommandOutcome::REJECTED;
    std::string bookingId;
    std::string aggregateId;
    std::string eventId;              // Последнее записанное событие
    int64_t version = 0;
    std::optional<BookingRow> row;    // Есть только при ACCEPTED
    std::optional<ErrorKind> errorKind;
    std::string message;
    bool duplicate = false;           // Повторная отправка уже записанной команды

    CommandResult() = default;

    bool accepted() const { return outcome == CommandOutcome::ACCEPTED; }

    static CommandResult rejected(ErrorKind kind, const std::string& message) {
        CommandResult r;
        r.outcome = CommandOutcome::REJECTED;
        r.errorKind = kind;
        r.message = message;
        return r;
    }

    nlohmann::json toJson() const {
        nlohmann::json j;
        j["outcome"] = toString(outcome);
        if (!bookingId.empty()) j["booking_id"] = bookingId;
        if (!aggregateId.empty()) j["aggregate_id"] = aggregateId;
        if (!eventId.empty()) j["event_id"] = eventId;
        if (version > 0) j["version"] = version;
        if (row) {
            j["status"] = toString(row->status);
            j["booking"] = row->toJson();
        }
        if (errorKind) j["error"] = toString(*errorKind);
        if (!message.empty()) j["message"] = message;
        if (duplicate) j["duplicate"] = true;
        return j;
    }
};

} // namespace booking::domain
