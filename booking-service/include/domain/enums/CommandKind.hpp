#pragma once

#include <string>
#include <optional>

namespace booking::domain {

/**
 * @brief Виды команд, которые принимает submitCommand()
 */
enum class CommandKind {
    BOOK_FLIGHT,
    BOOK_HOTEL,
    AMEND,
    CANCEL
};

inline std::string toString(CommandKind kind) {
    switch (kind) {
        case CommandKind::BOOK_FLIGHT: return "book_flight";
        case CommandKind::BOOK_HOTEL: return "book_hotel";
        case CommandKind::AMEND: return "amend";
        case CommandKind::CANCEL: return "cancel";
        default: return "unknown";
    }
}

inline std::optional<CommandKind> parseCommandKind(const std::string& str) {
    if (str == "book_flight") return CommandKind::BOOK_FLIGHT;
    if (str == "book_hotel") return CommandKind::BOOK_HOTEL;
    if (str == "amend") return CommandKind::AMEND;
    if (str == "cancel") return CommandKind::CANCEL;
    return std::nullopt;
}

} // namespace booking::domain
