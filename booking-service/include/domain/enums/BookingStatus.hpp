#pragma once

#include <string>

namespace booking::domain {

enum class BookingStatus {
    CONFIRMED,
    CANCELLED
};

inline std::string toString(BookingStatus status) {
    switch (status) {
        case BookingStatus::CONFIRMED: return "CONFIRMED";
        case BookingStatus::CANCELLED: return "CANCELLED";
        default: return "UNKNOWN";
    }
}

inline BookingStatus parseBookingStatus(const std::string& str) {
    if (str == "CANCELLED") return BookingStatus::CANCELLED;
    return BookingStatus::CONFIRMED;
}

/**
 * @brief CANCELLED — терминальный статус, дальше агрегат не меняется
 */
inline bool isTerminal(BookingStatus status) {
    return status == BookingStatus::CANCELLED;
}

} // namespace booking::domain
