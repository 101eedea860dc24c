#pragma once

#include <string>
#include <stdexcept>

namespace booking::domain {

enum class BookingType {
    FLIGHT,
    HOTEL
};

inline std::string toString(BookingType type) {
    switch (type) {
        case BookingType::FLIGHT: return "FLIGHT";
        case BookingType::HOTEL: return "HOTEL";
        default: return "UNKNOWN";
    }
}

inline BookingType parseBookingType(const std::string& str) {
    if (str == "FLIGHT") return BookingType::FLIGHT;
    if (str == "HOTEL") return BookingType::HOTEL;
    throw std::invalid_argument("Unknown booking type: " + str);
}

} // namespace booking::domain
