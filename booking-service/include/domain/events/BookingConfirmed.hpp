#pragma once

#include "domain/Money.hpp"
#include "domain/enums/BookingType.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <cstdint>

namespace booking::domain {

/**
 * @brief Событие: бронирование подтверждено (рождение агрегата)
 *
 * Схема v1 хранила price десятичным числом, v2 — как Money.
 */
struct BookingConfirmed {
    static constexpr const char* TYPE = "BookingConfirmed";
    static constexpr int SCHEMA_VERSION = 2;

    std::string bookingId;
    BookingType bookingType = BookingType::FLIGHT;
    std::string offerId;
    std::string userId;
    std::string userEmail;

    // Перелёт
    std::string departure;
    std::string destination;
    std::string departDate;
    std::string returnDate;

    // Отель
    std::string hotelName;
    std::string hotelCity;
    std::string checkIn;
    std::string checkOut;

    Money price;
    int32_t adults = 1;
    std::string paymentMethod = "credit_card";

    nlohmann::json toPayload() const;
    static BookingConfirmed fromPayload(const nlohmann::json& payload, int schemaVersion);
};

} // namespace booking::domain
