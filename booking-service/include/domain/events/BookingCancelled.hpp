#pragma once

#include "domain/Money.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace booking::domain {

/**
 * @brief Событие: бронирование отменено (терминальное)
 */
struct BookingCancelled {
    static constexpr const char* TYPE = "BookingCancelled";
    static constexpr int SCHEMA_VERSION = 1;

    std::string reason;
    Money refundAmount;

    nlohmann::json toPayload() const;
    static BookingCancelled fromPayload(const nlohmann::json& payload, int schemaVersion);
};

} // namespace booking::domain
