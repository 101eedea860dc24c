#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <cstdint>

namespace booking::domain {

/**
 * @brief Событие: изменены даты и/или количество пассажиров
 *
 * Пустое optional означает "поле не менялось".
 */
struct BookingAmended {
    static constexpr const char* TYPE = "BookingAmended";
    static constexpr int SCHEMA_VERSION = 1;

    std::optional<std::string> departDate;
    std::optional<std::string> returnDate;
    std::optional<std::string> checkIn;
    std::optional<std::string> checkOut;
    std::optional<int32_t> adults;
    std::string reason;

    nlohmann::json toPayload() const;
    static BookingAmended fromPayload(const nlohmann::json& payload, int schemaVersion);
};

} // namespace booking::domain
