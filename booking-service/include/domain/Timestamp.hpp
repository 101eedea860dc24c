#pragma once

#include <string>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <ctime>
#include <cstdint>

namespace booking::domain {

/**
 * @brief Временная метка (UTC, точность — микросекунды)
 *
 * В хранилище пишется как число микросекунд с эпохи, наружу — ISO 8601.
 */
struct Timestamp {
    std::chrono::system_clock::time_point value;

    Timestamp() : value(truncate(std::chrono::system_clock::now())) {}

    explicit Timestamp(std::chrono::system_clock::time_point tp) : value(truncate(tp)) {}

    static Timestamp now() {
        return Timestamp(std::chrono::system_clock::now());
    }

    static Timestamp fromUnixMicros(int64_t micros) {
        return Timestamp(std::chrono::system_clock::time_point(
            std::chrono::duration_cast<std::chrono::system_clock::duration>(
                std::chrono::microseconds(micros))));
    }

    int64_t toUnixMicros() const {
        return std::chrono::duration_cast<std::chrono::microseconds>(
            value.time_since_epoch()).count();
    }

    /**
     * @brief Преобразовать в ISO 8601: "2025-12-16T10:30:00.123456Z"
     */
    std::string toString() const {
        int64_t micros = toUnixMicros();
        std::time_t seconds = static_cast<std::time_t>(micros / 1000000);
        int64_t fraction = micros % 1000000;
        if (fraction < 0) {
            fraction += 1000000;
            --seconds;
        }

        std::tm tm{};
        gmtime_r(&seconds, &tm);

        std::ostringstream ss;
        ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S")
           << '.' << std::setw(6) << std::setfill('0') << fraction << 'Z';
        return ss.str();
    }

    /**
     * @brief Дата в формате YYYY-MM-DD (UTC)
     */
    std::string toDateString() const {
        std::time_t seconds = std::chrono::system_clock::to_time_t(value);
        std::tm tm{};
        gmtime_r(&seconds, &tm);

        std::ostringstream ss;
        ss << std::put_time(&tm, "%Y-%m-%d");
        return ss.str();
    }

    Timestamp addSeconds(int64_t seconds) const {
        return Timestamp(value + std::chrono::seconds(seconds));
    }

    bool operator==(const Timestamp& other) const { return value == other.value; }
    bool operator!=(const Timestamp& other) const { return value != other.value; }
    bool operator<(const Timestamp& other) const { return value < other.value; }
    bool operator>(const Timestamp& other) const { return value > other.value; }
    bool operator<=(const Timestamp& other) const { return value <= other.value; }
    bool operator>=(const Timestamp& other) const { return value >= other.value; }

private:
    // Храним не точнее микросекунд, иначе значение из БД не совпадёт с исходным
    static std::chrono::system_clock::time_point truncate(std::chrono::system_clock::time_point tp) {
        return std::chrono::time_point_cast<std::chrono::microseconds>(tp);
    }
};

} // namespace booking::domain
