#pragma once

#include "domain/errors/BookingErrors.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <cctype>
#include <cstdint>

/**
 * @file CommandValidation.hpp
 * @brief Проверки формы команд (до обращения к провайдеру и журналу)
 */

namespace booking::domain::validation {

constexpr int32_t MIN_ADULTS = 1;
constexpr int32_t MAX_ADULTS = 9;

// Предельные длины совпадают с шириной колонок в PostgreSQL
constexpr size_t MAX_ID_LENGTH = 128;
constexpr size_t MAX_COMMAND_ID_LENGTH = MAX_ID_LENGTH - 4;   // агрегат создания: "agg-" + command_id
constexpr size_t MAX_BOOKING_ID_LENGTH = 64;
constexpr size_t MAX_PLACE_LENGTH = 64;
constexpr size_t MAX_CITY_LENGTH = 128;
constexpr size_t MAX_NAME_LENGTH = 256;
constexpr size_t MAX_PAYMENT_METHOD_LENGTH = 32;

/**
 * @brief Строка вида YYYY-MM-DD с существующей календарной датой
 */
inline bool isIsoDate(const std::string& value) {
    if (value.size() != 10 || value[4] != '-' || value[7] != '-') {
        return false;
    }
    for (size_t i = 0; i < value.size(); ++i) {
        if (i == 4 || i == 7) continue;
        if (!std::isdigit(static_cast<unsigned char>(value[i]))) return false;
    }

    int year = std::stoi(value.substr(0, 4));
    int month = std::stoi(value.substr(5, 2));
    int day = std::stoi(value.substr(8, 2));
    if (month < 1 || month > 12 || day < 1) {
        return false;
    }

    static const int DAYS[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    int maxDay = DAYS[month - 1];
    bool leap = (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
    if (month == 2 && leap) {
        maxDay = 29;
    }
    return day <= maxDay;
}

inline void requireDate(const std::string& field, const std::string& value) {
    if (!isIsoDate(value)) {
        throw ValidationError(field + " must be a date in YYYY-MM-DD format");
    }
}

/**
 * @brief Дата не раньше today (обе строки YYYY-MM-DD сравниваются лексикографически)
 */
inline void requireNotPast(const std::string& field, const std::string& value,
                           const std::string& today) {
    requireDate(field, value);
    if (value < today) {
        throw ValidationError(field + " " + value + " is in the past");
    }
}

inline void requireAfter(const std::string& field, const std::string& value,
                         const std::string& otherField, const std::string& other) {
    requireDate(field, value);
    if (value <= other) {
        throw ValidationError(field + " must be after " + otherField);
    }
}

inline void requireMinLength(const std::string& field, const std::string& value, size_t min) {
    if (value.size() < min) {
        throw ValidationError(field + " must be at least " + std::to_string(min) + " characters");
    }
}

/**
 * @brief Число символов UTF-8 (VARCHAR(n) в PostgreSQL считает символы, а не байты)
 */
inline size_t characterCount(const std::string& value) {
    size_t count = 0;
    for (unsigned char c : value) {
        if ((c & 0xC0) != 0x80) {
            ++count;
        }
    }
    return count;
}

inline void requireMaxLength(const std::string& field, const std::string& value, size_t max) {
    if (characterCount(value) > max) {
        throw ValidationError(field + " must be at most " + std::to_string(max) + " characters");
    }
}

inline void requireLength(const std::string& field, const std::string& value, size_t min, size_t max) {
    requireMinLength(field, value, min);
    requireMaxLength(field, value, max);
}

inline void requireNonEmpty(const std::string& field, const std::string& value) {
    if (value.empty()) {
        throw ValidationError(field + " is required");
    }
}

inline void requireAdults(int32_t adults) {
    if (adults < MIN_ADULTS || adults > MAX_ADULTS) {
        throw ValidationError("adults must be between " + std::to_string(MIN_ADULTS) +
                              " and " + std::to_string(MAX_ADULTS));
    }
}

inline void requirePositivePrice(const std::optional<double>& price) {
    if (price && *price <= 0.0) {
        throw ValidationError("expected_price must be positive");
    }
}

// Чтение необязательных полей из тела команды

template <typename T>
std::optional<T> optionalField(const nlohmann::json& body, const char* key) {
    if (!body.contains(key) || body[key].is_null()) {
        return std::nullopt;
    }
    return body[key].get<T>();
}

/**
 * @brief Идентификатор пользователя: строка, целое число или ничего
 *
 * Число приводится к строковому ключу; отсутствие поля означает
 * анонимную бронь (пустая строка).
 *
 * @throws ValidationError для значения другого типа
 */
inline std::string userIdField(const nlohmann::json& body) {
    if (!body.contains("user_id") || body["user_id"].is_null()) {
        return "";
    }
    const auto& value = body["user_id"];
    if (value.is_string()) {
        return value.get<std::string>();
    }
    if (value.is_number_unsigned()) {
        return std::to_string(value.get<uint64_t>());
    }
    if (value.is_number_integer()) {
        return std::to_string(value.get<int64_t>());
    }
    throw ValidationError("user_id must be a string or an integer");
}

} // namespace booking::domain::validation
