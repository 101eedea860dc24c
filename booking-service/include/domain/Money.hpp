#pragma once

#include <string>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace booking::domain {

/**
 * @brief Денежная сумма с валютой
 *
 * Хранится как целая часть + дробная (10^-9), чтобы свёртка событий
 * давала побитово одинаковый результат при повторной проекции.
 */
class Money {
public:
    int64_t units = 0;      // Целая часть
    int32_t nano = 0;       // Дробная часть (10^-9)
    std::string currency = "EUR";

    Money() = default;

    Money(int64_t u, int32_t n, const std::string& cur = "EUR")
        : units(u), nano(n), currency(cur) {}

    static Money fromDouble(double value, const std::string& cur = "EUR") {
        Money m;
        m.currency = cur;
        m.units = static_cast<int64_t>(value);
        m.nano = static_cast<int32_t>((value - static_cast<double>(m.units)) * 1e9 + (value >= 0 ? 0.5 : -0.5));
        if (m.nano >= 1000000000) {
            m.units++;
            m.nano -= 1000000000;
        }
        return m;
    }

    double toDouble() const {
        return static_cast<double>(units) + static_cast<double>(nano) / 1e9;
    }

    bool isPositive() const {
        return units > 0 || (units == 0 && nano > 0);
    }

    nlohmann::json toJson() const {
        return {{"units", units}, {"nano", nano}, {"currency", currency}};
    }

    static Money fromJson(const nlohmann::json& j) {
        Money m;
        m.units = j.value("units", int64_t{0});
        m.nano = j.value("nano", int32_t{0});
        m.currency = j.value("currency", std::string("EUR"));
        return m;
    }

    bool operator==(const Money& other) const {
        return units == other.units && nano == other.nano && currency == other.currency;
    }

    bool operator!=(const Money& other) const {
        return !(*this == other);
    }
};

} // namespace booking::domain
