#pragma once

#include "domain/Money.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <cstdint>

namespace booking::domain {

/**
 * @brief Предложение провайдера (перелёт или номер в отеле)
 */
class Offer {
public:
    std::string offerId;
    std::string origin;
    std::string destination;
    std::string departDate;
    std::string returnDate;
    std::string carrier;
    Money price;
    int32_t capacity = 0;     // Сколько мест ещё можно продать

    Offer() = default;

    nlohmann::json toJson() const {
        nlohmann::json j;
        j["offer_id"] = offerId;
        j["origin"] = origin;
        j["destination"] = destination;
        j["depart_date"] = departDate;
        j["return_date"] = returnDate;
        j["carrier"] = carrier;
        j["price"] = price.toJson();
        j["capacity"] = capacity;
        return j;
    }
};

/**
 * @brief Ответ провайдера на проверку предложения
 */
class OfferValidation {
public:
    bool valid = false;
    Money price;
    int32_t capacity = 0;

    OfferValidation() = default;

    OfferValidation(bool v, const Money& p, int32_t c)
        : valid(v), price(p), capacity(c) {}
};

/**
 * @brief Критерии поиска предложений
 */
class SearchCriteria {
public:
    std::string origin;
    std::string destination;
    std::string departDate;
    std::string returnDate;
    int32_t adults = 1;
    std::optional<double> maxPrice;

    SearchCriteria() = default;

    static SearchCriteria fromJson(const nlohmann::json& j) {
        SearchCriteria c;
        c.origin = j.value("origin", "");
        c.destination = j.value("destination", "");
        c.departDate = j.value("depart_date", "");
        c.returnDate = j.value("return_date", "");
        c.adults = j.value("adults", int32_t{1});
        if (j.contains("max_price") && j["max_price"].is_number()) {
            c.maxPrice = j["max_price"].get<double>();
        }
        return c;
    }
};

} // namespace booking::domain
