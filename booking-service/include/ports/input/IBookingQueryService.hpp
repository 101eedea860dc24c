#pragma once

#include "domain/BookingRow.hpp"
#include "domain/Offer.hpp"
#include <optional>
#include <string>
#include <vector>

namespace booking::ports::input {

/**
 * @brief Запросы к read model (журнал не читается)
 */
class IBookingQueryService {
public:
    virtual ~IBookingQueryService() = default;

    virtual std::optional<domain::BookingRow> getBooking(const std::string& bookingId) = 0;

    virtual std::optional<domain::BookingRow> getBookingByAggregate(const std::string& aggregateId) = 0;

    /**
     * @brief Брони пользователя, новые сначала
     */
    virtual std::vector<domain::BookingRow> listBookings(const std::string& userId) = 0;

    /**
     * @brief Поиск предложений у провайдера
     * @throws ProviderError
     */
    virtual std::vector<domain::Offer> searchOffers(const domain::SearchCriteria& criteria) = 0;
};

} // namespace booking::ports::input
