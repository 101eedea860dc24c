#pragma once

#include "ports/input/IBookingQueryService.hpp"
#include "ports/output/IBookingReadRepository.hpp"
#include "ports/output/IOfferProvider.hpp"
#include <iostream>
#include <memory>

namespace booking::application {

/**
 * @brief Запросы к read model и поиск у провайдера
 */
class BookingQueryService : public ports::input::IBookingQueryService {
public:
    BookingQueryService(
        std::shared_ptr<ports::output::IBookingReadRepository> repository,
        std::shared_ptr<ports::output::IOfferProvider> provider
    ) : repository_(std::move(repository))
      , provider_(std::move(provider))
    {
        std::cout << "[BookingQueryService] Created" << std::endl;
    }

    std::optional<domain::BookingRow> getBooking(const std::string& bookingId) override {
        auto row = repository_->findByBookingId(bookingId);
        if (!row) {
            std::cout << "[BookingQueryService] Booking not found: " << bookingId << std::endl;
        }
        return row;
    }

    std::optional<domain::BookingRow> getBookingByAggregate(const std::string& aggregateId) override {
        return repository_->findByAggregateId(aggregateId);
    }

    std::vector<domain::BookingRow> listBookings(const std::string& userId) override {
        return repository_->findByUserId(userId);
    }

    std::vector<domain::Offer> searchOffers(const domain::SearchCriteria& criteria) override {
        return provider_->searchOffers(criteria);
    }

private:
    std::shared_ptr<ports::output::IBookingReadRepository> repository_;
    std::shared_ptr<ports::output::IOfferProvider> provider_;
};

} // namespace booking::application
