#pragma once

#include "application/ProjectionEngine.hpp"
#include "application/CommandPipeline.hpp"
#include "application/handlers/CreateBookingHandler.hpp"
#include "application/handlers/AmendBookingHandler.hpp"
#include "application/handlers/CancelBookingHandler.hpp"
#include "application/BookingCommandService.hpp"
#include "application/BookingQueryService.hpp"
#include "application/ReplayService.hpp"
#include "adapters/secondary/persistence/InMemoryEventLog.hpp"
#include "adapters/secondary/persistence/InMemoryBookingRepository.hpp"
#include "../mocks/MockOfferProvider.hpp"
#include <memory>

namespace booking::tests {

/**
 * @brief Собранный in-memory стек сервиса для тестов
 *
 * Журнал, read model и провайдер можно подменить до вызова build().
 */
struct BookingTestContext {
    std::shared_ptr<ports::output::IEventLog> eventLog =
        std::make_shared<adapters::secondary::InMemoryEventLog>();
    std::shared_ptr<ports::output::IBookingReadRepository> repository =
        std::make_shared<adapters::secondary::InMemoryBookingRepository>();
    std::shared_ptr<MockOfferProvider> mockProvider = std::make_shared<MockOfferProvider>();
    std::shared_ptr<ports::output::IOfferProvider> provider = mockProvider;

    std::shared_ptr<application::ProjectionEngine> projection;
    std::shared_ptr<application::CommandPipeline> pipeline;
    std::shared_ptr<application::BookingCommandService> commands;
    std::shared_ptr<application::BookingQueryService> queries;
    std::shared_ptr<application::ReplayService> replay;

    void build() {
        projection = std::make_shared<application::ProjectionEngine>(eventLog, repository);
        pipeline = std::make_shared<application::CommandPipeline>(eventLog, projection);
        commands = std::make_shared<application::BookingCommandService>(
            std::make_shared<application::CreateBookingHandler>(provider, pipeline),
            std::make_shared<application::AmendBookingHandler>(repository, provider, pipeline),
            std::make_shared<application::CancelBookingHandler>(repository, pipeline));
        queries = std::make_shared<application::BookingQueryService>(repository, provider);
        replay = std::make_shared<application::ReplayService>(eventLog, repository, projection);
    }
};

inline domain::BookFlightCommand flightCommand(const std::string& offerId = "OFR-1",
                                               const std::string& userId = "user-1") {
    domain::BookFlightCommand cmd;
    cmd.offerId = offerId;
    cmd.userId = userId;
    cmd.userEmail = userId + "@example.com";
    cmd.departure = "Paris";
    cmd.destination = "London";
    cmd.departDate = "2099-06-01";
    cmd.returnDate = "2099-06-10";
    cmd.adults = 1;
    return cmd;
}

inline domain::BookHotelCommand hotelCommand(const std::string& offerId = "HTL-1",
                                             const std::string& userId = "user-1") {
    domain::BookHotelCommand cmd;
    cmd.offerId = offerId;
    cmd.userId = userId;
    cmd.hotelName = "Grand Hotel";
    cmd.hotelCity = "Rome";
    cmd.checkIn = "2099-07-01";
    cmd.checkOut = "2099-07-05";
    cmd.adults = 2;
    return cmd;
}

inline domain::CancelBookingCommand cancelCommand(const std::string& bookingId,
                                                  const std::string& reason = "change of plans") {
    domain::CancelBookingCommand cmd;
    cmd.bookingId = bookingId;
    cmd.reason = reason;
    return cmd;
}

} // namespace booking::tests
