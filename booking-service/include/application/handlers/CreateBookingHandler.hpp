#pragma once

#include "application/CommandPipeline.hpp"
#include "ports/output/IOfferProvider.hpp"
#include "domain/commands/BookFlightCommand.hpp"
#include "domain/commands/BookHotelCommand.hpp"
#include "domain/events/BookingEvent.hpp"
#include "utils/UuidGenerator.hpp"
#include <iostream>
#include <memory>

namespace booking::application {

/**
 * @brief Создание брони (перелёт или отель)
 *
 * 1. Проверка формы команды.
 * 2. Повторная отправка той же команды возвращает уже записанный результат.
 * 3. Проверка предложения у провайдера (ошибки провайдера пробрасываются,
 *    в журнал ничего не пишется).
 * 4. BookingConfirmed с версией 1.
 */
class CreateBookingHandler {
public:
    CreateBookingHandler(
        std::shared_ptr<ports::output::IOfferProvider> provider,
        std::shared_ptr<CommandPipeline> pipeline
    ) : provider_(std::move(provider))
      , pipeline_(std::move(pipeline))
    {
        std::cout << "[CreateBookingHandler] Created" << std::endl;
    }

    domain::CommandResult handle(const domain::BookFlightCommand& command) {
        command.validate(domain::Timestamp::now().toDateString());

        std::string aggregateId = resolveAggregateId(command.aggregateId, command.commandId);
        if (auto recorded = pipeline_->findRecorded(aggregateId, 1, command.commandId, "")) {
            return *recorded;
        }

        auto offer = checkOffer(command.offerId, command.adults, command.expectedPrice);

        domain::BookingConfirmed event;
        event.bookingId = utils::UuidGenerator::generateWithPrefix("bkg");
        event.bookingType = domain::BookingType::FLIGHT;
        event.offerId = command.offerId;
        event.userId = command.userId;
        event.userEmail = command.userEmail;
        event.departure = command.departure;
        event.destination = command.destination;
        event.departDate = command.departDate;
        event.returnDate = command.returnDate;
        event.price = offer.price;
        event.adults = command.adults;
        event.paymentMethod = command.paymentMethod;

        std::cout << "[CreateBookingHandler] Booking flight " << command.offerId
                  << " for " << command.userId << " as " << aggregateId << std::endl;
        return pipeline_->execute(aggregateId, 0, {domain::toDraft(event, command.commandId)},
                                  command.commandId, event.bookingId);
    }

    domain::CommandResult handle(const domain::BookHotelCommand& command) {
        command.validate(domain::Timestamp::now().toDateString());

        std::string aggregateId = resolveAggregateId(command.aggregateId, command.commandId);
        if (auto recorded = pipeline_->findRecorded(aggregateId, 1, command.commandId, "")) {
            return *recorded;
        }

        auto offer = checkOffer(command.offerId, command.adults, command.expectedPrice);

        domain::BookingConfirmed event;
        event.bookingId = utils::UuidGenerator::generateWithPrefix("bkg");
        event.bookingType = domain::BookingType::HOTEL;
        event.offerId = command.offerId;
        event.userId = command.userId;
        event.userEmail = command.userEmail;
        event.hotelName = command.hotelName;
        event.hotelCity = command.hotelCity;
        event.checkIn = command.checkIn;
        event.checkOut = command.checkOut;
        event.price = offer.price;
        event.adults = command.adults;
        event.paymentMethod = command.paymentMethod;

        std::cout << "[CreateBookingHandler] Booking hotel " << command.hotelName
                  << " for " << command.userId << " as " << aggregateId << std::endl;
        return pipeline_->execute(aggregateId, 0, {domain::toDraft(event, command.commandId)},
                                  command.commandId, event.bookingId);
    }

private:
    std::shared_ptr<ports::output::IOfferProvider> provider_;
    std::shared_ptr<CommandPipeline> pipeline_;

    /**
     * @brief Агрегат из команды; при наличии commandId выводится из него,
     *        чтобы повторная отправка попала в тот же агрегат
     */
    static std::string resolveAggregateId(const std::string& requested, const std::string& commandId) {
        if (!requested.empty()) {
            return requested;
        }
        if (!commandId.empty()) {
            return "agg-" + commandId;
        }
        return utils::UuidGenerator::generate();
    }

    domain::OfferValidation checkOffer(
        const std::string& offerId,
        int32_t adults,
        const std::optional<double>& expectedPrice)
    {
        auto validation = provider_->validateOffer(offerId);

        std::string reason;
        if (!validation.valid) {
            reason = "offer is no longer valid";
        } else if (validation.capacity <= 0) {
            reason = "sold out";
        } else if (validation.capacity < adults) {
            reason = "only " + std::to_string(validation.capacity) + " seats left";
        } else if (expectedPrice &&
                   domain::Money::fromDouble(*expectedPrice, validation.price.currency) != validation.price) {
            reason = "price changed to " + std::to_string(validation.price.toDouble());
        }

        if (!reason.empty()) {
            std::cout << "[CreateBookingHandler] REJECTED: offer " << offerId << " " << reason << std::endl;
            throw domain::OfferUnavailableError(offerId, reason);
        }
        return validation;
    }
};

} // namespace booking::application
