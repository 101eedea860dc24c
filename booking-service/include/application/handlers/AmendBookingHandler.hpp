#pragma once

#include "application/CommandPipeline.hpp"
#include "ports/output/IBookingReadRepository.hpp"
#include "ports/output/IOfferProvider.hpp"
#include "domain/commands/AmendBookingCommand.hpp"
#include "domain/events/BookingEvent.hpp"
#include <iostream>
#include <memory>

namespace booking::application {

/**
 * @brief Изменение дат или числа пассажиров подтверждённой брони
 *
 * В событие попадают только реально изменившиеся поля. Увеличение
 * числа пассажиров заново проверяется у провайдера.
 */
class AmendBookingHandler {
public:
    AmendBookingHandler(
        std::shared_ptr<ports::output::IBookingReadRepository> repository,
        std::shared_ptr<ports::output::IOfferProvider> provider,
        std::shared_ptr<CommandPipeline> pipeline
    ) : repository_(std::move(repository))
      , provider_(std::move(provider))
      , pipeline_(std::move(pipeline))
    {
        std::cout << "[AmendBookingHandler] Created" << std::endl;
    }

    /**
     * @brief Изменить бронь
     *
     * Решение принимается по строке, догнанной до текущей версии журнала.
     * Конфликт с параллельной командой пробрасывается.
     */
    domain::CommandResult handle(const domain::AmendBookingCommand& command) {
        command.validate(domain::Timestamp::now().toDateString());
        return record(command, loadRow(command.bookingId));
    }

private:
    std::shared_ptr<ports::output::IBookingReadRepository> repository_;
    std::shared_ptr<ports::output::IOfferProvider> provider_;
    std::shared_ptr<CommandPipeline> pipeline_;

    domain::BookingRow loadRow(const std::string& bookingId) {
        auto row = repository_->findByBookingId(bookingId);
        if (!row) {
            throw domain::InvalidStateTransitionError("Booking " + bookingId + " does not exist");
        }
        if (pipeline_->catchUp(row->aggregateId)) {
            std::cout << "[AmendBookingHandler] Row of " << bookingId
                      << " was behind the log, re-reading" << std::endl;
            row = repository_->findByBookingId(bookingId);
            if (!row) {
                throw domain::InvalidStateTransitionError("Booking " + bookingId + " does not exist");
            }
        }
        return *row;
    }

    domain::CommandResult record(const domain::AmendBookingCommand& command, const domain::BookingRow& row) {
        if (auto recorded = pipeline_->findRecorded(row.aggregateId, 1, command.commandId, row.bookingId)) {
            return *recorded;
        }

        if (row.status != domain::BookingStatus::CONFIRMED) {
            throw domain::InvalidStateTransitionError(
                "Booking " + row.bookingId + " is " + domain::toString(row.status) + " and cannot be amended");
        }

        auto event = buildEvent(command, row);
        if (event.adults && *event.adults > row.adults) {
            checkExtraSeats(row, *event.adults - row.adults);
        }

        int64_t expectedVersion = command.expectedVersion.value_or(row.lastVersion);
        std::cout << "[AmendBookingHandler] Amending " << row.bookingId
                  << " at version " << expectedVersion << std::endl;
        return pipeline_->execute(row.aggregateId, expectedVersion,
                                  {domain::toDraft(event, command.commandId)},
                                  command.commandId, row.bookingId);
    }

    static domain::BookingAmended buildEvent(const domain::AmendBookingCommand& command,
                                             const domain::BookingRow& row)
    {
        bool flight = row.bookingType == domain::BookingType::FLIGHT;
        if (flight && (command.checkIn || command.checkOut)) {
            throw domain::ValidationError("check_in/check_out cannot be amended on a flight booking");
        }
        if (!flight && (command.departDate || command.returnDate)) {
            throw domain::ValidationError("depart_date/return_date cannot be amended on a hotel booking");
        }

        domain::BookingAmended event;
        event.reason = command.reason;
        if (command.departDate && *command.departDate != row.departDate) event.departDate = command.departDate;
        if (command.returnDate && *command.returnDate != row.returnDate) event.returnDate = command.returnDate;
        if (command.checkIn && *command.checkIn != row.checkIn) event.checkIn = command.checkIn;
        if (command.checkOut && *command.checkOut != row.checkOut) event.checkOut = command.checkOut;
        if (command.adults && *command.adults != row.adults) event.adults = command.adults;

        if (!event.departDate && !event.returnDate && !event.checkIn && !event.checkOut && !event.adults) {
            throw domain::ValidationError("amend does not change booking " + row.bookingId);
        }

        if (flight) {
            std::string depart = event.departDate.value_or(row.departDate);
            std::string ret = event.returnDate.value_or(row.returnDate);
            if (!ret.empty() && ret <= depart) {
                throw domain::ValidationError("return_date must be after depart_date");
            }
        } else {
            std::string checkIn = event.checkIn.value_or(row.checkIn);
            std::string checkOut = event.checkOut.value_or(row.checkOut);
            if (checkOut <= checkIn) {
                throw domain::ValidationError("check_out must be after check_in");
            }
        }
        return event;
    }

    void checkExtraSeats(const domain::BookingRow& row, int32_t extra) {
        auto validation = provider_->validateOffer(row.offerId);
        if (!validation.valid) {
            throw domain::OfferUnavailableError(row.offerId, "offer is no longer valid");
        }
        if (validation.capacity < extra) {
            std::cout << "[AmendBookingHandler] REJECTED: offer " << row.offerId << " has "
                      << validation.capacity << " seats, " << extra << " requested" << std::endl;
            throw domain::OfferUnavailableError(row.offerId,
                "only " + std::to_string(validation.capacity) + " seats left");
        }
    }
};

} // namespace booking::application
