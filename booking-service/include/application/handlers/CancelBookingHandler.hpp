#pragma once

#include "application/CommandPipeline.hpp"
#include "ports/output/IBookingReadRepository.hpp"
#include "domain/commands/CancelBookingCommand.hpp"
#include "domain/events/BookingEvent.hpp"
#include <iostream>
#include <memory>

namespace booking::application {

/**
 * @brief Отмена подтверждённой брони; возврат равен цене брони
 */
class CancelBookingHandler {
public:
    CancelBookingHandler(
        std::shared_ptr<ports::output::IBookingReadRepository> repository,
        std::shared_ptr<CommandPipeline> pipeline
    ) : repository_(std::move(repository))
      , pipeline_(std::move(pipeline))
    {
        std::cout << "[CancelBookingHandler] Created" << std::endl;
    }

    /**
     * @brief Отменить бронь
     *
     * Решение принимается по строке, догнанной до текущей версии журнала.
     * Конфликт с параллельной командой пробрасывается.
     */
    domain::CommandResult handle(const domain::CancelBookingCommand& command) {
        command.validate();
        return record(command, loadRow(command.bookingId));
    }

private:
    std::shared_ptr<ports::output::IBookingReadRepository> repository_;
    std::shared_ptr<CommandPipeline> pipeline_;

    domain::BookingRow loadRow(const std::string& bookingId) {
        auto row = repository_->findByBookingId(bookingId);
        if (!row) {
            throw domain::InvalidStateTransitionError("Booking " + bookingId + " does not exist");
        }
        if (pipeline_->catchUp(row->aggregateId)) {
            std::cout << "[CancelBookingHandler] Row of " << bookingId
                      << " was behind the log, re-reading" << std::endl;
            row = repository_->findByBookingId(bookingId);
            if (!row) {
                throw domain::InvalidStateTransitionError("Booking " + bookingId + " does not exist");
            }
        }
        return *row;
    }

    domain::CommandResult record(const domain::CancelBookingCommand& command, const domain::BookingRow& row) {
        if (auto recorded = pipeline_->findRecorded(row.aggregateId, 1, command.commandId, row.bookingId)) {
            return *recorded;
        }

        if (row.status != domain::BookingStatus::CONFIRMED) {
            throw domain::InvalidStateTransitionError(
                "Booking " + row.bookingId + " is " + domain::toString(row.status) + " and cannot be cancelled");
        }

        domain::BookingCancelled event;
        event.reason = command.reason;
        event.refundAmount = row.price;

        int64_t expectedVersion = command.expectedVersion.value_or(row.lastVersion);
        std::cout << "[CancelBookingHandler] Cancelling " << row.bookingId
                  << " at version " << expectedVersion << std::endl;
        return pipeline_->execute(row.aggregateId, expectedVersion,
                                  {domain::toDraft(event, command.commandId)},
                                  command.commandId, row.bookingId);
    }
};

} // namespace booking::application
