#pragma once

#include "ports/input/IBookingCommandService.hpp"
#include "application/handlers/CreateBookingHandler.hpp"
#include "application/handlers/AmendBookingHandler.hpp"
#include "application/handlers/CancelBookingHandler.hpp"
#include "domain/enums/CommandKind.hpp"
#include <iostream>
#include <memory>

namespace booking::application {

/**
 * @brief Сервис команд: маршрутизация по виду команды
 */
class BookingCommandService : public ports::input::IBookingCommandService {
public:
    BookingCommandService(
        std::shared_ptr<CreateBookingHandler> createHandler,
        std::shared_ptr<AmendBookingHandler> amendHandler,
        std::shared_ptr<CancelBookingHandler> cancelHandler
    ) : createHandler_(std::move(createHandler))
      , amendHandler_(std::move(amendHandler))
      , cancelHandler_(std::move(cancelHandler))
    {
        std::cout << "[BookingCommandService] Created" << std::endl;
    }

    /**
     * @brief Выполнить команду из JSON
     *
     * Любая доменная ошибка возвращается как REJECTED с её видом,
     * ошибка проекции после записи — как DEGRADED.
     */
    domain::CommandResult submitCommand(const std::string& kind, const nlohmann::json& payload) override {
        auto parsed = domain::parseCommandKind(kind);
        if (!parsed) {
            return reject(kind, domain::ErrorKind::VALIDATION, "Unknown command kind: " + kind);
        }
        if (!payload.is_object()) {
            return reject(kind, domain::ErrorKind::VALIDATION, "Command payload must be a JSON object");
        }

        try {
            switch (*parsed) {
                case domain::CommandKind::BOOK_FLIGHT:
                    return bookFlight(domain::BookFlightCommand::fromJson(payload));
                case domain::CommandKind::BOOK_HOTEL:
                    return bookHotel(domain::BookHotelCommand::fromJson(payload));
                case domain::CommandKind::AMEND:
                    return amendBooking(domain::AmendBookingCommand::fromJson(payload));
                case domain::CommandKind::CANCEL:
                    return cancelBooking(domain::CancelBookingCommand::fromJson(payload));
            }
        } catch (const domain::BookingException& e) {
            return reject(kind, e.kind(), e.what());
        } catch (const nlohmann::json::exception& e) {
            return reject(kind, domain::ErrorKind::VALIDATION, std::string("Invalid payload: ") + e.what());
        }
        return reject(kind, domain::ErrorKind::VALIDATION, "Unsupported command kind: " + kind);
    }

    domain::CommandResult bookFlight(const domain::BookFlightCommand& command) override {
        return createHandler_->handle(command);
    }

    domain::CommandResult bookHotel(const domain::BookHotelCommand& command) override {
        return createHandler_->handle(command);
    }

    domain::CommandResult amendBooking(const domain::AmendBookingCommand& command) override {
        return amendHandler_->handle(command);
    }

    domain::CommandResult cancelBooking(const domain::CancelBookingCommand& command) override {
        return cancelHandler_->handle(command);
    }

private:
    std::shared_ptr<CreateBookingHandler> createHandler_;
    std::shared_ptr<AmendBookingHandler> amendHandler_;
    std::shared_ptr<CancelBookingHandler> cancelHandler_;

    static domain::CommandResult reject(const std::string& kind, domain::ErrorKind errorKind,
                                        const std::string& message)
    {
        std::cout << "[BookingCommandService] REJECTED " << kind << ": "
                  << domain::toString(errorKind) << ": " << message << std::endl;
        return domain::CommandResult::rejected(errorKind, message);
    }
};

} // namespace booking::application
