#pragma once

#include "domain/CommandResult.hpp"
#include "domain/commands/BookFlightCommand.hpp"
#include "domain/commands/BookHotelCommand.hpp"
#include "domain/commands/AmendBookingCommand.hpp"
#include "domain/commands/CancelBookingCommand.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace booking::ports::input {

/**
 * @brief Командный интерфейс бронирований
 */
class IBookingCommandService {
public:
    virtual ~IBookingCommandService() = default;

    /**
     * @brief Универсальная точка входа: вид команды + JSON-тело
     *
     * Доменные ошибки не бросает, а возвращает как REJECTED.
     */
    virtual domain::CommandResult submitCommand(const std::string& kind,
                                                const nlohmann::json& payload) = 0;

    // Типизированные методы бросают BookingException при отказе.
    // DEGRADED возвращается, а не бросается.

    virtual domain::CommandResult bookFlight(const domain::BookFlightCommand& command) = 0;

    virtual domain::CommandResult bookHotel(const domain::BookHotelCommand& command) = 0;

    virtual domain::CommandResult amendBooking(const domain::AmendBookingCommand& command) = 0;

    virtual domain::CommandResult cancelBooking(const domain::CancelBookingCommand& command) = 0;
};

} // namespace booking::ports::input
