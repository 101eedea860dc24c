#pragma once

#include "domain/Event.hpp"
#include "domain/events/BookingConfirmed.hpp"
#include "domain/events/BookingAmended.hpp"
#include "domain/events/BookingCancelled.hpp"
#include <variant>
#include <string>

namespace booking::domain {

/**
 * @brief Закрытое множество событий агрегата бронирования
 *
 * При добавлении нового события:
 *   1. Добавить тип в variant
 *   2. Добавить ветку в decodeEvent()
 *   3. BookingProjector не скомпилируется, пока для типа нет своей свёртки
 */
using BookingEvent = std::variant<BookingConfirmed, BookingAmended, BookingCancelled>;

/**
 * @brief Имя типа события для записи в журнал
 */
std::string eventTypeOf(const BookingEvent& event);

/**
 * @brief Построить черновик для IEventLog::append()
 */
EventDraft toDraft(const BookingEvent& event, const std::string& commandId = "");

/**
 * @brief Разобрать payload записанного события
 *
 * @throws UnknownEventTypeError если eventType не из BookingEvent
 */
BookingEvent decodeEvent(const Event& event);

} // namespace booking::domain
