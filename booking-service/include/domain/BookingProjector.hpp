#pragma once

#include "domain/BookingRow.hpp"
#include "domain/Event.hpp"
#include <optional>
#include <vector>

namespace booking::domain {

/**
 * @brief Чистая свёртка событий в BookingRow
 *
 * Не обращается ни к журналу, ни к хранилищу. Одни и те же события
 * всегда дают одну и ту же строку.
 */
class BookingProjector {
public:
    /**
     * @brief Применить одно событие к текущему состоянию
     *
     * Событие с version <= lastVersion игнорируется (строка возвращается как есть).
     *
     * @throws UnknownEventTypeError тип события не известен
     * @throws ProjectionFailureError поток нарушен (пропуск версии,
     *         событие до создания, повторное создание)
     */
    static BookingRow apply(const std::optional<BookingRow>& current, const Event& event);

    /**
     * @brief Свернуть последовательность событий начиная с current
     */
    static std::optional<BookingRow> fold(std::optional<BookingRow> current,
                                          const std::vector<Event>& events);
};

} // namespace booking::domain
