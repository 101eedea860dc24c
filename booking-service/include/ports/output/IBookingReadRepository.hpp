#pragma once

#include "domain/BookingRow.hpp"
#include <optional>
#include <string>
#include <vector>
#include <cstdint>

namespace booking::ports::output {

/**
 * @brief Хранилище read model (одна строка на бронирование)
 *
 * Пишет в него только ProjectionEngine. Ключ — bookingId,
 * вторичный индекс — aggregateId.
 */
class IBookingReadRepository {
public:
    virtual ~IBookingReadRepository() = default;

    /**
     * @brief Вставить или заменить строку
     * @throws StorageError
     */
    virtual void save(const domain::BookingRow& row) = 0;

    virtual std::optional<domain::BookingRow> findByBookingId(const std::string& bookingId) = 0;

    virtual std::optional<domain::BookingRow> findByAggregateId(const std::string& aggregateId) = 0;

    virtual std::vector<domain::BookingRow> findByUserId(const std::string& userId) = 0;

    virtual std::vector<domain::BookingRow> findAll() = 0;

    /**
     * @brief Удалить строку агрегата (журнал не затрагивается)
     * @return true если строка была
     */
    virtual bool removeByAggregateId(const std::string& aggregateId) = 0;

    virtual int64_t count() = 0;
};

} // namespace booking::ports::output
