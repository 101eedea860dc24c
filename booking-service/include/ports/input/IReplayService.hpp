#pragma once

#include "domain/BookingRow.hpp"
#include "domain/Event.hpp"
#include "domain/RebuildReport.hpp"
#include "domain/Timestamp.hpp"
#include <string>
#include <vector>
#include <cstdint>

namespace booking::ports::input {

/**
 * @brief Операционные функции: перестройка, выгрузка, аудит
 */
class IReplayService {
public:
    virtual ~IReplayService() = default;

    /**
     * @brief Перестроить строку агрегата из журнала
     * @throws NotFoundError у агрегата нет событий
     * @throws ProjectionFailureError свёртка не удалась (строка не тронута)
     */
    virtual domain::BookingRow rebuildReadModel(const std::string& aggregateId) = 0;

    /**
     * @brief Перестроить всю read model
     */
    virtual domain::RebuildReport rebuildReadModel() = 0;

    /**
     * @brief Выгрузить события с позиции fromPosition
     * @param limit 0 — без ограничения
     */
    virtual std::vector<domain::Event> exportEvents(int64_t fromPosition, size_t limit) = 0;

    /**
     * @brief Полная история агрегата
     */
    virtual std::vector<domain::Event> history(const std::string& aggregateId) = 0;

    /**
     * @brief Удалить отменённые брони, не менявшиеся с olderThan
     * @return число удалённых строк
     */
    virtual int64_t pruneReadModel(const domain::Timestamp& olderThan) = 0;
};

} // namespace booking::ports::input
