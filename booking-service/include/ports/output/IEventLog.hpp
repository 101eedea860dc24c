#pragma once

#include "domain/Event.hpp"
#include <string>
#include <vector>
#include <cstdint>

namespace booking::ports::output {

/**
 * @brief Журнал событий: единственный источник истины
 *
 * События только добавляются. Версии агрегата идут с 1 без пропусков,
 * position задаёт глобальный порядок добавления.
 */
class IEventLog {
public:
    virtual ~IEventLog() = default;

    /**
     * @brief Атомарно добавить пачку событий агрегата
     *
     * Версии назначаются подряд начиная с expectedVersion + 1.
     * Либо видна вся пачка, либо ничего.
     *
     * @throws ConcurrencyConflictError текущая версия != expectedVersion
     * @throws StorageError сбой хранилища (ничего не записано)
     */
    virtual std::vector<domain::Event> append(
        const std::string& aggregateId,
        int64_t expectedVersion,
        const std::vector<domain::EventDraft>& drafts) = 0;

    /**
     * @brief События агрегата с версии fromVersion по возрастанию
     */
    virtual std::vector<domain::Event> read(const std::string& aggregateId, int64_t fromVersion) = 0;

    /**
     * @brief События всех агрегатов с position >= fromPosition в порядке добавления
     * @param limit максимум событий (0 — без ограничения)
     */
    virtual std::vector<domain::Event> readAll(int64_t fromPosition, size_t limit) = 0;

    /**
     * @brief Текущая версия агрегата (0 — событий нет)
     */
    virtual int64_t currentVersion(const std::string& aggregateId) = 0;

    /**
     * @brief Общее число событий в журнале
     */
    virtual int64_t count() = 0;
};

} // namespace booking::ports::output
