#pragma once

#include "domain/Timestamp.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <cstdint>

namespace booking::domain {

/**
 * @brief Черновик события: ещё не имеет id, версии и позиции
 *
 * Версию, время и идентификатор назначает журнал при append().
 */
struct EventDraft {
    std::string eventType;
    int schemaVersion = 1;
    nlohmann::json payload = nlohmann::json::object();
    std::string commandId;    // Ключ идемпотентности команды (может быть пустым)
};

/**
 * @brief Неизменяемая запись журнала событий
 *
 * (aggregateId, version) уникальна, версии агрегата идут с 1 без пропусков.
 * position — глобальный порядок добавления в журнал.
 */
struct Event {
    std::string eventId;
    std::string aggregateId;
    std::string eventType;
    int64_t version = 0;
    Timestamp timestamp;
    int schemaVersion = 1;
    nlohmann::json payload = nlohmann::json::object();
    std::string commandId;
    int64_t position = 0;

    nlohmann::json toJson() const {
        nlohmann::json j;
        j["event_id"] = eventId;
        j["aggregate_id"] = aggregateId;
        j["event_type"] = eventType;
        j["version"] = version;
        j["timestamp"] = timestamp.toString();
        j["schema_version"] = schemaVersion;
        j["payload"] = payload;
        j["command_id"] = commandId;
        j["position"] = position;
        return j;
    }

    bool operator==(const Event& other) const {
        return eventId == other.eventId
            && aggregateId == other.aggregateId
            && eventType == other.eventType
            && version == other.version
            && timestamp == other.timestamp
            && schemaVersion == other.schemaVersion
            && payload == other.payload
            && commandId == other.commandId
            && position == other.position;
    }
};

} // namespace booking::domain
