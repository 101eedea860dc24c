#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include <cstdint>

namespace booking::domain {

/**
 * @brief Итог полной перестройки read model
 *
 * Ошибка одного агрегата не останавливает перестройку остальных.
 */
class RebuildReport {
public:
    struct Failure {
        std::string aggregateId;
        std::string eventId;
        std::string message;
    };

    int64_t aggregatesRebuilt = 0;
    int64_t eventsScanned = 0;
    std::vector<Failure> failures;

    RebuildReport() = default;

    bool ok() const { return failures.empty(); }

    nlohmann::json toJson() const {
        nlohmann::json j;
        j["aggregates_rebuilt"] = aggregatesRebuilt;
        j["events_scanned"] = eventsScanned;
        j["failures"] = nlohmann::json::array();
        for (const auto& f : failures) {
            j["failures"].push_back({
                {"aggregate_id", f.aggregateId},
                {"event_id", f.eventId},
                {"message", f.message}
            });
        }
        return j;
    }
};

} // namespace booking::domain
