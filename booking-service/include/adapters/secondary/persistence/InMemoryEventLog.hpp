#pragma once

#include "ports/output/IEventLog.hpp"
#include "domain/errors/BookingErrors.hpp"
#include "utils/UuidGenerator.hpp"
#include <algorithm>
#include <iostream>
#include <mutex>
#include <unordered_map>
#include <vector>

namespace booking::adapters::secondary {

/**
 * @brief In-memory журнал событий
 *
 * Один мьютекс на весь журнал: проверка версии и вставка пачки
 * выполняются под ним, поэтому читатели никогда не видят пропусков.
 */
class InMemoryEventLog : public ports::output::IEventLog {
public:
    InMemoryEventLog() {
        std::cout << "[InMemoryEventLog] Created" << std::endl;
    }

    std::vector<domain::Event> append(
        const std::string& aggregateId,
        int64_t expectedVersion,
        const std::vector<domain::EventDraft>& drafts) override
    {
        std::lock_guard<std::mutex> lock(mutex_);

        auto& stream = streams_[aggregateId];
        int64_t actual = static_cast<int64_t>(stream.size());
        if (actual != expectedVersion) {
            std::cerr << "[InMemoryEventLog] Conflict on " << aggregateId
                      << ": expected " << expectedVersion << ", actual " << actual << std::endl;
            throw domain::ConcurrencyConflictError(aggregateId, expectedVersion, actual);
        }

        // Время внутри агрегата не убывает, даже если часы сдвинулись назад
        domain::Timestamp floor = stream.empty()
            ? domain::Timestamp::fromUnixMicros(0)
            : events_[stream.back()].timestamp;

        std::vector<domain::Event> appended;
        appended.reserve(drafts.size());
        for (size_t i = 0; i < drafts.size(); ++i) {
            const auto& draft = drafts[i];
            domain::Event event;
            event.eventId = utils::UuidGenerator::generate();
            event.aggregateId = aggregateId;
            event.eventType = draft.eventType;
            event.version = expectedVersion + static_cast<int64_t>(i) + 1;
            event.timestamp = std::max(domain::Timestamp::now(), floor);
            event.schemaVersion = draft.schemaVersion;
            event.payload = draft.payload;
            event.commandId = draft.commandId;
            event.position = static_cast<int64_t>(events_.size() + i) + 1;
            floor = event.timestamp;
            appended.push_back(std::move(event));
        }

        for (const auto& event : appended) {
            stream.push_back(events_.size());
            events_.push_back(event);
        }

        return appended;
    }

    std::vector<domain::Event> read(const std::string& aggregateId, int64_t fromVersion) override {
        std::lock_guard<std::mutex> lock(mutex_);

        std::vector<domain::Event> result;
        auto it = streams_.find(aggregateId);
        if (it == streams_.end()) {
            return result;
        }

        size_t start = fromVersion > 1 ? static_cast<size_t>(fromVersion - 1) : 0;
        for (size_t i = start; i < it->second.size(); ++i) {
            result.push_back(events_[it->second[i]]);
        }
        return result;
    }

    std::vector<domain::Event> readAll(int64_t fromPosition, size_t limit) override {
        std::lock_guard<std::mutex> lock(mutex_);

        std::vector<domain::Event> result;
        size_t start = fromPosition > 1 ? static_cast<size_t>(fromPosition - 1) : 0;
        for (size_t i = start; i < events_.size(); ++i) {
            if (limit > 0 && result.size() >= limit) {
                break;
            }
            result.push_back(events_[i]);
        }
        return result;
    }

    int64_t currentVersion(const std::string& aggregateId) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = streams_.find(aggregateId);
        return it == streams_.end() ? 0 : static_cast<int64_t>(it->second.size());
    }

    int64_t count() override {
        std::lock_guard<std::mutex> lock(mutex_);
        return static_cast<int64_t>(events_.size());
    }

private:
    std::mutex mutex_;
    std::vector<domain::Event> events_;                                   // position - 1 -> event
    std::unordered_map<std::string, std::vector<size_t>> streams_;        // aggregateId -> индексы в events_
};

} // namespace booking::adapters::secondary
