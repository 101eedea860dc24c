#pragma once

#include "application/ProjectionEngine.hpp"
#include "ports/output/IEventLog.hpp"
#include "domain/CommandResult.hpp"
#include "domain/events/BookingConfirmed.hpp"
#include "domain/errors/BookingErrors.hpp"
#include <iostream>
#include <memory>
#include <optional>
#include <vector>

namespace booking::application {

/**
 * @brief Общие шаги 3 и 4 любой команды: запись в журнал, затем проекция
 *
 * Запись всегда предшествует проекции. Если проекция не удалась,
 * событие остаётся в журнале, а результат помечается DEGRADED.
 */
class CommandPipeline {
public:
    CommandPipeline(
        std::shared_ptr<ports::output::IEventLog> eventLog,
        std::shared_ptr<ProjectionEngine> projection
    ) : eventLog_(std::move(eventLog))
      , projection_(std::move(projection))
    {
        std::cout << "[CommandPipeline] Created" << std::endl;
    }

    /**
     * @brief Записать события агрегата и спроецировать их
     *
     * При ConcurrencyConflict проверяет, не записала ли уже выигравшая
     * сторона ту же команду (тот же commandId). Если да, возвращает уже
     * записанный результат, иначе пробрасывает конфликт.
     *
     * @param bookingId идентификатор брони для результата DEGRADED
     * @throws ConcurrencyConflictError
     * @throws StorageError
     */
    domain::CommandResult execute(
        const std::string& aggregateId,
        int64_t expectedVersion,
        const std::vector<domain::EventDraft>& drafts,
        const std::string& commandId,
        const std::string& bookingId)
    {
        std::vector<domain::Event> appended;
        try {
            appended = eventLog_->append(aggregateId, expectedVersion, drafts);
        } catch (const domain::ConcurrencyConflictError& e) {
            if (!commandId.empty()) {
                if (auto recorded = findRecorded(aggregateId, expectedVersion + 1, commandId, bookingId)) {
                    return *recorded;
                }
            }
            std::cerr << "[CommandPipeline] " << e.what() << std::endl;
            throw;
        } catch (const domain::StorageError& e) {
            std::cerr << "[CommandPipeline] Append failed for " << aggregateId << ": " << e.what() << std::endl;
            throw;
        }

        std::cout << "[CommandPipeline] Appended " << appended.size() << " event(s) to "
                  << aggregateId << ", version " << appended.back().version << std::endl;
        return project(appended, bookingId, false);
    }

    /**
     * @brief Найти в истории агрегата события, записанные командой commandId
     *
     * Используется для повторной отправки уже выполненной команды.
     */
    std::optional<domain::CommandResult> findRecorded(
        const std::string& aggregateId,
        int64_t fromVersion,
        const std::string& commandId,
        const std::string& bookingId)
    {
        if (commandId.empty()) {
            return std::nullopt;
        }

        std::vector<domain::Event> recorded;
        for (auto& event : eventLog_->read(aggregateId, fromVersion)) {
            if (event.commandId == commandId) {
                recorded.push_back(std::move(event));
            }
        }
        if (recorded.empty()) {
            return std::nullopt;
        }

        std::cout << "[CommandPipeline] Command " << commandId << " already recorded on "
                  << aggregateId << ", returning existing result" << std::endl;
        return project(recorded, bookingIdFrom(recorded, bookingId), true);
    }

    /**
     * @brief Догнать отставшую строку агрегата перед повтором команды
     *
     * @return true если строка продвинулась и команду можно повторить
     * @throws ProjectionFailureError
     */
    bool catchUp(const std::string& aggregateId) {
        return projection_->catchUp(aggregateId);
    }

private:
    std::shared_ptr<ports::output::IEventLog> eventLog_;
    std::shared_ptr<ProjectionEngine> projection_;

    domain::CommandResult project(
        const std::vector<domain::Event>& events,
        const std::string& bookingId,
        bool duplicate)
    {
        domain::CommandResult result;
        result.aggregateId = events.back().aggregateId;
        result.eventId = events.back().eventId;
        result.version = events.back().version;
        result.bookingId = bookingId;
        result.duplicate = duplicate;

        try {
            auto row = projection_->applyAll(events);
            result.outcome = domain::CommandOutcome::ACCEPTED;
            result.bookingId = row.bookingId;
            result.row = row;
        } catch (const domain::ProjectionFailureError& e) {
            std::cerr << "[CommandPipeline] Event " << result.eventId << " is durable but projection of "
                      << result.aggregateId << " failed: " << e.what() << std::endl;
            result.outcome = domain::CommandOutcome::DEGRADED;
            result.errorKind = domain::ErrorKind::PROJECTION_FAILURE;
            result.message = e.what();
        }
        return result;
    }

    static std::string bookingIdFrom(const std::vector<domain::Event>& events, const std::string& fallback) {
        for (const auto& event : events) {
            if (event.eventType == domain::BookingConfirmed::TYPE) {
                return event.payload.value("booking_id", fallback);
            }
        }
        return fallback;
    }
};

} // namespace booking::application
