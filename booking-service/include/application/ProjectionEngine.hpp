#pragma once

#include "ports/output/IEventLog.hpp"
#include "ports/output/IBookingReadRepository.hpp"
#include "domain/BookingProjector.hpp"
#include "domain/RebuildReport.hpp"
#include "domain/errors/BookingErrors.hpp"
#include <array>
#include <functional>
#include <iostream>
#include <memory>
#include <mutex>
#include <unordered_set>

namespace booking::application {

/**
 * @brief Проекция событий журнала в read model
 *
 * Проекция одного агрегата сериализована (полосатые мьютексы), иначе
 * два параллельных обработчика могли бы записать более старую строку
 * поверх более новой. Разные агрегаты проецируются параллельно.
 *
 * Любая ошибка свёртки или сохранения превращается в ProjectionFailureError
 * и касается только своего агрегата.
 */
class ProjectionEngine {
public:
    static constexpr size_t LOCK_STRIPES = 64;
    static constexpr size_t DEFAULT_PAGE_SIZE = 500;

    ProjectionEngine(
        std::shared_ptr<ports::output::IEventLog> eventLog,
        std::shared_ptr<ports::output::IBookingReadRepository> repository
    ) : eventLog_(std::move(eventLog))
      , repository_(std::move(repository))
    {
        std::cout << "[ProjectionEngine] Created" << std::endl;
    }

    /**
     * @brief Применить только что записанное событие
     *
     * Повторное применение (version <= lastVersion) ничего не меняет.
     * Если строка отстала больше чем на одну версию, недостающие события
     * дочитываются из журнала.
     *
     * @throws ProjectionFailureError
     */
    domain::BookingRow apply(const domain::Event& event) {
        std::lock_guard<std::mutex> lock(stripeFor(event.aggregateId));

        return guarded(event.aggregateId, event.eventId, [&]() {
            auto current = repository_->findByAggregateId(event.aggregateId);
            if (current && event.version <= current->lastVersion) {
                return *current;
            }

            int64_t expected = current ? current->lastVersion + 1 : 1;
            std::vector<domain::Event> pending;
            if (event.version > expected) {
                std::cout << "[ProjectionEngine] Catching up " << event.aggregateId
                          << " from version " << expected << " to " << event.version << std::endl;
                for (auto& e : eventLog_->read(event.aggregateId, expected)) {
                    if (e.version <= event.version) {
                        pending.push_back(std::move(e));
                    }
                }
            } else {
                pending.push_back(event);
            }

            auto row = domain::BookingProjector::fold(current, pending);
            repository_->save(*row);
            return *row;
        });
    }

    /**
     * @brief Дотянуть строку агрегата до текущей версии журнала
     *
     * Нужна после DEGRADED: событие уже в журнале, а строка отстала.
     *
     * @return true если строка была продвинута
     * @throws ProjectionFailureError
     */
    bool catchUp(const std::string& aggregateId) {
        std::lock_guard<std::mutex> lock(stripeFor(aggregateId));

        auto current = repository_->findByAggregateId(aggregateId);
        int64_t stored = current ? current->lastVersion : 0;
        int64_t logVersion = eventLog_->currentVersion(aggregateId);
        if (logVersion <= stored) {
            return false;
        }

        auto pending = eventLog_->read(aggregateId, stored + 1);
        if (pending.empty()) {
            return false;
        }

        std::cout << "[ProjectionEngine] Catching up " << aggregateId
                  << " from version " << stored << " to " << logVersion << std::endl;
        guarded(aggregateId, pending.back().eventId, [&]() {
            auto row = domain::BookingProjector::fold(current, pending);
            repository_->save(*row);
            return *row;
        });
        return true;
    }

    /**
     * @brief Применить пачку событий одного агрегата по порядку
     */
    domain::BookingRow applyAll(const std::vector<domain::Event>& events) {
        if (events.empty()) {
            throw domain::ProjectionFailureError("", "", "no events to project");
        }
        domain::BookingRow row;
        for (const auto& event : events) {
            row = apply(event);
        }
        return row;
    }

    /**
     * @brief Свернуть поток агрегата с версии 1 и заменить строку
     *
     * Строка заменяется только если свёртка прошла успешно.
     *
     * @throws NotFoundError у агрегата нет событий
     * @throws ProjectionFailureError
     */
    domain::BookingRow rebuild(const std::string& aggregateId) {
        std::lock_guard<std::mutex> lock(stripeFor(aggregateId));

        auto events = eventLog_->read(aggregateId, 1);
        if (events.empty()) {
            throw domain::NotFoundError("No events for aggregate " + aggregateId);
        }

        auto row = guarded(aggregateId, events.back().eventId, [&]() {
            auto folded = domain::BookingProjector::fold(std::nullopt, events);
            repository_->save(*folded);
            return *folded;
        });

        std::cout << "[ProjectionEngine] Rebuilt " << aggregateId
                  << " at version " << row.lastVersion << std::endl;
        return row;
    }

    /**
     * @brief Перестроить все агрегаты журнала
     *
     * Журнал читается страницами по pageSize. Ошибка одного агрегата
     * попадает в отчёт и не останавливает остальные.
     */
    domain::RebuildReport rebuildAll(size_t pageSize = DEFAULT_PAGE_SIZE) {
        domain::RebuildReport report;
        std::vector<std::string> aggregates;
        std::unordered_set<std::string> seen;

        int64_t position = 1;
        while (true) {
            auto page = eventLog_->readAll(position, pageSize);
            if (page.empty()) {
                break;
            }
            for (const auto& event : page) {
                if (seen.insert(event.aggregateId).second) {
                    aggregates.push_back(event.aggregateId);
                }
            }
            report.eventsScanned += static_cast<int64_t>(page.size());
            position = page.back().position + 1;
            if (page.size() < pageSize) {
                break;
            }
        }

        for (const auto& aggregateId : aggregates) {
            try {
                rebuild(aggregateId);
                report.aggregatesRebuilt++;
            } catch (const domain::ProjectionFailureError& e) {
                report.failures.push_back({aggregateId, e.eventId(), e.what()});
            } catch (const domain::BookingException& e) {
                std::cerr << "[ProjectionEngine] Rebuild of " << aggregateId
                          << " failed: " << e.what() << std::endl;
                report.failures.push_back({aggregateId, "", e.what()});
            }
        }

        std::cout << "[ProjectionEngine] Rebuild complete: " << report.aggregatesRebuilt
                  << " aggregates, " << report.failures.size() << " failures" << std::endl;
        return report;
    }

private:
    std::shared_ptr<ports::output::IEventLog> eventLog_;
    std::shared_ptr<ports::output::IBookingReadRepository> repository_;
    std::array<std::mutex, LOCK_STRIPES> stripes_;

    std::mutex& stripeFor(const std::string& aggregateId) {
        return stripes_[std::hash<std::string>{}(aggregateId) % LOCK_STRIPES];
    }

    /**
     * @brief Выполнить шаг проекции, сведя все ошибки к ProjectionFailureError
     */
    template <typename F>
    domain::BookingRow guarded(const std::string& aggregateId, const std::string& eventId, F step) {
        try {
            return step();
        } catch (const domain::ProjectionFailureError& e) {
            std::cerr << "[ProjectionEngine] " << e.what() << std::endl;
            throw;
        } catch (const std::exception& e) {
            std::cerr << "[ProjectionEngine] Projection failed for " << aggregateId
                      << " at event " << eventId << ": " << e.what() << std::endl;
            throw domain::ProjectionFailureError(aggregateId, eventId, e.what());
        }
    }
};

} // namespace booking::application
