#pragma once

#include "ports/input/IReplayService.hpp"
#include "ports/output/IEventLog.hpp"
#include "ports/output/IBookingReadRepository.hpp"
#include "application/ProjectionEngine.hpp"
#include <iostream>
#include <memory>

namespace booking::application {

/**
 * @brief Перестройка read model, выгрузка журнала, аудит
 *
 * Журнал здесь только читается.
 */
class ReplayService : public ports::input::IReplayService {
public:
    ReplayService(
        std::shared_ptr<ports::output::IEventLog> eventLog,
        std::shared_ptr<ports::output::IBookingReadRepository> repository,
        std::shared_ptr<ProjectionEngine> projection
    ) : eventLog_(std::move(eventLog))
      , repository_(std::move(repository))
      , projection_(std::move(projection))
    {
        std::cout << "[ReplayService] Created" << std::endl;
    }

    domain::BookingRow rebuildReadModel(const std::string& aggregateId) override {
        return projection_->rebuild(aggregateId);
    }

    domain::RebuildReport rebuildReadModel() override {
        std::cout << "[ReplayService] Rebuilding read model from " << eventLog_->count()
                  << " events" << std::endl;
        return projection_->rebuildAll();
    }

    std::vector<domain::Event> exportEvents(int64_t fromPosition, size_t limit) override {
        return eventLog_->readAll(fromPosition, limit);
    }

    std::vector<domain::Event> history(const std::string& aggregateId) override {
        return eventLog_->read(aggregateId, 1);
    }

    int64_t pruneReadModel(const domain::Timestamp& olderThan) override {
        int64_t removed = 0;
        for (const auto& row : repository_->findAll()) {
            if (row.status == domain::BookingStatus::CANCELLED && row.updatedAt < olderThan) {
                if (repository_->removeByAggregateId(row.aggregateId)) {
                    removed++;
                }
            }
        }
        std::cout << "[ReplayService] Pruned " << removed << " cancelled bookings older than "
                  << olderThan.toString() << std::endl;
        return removed;
    }

private:
    std::shared_ptr<ports::output::IEventLog> eventLog_;
    std::shared_ptr<ports::output::IBookingReadRepository> repository_;
    std::shared_ptr<ProjectionEngine> projection_;
};

} // namespace booking::application
