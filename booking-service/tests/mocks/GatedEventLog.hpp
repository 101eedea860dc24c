#pragma once

#include "ports/output/IEventLog.hpp"
#include <condition_variable>
#include <memory>
#include <mutex>

namespace booking::tests {

/**
 * @brief Журнал-обёртка: append() ждёт, пока до него дойдут parties вызовов
 *
 * Позволяет гарантировать, что несколько команд прошли проверку
 * до того, как любая из них записала событие.
 */
class GatedEventLog : public ports::output::IEventLog {
public:
    GatedEventLog(std::shared_ptr<ports::output::IEventLog> delegate, int parties)
        : delegate_(std::move(delegate)), parties_(parties) {}

    std::vector<domain::Event> append(
        const std::string& aggregateId,
        int64_t expectedVersion,
        const std::vector<domain::EventDraft>& drafts) override
    {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            ++arrived_;
            gate_.notify_all();
            gate_.wait(lock, [this]() { return arrived_ >= parties_; });
        }
        return delegate_->append(aggregateId, expectedVersion, drafts);
    }

    std::vector<domain::Event> read(const std::string& aggregateId, int64_t fromVersion) override {
        return delegate_->read(aggregateId, fromVersion);
    }

    std::vector<domain::Event> readAll(int64_t fromPosition, size_t limit) override {
        return delegate_->readAll(fromPosition, limit);
    }

    int64_t currentVersion(const std::string& aggregateId) override {
        return delegate_->currentVersion(aggregateId);
    }

    int64_t count() override {
        return delegate_->count();
    }

private:
    std::shared_ptr<ports::output::IEventLog> delegate_;
    int parties_;
    int arrived_ = 0;
    std::mutex mutex_;
    std::condition_variable gate_;
};

} // namespace booking::tests
