#pragma once

#include "ports/output/IBookingReadRepository.hpp"
#include <ThreadSafeMap.hpp>
#include <algorithm>
#include <iostream>
#include <mutex>
#include <unordered_map>

namespace booking::adapters::secondary {

/**
 * @brief In-memory read model
 */
class InMemoryBookingRepository : public ports::output::IBookingReadRepository {
public:
    InMemoryBookingRepository() {
        std::cout << "[InMemoryBookingRepository] Created" << std::endl;
    }

    void save(const domain::BookingRow& row) override {
        rows_.insert(row.bookingId, std::make_shared<domain::BookingRow>(row));

        std::lock_guard<std::mutex> lock(indexMutex_);
        aggregateIndex_[row.aggregateId] = row.bookingId;
    }

    std::optional<domain::BookingRow> findByBookingId(const std::string& bookingId) override {
        auto row = rows_.find(bookingId);
        return row ? std::optional(*row) : std::nullopt;
    }

    std::optional<domain::BookingRow> findByAggregateId(const std::string& aggregateId) override {
        std::string bookingId;
        {
            std::lock_guard<std::mutex> lock(indexMutex_);
            auto it = aggregateIndex_.find(aggregateId);
            if (it == aggregateIndex_.end()) {
                return std::nullopt;
            }
            bookingId = it->second;
        }
        return findByBookingId(bookingId);
    }

    /**
     * @brief Брони пользователя, новые первыми
     */
    std::vector<domain::BookingRow> findByUserId(const std::string& userId) override {
        std::vector<domain::BookingRow> result;
        for (const auto& row : rows_.getAll()) {
            if (row->userId == userId) {
                result.push_back(*row);
            }
        }

        std::sort(result.begin(), result.end(),
            [](const domain::BookingRow& a, const domain::BookingRow& b) {
                if (a.createdAt != b.createdAt) return a.createdAt > b.createdAt;
                return a.bookingId < b.bookingId;
            });
        return result;
    }

    std::vector<domain::BookingRow> findAll() override {
        std::vector<domain::BookingRow> result;
        for (const auto& row : rows_.getAll()) {
            result.push_back(*row);
        }

        std::sort(result.begin(), result.end(),
            [](const domain::BookingRow& a, const domain::BookingRow& b) {
                if (a.createdAt != b.createdAt) return a.createdAt < b.createdAt;
                return a.bookingId < b.bookingId;
            });
        return result;
    }

    bool removeByAggregateId(const std::string& aggregateId) override {
        std::string bookingId;
        {
            std::lock_guard<std::mutex> lock(indexMutex_);
            auto it = aggregateIndex_.find(aggregateId);
            if (it == aggregateIndex_.end()) {
                return false;
            }
            bookingId = it->second;
            aggregateIndex_.erase(it);
        }
        return rows_.remove(bookingId) != nullptr;
    }

    int64_t count() override {
        return static_cast<int64_t>(rows_.size());
    }

private:
    ThreadSafeMap<std::string, domain::BookingRow> rows_;                 // bookingId -> row
    std::mutex indexMutex_;
    std::unordered_map<std::string, std::string> aggregateIndex_;         // aggregateId -> bookingId
};

} // namespace booking::adapters::secondary
