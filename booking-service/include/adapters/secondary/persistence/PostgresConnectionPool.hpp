#pragma once

#include "settings/DbSettings.hpp"
#include "domain/errors/BookingErrors.hpp"
#include <pqxx/pqxx>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <iostream>
#include <memory>
#include <mutex>

namespace booking::adapters::secondary {

/**
 * @brief Ограниченный пул соединений PostgreSQL
 *
 * Общий для журнала событий и read model: оба хранилища владеют
 * своими таблицами, но берут соединения из одного пула.
 * Соединения открываются лениво, не больше poolSize одновременно.
 */
class PostgresConnectionPool {
public:
    /**
     * @brief Соединение, взятое из пула; возвращается в деструкторе
     */
    class Lease {
    public:
        Lease(PostgresConnectionPool* pool, std::unique_ptr<pqxx::connection> conn)
            : pool_(pool), conn_(std::move(conn)) {}

        Lease(Lease&& other) noexcept
            : pool_(other.pool_), conn_(std::move(other.conn_)) {
            other.pool_ = nullptr;
        }

        Lease(const Lease&) = delete;
        Lease& operator=(const Lease&) = delete;
        Lease& operator=(Lease&&) = delete;

        ~Lease() {
            if (pool_ && conn_) {
                pool_->release(std::move(conn_));
            }
        }

        pqxx::connection& operator*() { return *conn_; }
        pqxx::connection* operator->() { return conn_.get(); }

    private:
        PostgresConnectionPool* pool_;
        std::unique_ptr<pqxx::connection> conn_;
    };

    explicit PostgresConnectionPool(std::shared_ptr<settings::DbSettings> settings)
        : settings_(std::move(settings))
        , maxSize_(settings_->getPoolSize() > 0 ? settings_->getPoolSize() : 1)
        , acquireTimeout_(settings_->getAcquireTimeoutMs())
    {
        std::cout << "[PostgresConnectionPool] Created for " << settings_->getName()
                  << " (size=" << maxSize_ << ")" << std::endl;
    }

    ~PostgresConnectionPool() {
        shutdown();
    }

    /**
     * @brief Взять соединение
     * @throws StorageError пул закрыт, истёк таймаут или не удалось подключиться
     */
    Lease acquire() {
        std::unique_lock<std::mutex> lock(mutex_);
        bool ready = available_.wait_for(lock, acquireTimeout_, [this]() {
            return shutdown_ || !idle_.empty() || opened_ < maxSize_;
        });

        if (shutdown_) {
            throw domain::StorageError("Connection pool is shut down");
        }
        if (!ready) {
            std::cerr << "[PostgresConnectionPool] Timed out after " << acquireTimeout_.count()
                      << "ms waiting for a connection" << std::endl;
            throw domain::StorageError("Timed out waiting for a database connection");
        }

        if (!idle_.empty()) {
            auto conn = std::move(idle_.front());
            idle_.pop_front();
            return Lease(this, std::move(conn));
        }

        opened_++;
        lock.unlock();

        try {
            auto conn = std::make_unique<pqxx::connection>(settings_->getConnectionString());
            std::cout << "[PostgresConnectionPool] Opened connection to " << settings_->getHost()
                      << ":" << settings_->getPort() << std::endl;
            return Lease(this, std::move(conn));
        } catch (const std::exception& e) {
            {
                std::lock_guard<std::mutex> guard(mutex_);
                opened_--;
            }
            available_.notify_one();
            std::cerr << "[PostgresConnectionPool] Connection failed: " << e.what() << std::endl;
            throw domain::StorageError(std::string("Database connection failed: ") + e.what());
        }
    }

    /**
     * @brief Закрыть все простаивающие соединения и отклонять новые запросы
     */
    void shutdown() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (shutdown_) {
                return;
            }
            shutdown_ = true;
            opened_ -= idle_.size();
            idle_.clear();
        }
        available_.notify_all();
        std::cout << "[PostgresConnectionPool] Shut down" << std::endl;
    }

private:
    std::shared_ptr<settings::DbSettings> settings_;
    size_t maxSize_;
    std::chrono::milliseconds acquireTimeout_;

    std::mutex mutex_;
    std::condition_variable available_;
    std::deque<std::unique_ptr<pqxx::connection>> idle_;
    size_t opened_ = 0;
    bool shutdown_ = false;

    void release(std::unique_ptr<pqxx::connection> conn) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (shutdown_ || !conn->is_open()) {
                opened_--;
            } else {
                idle_.push_back(std::move(conn));
            }
        }
        available_.notify_one();
    }
};

} // namespace booking::adapters::secondary
