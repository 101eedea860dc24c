#pragma once

#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <queue>
#include <utility>

/**
 * @file ThreadSafeQueue.hpp
 * @brief Потокобезопасная ограниченная очередь
 * @details
 * tryPush() не блокирует: при заполненной или закрытой очереди
 * возвращает false. pop() блокирует до появления элемента или закрытия.
 * После shutdown() ещё не взятые элементы отбрасываются.
 */
template <typename T>
class ThreadSafeQueue {
public:
    explicit ThreadSafeQueue(size_t capacity) : capacity_(capacity) {}

    ~ThreadSafeQueue() {
        shutdown();
    }

    ThreadSafeQueue(const ThreadSafeQueue&) = delete;
    ThreadSafeQueue& operator=(const ThreadSafeQueue&) = delete;

    /**
     * @brief Добавить элемент, если есть место
     * @return false если очередь заполнена или закрыта
     */
    bool tryPush(T item) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (shutdown_ || queue_.size() >= capacity_) {
                return false;
            }
            queue_.push(std::move(item));
        }
        condVar_.notify_one();
        return true;
    }

    /**
     * @brief Извлечь элемент (блокирующий вызов)
     * @return std::nullopt, если очередь закрыта
     */
    std::optional<T> pop() {
        std::unique_lock<std::mutex> lock(mutex_);
        condVar_.wait(lock, [this]() { return !queue_.empty() || shutdown_; });

        if (shutdown_) {
            return std::nullopt;
        }

        T item = std::move(queue_.front());
        queue_.pop();
        return item;
    }

    /**
     * @brief Закрыть очередь, отбросить ожидающие элементы и пробудить потоки
     */
    void shutdown() {
        std::queue<T> dropped;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            shutdown_ = true;
            std::swap(dropped, queue_);
        }
        condVar_.notify_all();
    }

    bool isShutdown() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return shutdown_;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }

    size_t capacity() const { return capacity_; }

private:
    std::queue<T> queue_;
    const size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable condVar_;
    bool shutdown_ = false;
};
