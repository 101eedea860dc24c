#pragma once

#include "ports/output/IOfferProvider.hpp"
#include "domain/errors/BookingErrors.hpp"
#include <ThreadSafeQueue.hpp>
#include <algorithm>
#include <chrono>
#include <functional>
#include <future>
#include <iostream>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace booking::adapters::secondary {

/**
 * @brief Декоратор IOfferProvider: каждый вызов ограничен по времени
 *
 * Вызовы делегата выполняет фиксированный набор рабочих потоков,
 * задания ждут в ограниченной очереди. Если очередь заполнена или ответ
 * не пришёл за timeout, бросается ProviderError; опоздавшее задание
 * дорабатывает в своём потоке, и его результат отбрасывается.
 *
 * shutdown() закрывает очередь (ожидающие задания отменяются)
 * и дожидается потоков, поэтому после него вызовов делегата нет.
 */
class TimeoutOfferProvider : public ports::output::IOfferProvider {
public:
    static constexpr size_t DEFAULT_WORKERS = 4;
    static constexpr size_t DEFAULT_QUEUE_CAPACITY = 64;

    TimeoutOfferProvider(
        std::shared_ptr<ports::output::IOfferProvider> delegate,
        std::chrono::milliseconds timeout,
        size_t workers = DEFAULT_WORKERS,
        size_t queueCapacity = DEFAULT_QUEUE_CAPACITY
    ) : delegate_(std::move(delegate))
      , timeout_(timeout)
      , queue_(queueCapacity)
    {
        workers_.reserve(workers);
        for (size_t i = 0; i < std::max<size_t>(workers, 1); ++i) {
            workers_.emplace_back([this]() { runWorker(); });
        }
        std::cout << "[TimeoutOfferProvider] Created (timeout=" << timeout_.count() << "ms, workers="
                  << workers_.size() << ", queue=" << queueCapacity << ")" << std::endl;
    }

    ~TimeoutOfferProvider() override {
        shutdown();
    }

    TimeoutOfferProvider(const TimeoutOfferProvider&) = delete;
    TimeoutOfferProvider& operator=(const TimeoutOfferProvider&) = delete;

    domain::OfferValidation validateOffer(const std::string& offerId) override {
        auto delegate = delegate_;
        return callWithTimeout<domain::OfferValidation>("validateOffer(" + offerId + ")",
            [delegate, offerId]() { return delegate->validateOffer(offerId); });
    }

    std::vector<domain::Offer> searchOffers(const domain::SearchCriteria& criteria) override {
        auto delegate = delegate_;
        return callWithTimeout<std::vector<domain::Offer>>("searchOffers",
            [delegate, criteria]() { return delegate->searchOffers(criteria); });
    }

    /**
     * @brief Отменить ожидающие задания и дождаться рабочих потоков
     */
    void shutdown() {
        std::lock_guard<std::mutex> lock(shutdownMutex_);
        if (workers_.empty()) {
            return;
        }
        queue_.shutdown();
        for (auto& worker : workers_) {
            if (worker.joinable()) {
                worker.join();
            }
        }
        workers_.clear();
        std::cout << "[TimeoutOfferProvider] Stopped" << std::endl;
    }

    /**
     * @brief Число заданий, ещё не взятых рабочими потоками
     */
    size_t pending() const {
        return queue_.size();
    }

private:
    std::shared_ptr<ports::output::IOfferProvider> delegate_;
    std::chrono::milliseconds timeout_;
    ThreadSafeQueue<std::function<void()>> queue_;
    std::vector<std::thread> workers_;
    std::mutex shutdownMutex_;

    void runWorker() {
        while (auto job = queue_.pop()) {
            (*job)();
        }
    }

    template <typename R, typename F>
    R callWithTimeout(const std::string& operation, F call) {
        auto task = std::make_shared<std::packaged_task<R()>>(std::move(call));
        auto future = task->get_future();
        if (!queue_.tryPush([task]() { (*task)(); })) {
            std::cerr << "[TimeoutOfferProvider] " << operation << " rejected: "
                      << (queue_.isShutdown() ? "provider stopped" : "queue full") << std::endl;
            throw domain::ProviderError(operation + (queue_.isShutdown()
                ? " rejected: provider stopped"
                : " rejected: too many pending provider calls"));
        }

        if (future.wait_for(timeout_) != std::future_status::ready) {
            std::cerr << "[TimeoutOfferProvider] " << operation << " timed out after "
                      << timeout_.count() << "ms" << std::endl;
            throw domain::ProviderError(operation + " timed out after " +
                                        std::to_string(timeout_.count()) + "ms");
        }

        try {
            return future.get();
        } catch (const domain::ProviderError&) {
            throw;
        } catch (const std::exception& e) {
            std::cerr << "[TimeoutOfferProvider] " << operation << " failed: " << e.what() << std::endl;
            throw domain::ProviderError(operation + " failed: " + e.what());
        }
    }
};

} // namespace booking::adapters::secondary
