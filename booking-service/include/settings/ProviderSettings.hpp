#pragma once

#include <chrono>
#include <cstddef>
#include <cstdlib>
#include <string>

namespace booking::settings {

/**
 * @brief Настройки провайдера предложений
 *
 * Читает из ENV:
 * - BOOKING_PROVIDER_TIMEOUT_MS (default: 2000)
 * - BOOKING_PROVIDER_LATENCY_MS (default: 0) — задержка встроенного каталога
 * - BOOKING_CURRENCY (default: EUR)
 * - BOOKING_PROVIDER_WORKERS (default: 4) — потоков для вызовов провайдера
 * - BOOKING_PROVIDER_QUEUE (default: 64) — ожидающих вызовов сверх занятых потоков
 */
class ProviderSettings {
public:
    ProviderSettings() {
        if (const char* val = std::getenv("BOOKING_PROVIDER_TIMEOUT_MS")) {
            timeoutMs_ = std::stoi(val);
        }
        if (const char* val = std::getenv("BOOKING_PROVIDER_LATENCY_MS")) {
            latencyMs_ = std::stoi(val);
        }
        if (const char* val = std::getenv("BOOKING_CURRENCY")) {
            currency_ = val;
        }
        if (const char* val = std::getenv("BOOKING_PROVIDER_WORKERS")) {
            workers_ = static_cast<size_t>(std::stoi(val));
        }
        if (const char* val = std::getenv("BOOKING_PROVIDER_QUEUE")) {
            queueCapacity_ = static_cast<size_t>(std::stoi(val));
        }
    }

    std::chrono::milliseconds getTimeout() const { return std::chrono::milliseconds(timeoutMs_); }
    std::chrono::milliseconds getLatency() const { return std::chrono::milliseconds(latencyMs_); }
    std::string getCurrency() const { return currency_; }
    size_t getWorkers() const { return workers_; }
    size_t getQueueCapacity() const { return queueCapacity_; }

private:
    int timeoutMs_ = 2000;
    int latencyMs_ = 0;
    std::string currency_ = "EUR";
    size_t workers_ = 4;
    size_t queueCapacity_ = 64;
};

} // namespace booking::settings
