#pragma once

#include <cstdlib>
#include <string>

namespace booking::settings {

/**
 * @brief Выбор хранилища
 *
 * Читает из ENV:
 * - BOOKING_STORAGE: memory (default) | postgres
 */
class StorageSettings {
public:
    StorageSettings() {
        if (const char* val = std::getenv("BOOKING_STORAGE")) {
            backend_ = val;
        }
    }

    std::string getBackend() const { return backend_; }
    bool usePostgres() const { return backend_ == "postgres"; }

private:
    std::string backend_ = "memory";
};

} // namespace booking::settings
