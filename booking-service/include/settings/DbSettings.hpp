#pragma once

#include <string>
#include <cstdlib>

namespace booking::settings {

/**
 * @brief Настройки подключения к PostgreSQL
 *
 * Читает параметры из переменных окружения.
 */
class DbSettings {
public:
    DbSettings() {
        host_ = getEnvOrDefault("BOOKING_DB_HOST", "localhost");
        port_ = std::stoi(getEnvOrDefault("BOOKING_DB_PORT", "5432"));
        name_ = getEnvOrDefault("BOOKING_DB_NAME", "booking_db");
        user_ = getEnvOrDefault("BOOKING_DB_USER", "booking_user");
        password_ = getEnvOrDefault("BOOKING_DB_PASSWORD", "");
        poolSize_ = static_cast<size_t>(std::stoi(getEnvOrDefault("BOOKING_DB_POOL_SIZE", "4")));
        acquireTimeoutMs_ = std::stoi(getEnvOrDefault("BOOKING_DB_ACQUIRE_TIMEOUT_MS", "5000"));
    }

    std::string getHost() const { return host_; }
    int getPort() const { return port_; }
    std::string getName() const { return name_; }
    std::string getUser() const { return user_; }
    std::string getPassword() const { return password_; }
    size_t getPoolSize() const { return poolSize_; }
    int getAcquireTimeoutMs() const { return acquireTimeoutMs_; }

    std::string getConnectionString() const {
        std::string conn = "host=" + host_ + " port=" + std::to_string(port_) +
                           " dbname=" + name_ + " user=" + user_;
        if (!password_.empty()) {
            conn += " password=" + password_;
        }
        return conn;
    }

private:
    std::string host_;
    int port_;
    std::string name_;
    std::string user_;
    std::string password_;
    size_t poolSize_;
    int acquireTimeoutMs_;

    static std::string getEnvOrDefault(const char* name, const char* defaultValue) {
        const char* value = std::getenv(name);
        return value ? std::string(value) : std::string(defaultValue);
    }
};

} // namespace booking::settings
