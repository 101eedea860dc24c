#pragma once

#include <string>
#include <random>
#include <sstream>
#include <iomanip>
#include <cstdint>

namespace booking::utils {

/**
 * @brief Генератор идентификаторов событий, агрегатов и бронирований
 *
 * @note Thread-safe благодаря thread_local генератору
 */
class UuidGenerator {
public:
    /**
     * @brief UUID v4: xxxxxxxx-xxxx-4xxx-yxxx-xxxxxxxxxxxx
     */
    static std::string generate() {
        uint64_t part1 = next();
        uint64_t part2 = next();

        std::ostringstream ss;
        ss << std::hex << std::setfill('0');
        ss << std::setw(8) << ((part1 >> 32) & 0xFFFFFFFF) << "-";
        ss << std::setw(4) << ((part1 >> 16) & 0xFFFF) << "-";
        ss << std::setw(4) << ((part1 & 0x0FFF) | 0x4000) << "-";
        ss << std::setw(4) << (((part2 >> 48) & 0x3FFF) | 0x8000) << "-";
        ss << std::setw(12) << (part2 & 0xFFFFFFFFFFFFULL);
        return ss.str();
    }

    /**
     * @brief Короткий ID с префиксом: "bkg-1a2b3c4d5e6f7a8b"
     */
    static std::string generateWithPrefix(const std::string& prefix) {
        std::ostringstream ss;
        ss << prefix << "-" << std::hex << std::setfill('0') << std::setw(16) << next();
        return ss.str();
    }

private:
    static uint64_t next() {
        thread_local std::random_device rd;
        thread_local std::mt19937_64 gen(rd());
        std::uniform_int_distribution<uint64_t> dist;
        return dist(gen);
    }
};

} // namespace booking::utils
