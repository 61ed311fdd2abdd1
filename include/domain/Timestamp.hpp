#pragma once

#include <string>
#include <chrono>
#include <cstdint>
#include <iomanip>
#include <sstream>
#include <ctime>

namespace lease::domain {

/**
 * @brief Момент времени с точностью до секунды
 *
 * Токены и счётчики использования оперируют Unix-секундами,
 * наружу (в JSON-ответы) время отдаётся в ISO 8601 (UTC).
 */
struct Timestamp {
    std::chrono::system_clock::time_point value;

    Timestamp() : value(std::chrono::system_clock::now()) {}

    explicit Timestamp(std::chrono::system_clock::time_point tp) : value(tp) {}

    static Timestamp now() {
        return Timestamp(std::chrono::system_clock::now());
    }

    static Timestamp fromUnixSeconds(int64_t seconds) {
        return Timestamp(std::chrono::system_clock::time_point(
            std::chrono::seconds(seconds)
        ));
    }

    int64_t toUnixSeconds() const {
        return std::chrono::duration_cast<std::chrono::seconds>(
            value.time_since_epoch()
        ).count();
    }

    Timestamp addSeconds(int64_t seconds) const {
        return Timestamp(value + std::chrono::seconds(seconds));
    }

    /**
     * @brief ISO 8601 в UTC, например "2025-12-16T10:30:00Z"
     */
    std::string toString() const {
        auto t = std::chrono::system_clock::to_time_t(value);
        std::tm tm{};
        gmtime_r(&t, &tm);

        std::ostringstream ss;
        ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
        return ss.str();
    }

    bool operator<(const Timestamp& other) const { return value < other.value; }
    bool operator==(const Timestamp& other) const { return value == other.value; }
};

} // namespace lease::domain
