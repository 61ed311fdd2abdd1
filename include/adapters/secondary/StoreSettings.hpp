#pragma once

#include <string>
#include <chrono>
#include <cstdlib>

namespace lease::adapters::secondary {

/**
 * @brief Ограничения обращений к хранилищу арендаторов
 *
 * LEASE_STORE_TIMEOUT_MS: дедлайн одного обращения, по умолчанию 2000.
 * LEASE_STORE_MAX_IN_FLIGHT: сколько обращений может ждать хранилище
 * одновременно, по умолчанию 8.
 */
class StoreSettings {
public:
    StoreSettings() {
        timeout_ = std::chrono::milliseconds(std::stol(getEnvOrDefault("LEASE_STORE_TIMEOUT_MS", "2000")));
        maxInFlight_ = std::stoi(getEnvOrDefault("LEASE_STORE_MAX_IN_FLIGHT", "8"));
    }

    StoreSettings(std::chrono::milliseconds timeout, int maxInFlight)
        : timeout_(timeout), maxInFlight_(maxInFlight) {}

    std::chrono::milliseconds getTimeout() const { return timeout_; }
    int getMaxInFlight() const { return maxInFlight_; }

private:
    std::chrono::milliseconds timeout_;
    int maxInFlight_;

    static std::string getEnvOrDefault(const char* name, const std::string& defaultValue) {
        const char* value = std::getenv(name);
        return value ? value : defaultValue;
    }
};

} // namespace lease::adapters::secondary
