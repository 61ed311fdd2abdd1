#pragma once

#include <string>
#include <cstdlib>

namespace lease::adapters::secondary {

/**
 * @brief Ключ администратора для выпуска токенов
 *
 * LEASE_ADMIN_KEY необязателен. Если задан, переданный в запросе
 * adminKey обязан с ним совпасть.
 */
class AdminSettings {
public:
    AdminSettings() {
        const char* value = std::getenv("LEASE_ADMIN_KEY");
        adminKey_ = value ? value : "";
    }

    explicit AdminSettings(std::string adminKey) : adminKey_(std::move(adminKey)) {}

    bool isConfigured() const { return !adminKey_.empty(); }

    bool matches(const std::string& candidate) const {
        return isConfigured() && candidate == adminKey_;
    }

private:
    std::string adminKey_;
};

} // namespace lease::adapters::secondary
