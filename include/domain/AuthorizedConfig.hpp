#pragma once

#include "domain/WidgetConfig.hpp"
#include <string>
#include <optional>
#include <cstdint>

namespace lease::domain {

/**
 * @brief Результат успешной проверки сессии
 *
 * Конфигурация виджета плюс метаданные проверки.
 */
struct AuthorizedConfig {
    WidgetConfig config;

    std::string tenantId;
    std::string tenantName;
    bool active = true;

    std::string timestamp;               ///< ISO 8601
    int64_t usageCount = 0;              ///< Значение после инкремента
    std::optional<std::string> domain;   ///< Домен из запроса, как пришёл
};

} // namespace lease::domain
