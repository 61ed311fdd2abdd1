#pragma once

#include "domain/Timestamp.hpp"
#include "domain/WidgetConfig.hpp"
#include <string>
#include <vector>
#include <optional>
#include <cstdint>

namespace lease::domain {

/**
 * @brief Арендатор виджета (запись внешнего хранилища)
 *
 * Ядро читает запись при каждой проверке и пишет только
 * счётчик использования (usageCount, lastUsedAt).
 */
struct TenantRecord {
    std::string tenantId;
    std::string name;
    bool active = true;

    /// Пустой список означает отсутствие ограничений по домену
    std::vector<std::string> allowedOrigins;

    WidgetConfig widgetConfig;

    int64_t usageCount = 0;
    std::optional<Timestamp> lastUsedAt;

    bool hasDomainRestrictions() const {
        return !allowedOrigins.empty();
    }
};

} // namespace lease::domain
