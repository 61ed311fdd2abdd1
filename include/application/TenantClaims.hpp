#pragma once

#include "domain/TenantRecord.hpp"
#include <nlohmann/json.hpp>

namespace lease::application {

/**
 * @brief Идентификационные claims токена, собранные из текущей записи арендатора
 */
inline nlohmann::json identityClaims(const domain::TenantRecord& tenant) {
    nlohmann::json claims;
    claims["tenantName"] = tenant.name;
    claims["widgetId"] = tenant.widgetConfig.widgetId;
    claims["tokenType"] = "jwt";
    return claims;
}

} // namespace lease::application
