#pragma once

#include "domain/TenantRecord.hpp"
#include <string>
#include <vector>

namespace lease::tests::mocks {

inline domain::TenantRecord makeTenant(
    const std::string& tenantId,
    std::vector<std::string> allowedOrigins = {},
    bool active = true
) {
    domain::TenantRecord tenant;
    tenant.tenantId = tenantId;
    tenant.name = "Tenant " + tenantId;
    tenant.active = active;
    tenant.allowedOrigins = std::move(allowedOrigins);
    tenant.widgetConfig.widgetId = "widget-" + tenantId;
    tenant.widgetConfig.customization.botName = "Bot " + tenantId;
    return tenant;
}

} // namespace lease::tests::mocks
