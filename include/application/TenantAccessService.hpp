#pragma once

#include "ports/input/ITenantAccessService.hpp"
#include "ports/output/ITenantRepository.hpp"
#include "application/TenantResolver.hpp"
#include "application/UsageRecorder.hpp"
#include "domain/DomainMatcher.hpp"
#include <memory>
#include <iostream>

namespace lease::application {

/**
 * @brief Операции по id арендатора или виджета, без токена
 *
 * Проверка домена, проверка арендатора, сведения о виджете
 * и учёт использования.
 */
class TenantAccessService : public ports::input::ITenantAccessService {
public:
    TenantAccessService(
        std::shared_ptr<ports::output::ITenantRepository> repository,
        std::shared_ptr<UsageRecorder> usageRecorder
    ) : repository_(repository)
      , resolver_(std::move(repository))
      , usageRecorder_(std::move(usageRecorder))
    {
        std::cout << "[TenantAccessService] Created" << std::endl;
    }

    ports::input::DomainCheckResult verifyDomain(
        const std::string& tenantId,
        const std::string& origin
    ) override {
        ports::input::DomainCheckResult result;

        auto lookup = resolver_.resolve(tenantId, false);
        if (!lookup.ok()) {
            result.error = lookup.error;
            result.message = lookup.message;
            return result;
        }

        const domain::TenantRecord& tenant = *lookup.tenant;
        result.restrictions = tenant.hasDomainRestrictions();
        result.allowedOrigins = tenant.allowedOrigins;
        result.allowed = domain::DomainMatcher::isAllowed(origin, tenant.allowedOrigins);
        return result;
    }

    ports::input::ClientCheckResult validateClient(
        const std::string& tenantId,
        const std::optional<std::string>& origin
    ) override {
        ports::input::ClientCheckResult result;
        result.tenantId = tenantId;

        auto lookup = resolver_.resolve(tenantId);
        if (!lookup.ok()) {
            result.error = lookup.error;
            result.message = lookup.message;
            return result;
        }

        const domain::TenantRecord& tenant = *lookup.tenant;
        result.valid = true;
        result.tenantName = tenant.name;
        result.active = tenant.active;
        result.restrictions = tenant.hasDomainRestrictions();
        result.allowedOrigins = tenant.allowedOrigins;

        bool hasOrigin = origin.has_value() && !origin->empty();
        if (hasOrigin && result.restrictions) {
            result.domainAllowed = domain::DomainMatcher::isAllowed(*origin, tenant.allowedOrigins);
        }
        result.message = "Valid";
        return result;
    }

    ports::input::WidgetInfoResult widgetInfo(const std::string& widgetId) override {
        ports::input::WidgetInfoResult result;

        std::optional<domain::TenantRecord> tenant;
        try {
            tenant = repository_->findTenantByWidgetId(widgetId);
        } catch (const domain::StoreUnavailableError& e) {
            std::cerr << "[TenantAccessService] Store unavailable for widget "
                      << widgetId << ": " << e.what() << std::endl;
            result.error = domain::ValidationError::STORE_UNAVAILABLE;
            result.message = "Tenant store unavailable";
            return result;
        }

        if (!tenant) {
            result.error = domain::ValidationError::TENANT_NOT_FOUND;
            result.message = "Widget not found";
            return result;
        }

        result.found = true;
        result.config = tenant->widgetConfig;
        result.tenantName = tenant->name;
        result.active = tenant->active;
        return result;
    }

    void trackUsage(const std::string& tenantId) override {
        usageRecorder_->recordById(tenantId);
    }

private:
    std::shared_ptr<ports::output::ITenantRepository> repository_;
    TenantResolver resolver_;
    std::shared_ptr<UsageRecorder> usageRecorder_;
};

} // namespace lease::application
