#pragma once

#include "ports/output/ITenantRepository.hpp"
#include "domain/enums/ValidationError.hpp"
#include <memory>
#include <optional>
#include <string>
#include <iostream>

namespace lease::application {

/**
 * @brief Результат поиска арендатора
 */
struct TenantLookup {
    std::optional<domain::TenantRecord> tenant;
    std::optional<domain::ValidationError> error;
    std::string message;

    bool ok() const { return !error.has_value(); }
};

/**
 * @brief Поиск арендатора с проверкой флага active
 *
 * Общий шаг валидатора, рефрешера и выдачи токенов:
 * - нет записи          -> TENANT_NOT_FOUND
 * - active == false     -> TENANT_INACTIVE
 * - хранилище не ответило -> STORE_UNAVAILABLE
 */
class TenantResolver {
public:
    explicit TenantResolver(std::shared_ptr<ports::output::ITenantRepository> repository)
        : repository_(std::move(repository)) {}

    TenantLookup resolve(const std::string& tenantId, bool requireActive = true) const {
        TenantLookup lookup;

        std::optional<domain::TenantRecord> tenant;
        try {
            tenant = repository_->findTenant(tenantId);
        } catch (const domain::StoreUnavailableError& e) {
            std::cerr << "[TenantResolver] Store unavailable for tenant "
                      << tenantId << ": " << e.what() << std::endl;
            lookup.error = domain::ValidationError::STORE_UNAVAILABLE;
            lookup.message = "Tenant store unavailable";
            return lookup;
        }

        if (!tenant) {
            lookup.error = domain::ValidationError::TENANT_NOT_FOUND;
            lookup.message = "Client not found";
            return lookup;
        }

        if (requireActive && !tenant->active) {
            lookup.error = domain::ValidationError::TENANT_INACTIVE;
            lookup.message = "Client account is inactive";
            lookup.tenant = std::move(tenant);
            return lookup;
        }

        lookup.tenant = std::move(tenant);
        return lookup;
    }

private:
    std::shared_ptr<ports::output::ITenantRepository> repository_;
};

} // namespace lease::application
