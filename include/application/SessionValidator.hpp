#pragma once

#include "ports/input/ISessionValidator.hpp"
#include "ports/output/ITokenCodec.hpp"
#include "ports/output/ITenantRepository.hpp"
#include "ports/output/IClock.hpp"
#include "application/TenantResolver.hpp"
#include "application/UsageRecorder.hpp"
#include "application/LeaseMetrics.hpp"
#include "domain/DomainMatcher.hpp"
#include <memory>
#include <iostream>

namespace lease::application {

/**
 * @brief Проверка сессии виджета
 *
 * Конечный автомат:
 *   RECEIVED -> DECODED -> TENANT_RESOLVED -> DOMAIN_CHECKED -> AUTHORIZED
 * с выходом в REJECTED на любом шаге.
 *
 * Домен всегда проверяется по текущему allow-list из хранилища,
 * снимок в токене используется только как идентификация.
 */
class SessionValidator : public ports::input::ISessionValidator {
public:
    SessionValidator(
        std::shared_ptr<ports::output::ITokenCodec> codec,
        std::shared_ptr<ports::output::ITenantRepository> repository,
        std::shared_ptr<ports::output::IClock> clock,
        std::shared_ptr<UsageRecorder> usageRecorder,
        std::shared_ptr<LeaseMetrics> metrics
    ) : codec_(std::move(codec))
      , resolver_(std::move(repository))
      , clock_(std::move(clock))
      , usageRecorder_(std::move(usageRecorder))
      , metrics_(std::move(metrics))
    {
        std::cout << "[SessionValidator] Created" << std::endl;
    }

    ports::input::ValidateResult validate(
        const std::string& serializedToken,
        const std::optional<std::string>& callerOrigin
    ) override {
        using domain::ValidationStage;
        using domain::ValidationError;

        ports::input::ValidateResult result;
        result.stage = ValidationStage::RECEIVED;

        // RECEIVED -> DECODED
        ports::output::DecodeResult decoded;
        try {
            decoded = codec_->decode(serializedToken, false);
        } catch (const domain::ConfigurationError& e) {
            std::cerr << "[SessionValidator] " << e.what() << std::endl;
            return reject(result, ValidationError::CONFIGURATION_ERROR, "Token validation is not configured");
        }
        if (!decoded.ok()) {
            return reject(result, domain::fromDecodeError(*decoded.error), decoded.message);
        }
        const domain::CapabilityToken& token = *decoded.token;
        result.stage = ValidationStage::DECODED;

        // DECODED -> TENANT_RESOLVED
        auto lookup = resolver_.resolve(token.tenantId);
        if (!lookup.ok()) {
            return reject(result, *lookup.error, lookup.message);
        }
        domain::TenantRecord& tenant = *lookup.tenant;
        result.stage = ValidationStage::TENANT_RESOLVED;

        // TENANT_RESOLVED -> DOMAIN_CHECKED
        bool hasOrigin = callerOrigin.has_value() && !callerOrigin->empty();
        if (tenant.hasDomainRestrictions()) {
            if (!hasOrigin) {
                return reject(result, ValidationError::DOMAIN_REQUIRED, "Domain information is required");
            }
            if (!domain::DomainMatcher::isAllowed(*callerOrigin, tenant.allowedOrigins)) {
                std::cout << "[SessionValidator] Domain " << *callerOrigin
                          << " not authorized for tenant " << tenant.tenantId << std::endl;
                return reject(result, ValidationError::DOMAIN_NOT_AUTHORIZED, "Domain not authorized");
            }
        }
        result.stage = ValidationStage::DOMAIN_CHECKED;

        // DOMAIN_CHECKED -> AUTHORIZED
        usageRecorder_->record(tenant);

        domain::AuthorizedConfig authorized;
        authorized.config = tenant.widgetConfig;
        authorized.tenantId = tenant.tenantId;
        authorized.tenantName = tenant.name;
        authorized.active = tenant.active;
        authorized.timestamp = clock_->now().toString();
        authorized.usageCount = tenant.usageCount;
        if (hasOrigin) {
            authorized.domain = *callerOrigin;
        }

        result.valid = true;
        result.stage = ValidationStage::AUTHORIZED;
        result.message = "Valid";
        result.authorized = std::move(authorized);
        metrics_->recordValidation(std::nullopt);

        std::cout << "[SessionValidator] Authorized tenant " << tenant.tenantId
                  << " (usage=" << tenant.usageCount << ")" << std::endl;
        return result;
    }

private:
    std::shared_ptr<ports::output::ITokenCodec> codec_;
    TenantResolver resolver_;
    std::shared_ptr<ports::output::IClock> clock_;
    std::shared_ptr<UsageRecorder> usageRecorder_;
    std::shared_ptr<LeaseMetrics> metrics_;

    ports::input::ValidateResult reject(
        ports::input::ValidateResult& result,
        domain::ValidationError error,
        const std::string& message
    ) {
        result.valid = false;
        result.rejectedAt = result.stage;
        result.stage = domain::ValidationStage::REJECTED;
        result.error = error;
        result.message = message;
        metrics_->recordValidation(error);

        std::cout << "[SessionValidator] Rejected at " << domain::toString(result.rejectedAt)
                  << ": " << domain::toString(error) << std::endl;
        return result;
    }
};

} // namespace lease::application
