#pragma once

#include "ports/input/ITokenRefresher.hpp"
#include "ports/output/ITokenCodec.hpp"
#include "ports/output/ITenantRepository.hpp"
#include "ports/output/IClock.hpp"
#include "adapters/secondary/TokenSettings.hpp"
#include "application/TenantResolver.hpp"
#include "application/TenantClaims.hpp"
#include "application/LeaseMetrics.hpp"
#include <memory>
#include <iostream>

namespace lease::application {

/**
 * @brief Перевыпуск токена арендатора
 *
 * Старый токен должен иметь верную подпись, срок действия не важен.
 * Новый токен получает текущий allow-list арендатора и TTL из настроек.
 * Домен вызывающего не проверяется.
 */
class TokenRefresher : public ports::input::ITokenRefresher {
public:
    TokenRefresher(
        std::shared_ptr<adapters::secondary::TokenSettings> settings,
        std::shared_ptr<ports::output::ITokenCodec> codec,
        std::shared_ptr<ports::output::ITenantRepository> repository,
        std::shared_ptr<ports::output::IClock> clock,
        std::shared_ptr<LeaseMetrics> metrics
    ) : settings_(std::move(settings))
      , codec_(std::move(codec))
      , resolver_(std::move(repository))
      , clock_(std::move(clock))
      , metrics_(std::move(metrics))
    {
        std::cout << "[TokenRefresher] Created" << std::endl;
    }

    ports::input::RefreshResult refresh(const std::string& serializedToken) override {
        ports::input::RefreshResult result;

        try {
            auto decoded = codec_->decode(serializedToken, true);
            if (!decoded.ok()) {
                return fail(result, domain::fromDecodeError(*decoded.error), decoded.message);
            }

            const int64_t now = clock_->now().toUnixSeconds();
            result.previousTokenExpired = decoded.token->isExpiredAt(now);

            auto lookup = resolver_.resolve(decoded.token->tenantId);
            if (!lookup.ok()) {
                return fail(result, *lookup.error, lookup.message);
            }
            const domain::TenantRecord& tenant = *lookup.tenant;

            auto token = codec_->issue(
                tenant.tenantId,
                tenant.allowedOrigins,
                identityClaims(tenant),
                settings_->getTokenTtl()
            );

            result.success = true;
            result.expiresIn = token.lifetimeSeconds();
            result.token = std::move(token);
            result.message = "Token refreshed successfully";
            metrics_->recordRefresh(true);

            std::cout << "[TokenRefresher] Refreshed token for tenant " << tenant.tenantId
                      << (result.previousTokenExpired ? " (previous token expired)" : "")
                      << std::endl;
            return result;

        } catch (const domain::ConfigurationError& e) {
            std::cerr << "[TokenRefresher] " << e.what() << std::endl;
            return fail(result, domain::ValidationError::CONFIGURATION_ERROR,
                        "Token signing is not configured");
        }
    }

private:
    std::shared_ptr<adapters::secondary::TokenSettings> settings_;
    std::shared_ptr<ports::output::ITokenCodec> codec_;
    TenantResolver resolver_;
    std::shared_ptr<ports::output::IClock> clock_;
    std::shared_ptr<LeaseMetrics> metrics_;

    ports::input::RefreshResult fail(
        ports::input::RefreshResult& result,
        domain::ValidationError error,
        const std::string& message
    ) {
        result.success = false;
        result.token.reset();
        result.error = error;
        result.message = message;
        metrics_->recordRefresh(false);

        std::cout << "[TokenRefresher] Refresh rejected: " << domain::toString(error) << std::endl;
        return result;
    }
};

} // namespace lease::application
