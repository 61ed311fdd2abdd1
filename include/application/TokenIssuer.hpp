#pragma once

#include "ports/input/ITokenIssuer.hpp"
#include "ports/output/ITokenCodec.hpp"
#include "ports/output/ITenantRepository.hpp"
#include "adapters/secondary/TokenSettings.hpp"
#include "application/TenantResolver.hpp"
#include "application/TenantClaims.hpp"
#include "application/LeaseMetrics.hpp"
#include <memory>
#include <iostream>

namespace lease::application {

/**
 * @brief Выпуск токенов и их проверка без побочных эффектов
 */
class TokenIssuer : public ports::input::ITokenIssuer {
public:
    TokenIssuer(
        std::shared_ptr<adapters::secondary::TokenSettings> settings,
        std::shared_ptr<ports::output::ITokenCodec> codec,
        std::shared_ptr<ports::output::ITenantRepository> repository,
        std::shared_ptr<LeaseMetrics> metrics
    ) : settings_(std::move(settings))
      , codec_(std::move(codec))
      , resolver_(std::move(repository))
      , metrics_(std::move(metrics))
    {
        std::cout << "[TokenIssuer] Created" << std::endl;
    }

    ports::input::IssueResult issueToken(const std::string& tenantId) override {
        ports::input::IssueResult result;

        auto lookup = resolver_.resolve(tenantId);
        if (!lookup.ok()) {
            result.error = lookup.error;
            result.message = lookup.message;
            metrics_->recordIssue(false);
            return result;
        }
        const domain::TenantRecord& tenant = *lookup.tenant;

        try {
            auto token = codec_->issue(
                tenant.tenantId,
                tenant.allowedOrigins,
                identityClaims(tenant),
                settings_->getTokenTtl()
            );
            result.success = true;
            result.expiresIn = token.lifetimeSeconds();
            result.tenantName = tenant.name;
            result.token = std::move(token);
            result.message = "Token generated successfully";
        } catch (const domain::ConfigurationError& e) {
            std::cerr << "[TokenIssuer] " << e.what() << std::endl;
            result.error = domain::ValidationError::CONFIGURATION_ERROR;
            result.message = "Token signing is not configured";
        }

        metrics_->recordIssue(result.success);
        return result;
    }

    ports::input::VerifyResult verifyToken(const std::string& serializedToken) override {
        ports::input::VerifyResult result;

        ports::output::DecodeResult decoded;
        try {
            decoded = codec_->decode(serializedToken, false);
        } catch (const domain::ConfigurationError& e) {
            std::cerr << "[TokenIssuer] " << e.what() << std::endl;
            result.error = domain::ValidationError::CONFIGURATION_ERROR;
            result.message = "Token validation is not configured";
            return result;
        }

        if (!decoded.ok()) {
            result.error = domain::fromDecodeError(*decoded.error);
            result.message = decoded.message;
            return result;
        }

        result.tenantId = decoded.token->tenantId;
        result.issuedAt = decoded.token->issuedAt;
        result.expiresAt = decoded.token->expiresAt;

        // Отсутствующий или отключённый арендатор не делает токен невалидным,
        // это лишь отражается в отчёте
        auto lookup = resolver_.resolve(result.tenantId, false);
        if (lookup.error == domain::ValidationError::STORE_UNAVAILABLE) {
            result.error = lookup.error;
            result.message = lookup.message;
            return result;
        }

        if (lookup.tenant) {
            result.tenantExists = true;
            result.tenantActive = lookup.tenant->active;
            result.tenantName = lookup.tenant->name;
        }

        result.valid = true;
        result.message = "Token is valid";
        return result;
    }

private:
    std::shared_ptr<adapters::secondary::TokenSettings> settings_;
    std::shared_ptr<ports::output::ITokenCodec> codec_;
    TenantResolver resolver_;
    std::shared_ptr<LeaseMetrics> metrics_;
};

} // namespace lease::application
