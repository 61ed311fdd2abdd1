#pragma once

#include <IHttpHandler.hpp>
#include "ports/output/IClock.hpp"
#include "adapters/secondary/TokenSettings.hpp"
#include "adapters/primary/JsonResponses.hpp"
#include <nlohmann/json.hpp>
#include <memory>

namespace lease::adapters::primary {

/**
 * @brief GET /api/auth/info: параметры системы токенов
 *
 * Секрет подписи наружу не отдаётся, только TTL, алгоритм и issuer.
 */
class AuthInfoHandler : public IHttpHandler {
public:
    AuthInfoHandler(
        std::shared_ptr<secondary::TokenSettings> settings,
        std::shared_ptr<ports::output::IClock> clock
    ) : settings_(std::move(settings))
      , clock_(std::move(clock)) {}

    void handle(IRequest& req, IResponse& res) override {
        nlohmann::json response;
        response["system"] = "Widget Lease Authentication";
        response["version"] = "1.0.0";
        response["tokenExpiry"] = settings_->getTokenTtl().count();
        response["supportedAlgorithm"] = "HS256";
        response["issuer"] = settings_->getIssuer();
        response["features"] = {"token-generation", "token-verification", "token-refresh", "domain-validation"};
        response["endpoints"] = {
            {"token", "/api/auth/token"},
            {"verify", "/api/auth/verify"},
            {"refresh", "/api/auth/refresh"},
            {"validateClient", "/api/auth/validate-client"}
        };
        response["timestamp"] = clock_->now().toString();

        sendJson(res, 200, response);
    }

private:
    std::shared_ptr<secondary::TokenSettings> settings_;
    std::shared_ptr<ports::output::IClock> clock_;
};

} // namespace lease::adapters::primary
