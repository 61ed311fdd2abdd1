#pragma once

#include <IHttpHandler.hpp>
#include "ports/input/ITokenIssuer.hpp"
#include "adapters/primary/JsonResponses.hpp"
#include "domain/Timestamp.hpp"
#include <nlohmann/json.hpp>
#include <memory>

namespace lease::adapters::primary {

/**
 * @brief Проверка токена без учёта использования
 *
 * POST /api/auth/verify
 * { "token": "eyJ..." }
 *
 * Response:
 * {
 *   "valid": true,
 *   "tenantId": "t1",
 *   "issuedAt": "...",
 *   "expiresAt": "...",
 *   "client": { "exists": true, "active": true, "name": "Acme" }
 * }
 */
class VerifyTokenHandler : public IHttpHandler {
public:
    explicit VerifyTokenHandler(
        std::shared_ptr<ports::input::ITokenIssuer> issuer
    ) : issuer_(std::move(issuer)) {}

    void handle(IRequest& req, IResponse& res) override {
        try {
            auto body = nlohmann::json::parse(req.getBody());

            std::string token = body.value("token", "");
            if (token.empty()) {
                sendError(res, 400, "Token is required", "Please provide a token to verify");
                return;
            }

            auto result = issuer_->verifyToken(token);
            if (!result.valid) {
                sendValidationError(res, *result.error, result.message);
                return;
            }

            nlohmann::json client;
            client["exists"] = result.tenantExists;
            client["active"] = result.tenantActive;
            client["name"] = result.tenantExists ? nlohmann::json(result.tenantName) : nlohmann::json(nullptr);

            nlohmann::json response;
            response["valid"] = true;
            response["tenantId"] = result.tenantId;
            response["issuedAt"] = domain::Timestamp::fromUnixSeconds(result.issuedAt).toString();
            response["expiresAt"] = domain::Timestamp::fromUnixSeconds(result.expiresAt).toString();
            response["client"] = client;

            sendJson(res, 200, response);

        } catch (const nlohmann::json::exception& e) {
            sendError(res, 400, "Invalid JSON", e.what());
        }
    }

private:
    std::shared_ptr<ports::input::ITokenIssuer> issuer_;
};

} // namespace lease::adapters::primary
