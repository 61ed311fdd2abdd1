#pragma once

#include <IHttpHandler.hpp>
#include "ports/input/ITokenIssuer.hpp"
#include "adapters/secondary/AdminSettings.hpp"
#include "adapters/primary/JsonResponses.hpp"
#include "domain/Timestamp.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <memory>
#include <iostream>

namespace lease::adapters::primary {

/**
 * @brief Выпуск токена для арендатора (административный)
 *
 * POST /api/auth/token
 * {
 *   "tenantId": "t1",
 *   "adminKey": "..."   // необязателен; если передан, должен совпасть с LEASE_ADMIN_KEY
 * }
 *
 * Response (200 OK):
 * {
 *   "success": true,
 *   "token": "eyJ...",
 *   "tokenType": "Bearer",
 *   "expiresIn": 86400,
 *   "tenantId": "t1",
 *   "generatedAt": "2025-12-16T10:30:00Z",
 *   "client": { "name": "...", "tenantId": "t1" }
 * }
 */
class IssueTokenHandler : public IHttpHandler {
public:
    IssueTokenHandler(
        std::shared_ptr<ports::input::ITokenIssuer> issuer,
        std::shared_ptr<secondary::AdminSettings> adminSettings
    ) : issuer_(std::move(issuer))
      , adminSettings_(std::move(adminSettings))
    {
        std::cout << "[IssueTokenHandler] Created" << std::endl;
    }

    void handle(IRequest& req, IResponse& res) override {
        try {
            auto body = nlohmann::json::parse(req.getBody());

            std::string tenantId = readTenantId(body);
            if (tenantId.empty()) {
                sendError(res, 400, "Client ID is required", "Request body must contain tenantId");
                return;
            }

            if (body.contains("adminKey") && !body["adminKey"].is_null()) {
                std::string adminKey = body["adminKey"].is_string()
                    ? body["adminKey"].get<std::string>() : "";
                if (!adminSettings_->matches(adminKey)) {
                    std::cout << "[IssueTokenHandler] Invalid admin key for tenant " << tenantId << std::endl;
                    sendError(res, 401, "Invalid admin key", "Admin key does not match");
                    return;
                }
            }

            auto result = issuer_->issueToken(tenantId);
            if (!result.success) {
                sendValidationError(res, *result.error, result.message);
                return;
            }

            nlohmann::json client;
            client["name"] = result.tenantName;
            client["tenantId"] = tenantId;

            nlohmann::json response;
            response["success"] = true;
            response["token"] = result.token->serialized;
            response["tokenType"] = "Bearer";
            response["expiresIn"] = result.expiresIn;
            response["tenantId"] = tenantId;
            response["generatedAt"] = domain::Timestamp::fromUnixSeconds(result.token->issuedAt).toString();
            response["client"] = client;

            sendJson(res, 200, response);

        } catch (const nlohmann::json::exception& e) {
            sendError(res, 400, "Invalid JSON", e.what());
        } catch (const std::exception& e) {
            std::cerr << "[IssueTokenHandler] Error: " << e.what() << std::endl;
            sendError(res, 500, "Internal server error", "Failed to generate token");
        }
    }

private:
    std::shared_ptr<ports::input::ITokenIssuer> issuer_;
    std::shared_ptr<secondary::AdminSettings> adminSettings_;
};

} // namespace lease::adapters::primary
