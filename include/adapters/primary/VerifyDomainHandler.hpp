#pragma once

#include <IHttpHandler.hpp>
#include "ports/input/ITenantAccessService.hpp"
#include "adapters/primary/JsonResponses.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <iostream>

namespace lease::adapters::primary {

/**
 * @brief Проверка домена для арендатора без токена
 *
 * POST /api/verify-domain
 * { "tenantId": "t2", "domain": "shop.acme.com" }
 *
 * Response:
 * {
 *   "allowed": true,
 *   "domain": "shop.acme.com",
 *   "tenantId": "t2",
 *   "restrictions": true,
 *   "allowedOrigins": ["acme.com"]
 * }
 */
class VerifyDomainHandler : public IHttpHandler {
public:
    explicit VerifyDomainHandler(
        std::shared_ptr<ports::input::ITenantAccessService> accessService
    ) : accessService_(std::move(accessService)) {}

    void handle(IRequest& req, IResponse& res) override {
        try {
            auto body = nlohmann::json::parse(req.getBody());

            std::string tenantId = readTenantId(body);
            std::string origin = body.value("domain", "");
            if (tenantId.empty() || origin.empty()) {
                sendError(res, 400, "Missing required parameters", "Both tenantId and domain are required");
                return;
            }

            auto result = accessService_->verifyDomain(tenantId, origin);
            if (result.error) {
                sendValidationError(res, *result.error, result.message);
                return;
            }

            nlohmann::json response;
            response["allowed"] = result.allowed;
            response["domain"] = origin;
            response["tenantId"] = tenantId;
            response["restrictions"] = result.restrictions;
            response["allowedOrigins"] = result.allowedOrigins;

            sendJson(res, 200, response);

        } catch (const nlohmann::json::exception& e) {
            sendError(res, 400, "Invalid JSON", e.what());
        } catch (const std::exception& e) {
            std::cerr << "[VerifyDomainHandler] Error: " << e.what() << std::endl;
            sendError(res, 500, "Internal server error", "Domain verification failed");
        }
    }

private:
    std::shared_ptr<ports::input::ITenantAccessService> accessService_;
};

} // namespace lease::adapters::primary
