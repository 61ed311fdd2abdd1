#pragma once

#include <IHttpHandler.hpp>
#include "ports/input/ITenantAccessService.hpp"
#include "ports/output/IClock.hpp"
#include "adapters/primary/JsonResponses.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <iostream>

namespace lease::adapters::primary {

/**
 * @brief Проверка арендатора без токена
 *
 * POST /api/auth/validate-client
 * { "tenantId": "t2", "domain": "shop.acme.com" }   // domain необязателен
 *
 * Response:
 * {
 *   "valid": true,
 *   "tenantId": "t2",
 *   "client": { "name": "Acme", "active": true, "hasRestrictions": true },
 *   "domain": { "provided": "shop.acme.com", "allowed": true, "restrictions": ["acme.com"] },
 *   "timestamp": "..."
 * }
 *
 * Запрещённый домен не ошибка: allowed == false при статусе 200.
 * Счётчик использования не меняется.
 */
class ValidateClientHandler : public IHttpHandler {
public:
    ValidateClientHandler(
        std::shared_ptr<ports::input::ITenantAccessService> accessService,
        std::shared_ptr<ports::output::IClock> clock
    ) : accessService_(std::move(accessService))
      , clock_(std::move(clock)) {}

    void handle(IRequest& req, IResponse& res) override {
        try {
            auto body = nlohmann::json::parse(req.getBody());

            std::string tenantId = readTenantId(body);
            if (tenantId.empty()) {
                sendError(res, 400, "Client ID is required", "Please provide a tenantId to validate");
                return;
            }

            std::optional<std::string> origin;
            std::string domainValue = body.value("domain", "");
            if (!domainValue.empty()) {
                origin = domainValue;
            }

            auto result = accessService_->validateClient(tenantId, origin);
            if (!result.valid) {
                sendValidationError(res, *result.error, result.message);
                return;
            }

            nlohmann::json client;
            client["name"] = result.tenantName;
            client["active"] = result.active;
            client["hasRestrictions"] = result.restrictions;

            nlohmann::json domainInfo;
            domainInfo["provided"] = origin ? nlohmann::json(*origin) : nlohmann::json(nullptr);
            domainInfo["allowed"] = result.domainAllowed;
            domainInfo["restrictions"] = result.allowedOrigins;

            nlohmann::json response;
            response["valid"] = true;
            response["tenantId"] = result.tenantId;
            response["client"] = client;
            response["domain"] = domainInfo;
            response["timestamp"] = clock_->now().toString();

            sendJson(res, 200, response);

        } catch (const nlohmann::json::exception& e) {
            sendError(res, 400, "Invalid JSON", e.what());
        } catch (const std::exception& e) {
            std::cerr << "[ValidateClientHandler] Error: " << e.what() << std::endl;
            sendError(res, 500, "Internal server error", "Failed to validate client");
        }
    }

private:
    std::shared_ptr<ports::input::ITenantAccessService> accessService_;
    std::shared_ptr<ports::output::IClock> clock_;
};

} // namespace lease::adapters::primary
