#pragma once

#include <IHttpHandler.hpp>
#include "ports/input/ISessionValidator.hpp"
#include "adapters/primary/JsonResponses.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <iostream>

namespace lease::adapters::primary {

/**
 * @brief Проверка токена виджета и выдача его конфигурации
 *
 * POST /api/validate
 * {
 *   "token": "eyJ...",
 *   "domain": "shop.acme.com"   // обязателен, если у арендатора есть allow-list
 * }
 *
 * Response (200 OK):
 * {
 *   "valid": true,
 *   "config": { "widgetId": "...", "customization": {...} },
 *   "client": { "name": "...", "active": true, "tenantId": "..." },
 *   "validation": { "domain": "...", "timestamp": "...", "usageCount": 42 }
 * }
 *
 * Errors: 400, 401, 403, 404, 500, см. toHttpError()
 */
class ValidateHandler : public IHttpHandler {
public:
    explicit ValidateHandler(
        std::shared_ptr<ports::input::ISessionValidator> validator
    ) : validator_(std::move(validator)) {}

    void handle(IRequest& req, IResponse& res) override {
        try {
            auto body = nlohmann::json::parse(req.getBody());

            std::string token = body.value("token", "");
            if (token.empty()) {
                sendError(res, 400, "Token is required", "Request body must contain a token");
                return;
            }

            std::optional<std::string> origin;
            if (body.contains("domain") && body["domain"].is_string()) {
                origin = body["domain"].get<std::string>();
            }

            auto result = validator_->validate(token, origin);
            if (!result.valid) {
                sendValidationError(res, *result.error, result.message);
                return;
            }

            const auto& authorized = *result.authorized;

            nlohmann::json client;
            client["name"] = authorized.tenantName;
            client["active"] = authorized.active;
            client["tenantId"] = authorized.tenantId;

            nlohmann::json validation;
            validation["domain"] = authorized.domain ? nlohmann::json(*authorized.domain) : nlohmann::json(nullptr);
            validation["timestamp"] = authorized.timestamp;
            validation["usageCount"] = authorized.usageCount;

            nlohmann::json response;
            response["valid"] = true;
            response["config"] = domain::toJson(authorized.config);
            response["client"] = client;
            response["validation"] = validation;

            sendJson(res, 200, response);

        } catch (const nlohmann::json::exception& e) {
            sendError(res, 400, "Invalid JSON", e.what());
        } catch (const std::exception& e) {
            std::cerr << "[ValidateHandler] Error: " << e.what() << std::endl;
            sendError(res, 500, "Internal server error", "An error occurred during validation");
        }
    }

private:
    std::shared_ptr<ports::input::ISessionValidator> validator_;
};

} // namespace lease::adapters::primary
