#pragma once

#include <IHttpHandler.hpp>
#include "ports/input/ITenantAccessService.hpp"
#include "adapters/primary/JsonResponses.hpp"
#include "domain/WidgetConfig.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <iostream>

namespace lease::adapters::primary {

/**
 * @brief GET /api/widget-info/{widgetId}: публичная конфигурация виджета
 *
 * Роутер регистрирует с паттерном "/api/widget-info/*".
 * Отдаёт только внешний вид и флаг active, без allow-list и счётчиков.
 */
class WidgetInfoHandler : public IHttpHandler {
public:
    explicit WidgetInfoHandler(
        std::shared_ptr<ports::input::ITenantAccessService> accessService
    ) : accessService_(std::move(accessService)) {}

    void handle(IRequest& req, IResponse& res) override {
        try {
            std::string widgetId = req.getPathParam(0).value_or("");
            if (widgetId.empty()) {
                sendError(res, 400, "Widget ID is required", "Use GET /api/widget-info/{widgetId}");
                return;
            }

            auto result = accessService_->widgetInfo(widgetId);
            if (!result.found) {
                if (result.error == domain::ValidationError::TENANT_NOT_FOUND) {
                    sendError(res, 404, "Widget not found", widgetId);
                } else {
                    sendValidationError(res, *result.error, result.message);
                }
                return;
            }

            nlohmann::json client;
            client["name"] = result.tenantName;
            client["active"] = result.active;

            nlohmann::json response;
            response["widgetId"] = widgetId;
            response["exists"] = true;
            response["active"] = result.active;
            response["customization"] = domain::toJson(result.config)["customization"];
            response["client"] = client;

            sendJson(res, 200, response);

        } catch (const std::exception& e) {
            std::cerr << "[WidgetInfoHandler] Error: " << e.what() << std::endl;
            sendError(res, 500, "Internal server error", "Failed to get widget info");
        }
    }

private:
    std::shared_ptr<ports::input::ITenantAccessService> accessService_;
};

} // namespace lease::adapters::primary
