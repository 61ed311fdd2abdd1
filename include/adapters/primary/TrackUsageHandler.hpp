#pragma once

#include <IHttpHandler.hpp>
#include "ports/input/ITenantAccessService.hpp"
#include "adapters/primary/JsonResponses.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <iostream>

namespace lease::adapters::primary {

/**
 * @brief Маячок использования виджета
 *
 * POST /api/usage/track
 * { "tenantId": "t1", "url": "...", "referrer": "..." }
 *
 * Отвечает 200 при любом исходе учёта, чтобы не раскрывать
 * существование арендатора. 400 только при отсутствии tenantId.
 */
class TrackUsageHandler : public IHttpHandler {
public:
    explicit TrackUsageHandler(
        std::shared_ptr<ports::input::ITenantAccessService> accessService
    ) : accessService_(std::move(accessService)) {}

    void handle(IRequest& req, IResponse& res) override {
        try {
            auto body = nlohmann::json::parse(req.getBody());

            std::string tenantId = readTenantId(body);
            if (tenantId.empty()) {
                sendError(res, 400, "Client ID is required", "Request body must contain tenantId");
                return;
            }

            accessService_->trackUsage(tenantId);

        } catch (const nlohmann::json::exception& e) {
            sendError(res, 400, "Invalid JSON", e.what());
            return;
        } catch (const std::exception& e) {
            std::cerr << "[TrackUsageHandler] Tracking failed: " << e.what() << std::endl;
        }

        nlohmann::json response;
        response["success"] = true;
        response["message"] = "Usage tracked";
        sendJson(res, 200, response);
    }

private:
    std::shared_ptr<ports::input::ITenantAccessService> accessService_;
};

} // namespace lease::adapters::primary
