#pragma once

#include <IHttpHandler.hpp>
#include "ports/output/IClock.hpp"
#include "adapters/primary/JsonResponses.hpp"
#include <nlohmann/json.hpp>
#include <memory>

namespace lease::adapters::primary {

/**
 * @brief Проверка здоровья сервиса
 *
 * Endpoint: GET /api/health
 */
class HealthHandler : public IHttpHandler {
public:
    explicit HealthHandler(std::shared_ptr<ports::output::IClock> clock)
        : clock_(std::move(clock)) {}

    void handle(IRequest& req, IResponse& res) override {
        nlohmann::json response;
        response["status"] = "ok";
        response["service"] = "widget-lease-service";
        response["timestamp"] = clock_->now().toString();
        response["version"] = "1.0.0";

        sendJson(res, 200, response);
    }

private:
    std::shared_ptr<ports::output::IClock> clock_;
};

} // namespace lease::adapters::primary
