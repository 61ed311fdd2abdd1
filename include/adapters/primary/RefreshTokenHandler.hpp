#pragma once

#include <IHttpHandler.hpp>
#include "ports/input/ITokenRefresher.hpp"
#include "adapters/primary/JsonResponses.hpp"
#include "domain/Timestamp.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <iostream>

namespace lease::adapters::primary {

/**
 * @brief Хэндлер обновления токена
 *
 * Endpoint: POST /api/auth/refresh
 *
 * Токен берётся из тела {"token": "..."}, либо из
 * Authorization: Bearer <token>. Истёкший токен обновить можно,
 * поддельный нельзя.
 *
 * Response (200 OK):
 *   {
 *     "success": true,
 *     "token": "eyJhbGci...",
 *     "tokenType": "Bearer",
 *     "expiresIn": 86400,
 *     "tenantId": "t1",
 *     "refreshedAt": "...",
 *     "previousTokenExpired": true
 *   }
 *
 * Errors:
 *   400: токен не передан
 *   401: подпись не сходится или токен ещё не активен
 *   403/404: арендатор отключён или удалён
 */
class RefreshTokenHandler : public IHttpHandler {
public:
    explicit RefreshTokenHandler(
        std::shared_ptr<ports::input::ITokenRefresher> refresher
    ) : refresher_(std::move(refresher))
    {
        std::cout << "[RefreshTokenHandler] Created" << std::endl;
    }

    void handle(IRequest& req, IResponse& res) override {
        try {
            std::string token = extractToken(req);
            if (token.empty()) {
                sendError(res, 400, "Token is required", "Provide the token to refresh");
                return;
            }

            auto result = refresher_->refresh(token);
            if (!result.success) {
                sendValidationError(res, *result.error, result.message);
                return;
            }

            nlohmann::json response;
            response["success"] = true;
            response["token"] = result.token->serialized;
            response["tokenType"] = "Bearer";
            response["expiresIn"] = result.expiresIn;
            response["tenantId"] = result.token->tenantId;
            response["refreshedAt"] = domain::Timestamp::fromUnixSeconds(result.token->issuedAt).toString();
            response["previousTokenExpired"] = result.previousTokenExpired;

            sendJson(res, 200, response);

        } catch (const nlohmann::json::exception& e) {
            sendError(res, 400, "Invalid JSON", e.what());
        } catch (const std::exception& e) {
            std::cerr << "[RefreshTokenHandler] Error: " << e.what() << std::endl;
            sendError(res, 500, "Internal server error", "Failed to refresh token");
        }
    }

private:
    std::shared_ptr<ports::input::ITokenRefresher> refresher_;

    /**
     * @brief Токен из тела запроса или заголовка Authorization
     */
    static std::string extractToken(IRequest& req) {
        const std::string raw = req.getBody();
        if (!raw.empty()) {
            auto body = nlohmann::json::parse(raw);
            std::string token = body.value("token", "");
            if (!token.empty()) {
                return token;
            }
        }
        return req.getBearerToken().value_or("");
    }
};

} // namespace lease::adapters::primary
