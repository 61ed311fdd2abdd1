#pragma once

#include <IResponse.hpp>
#include "domain/enums/ValidationError.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace lease::adapters::primary {

/**
 * @brief HTTP-представление ошибки ядра
 */
struct HttpError {
    int status;
    const char* error;
};

/**
 * @brief Единая таблица ValidationError -> HTTP статус
 */
inline HttpError toHttpError(domain::ValidationError error) {
    using domain::ValidationError;
    switch (error) {
        case ValidationError::INVALID_TOKEN:         return {401, "Invalid token format"};
        case ValidationError::TOKEN_EXPIRED:         return {401, "Token has expired"};
        case ValidationError::TOKEN_NOT_ACTIVE:      return {401, "Token not active yet"};
        case ValidationError::TENANT_NOT_FOUND:      return {404, "Client not found"};
        case ValidationError::TENANT_INACTIVE:       return {403, "Client account is inactive"};
        case ValidationError::DOMAIN_REQUIRED:       return {400, "Domain information is required"};
        case ValidationError::DOMAIN_NOT_AUTHORIZED: return {403, "Domain not authorized"};
        case ValidationError::STORE_UNAVAILABLE:     return {500, "Service temporarily unavailable"};
        case ValidationError::CONFIGURATION_ERROR:   return {500, "Server configuration error"};
    }
    return {500, "Internal server error"};
}

inline void sendJson(IResponse& res, int status, const nlohmann::json& body) {
    res.setStatus(status);
    res.setHeader("Content-Type", "application/json");
    res.setBody(body.dump());
}

inline void sendError(IResponse& res, int status, const std::string& error, const std::string& message) {
    nlohmann::json body;
    body["error"] = error;
    body["message"] = message;
    sendJson(res, status, body);
}

inline void sendValidationError(IResponse& res, domain::ValidationError error, const std::string& message) {
    auto mapped = toHttpError(error);

    nlohmann::json body;
    body["error"] = mapped.error;
    body["code"] = domain::toString(error);
    body["message"] = message;
    sendJson(res, mapped.status, body);
}

/**
 * @brief Идентификатор арендатора из тела запроса
 *
 * Принимается tenantId, для старых клиентов также clientId.
 */
inline std::string readTenantId(const nlohmann::json& body) {
    std::string tenantId = body.value("tenantId", "");
    if (tenantId.empty()) {
        tenantId = body.value("clientId", "");
    }
    return tenantId;
}

} // namespace lease::adapters::primary
