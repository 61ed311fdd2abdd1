#pragma once

#include "domain/enums/DecodeError.hpp"
#include <string>

namespace lease::domain {

/**
 * @brief Единая таксономия ошибок проверки и обновления токена
 *
 * Все виды, кроме STORE_UNAVAILABLE и CONFIGURATION_ERROR, являются
 * ошибками клиентского ввода. Ядро ничего не повторяет.
 */
enum class ValidationError {
    INVALID_TOKEN,
    TOKEN_EXPIRED,
    TOKEN_NOT_ACTIVE,
    TENANT_NOT_FOUND,
    TENANT_INACTIVE,
    DOMAIN_REQUIRED,
    DOMAIN_NOT_AUTHORIZED,
    STORE_UNAVAILABLE,
    CONFIGURATION_ERROR
};

inline std::string toString(ValidationError error) {
    switch (error) {
        case ValidationError::INVALID_TOKEN:         return "INVALID_TOKEN";
        case ValidationError::TOKEN_EXPIRED:         return "TOKEN_EXPIRED";
        case ValidationError::TOKEN_NOT_ACTIVE:      return "TOKEN_NOT_ACTIVE";
        case ValidationError::TENANT_NOT_FOUND:      return "TENANT_NOT_FOUND";
        case ValidationError::TENANT_INACTIVE:       return "TENANT_INACTIVE";
        case ValidationError::DOMAIN_REQUIRED:       return "DOMAIN_REQUIRED";
        case ValidationError::DOMAIN_NOT_AUTHORIZED: return "DOMAIN_NOT_AUTHORIZED";
        case ValidationError::STORE_UNAVAILABLE:     return "STORE_UNAVAILABLE";
        case ValidationError::CONFIGURATION_ERROR:   return "CONFIGURATION_ERROR";
    }
    return "UNKNOWN";
}

/**
 * @brief Отображение ошибок кодека 1:1
 */
inline ValidationError fromDecodeError(DecodeError error) {
    switch (error) {
        case DecodeError::MALFORMED:     return ValidationError::INVALID_TOKEN;
        case DecodeError::EXPIRED:       return ValidationError::TOKEN_EXPIRED;
        case DecodeError::NOT_YET_VALID: return ValidationError::TOKEN_NOT_ACTIVE;
    }
    return ValidationError::INVALID_TOKEN;
}

} // namespace lease::domain
