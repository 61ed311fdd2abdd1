#pragma once

#include "domain/CapabilityToken.hpp"
#include "domain/enums/ValidationError.hpp"
#include <string>
#include <optional>
#include <cstdint>

namespace lease::ports::input {

/**
 * @brief Результат выпуска токена
 */
struct IssueResult {
    bool success = false;
    std::optional<domain::CapabilityToken> token;
    int64_t expiresIn = 0;
    std::string tenantName;
    std::optional<domain::ValidationError> error;
    std::string message;
};

/**
 * @brief Результат проверки токена без учёта использования
 */
struct VerifyResult {
    bool valid = false;
    std::string tenantId;
    int64_t issuedAt = 0;
    int64_t expiresAt = 0;

    bool tenantExists = false;
    bool tenantActive = false;
    std::string tenantName;

    std::optional<domain::ValidationError> error;
    std::string message;
};

/**
 * @brief Административный выпуск и проверка токенов
 */
class ITokenIssuer {
public:
    virtual ~ITokenIssuer() = default;

    /**
     * @brief Выпустить токен для активного арендатора
     */
    virtual IssueResult issueToken(const std::string& tenantId) = 0;

    /**
     * @brief Проверить токен, не трогая счётчики использования
     */
    virtual VerifyResult verifyToken(const std::string& serializedToken) = 0;
};

} // namespace lease::ports::input
