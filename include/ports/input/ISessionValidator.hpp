#pragma once

#include "domain/AuthorizedConfig.hpp"
#include "domain/enums/ValidationError.hpp"
#include "domain/enums/ValidationStage.hpp"
#include <string>
#include <optional>

namespace lease::ports::input {

/**
 * @brief Результат проверки сессии
 *
 * stage фиксирует терминальное состояние: AUTHORIZED или REJECTED.
 * rejectedAt: шаг, на котором проверка остановилась.
 */
struct ValidateResult {
    bool valid = false;
    domain::ValidationStage stage = domain::ValidationStage::RECEIVED;
    domain::ValidationStage rejectedAt = domain::ValidationStage::RECEIVED;
    std::optional<domain::ValidationError> error;
    std::string message;
    std::optional<domain::AuthorizedConfig> authorized;
};

/**
 * @brief Проверка токена и домена вызывающей страницы
 */
class ISessionValidator {
public:
    virtual ~ISessionValidator() = default;

    /**
     * @param serializedToken токен из запроса
     * @param callerOrigin домен страницы; nullopt или пустая строка означают, что домен не передан
     */
    virtual ValidateResult validate(
        const std::string& serializedToken,
        const std::optional<std::string>& callerOrigin
    ) = 0;
};

} // namespace lease::ports::input
