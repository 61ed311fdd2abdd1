#pragma once

#include "domain/CapabilityToken.hpp"
#include "domain/enums/ValidationError.hpp"
#include <string>
#include <optional>
#include <cstdint>

namespace lease::ports::input {

/**
 * @brief Результат обновления токена
 */
struct RefreshResult {
    bool success = false;
    std::optional<domain::CapabilityToken> token;
    int64_t expiresIn = 0;               ///< seconds
    bool previousTokenExpired = false;
    std::optional<domain::ValidationError> error;
    std::string message;
};

/**
 * @brief Перевыпуск токена, в том числе уже истёкшего
 */
class ITokenRefresher {
public:
    virtual ~ITokenRefresher() = default;

    virtual RefreshResult refresh(const std::string& serializedToken) = 0;
};

} // namespace lease::ports::input
