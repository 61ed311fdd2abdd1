#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include <cstdint>

namespace lease::domain {

/**
 * @brief Подписанный токен доступа арендатора
 *
 * На сервере не хранится: создаётся кодеком, носится клиентом
 * и просто истекает.
 */
struct CapabilityToken {
    std::string tenantId;

    /// Копия allow-list на момент выпуска, для проверки домена не используется
    std::vector<std::string> allowedOriginsSnapshot;

    int64_t issuedAt = 0;   ///< Unix seconds
    int64_t expiresAt = 0;  ///< Unix seconds

    std::string tokenId;     ///< jti, различает токены выпущенные в одну секунду
    nlohmann::json extraClaims = nlohmann::json::object();

    /// Сериализованная форма header.payload.signature
    std::string serialized;

    bool isExpiredAt(int64_t nowSeconds) const {
        return expiresAt < nowSeconds;
    }

    int64_t lifetimeSeconds() const {
        return expiresAt - issuedAt;
    }
};

} // namespace lease::domain
