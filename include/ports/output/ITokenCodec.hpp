#pragma once

#include "domain/CapabilityToken.hpp"
#include "domain/enums/DecodeError.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace lease::ports::output {

/**
 * @brief Результат разбора токена
 *
 * Ровно одно из полей token/error заполнено.
 */
struct DecodeResult {
    std::optional<domain::CapabilityToken> token;
    std::optional<domain::DecodeError> error;
    std::string message;

    bool ok() const { return token.has_value(); }

    static DecodeResult success(domain::CapabilityToken t) {
        DecodeResult r;
        r.token = std::move(t);
        return r;
    }

    static DecodeResult failure(domain::DecodeError e, std::string msg) {
        DecodeResult r;
        r.error = e;
        r.message = std::move(msg);
        return r;
    }
};

/**
 * @brief Кодек подписанных токенов доступа
 *
 * Для остальных компонентов токен является непрозрачной строкой.
 */
class ITokenCodec {
public:
    virtual ~ITokenCodec() = default;

    /**
     * @brief Выпустить токен
     *
     * issuedAt = now(), expiresAt = now() + ttl.
     *
     * @throws domain::ConfigurationError если секрет подписи не задан
     * @throws std::invalid_argument если extraClaims не объект или
     *         использует зарезервированные имена
     */
    virtual domain::CapabilityToken issue(
        const std::string& tenantId,
        const std::vector<std::string>& allowedOriginsSnapshot,
        const nlohmann::json& extraClaims,
        std::chrono::seconds ttl
    ) = 0;

    /**
     * @brief Разобрать и проверить токен
     *
     * @param ignoreExpiry не сообщать EXPIRED (для обновления токена)
     */
    virtual DecodeResult decode(const std::string& serializedToken, bool ignoreExpiry) = 0;

    DecodeResult decode(const std::string& serializedToken) {
        return decode(serializedToken, false);
    }
};

} // namespace lease::ports::output
