#pragma once

#include "ports/output/ITokenCodec.hpp"
#include "ports/output/IClock.hpp"
#include "adapters/secondary/TokenSettings.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <string>

namespace lease::adapters::secondary {

/**
 * @brief Кодек токенов на HMAC-SHA256 (compact JWS, alg HS256)
 *
 * Формат: base64url(header).base64url(payload).base64url(signature)
 *
 * Payload:
 * - tenantId, allowedOrigins
 * - iat, nbf, exp (Unix seconds)
 * - jti (случайный, 128 бит)
 * - iss (из настроек), aud (= tenantId), sub ("client-access")
 * - дополнительные claims на верхнем уровне
 *
 * Один общий секрет на систему, без ротации и отзыва.
 */
class HmacTokenCodec : public ports::output::ITokenCodec {
public:
    static constexpr const char* SUBJECT = "client-access";

    HmacTokenCodec(
        std::shared_ptr<TokenSettings> settings,
        std::shared_ptr<ports::output::IClock> clock
    );

    using ports::output::ITokenCodec::decode;

    domain::CapabilityToken issue(
        const std::string& tenantId,
        const std::vector<std::string>& allowedOriginsSnapshot,
        const nlohmann::json& extraClaims,
        std::chrono::seconds ttl
    ) override;

    ports::output::DecodeResult decode(
        const std::string& serializedToken,
        bool ignoreExpiry
    ) override;

    /**
     * @brief Зарезервированное имя claim (не может быть в extraClaims)
     */
    static bool isReservedClaim(const std::string& name);

private:
    std::shared_ptr<TokenSettings> settings_;
    std::shared_ptr<ports::output::IClock> clock_;

    std::string sign(const std::string& signingInput) const;
    bool verifySignature(const std::string& signingInput, const std::string& signature) const;

    static const std::string& encodedHeader();
};

} // namespace lease::adapters::secondary
