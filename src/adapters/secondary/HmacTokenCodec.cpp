#include "adapters/secondary/HmacTokenCodec.hpp"
#include "utils/Base64Url.hpp"
#include "utils/IdGenerator.hpp"

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <algorithm>
#include <array>
#include <iostream>
#include <stdexcept>

namespace lease::adapters::secondary {

using ports::output::DecodeResult;
using domain::DecodeError;

namespace {

const std::array<const char*, 9> RESERVED_CLAIMS = {
    "tenantId", "allowedOrigins", "iat", "nbf", "exp", "jti", "iss", "aud", "sub"
};

bool isStringArray(const nlohmann::json& value) {
    if (!value.is_array()) {
        return false;
    }
    for (const auto& item : value) {
        if (!item.is_string()) {
            return false;
        }
    }
    return true;
}

// Пустая строка, если claim отсутствует или не строка
std::string stringClaim(const nlohmann::json& object, const char* name) {
    auto it = object.find(name);
    if (it == object.end() || !it->is_string()) {
        return "";
    }
    return it->get<std::string>();
}

} // namespace

HmacTokenCodec::HmacTokenCodec(
    std::shared_ptr<TokenSettings> settings,
    std::shared_ptr<ports::output::IClock> clock
) : settings_(std::move(settings))
  , clock_(std::move(clock))
{
    std::cout << "[HmacTokenCodec] Created (issuer=" << settings_->getIssuer()
              << ", ttl=" << settings_->getTokenTtl().count() << "s)" << std::endl;
}

bool HmacTokenCodec::isReservedClaim(const std::string& name) {
    for (const char* reserved : RESERVED_CLAIMS) {
        if (name == reserved) {
            return true;
        }
    }
    return false;
}

domain::CapabilityToken HmacTokenCodec::issue(
    const std::string& tenantId,
    const std::vector<std::string>& allowedOriginsSnapshot,
    const nlohmann::json& extraClaims,
    std::chrono::seconds ttl
) {
    if (!settings_->hasSecret()) {
        throw domain::ConfigurationError("Token signing secret is not configured");
    }
    if (tenantId.empty()) {
        throw std::invalid_argument("tenantId must not be empty");
    }
    if (!extraClaims.is_null() && !extraClaims.is_object()) {
        throw std::invalid_argument("extraClaims must be a JSON object");
    }

    domain::CapabilityToken token;
    token.tenantId = tenantId;
    token.allowedOriginsSnapshot = allowedOriginsSnapshot;
    token.issuedAt = clock_->now().toUnixSeconds();
    token.expiresAt = token.issuedAt + ttl.count();
    token.tokenId = utils::IdGenerator::generateTokenId();

    nlohmann::json payload = nlohmann::json::object();
    if (extraClaims.is_object()) {
        for (auto it = extraClaims.begin(); it != extraClaims.end(); ++it) {
            if (isReservedClaim(it.key())) {
                throw std::invalid_argument("Reserved claim in extraClaims: " + it.key());
            }
            payload[it.key()] = it.value();
        }
        token.extraClaims = extraClaims;
    }

    payload["tenantId"] = token.tenantId;
    payload["allowedOrigins"] = token.allowedOriginsSnapshot;
    payload["iat"] = token.issuedAt;
    payload["nbf"] = token.issuedAt;
    payload["exp"] = token.expiresAt;
    payload["jti"] = token.tokenId;
    payload["iss"] = settings_->getIssuer();
    payload["aud"] = token.tenantId;
    payload["sub"] = SUBJECT;

    std::string signingInput = encodedHeader() + "." + utils::Base64Url::encode(payload.dump());
    token.serialized = signingInput + "." + sign(signingInput);

    std::cout << "[HmacTokenCodec] Issued token for tenant " << tenantId
              << " (jti=" << token.tokenId << ", exp=" << token.expiresAt << ")" << std::endl;

    return token;
}

DecodeResult HmacTokenCodec::decode(const std::string& serializedToken, bool ignoreExpiry) {
    if (!settings_->hasSecret()) {
        throw domain::ConfigurationError("Token signing secret is not configured");
    }

    // header.payload.signature
    size_t firstDot = serializedToken.find('.');
    size_t lastDot = serializedToken.rfind('.');
    if (firstDot == std::string::npos || firstDot == lastDot ||
        serializedToken.find('.', firstDot + 1) != lastDot) {
        return DecodeResult::failure(DecodeError::MALFORMED, "Invalid token format");
    }

    std::string headerPart = serializedToken.substr(0, firstDot);
    std::string payloadPart = serializedToken.substr(firstDot + 1, lastDot - firstDot - 1);
    std::string signaturePart = serializedToken.substr(lastDot + 1);

    auto headerJson = utils::Base64Url::decode(headerPart);
    auto payloadJson = utils::Base64Url::decode(payloadPart);
    if (!headerJson || !payloadJson) {
        return DecodeResult::failure(DecodeError::MALFORMED, "Invalid token encoding");
    }

    nlohmann::json header = nlohmann::json::parse(*headerJson, nullptr, false);
    if (!header.is_object() || stringClaim(header, "alg") != "HS256") {
        return DecodeResult::failure(DecodeError::MALFORMED, "Unsupported token algorithm");
    }

    if (!verifySignature(headerPart + "." + payloadPart, signaturePart)) {
        return DecodeResult::failure(DecodeError::MALFORMED, "Invalid token signature");
    }

    nlohmann::json payload = nlohmann::json::parse(*payloadJson, nullptr, false);
    if (!payload.is_object()) {
        return DecodeResult::failure(DecodeError::MALFORMED, "Invalid token payload");
    }

    if (!payload.contains("tenantId") || !payload["tenantId"].is_string() ||
        !payload.contains("iat") || !payload["iat"].is_number_integer() ||
        !payload.contains("exp") || !payload["exp"].is_number_integer() ||
        !payload.contains("allowedOrigins") || !isStringArray(payload["allowedOrigins"])) {
        return DecodeResult::failure(DecodeError::MALFORMED, "Missing required claims");
    }

    domain::CapabilityToken token;
    token.tenantId = payload["tenantId"].get<std::string>();
    token.allowedOriginsSnapshot = payload["allowedOrigins"].get<std::vector<std::string>>();
    token.issuedAt = payload["iat"].get<int64_t>();
    token.expiresAt = payload["exp"].get<int64_t>();
    token.tokenId = stringClaim(payload, "jti");
    token.serialized = serializedToken;

    if (token.tenantId.empty()) {
        return DecodeResult::failure(DecodeError::MALFORMED, "Empty tenantId claim");
    }
    if (stringClaim(payload, "iss") != settings_->getIssuer()) {
        return DecodeResult::failure(DecodeError::MALFORMED, "Unexpected token issuer");
    }
    if (stringClaim(payload, "aud") != token.tenantId) {
        return DecodeResult::failure(DecodeError::MALFORMED, "Unexpected token audience");
    }

    int64_t notBefore = token.issuedAt;
    if (payload.contains("nbf")) {
        if (!payload["nbf"].is_number_integer()) {
            return DecodeResult::failure(DecodeError::MALFORMED, "Invalid nbf claim");
        }
        notBefore = std::max(notBefore, payload["nbf"].get<int64_t>());
    }

    const int64_t now = clock_->now().toUnixSeconds();
    const int64_t skew = settings_->getClockSkew().count();

    if (notBefore > now + skew) {
        return DecodeResult::failure(DecodeError::NOT_YET_VALID, "Token not active yet");
    }
    if (!ignoreExpiry && token.expiresAt + skew < now) {
        return DecodeResult::failure(DecodeError::EXPIRED, "Token has expired");
    }

    nlohmann::json extra = nlohmann::json::object();
    for (auto it = payload.begin(); it != payload.end(); ++it) {
        if (!isReservedClaim(it.key())) {
            extra[it.key()] = it.value();
        }
    }
    token.extraClaims = std::move(extra);

    return DecodeResult::success(std::move(token));
}

std::string HmacTokenCodec::sign(const std::string& signingInput) const {
    const std::string& secret = settings_->getSecret();

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digestLen = 0;

    if (HMAC(EVP_sha256(),
             secret.data(), static_cast<int>(secret.size()),
             reinterpret_cast<const unsigned char*>(signingInput.data()), signingInput.size(),
             digest, &digestLen) == nullptr) {
        throw std::runtime_error("HMAC-SHA256 computation failed");
    }

    return utils::Base64Url::encode(
        std::string(reinterpret_cast<const char*>(digest), digestLen));
}

bool HmacTokenCodec::verifySignature(
    const std::string& signingInput,
    const std::string& signature
) const {
    std::string expected = sign(signingInput);
    if (expected.size() != signature.size()) {
        return false;
    }
    return CRYPTO_memcmp(expected.data(), signature.data(), expected.size()) == 0;
}

const std::string& HmacTokenCodec::encodedHeader() {
    static const std::string header =
        utils::Base64Url::encode(R"({"alg":"HS256","typ":"JWT"})");
    return header;
}

} // namespace lease::adapters::secondary
