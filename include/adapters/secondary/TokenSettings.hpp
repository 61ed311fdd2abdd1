#pragma once

#include "domain/Exceptions.hpp"
#include <string>
#include <chrono>
#include <cstdlib>
#include <cctype>

namespace lease::adapters::secondary {

/**
 * @brief Настройки подписи и времени жизни токенов
 *
 * Читаются один раз при старте и дальше не меняются.
 *
 * ENV:
 * - LEASE_JWT_SECRET          обязательный, иначе ConfigurationError
 * - LEASE_TOKEN_TTL           "3600", "30m", "24h", "7d" (по умолчанию 24h)
 * - LEASE_TOKEN_ISSUER        по умолчанию "chatbot-leasing-system"
 * - LEASE_CLOCK_SKEW_SECONDS  допуск для nbf/iat (по умолчанию 0)
 */
class TokenSettings {
public:
    static constexpr const char* DEFAULT_ISSUER = "chatbot-leasing-system";
    static constexpr const char* DEFAULT_TTL = "24h";

    TokenSettings() {
        secret_ = getEnvOrDefault("LEASE_JWT_SECRET", "");
        if (secret_.empty()) {
            throw domain::ConfigurationError("Required env variable not set: LEASE_JWT_SECRET");
        }
        tokenTtl_ = parseDuration(getEnvOrDefault("LEASE_TOKEN_TTL", DEFAULT_TTL));
        issuer_ = getEnvOrDefault("LEASE_TOKEN_ISSUER", DEFAULT_ISSUER);
        clockSkew_ = parseDuration(getEnvOrDefault("LEASE_CLOCK_SKEW_SECONDS", "0"));
    }

    /**
     * @brief Явная конфигурация (тесты, встраивание)
     *
     * Пустой секрет допустим здесь, ошибка возникнет при выпуске токена.
     */
    TokenSettings(
        std::string secret,
        std::chrono::seconds tokenTtl,
        std::string issuer = DEFAULT_ISSUER,
        std::chrono::seconds clockSkew = std::chrono::seconds(0)
    ) : secret_(std::move(secret))
      , tokenTtl_(tokenTtl)
      , issuer_(std::move(issuer))
      , clockSkew_(clockSkew)
    {}

    const std::string& getSecret() const { return secret_; }
    bool hasSecret() const { return !secret_.empty(); }
    std::chrono::seconds getTokenTtl() const { return tokenTtl_; }
    const std::string& getIssuer() const { return issuer_; }
    std::chrono::seconds getClockSkew() const { return clockSkew_; }

    /**
     * @brief Разобрать длительность: число секунд или <n>s|m|h|d
     * @throws domain::ConfigurationError при неверном формате
     */
    static std::chrono::seconds parseDuration(const std::string& value) {
        if (value.empty()) {
            throw domain::ConfigurationError("Empty duration");
        }

        size_t digits = 0;
        while (digits < value.size() && std::isdigit(static_cast<unsigned char>(value[digits]))) {
            ++digits;
        }
        if (digits == 0 || value.size() - digits > 1 || digits > 12) {
            throw domain::ConfigurationError("Invalid duration: " + value);
        }

        long long amount = std::stoll(value.substr(0, digits));
        long long multiplier = 1;
        if (digits < value.size()) {
            switch (value.back()) {
                case 's': multiplier = 1; break;
                case 'm': multiplier = 60; break;
                case 'h': multiplier = 3600; break;
                case 'd': multiplier = 86400; break;
                default:
                    throw domain::ConfigurationError("Invalid duration unit: " + value);
            }
        }
        return std::chrono::seconds(amount * multiplier);
    }

private:
    std::string secret_;
    std::chrono::seconds tokenTtl_;
    std::string issuer_;
    std::chrono::seconds clockSkew_;

    static std::string getEnvOrDefault(const char* name, const std::string& defaultValue) {
        const char* value = std::getenv(name);
        return value ? value : defaultValue;
    }
};

} // namespace lease::adapters::secondary
