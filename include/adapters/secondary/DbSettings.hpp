#pragma once

#include <string>
#include <cstdlib>
#include <stdexcept>

namespace lease::adapters::secondary {

/**
 * @brief Настройки подключения к БД арендаторов из ENV
 *
 * LEASE_DB_STATEMENT_TIMEOUT_MS (по умолчанию 2000) передаётся серверу
 * как statement_timeout: зависший запрос обрывает сам PostgreSQL.
 */
class DbSettings {
public:
    DbSettings() {
        host_ = getEnvOrDefault("LEASE_DB_HOST", "localhost");
        port_ = std::stoi(getEnvOrDefault("LEASE_DB_PORT", "5432"));
        name_ = getEnvOrDefault("LEASE_DB_NAME", "lease_db");
        user_ = getEnvOrDefault("LEASE_DB_USER", "lease_user");
        password_ = getEnvOrThrow("LEASE_DB_PASSWORD");
        statementTimeoutMs_ = std::stol(getEnvOrDefault("LEASE_DB_STATEMENT_TIMEOUT_MS", "2000"));
    }

    std::string getHost() const { return host_; }
    int getPort() const { return port_; }
    std::string getName() const { return name_; }
    std::string getUser() const { return user_; }
    long getStatementTimeoutMs() const { return statementTimeoutMs_; }

    std::string getConnectionString() const {
        return "host=" + host_ +
               " port=" + std::to_string(port_) +
               " dbname=" + name_ +
               " user=" + user_ +
               " password=" + password_ +
               " connect_timeout=5" +
               " options='-c statement_timeout=" + std::to_string(statementTimeoutMs_) + "'";
    }

private:
    std::string host_;
    int port_;
    std::string name_;
    std::string user_;
    std::string password_;
    long statementTimeoutMs_;

    static std::string getEnvOrDefault(const char* name, const std::string& defaultValue) {
        const char* value = std::getenv(name);
        return value ? value : defaultValue;
    }

    static std::string getEnvOrThrow(const char* name) {
        const char* value = std::getenv(name);
        if (!value) {
            throw std::runtime_error(std::string("Required env variable not set: ") + name);
        }
        return value;
    }
};

} // namespace lease::adapters::secondary
