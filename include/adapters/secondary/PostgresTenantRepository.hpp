#pragma once

#include "ports/output/ITenantRepository.hpp"
#include "DbSettings.hpp"
#include <pqxx/pqxx>
#include <nlohmann/json.hpp>
#include <memory>
#include <mutex>
#include <iostream>

namespace lease::adapters::secondary {

/**
 * @brief Хранилище арендаторов в PostgreSQL (таблица tenants, см. sql/init.sql)
 *
 * allowed_origins и widget_config хранятся как JSONB.
 * Любой сбой чтения превращается в StoreUnavailableError,
 * сбой записи счётчика возвращает nullopt.
 *
 * Время ожидания ограничено на стороне libpq: connect_timeout
 * и statement_timeout из DbSettings.
 */
class PostgresTenantRepository : public ports::output::ITenantRepository {
public:
    explicit PostgresTenantRepository(std::shared_ptr<DbSettings> settings)
        : settings_(std::move(settings))
    {
        std::cout << "[PostgresTenantRepository] Connecting..." << std::endl;
        try {
            connection_ = std::make_unique<pqxx::connection>(settings_->getConnectionString());
            std::cout << "[PostgresTenantRepository] Connected" << std::endl;
        } catch (const std::exception& e) {
            std::cerr << "[PostgresTenantRepository] Connection failed: " << e.what() << std::endl;
            throw;
        }
    }

    ~PostgresTenantRepository() override {
        if (connection_ && connection_->is_open()) {
            connection_->close();
        }
    }

    std::optional<domain::TenantRecord> findTenant(const std::string& tenantId) override {
        return findOne("tenant_id = $1", tenantId, "findTenant");
    }

    std::optional<domain::TenantRecord> findTenantByWidgetId(const std::string& widgetId) override {
        return findOne("widget_config->>'widgetId' = $1", widgetId, "findTenantByWidgetId");
    }

    std::optional<int64_t> recordUsage(
        const std::string& tenantId,
        const domain::Timestamp& usedAt
    ) override {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            ensureConnected();
            pqxx::work txn(*connection_);

            // Только колонки учёта: active и allow-list остаются как есть
            auto result = txn.exec_params(
                R"(
                    UPDATE tenants SET
                        usage_count = usage_count + 1,
                        last_used_at = to_timestamp($2),
                        updated_at = NOW()
                    WHERE tenant_id = $1
                    RETURNING usage_count
                )",
                tenantId,
                usedAt.toUnixSeconds()
            );

            txn.commit();

            if (result.empty()) return std::nullopt;
            return result[0]["usage_count"].as<int64_t>();

        } catch (const std::exception& e) {
            std::cerr << "[PostgresTenantRepository] recordUsage() failed: " << e.what() << std::endl;
            return std::nullopt;
        }
    }

private:
    std::shared_ptr<DbSettings> settings_;
    std::unique_ptr<pqxx::connection> connection_;
    std::mutex mutex_;

    std::optional<domain::TenantRecord> findOne(
        const std::string& condition,
        const std::string& value,
        const char* operation
    ) {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            ensureConnected();
            pqxx::work txn(*connection_);

            auto result = txn.exec_params(
                R"(SELECT tenant_id, name, active,
                          allowed_origins::text AS allowed_origins,
                          widget_config::text AS widget_config,
                          usage_count,
                          EXTRACT(EPOCH FROM last_used_at)::bigint AS last_used_epoch
                   FROM tenants WHERE )" + condition + " LIMIT 1",
                value
            );

            txn.commit();

            if (result.empty()) return std::nullopt;

            return rowToTenant(result[0]);

        } catch (const std::exception& e) {
            std::cerr << "[PostgresTenantRepository] " << operation << "() failed: " << e.what() << std::endl;
            throw domain::StoreUnavailableError(std::string("Tenant lookup failed: ") + e.what());
        }
    }

    void ensureConnected() {
        if (!connection_ || !connection_->is_open()) {
            std::cout << "[PostgresTenantRepository] Reconnecting..." << std::endl;
            connection_ = std::make_unique<pqxx::connection>(settings_->getConnectionString());
        }
    }

    static domain::TenantRecord rowToTenant(const pqxx::row& row) {
        domain::TenantRecord tenant;
        tenant.tenantId = row["tenant_id"].as<std::string>();
        tenant.name = row["name"].is_null() ? "" : row["name"].as<std::string>();
        tenant.active = row["active"].as<bool>();

        if (!row["allowed_origins"].is_null()) {
            auto origins = nlohmann::json::parse(row["allowed_origins"].as<std::string>());
            tenant.allowedOrigins = origins.get<std::vector<std::string>>();
        }

        if (!row["widget_config"].is_null()) {
            tenant.widgetConfig = domain::widgetConfigFromJson(
                nlohmann::json::parse(row["widget_config"].as<std::string>()));
        }

        tenant.usageCount = row["usage_count"].as<int64_t>();
        if (!row["last_used_epoch"].is_null()) {
            tenant.lastUsedAt = domain::Timestamp::fromUnixSeconds(
                row["last_used_epoch"].as<int64_t>());
        }
        return tenant;
    }
};

} // namespace lease::adapters::secondary
