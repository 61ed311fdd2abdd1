#pragma once

#include "ports/output/ITenantRepository.hpp"
#include "ports/output/IClock.hpp"
#include "application/LeaseMetrics.hpp"
#include <memory>
#include <optional>
#include <iostream>

namespace lease::application {

/**
 * @brief Учёт использования виджета (usageCount, lastUsedAt)
 *
 * Best-effort: инкремент выполняет хранилище одной операцией, остальные
 * поля арендатора не перезаписываются. Ошибки записи логируются
 * и наружу не выходят.
 */
class UsageRecorder {
public:
    UsageRecorder(
        std::shared_ptr<ports::output::ITenantRepository> repository,
        std::shared_ptr<ports::output::IClock> clock,
        std::shared_ptr<LeaseMetrics> metrics
    ) : repository_(std::move(repository))
      , clock_(std::move(clock))
      , metrics_(std::move(metrics))
    {}

    /**
     * @brief Учесть использование арендатора
     *
     * @param tenant запись, полученная при проверке; usageCount и lastUsedAt
     *        обновляются на месте (при сбое записи счётчик только оценочный)
     * @return true если хранилище приняло запись
     */
    bool record(domain::TenantRecord& tenant) {
        auto usedAt = clock_->now();
        tenant.lastUsedAt = usedAt;

        try {
            auto count = repository_->recordUsage(tenant.tenantId, usedAt);
            if (count) {
                tenant.usageCount = *count;
                return true;
            }
            std::cerr << "[UsageRecorder] Usage update rejected for tenant "
                      << tenant.tenantId << std::endl;
        } catch (const std::exception& e) {
            std::cerr << "[UsageRecorder] Usage update failed for tenant "
                      << tenant.tenantId << ": " << e.what() << std::endl;
        }

        tenant.usageCount += 1;
        metrics_->recordUsageWriteFailure();
        return false;
    }

    /**
     * @brief Найти арендатора и учесть использование
     *
     * Неизвестный арендатор и недоступное хранилище молча пропускаются.
     */
    void recordById(const std::string& tenantId) {
        std::optional<domain::TenantRecord> tenant;
        try {
            tenant = repository_->findTenant(tenantId);
        } catch (const domain::StoreUnavailableError& e) {
            std::cerr << "[UsageRecorder] Store unavailable, usage for "
                      << tenantId << " dropped: " << e.what() << std::endl;
            metrics_->recordUsageWriteFailure();
            return;
        }

        if (!tenant) {
            return;
        }
        record(*tenant);
    }

private:
    std::shared_ptr<ports::output::ITenantRepository> repository_;
    std::shared_ptr<ports::output::IClock> clock_;
    std::shared_ptr<LeaseMetrics> metrics_;
};

} // namespace lease::application
