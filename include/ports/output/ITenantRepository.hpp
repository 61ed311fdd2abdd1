#pragma once

#include "domain/TenantRecord.hpp"
#include "domain/Timestamp.hpp"
#include "domain/Exceptions.hpp"
#include <cstdint>
#include <string>
#include <optional>

namespace lease::ports::output {

/**
 * @brief Интерфейс хранилища арендаторов
 *
 * Ядро только читает записи. Единственная запись из ядра: счётчик
 * использования, и она не трогает остальные поля арендатора.
 */
class ITenantRepository {
public:
    virtual ~ITenantRepository() = default;

    /**
     * @brief Найти арендатора
     *
     * @return nullopt если арендатора нет
     * @throws domain::StoreUnavailableError если хранилище не ответило
     */
    virtual std::optional<domain::TenantRecord> findTenant(const std::string& tenantId) = 0;

    /**
     * @brief Найти арендатора по id его виджета
     *
     * @throws domain::StoreUnavailableError если хранилище не ответило
     */
    virtual std::optional<domain::TenantRecord> findTenantByWidgetId(const std::string& widgetId) = 0;

    /**
     * @brief Атомарно увеличить usageCount и выставить lastUsedAt
     *
     * active, allowedOrigins и конфигурация виджета не меняются.
     *
     * @return новое значение счётчика; nullopt при неудаче записи
     *         или если арендатора уже нет
     */
    virtual std::optional<int64_t> recordUsage(
        const std::string& tenantId,
        const domain::Timestamp& usedAt
    ) = 0;
};

} // namespace lease::ports::output
