#pragma once

#include "domain/enums/ValidationError.hpp"
#include "domain/WidgetConfig.hpp"
#include <string>
#include <vector>
#include <optional>

namespace lease::ports::input {

/**
 * @brief Результат проверки домена по id арендатора
 */
struct DomainCheckResult {
    bool allowed = false;
    bool restrictions = false;
    std::vector<std::string> allowedOrigins;
    std::optional<domain::ValidationError> error;
    std::string message;
};

/**
 * @brief Проверка арендатора без токена (id + необязательный домен)
 *
 * domainAllowed истинно, если домен не передан или ограничений нет.
 */
struct ClientCheckResult {
    bool valid = false;
    std::string tenantId;
    std::string tenantName;
    bool active = false;
    bool restrictions = false;
    std::vector<std::string> allowedOrigins;
    bool domainAllowed = true;
    std::optional<domain::ValidationError> error;
    std::string message;
};

/**
 * @brief Публичные сведения о виджете
 */
struct WidgetInfoResult {
    bool found = false;
    domain::WidgetConfig config;
    std::string tenantName;
    bool active = false;
    std::optional<domain::ValidationError> error;
    std::string message;
};

/**
 * @brief Доступ арендатора без токена: проверка домена и учёт использования
 */
class ITenantAccessService {
public:
    virtual ~ITenantAccessService() = default;

    virtual DomainCheckResult verifyDomain(
        const std::string& tenantId,
        const std::string& origin
    ) = 0;

    /**
     * @brief Проверить, что арендатор существует, активен и (если домен
     *        передан) допускает этот домен
     */
    virtual ClientCheckResult validateClient(
        const std::string& tenantId,
        const std::optional<std::string>& origin
    ) = 0;

    /**
     * @brief Конфигурация виджета по его id
     *
     * Неактивный арендатор не скрывается: active отдаётся в ответе.
     */
    virtual WidgetInfoResult widgetInfo(const std::string& widgetId) = 0;

    /**
     * @brief Зафиксировать использование (best-effort, ошибки не возвращаются)
     */
    virtual void trackUsage(const std::string& tenantId) = 0;
};

} // namespace lease::ports::input
