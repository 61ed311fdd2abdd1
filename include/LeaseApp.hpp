#pragma once

#include <BoostBeastApplication.hpp>
#include <IHttpHandler.hpp>
#include <boost/di.hpp>
#include <memory>

/**
 * @class LeaseApp
 * @brief Сервис аренды чат-виджета
 *
 * Наследует BoostBeastApplication с Template Method паттерном:
 * 1. loadEnvironment() - загрузка конфигурации сервера
 * 2. configureInjection() - настройка Boost.DI и регистрация handlers
 * 3. start() - запуск HTTP сервера (из базового класса)
 *
 * Архитектура: Hexagonal (Ports & Adapters)
 * - Primary Adapters: HTTP Handlers
 * - Secondary Adapters: HmacTokenCodec, PostgresTenantRepository, SystemClock
 *
 * Настройки токенов читаются один раз здесь: отсутствие секрета
 * подписи прерывает запуск с ConfigurationError.
 */
class LeaseApp : public BoostBeastApplication
{
public:
    LeaseApp();
    ~LeaseApp() override;

protected:
    void loadEnvironment(int argc, char* argv[]) override;

    /**
     * @brief Настроить Boost.DI контейнер и зарегистрировать handlers
     */
    void configureInjection() override;

private:
    void printStartupBanner();
};
