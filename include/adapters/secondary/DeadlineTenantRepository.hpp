#pragma once

#include "ports/output/ITenantRepository.hpp"
#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <system_error>
#include <thread>
#include <iostream>

namespace lease::adapters::secondary {

/**
 * @brief Декоратор ITenantRepository с дедлайном на обращение
 *
 * Вызов делегата выполняется в отдельном потоке. Если ответа нет
 * к дедлайну:
 * - чтение бросает StoreUnavailableError
 * - recordUsage возвращает nullopt
 *
 * Зависший вызов не прерывается, его результат отбрасывается.
 * Одновременно в делегате не больше maxInFlight вызовов: сверх лимита
 * обращение сразу считается неудачным, новый поток не создаётся.
 * Сам делегат должен иметь собственный таймаут (см. DbSettings).
 */
class DeadlineTenantRepository : public ports::output::ITenantRepository {
public:
    DeadlineTenantRepository(
        std::shared_ptr<ports::output::ITenantRepository> delegate,
        std::chrono::milliseconds timeout,
        int maxInFlight
    ) : delegate_(std::move(delegate))
      , timeout_(timeout)
      , maxInFlight_(maxInFlight)
      , inFlight_(std::make_shared<std::atomic<int>>(0))
    {
        std::cout << "[DeadlineTenantRepository] Store deadline "
                  << timeout_.count() << "ms, max in-flight " << maxInFlight_ << std::endl;
    }

    std::optional<domain::TenantRecord> findTenant(const std::string& tenantId) override {
        auto delegate = delegate_;
        return awaitLookup("findTenant(" + tenantId + ")", [delegate, tenantId]() {
            return delegate->findTenant(tenantId);
        });
    }

    std::optional<domain::TenantRecord> findTenantByWidgetId(const std::string& widgetId) override {
        auto delegate = delegate_;
        return awaitLookup("findTenantByWidgetId(" + widgetId + ")", [delegate, widgetId]() {
            return delegate->findTenantByWidgetId(widgetId);
        });
    }

    std::optional<int64_t> recordUsage(
        const std::string& tenantId,
        const domain::Timestamp& usedAt
    ) override {
        auto delegate = delegate_;
        auto future = runDetached([delegate, tenantId, usedAt]() {
            return delegate->recordUsage(tenantId, usedAt);
        });

        if (!future) {
            std::cerr << "[DeadlineTenantRepository] recordUsage(" << tenantId
                      << ") dropped: " << maxInFlight_ << " calls in flight" << std::endl;
            return std::nullopt;
        }
        if (future->wait_for(timeout_) != std::future_status::ready) {
            std::cerr << "[DeadlineTenantRepository] recordUsage(" << tenantId
                      << ") exceeded " << timeout_.count() << "ms" << std::endl;
            return std::nullopt;
        }
        return future->get();
    }

    /**
     * @brief Сколько вызовов делегата ещё не завершилось
     */
    int inFlight() const { return inFlight_->load(); }

private:
    std::shared_ptr<ports::output::ITenantRepository> delegate_;
    std::chrono::milliseconds timeout_;
    int maxInFlight_;
    std::shared_ptr<std::atomic<int>> inFlight_;

    /**
     * @brief Снимает вызов со счёта при выходе из делегата
     */
    class InFlightGuard {
    public:
        explicit InFlightGuard(std::shared_ptr<std::atomic<int>> counter)
            : counter_(std::move(counter)) {}
        ~InFlightGuard() { counter_->fetch_sub(1); }

        InFlightGuard(const InFlightGuard&) = delete;
        InFlightGuard& operator=(const InFlightGuard&) = delete;

    private:
        std::shared_ptr<std::atomic<int>> counter_;
    };

    template <typename Fn>
    std::optional<domain::TenantRecord> awaitLookup(const std::string& operation, Fn fn) {
        auto future = runDetached(std::move(fn));

        if (!future) {
            std::cerr << "[DeadlineTenantRepository] " << operation << " rejected: "
                      << maxInFlight_ << " calls in flight" << std::endl;
            throw domain::StoreUnavailableError("Tenant store overloaded");
        }
        if (future->wait_for(timeout_) != std::future_status::ready) {
            std::cerr << "[DeadlineTenantRepository] " << operation
                      << " exceeded " << timeout_.count() << "ms" << std::endl;
            throw domain::StoreUnavailableError("Tenant lookup timed out");
        }
        // Исключение делегата пробрасывается как есть
        return future->get();
    }

    /**
     * @brief Запустить задачу в отсоединённом потоке, если есть свободный слот
     *
     * std::async здесь не годится: деструктор его future ждёт завершения.
     *
     * @return nullopt если лимит одновременных вызовов исчерпан
     */
    template <typename Fn>
    auto runDetached(Fn fn) -> std::optional<std::future<decltype(fn())>> {
        using Result = decltype(fn());

        int current = inFlight_->load();
        do {
            if (current >= maxInFlight_) {
                return std::nullopt;
            }
        } while (!inFlight_->compare_exchange_weak(current, current + 1));

        auto counter = inFlight_;
        std::packaged_task<Result()> task([fn = std::move(fn), counter]() mutable {
            InFlightGuard guard(counter);
            return fn();
        });
        auto future = task.get_future();
        try {
            std::thread(std::move(task)).detach();
        } catch (const std::system_error& e) {
            inFlight_->fetch_sub(1);
            std::cerr << "[DeadlineTenantRepository] Cannot start store call: " << e.what() << std::endl;
            return std::nullopt;
        }
        return future;
    }
};

} // namespace lease::adapters::secondary
