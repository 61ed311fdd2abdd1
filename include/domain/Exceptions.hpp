#pragma once

#include <stdexcept>
#include <string>

namespace lease::domain {

/**
 * @brief Ошибка конфигурации (нет секрета подписи, неверный TTL)
 *
 * При старте фатальна.
 */
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Хранилище арендаторов недоступно (сбой, таймаут, отмена)
 *
 * Не путать с "арендатор не найден": это отсутствие ответа, а не пустой ответ.
 */
class StoreUnavailableError : public std::runtime_error {
public:
    explicit StoreUnavailableError(const std::string& message)
        : std::runtime_error(message) {}
};

} // namespace lease::domain
