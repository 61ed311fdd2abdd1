#pragma once

#include <string>
#include <vector>

namespace lease::domain {

/**
 * @brief Проверка домена вызывающей страницы по allow-list арендатора
 *
 * Чистая функция без внешних зависимостей. Работает только со строками
 * хостов, которые передал вызывающий: подлинность origin на его совести.
 *
 * Правила (домен запроса нормализуется в d):
 * 1. Точное совпадение строк до нормализации
 * 2. d == normalize(p)
 * 3. d является поддоменом normalize(p)
 * 4. p = "*.base": d == base или d является поддоменом base
 *
 * Пустой allow-list разрешает любой домен, включая пустую строку.
 */
class DomainMatcher {
public:
    static bool isAllowed(
        const std::string& requestOrigin,
        const std::vector<std::string>& allowList
    ) noexcept;

    /**
     * @brief Привести хост к каноничному виду
     *
     * Срезает ведущие "http://" или "https://" (без учёта регистра),
     * затем ведущий "www.", и переводит в нижний регистр.
     */
    static std::string normalize(const std::string& origin);

private:
    static bool matchesPattern(
        const std::string& requestOrigin,
        const std::string& normalizedOrigin,
        const std::string& pattern
    );

    static bool isSubdomainOf(const std::string& domain, const std::string& base);
};

} // namespace lease::domain
