#include "domain/DomainMatcher.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>

namespace lease::domain {

namespace {

const std::string WILDCARD_PREFIX = "*.";

bool startsWith(const std::string& value, const std::string& prefix) {
    return value.size() >= prefix.size() &&
           value.compare(0, prefix.size(), prefix) == 0;
}

} // namespace

bool DomainMatcher::isAllowed(
    const std::string& requestOrigin,
    const std::vector<std::string>& allowList
) noexcept {
    if (allowList.empty()) {
        return true;
    }

    try {
        const std::string normalizedOrigin = normalize(requestOrigin);

        return std::any_of(allowList.begin(), allowList.end(),
            [&](const std::string& pattern) {
                return matchesPattern(requestOrigin, normalizedOrigin, pattern);
            });
    } catch (const std::exception& e) {
        // Только std::bad_alloc при копировании строк
        std::cerr << "[DomainMatcher] Match aborted: " << e.what() << std::endl;
        return false;
    }
}

std::string DomainMatcher::normalize(const std::string& origin) {
    std::string result = origin;
    std::transform(result.begin(), result.end(), result.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (startsWith(result, "https://")) {
        result.erase(0, 8);
    } else if (startsWith(result, "http://")) {
        result.erase(0, 7);
    }

    if (startsWith(result, "www.")) {
        result.erase(0, 4);
    }

    return result;
}

bool DomainMatcher::matchesPattern(
    const std::string& requestOrigin,
    const std::string& normalizedOrigin,
    const std::string& pattern
) {
    if (requestOrigin == pattern) {
        return true;
    }

    if (startsWith(pattern, WILDCARD_PREFIX)) {
        const std::string base = normalize(pattern.substr(WILDCARD_PREFIX.size()));
        if (base.empty()) {
            return false;
        }
        return normalizedOrigin == base || isSubdomainOf(normalizedOrigin, base);
    }

    const std::string normalizedPattern = normalize(pattern);
    if (normalizedPattern.empty()) {
        return false;
    }

    return normalizedOrigin == normalizedPattern ||
           isSubdomainOf(normalizedOrigin, normalizedPattern);
}

bool DomainMatcher::isSubdomainOf(const std::string& domain, const std::string& base) {
    // domain заканчивается на "." + base
    if (domain.size() < base.size() + 1) {
        return false;
    }
    const size_t offset = domain.size() - base.size();
    return domain[offset - 1] == '.' &&
           domain.compare(offset, base.size(), base) == 0;
}

} // namespace lease::domain
