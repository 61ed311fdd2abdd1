#pragma once

#include <string>

namespace lease::domain {

/**
 * @brief Причина отказа при разборе токена
 */
enum class DecodeError {
    MALFORMED,      ///< Подпись не сходится или структура повреждена
    EXPIRED,        ///< Подпись верна, но exp в прошлом
    NOT_YET_VALID   ///< nbf/iat ещё не наступили
};

inline std::string toString(DecodeError error) {
    switch (error) {
        case DecodeError::MALFORMED:     return "MALFORMED";
        case DecodeError::EXPIRED:       return "EXPIRED";
        case DecodeError::NOT_YET_VALID: return "NOT_YET_VALID";
    }
    return "UNKNOWN";
}

} // namespace lease::domain
