#pragma once

#include <string>

namespace lease::domain {

/**
 * @brief Состояния проверки сессии
 *
 * RECEIVED -> DECODED -> TENANT_RESOLVED -> DOMAIN_CHECKED -> AUTHORIZED,
 * либо REJECTED на любом шаге.
 */
enum class ValidationStage {
    RECEIVED,
    DECODED,
    TENANT_RESOLVED,
    DOMAIN_CHECKED,
    AUTHORIZED,
    REJECTED
};

inline std::string toString(ValidationStage stage) {
    switch (stage) {
        case ValidationStage::RECEIVED:        return "RECEIVED";
        case ValidationStage::DECODED:         return "DECODED";
        case ValidationStage::TENANT_RESOLVED: return "TENANT_RESOLVED";
        case ValidationStage::DOMAIN_CHECKED:  return "DOMAIN_CHECKED";
        case ValidationStage::AUTHORIZED:      return "AUTHORIZED";
        case ValidationStage::REJECTED:        return "REJECTED";
    }
    return "UNKNOWN";
}

inline bool isTerminal(ValidationStage stage) {
    return stage == ValidationStage::AUTHORIZED ||
           stage == ValidationStage::REJECTED;
}

} // namespace lease::domain
