#pragma once

#include <string>

namespace inventory::domain {

/**
 * @brief Исход операции release / expire
 */
enum class ReleaseStatus {
    RELEASED,           ///< Переход выполнен, reserved уменьшен
    ALREADY_TERMINAL,   ///< Резерв уже RELEASED/EXPIRED, ничего не изменилось
    NOT_FOUND
};

inline std::string toString(ReleaseStatus status) {
    switch (status) {
        case ReleaseStatus::RELEASED:         return "RELEASED";
        case ReleaseStatus::ALREADY_TERMINAL: return "ALREADY_TERMINAL";
        case ReleaseStatus::NOT_FOUND:        return "NOT_FOUND";
    }
    return "UNKNOWN";
}

} // namespace inventory::domain
