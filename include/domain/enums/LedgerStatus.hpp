#pragma once

#include <string>

namespace inventory::domain {

/**
 * @brief Результат операции над StockEntry
 */
enum class LedgerStatus {
    SUCCESS,
    INSUFFICIENT,   ///< quantity > available, запись не изменена
    NOT_FOUND,
    UNDERFLOW       ///< release больше, чем reserved: значение обрезано до 0
};

inline std::string toString(LedgerStatus status) {
    switch (status) {
        case LedgerStatus::SUCCESS:      return "SUCCESS";
        case LedgerStatus::INSUFFICIENT: return "INSUFFICIENT";
        case LedgerStatus::NOT_FOUND:    return "NOT_FOUND";
        case LedgerStatus::UNDERFLOW:    return "UNDERFLOW";
    }
    return "UNKNOWN";
}

} // namespace inventory::domain
