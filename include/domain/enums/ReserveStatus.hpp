#pragma once

#include <string>

namespace inventory::domain {

/**
 * @brief Исход операции reserve
 *
 * INSUFFICIENT_STOCK - нормальный результат конкуренции, не ошибка сервиса.
 */
enum class ReserveStatus {
    RESERVED,
    INVALID_REQUEST,
    PRODUCT_NOT_FOUND,
    INSUFFICIENT_STOCK
};

inline std::string toString(ReserveStatus status) {
    switch (status) {
        case ReserveStatus::RESERVED:           return "RESERVED";
        case ReserveStatus::INVALID_REQUEST:    return "INVALID_REQUEST";
        case ReserveStatus::PRODUCT_NOT_FOUND:  return "PRODUCT_NOT_FOUND";
        case ReserveStatus::INSUFFICIENT_STOCK: return "INSUFFICIENT_STOCK";
    }
    return "UNKNOWN";
}

} // namespace inventory::domain
