#pragma once

#include <string>
#include <cstdint>

namespace inventory::domain {

/**
 * @brief Складской остаток одного товара
 *
 * Инвариант: 0 <= reserved <= quantity.
 * available не хранится, а вычисляется.
 */
struct StockEntry {
    std::string productId;
    int64_t quantity = 0;   ///< Всего единиц на складе
    int64_t reserved = 0;   ///< Сумма quantity всех ACTIVE резервов

    StockEntry() = default;

    StockEntry(std::string productId, int64_t quantity, int64_t reserved = 0)
        : productId(std::move(productId))
        , quantity(quantity)
        , reserved(reserved)
    {}

    int64_t available() const {
        return quantity - reserved;
    }

    bool isConsistent() const {
        return reserved >= 0 && reserved <= quantity;
    }
};

} // namespace inventory::domain
