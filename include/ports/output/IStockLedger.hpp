#pragma once

#include "domain/StockEntry.hpp"
#include "domain/enums/LedgerStatus.hpp"
#include <string>
#include <optional>
#include <vector>
#include <cstdint>

namespace inventory::ports::output {

/**
 * @brief Интерфейс складского журнала (Stock Ledger)
 *
 * Output Port: пассивное хранилище StockEntry по productId.
 * Своей синхронизации на уровне товара не делает - изменения одного товара
 * вызываются только из его критической секции (ReservationCoordinator).
 */
class IStockLedger {
public:
    virtual ~IStockLedger() = default;

    /**
     * @brief Добавить товар (загрузка каталога)
     *
     * @param productId ID товара
     * @param quantity Всего единиц на складе
     * @throws std::invalid_argument если quantity < 0 или productId пустой
     */
    virtual void addProduct(const std::string& productId, int64_t quantity) = 0;

    /**
     * @brief Копия записи товара
     * @return StockEntry или nullopt
     */
    virtual std::optional<domain::StockEntry> get(const std::string& productId) const = 0;

    virtual bool contains(const std::string& productId) const = 0;

    /**
     * @brief Зарезервировать quantity единиц
     *
     * @return SUCCESS, INSUFFICIENT (без изменений) или NOT_FOUND
     */
    virtual domain::LedgerStatus tryReserve(const std::string& productId, int64_t quantity) = 0;

    /**
     * @brief Вернуть quantity единиц из reserved
     *
     * reserved никогда не уходит в минус.
     *
     * @return SUCCESS, NOT_FOUND или UNDERFLOW (reserved был меньше quantity и обнулён)
     */
    virtual domain::LedgerStatus release(const std::string& productId, int64_t quantity) = 0;

    virtual std::vector<std::string> productIds() const = 0;

    virtual size_t size() const = 0;
};

} // namespace inventory::ports::output
