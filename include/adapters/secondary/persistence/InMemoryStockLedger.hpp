#pragma once

#include "ports/output/IStockLedger.hpp"
#include <ThreadSafeMap.hpp>
#include <stdexcept>

namespace inventory::adapters::secondary {

/**
 * @brief In-memory реализация складского журнала
 *
 * ThreadSafeMap защищает только структуру map. Поля StockEntry меняются
 * на месте через shared_ptr, поэтому tryReserve/release/get для одного товара
 * должны вызываться из его критической секции.
 */
class InMemoryStockLedger : public ports::output::IStockLedger {
public:
    void addProduct(const std::string& productId, int64_t quantity) override {
        if (productId.empty()) {
            throw std::invalid_argument("Product ID must not be empty");
        }
        if (quantity < 0) {
            throw std::invalid_argument(
                "Stock quantity must be non-negative for product " + productId);
        }
        entries_.insert(productId, std::make_shared<domain::StockEntry>(productId, quantity));
    }

    std::optional<domain::StockEntry> get(const std::string& productId) const override {
        auto entry = entries_.find(productId);
        return entry ? std::optional(*entry) : std::nullopt;
    }

    bool contains(const std::string& productId) const override {
        return entries_.contains(productId);
    }

    domain::LedgerStatus tryReserve(const std::string& productId, int64_t quantity) override {
        auto entry = entries_.find(productId);
        if (!entry) {
            return domain::LedgerStatus::NOT_FOUND;
        }
        if (quantity > entry->available()) {
            return domain::LedgerStatus::INSUFFICIENT;
        }
        entry->reserved += quantity;
        return domain::LedgerStatus::SUCCESS;
    }

    domain::LedgerStatus release(const std::string& productId, int64_t quantity) override {
        auto entry = entries_.find(productId);
        if (!entry) {
            return domain::LedgerStatus::NOT_FOUND;
        }
        if (entry->reserved < quantity) {
            entry->reserved = 0;
            return domain::LedgerStatus::UNDERFLOW;
        }
        entry->reserved -= quantity;
        return domain::LedgerStatus::SUCCESS;
    }

    std::vector<std::string> productIds() const override {
        return entries_.keys();
    }

    size_t size() const override {
        return entries_.size();
    }

private:
    ThreadSafeMap<std::string, domain::StockEntry> entries_;
};

} // namespace inventory::adapters::secondary
