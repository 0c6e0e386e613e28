#pragma once

#include "DomainEvent.hpp"
#include "domain/enums/ReserveStatus.hpp"
#include <string>
#include <cstdint>

namespace inventory::domain {

/**
 * @brief Событие: reserve отклонён (нет товара или не хватает остатка)
 */
struct ReservationRejectedEvent : public DomainEvent {
    static constexpr const char* TYPE = "reservation.rejected";

    std::string productId;
    int64_t quantity = 0;
    ReserveStatus reason = ReserveStatus::INSUFFICIENT_STOCK;

    ReservationRejectedEvent() : DomainEvent(TYPE) {}

    std::string toJson() const override;

    std::unique_ptr<DomainEvent> clone() const override {
        return std::make_unique<ReservationRejectedEvent>(*this);
    }
};

} // namespace inventory::domain
