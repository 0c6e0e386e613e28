#pragma once

#include "DomainEvent.hpp"
#include <string>
#include <cstdint>

namespace inventory::domain {

/**
 * @brief Событие: резерв создан
 */
struct ReservationCreatedEvent : public DomainEvent {
    static constexpr const char* TYPE = "reservation.created";

    std::string reservationId;
    std::string productId;
    int64_t quantity = 0;
    Timestamp expiresAt;

    ReservationCreatedEvent() : DomainEvent(TYPE) {}

    std::string toJson() const override;

    std::unique_ptr<DomainEvent> clone() const override {
        return std::make_unique<ReservationCreatedEvent>(*this);
    }
};

} // namespace inventory::domain
