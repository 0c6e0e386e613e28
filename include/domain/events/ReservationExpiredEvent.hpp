#pragma once

#include "DomainEvent.hpp"
#include <string>
#include <cstdint>

namespace inventory::domain {

/**
 * @brief Событие: резерв снят по TTL
 */
struct ReservationExpiredEvent : public DomainEvent {
    static constexpr const char* TYPE = "reservation.expired";

    std::string reservationId;
    std::string productId;
    int64_t quantity = 0;
    Timestamp expiresAt;

    ReservationExpiredEvent() : DomainEvent(TYPE) {}

    std::string toJson() const override;

    std::unique_ptr<DomainEvent> clone() const override {
        return std::make_unique<ReservationExpiredEvent>(*this);
    }
};

} // namespace inventory::domain
