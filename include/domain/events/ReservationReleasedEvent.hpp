#pragma once

#include "DomainEvent.hpp"
#include <string>
#include <cstdint>

namespace inventory::domain {

/**
 * @brief Событие: резерв отменён клиентом, товар вернулся в available
 */
struct ReservationReleasedEvent : public DomainEvent {
    static constexpr const char* TYPE = "reservation.released";

    std::string reservationId;
    std::string productId;
    int64_t quantity = 0;

    ReservationReleasedEvent() : DomainEvent(TYPE) {}

    std::string toJson() const override;

    std::unique_ptr<DomainEvent> clone() const override {
        return std::make_unique<ReservationReleasedEvent>(*this);
    }
};

} // namespace inventory::domain
