#include "domain/events/ReservationReleasedEvent.hpp"
#include <nlohmann/json.hpp>

namespace inventory::domain {

std::string ReservationReleasedEvent::toJson() const {
    nlohmann::json j;
    j["eventId"] = eventId;
    j["eventType"] = eventType;
    j["timestamp"] = timestamp.toString();
    j["reservationId"] = reservationId;
    j["productId"] = productId;
    j["quantity"] = quantity;
    return j.dump();
}

} // namespace inventory::domain
