#include "domain/events/ReservationExpiredEvent.hpp"
#include <nlohmann/json.hpp>

namespace inventory::domain {

std::string ReservationExpiredEvent::toJson() const {
    nlohmann::json j;
    j["eventId"] = eventId;
    j["eventType"] = eventType;
    j["timestamp"] = timestamp.toString();
    j["reservationId"] = reservationId;
    j["productId"] = productId;
    j["quantity"] = quantity;
    j["expiresAt"] = expiresAt.toString();
    return j.dump();
}

} // namespace inventory::domain
