#include "domain/events/ReservationRejectedEvent.hpp"
#include <nlohmann/json.hpp>

namespace inventory::domain {

std::string ReservationRejectedEvent::toJson() const {
    nlohmann::json j;
    j["eventId"] = eventId;
    j["eventType"] = eventType;
    j["timestamp"] = timestamp.toString();
    j["productId"] = productId;
    j["quantity"] = quantity;
    j["reason"] = toString(reason);
    return j.dump();
}

} // namespace inventory::domain
