#include <gtest/gtest.h>
#include "adapters/secondary/events/InMemoryEventBus.hpp"
#include "domain/events/ReservationCreatedEvent.hpp"
#include "domain/events/ReservationRejectedEvent.hpp"

#include <nlohmann/json.hpp>
#include <stdexcept>
#include <vector>

using namespace inventory::adapters::secondary;
using namespace inventory::domain;

class InMemoryEventBusTest : public ::testing::Test {
protected:
    InMemoryEventBus bus;

    ReservationCreatedEvent makeCreated(const std::string& reservationId) {
        ReservationCreatedEvent event;
        event.eventId = "evt-" + reservationId;
        event.reservationId = reservationId;
        event.productId = "SKU-1";
        event.quantity = 3;
        return event;
    }
};

TEST_F(InMemoryEventBusTest, Publish_DeliversToSubscribersOfType) {
    std::vector<std::string> received;
    bus.subscribe(ReservationCreatedEvent::TYPE, [&](const DomainEvent& e) {
        received.push_back(static_cast<const ReservationCreatedEvent&>(e).reservationId);
    });

    bus.publish(makeCreated("r-1"));
    bus.publish(makeCreated("r-2"));

    ASSERT_EQ(received.size(), 2u);
    EXPECT_EQ(received[0], "r-1");
    EXPECT_EQ(received[1], "r-2");
}

TEST_F(InMemoryEventBusTest, Publish_OtherTypeNotDelivered) {
    int calls = 0;
    bus.subscribe(ReservationRejectedEvent::TYPE, [&](const DomainEvent&) { ++calls; });

    bus.publish(makeCreated("r-1"));

    EXPECT_EQ(calls, 0);
}

TEST_F(InMemoryEventBusTest, Publish_NoSubscribers_NoThrow) {
    EXPECT_NO_THROW(bus.publish(makeCreated("r-1")));
}

TEST_F(InMemoryEventBusTest, HandlerException_DoesNotStopOtherHandlers) {
    int calls = 0;
    bus.subscribe(ReservationCreatedEvent::TYPE, [](const DomainEvent&) {
        throw std::runtime_error("subscriber failed");
    });
    bus.subscribe(ReservationCreatedEvent::TYPE, [&](const DomainEvent&) { ++calls; });

    EXPECT_NO_THROW(bus.publish(makeCreated("r-1")));
    EXPECT_EQ(calls, 1);
}

TEST_F(InMemoryEventBusTest, Unsubscribe_RemovesAllHandlersForType) {
    int calls = 0;
    bus.subscribe(ReservationCreatedEvent::TYPE, [&](const DomainEvent&) { ++calls; });
    bus.subscribe(ReservationCreatedEvent::TYPE, [&](const DomainEvent&) { ++calls; });
    EXPECT_EQ(bus.subscriberCount(ReservationCreatedEvent::TYPE), 2u);

    bus.unsubscribe(ReservationCreatedEvent::TYPE);
    bus.publish(makeCreated("r-1"));

    EXPECT_EQ(calls, 0);
    EXPECT_FALSE(bus.hasSubscribers(ReservationCreatedEvent::TYPE));
}

TEST_F(InMemoryEventBusTest, CancelSubscription_KeepsOtherHandlers) {
    int first = 0;
    int second = 0;
    auto firstId = bus.subscribe(ReservationCreatedEvent::TYPE, [&](const DomainEvent&) { ++first; });
    auto secondId = bus.subscribe(ReservationCreatedEvent::TYPE, [&](const DomainEvent&) { ++second; });
    EXPECT_NE(firstId, secondId);

    bus.cancelSubscription(firstId);
    bus.publish(makeCreated("r-1"));

    EXPECT_EQ(first, 0);
    EXPECT_EQ(second, 1);
    EXPECT_EQ(bus.subscriberCount(ReservationCreatedEvent::TYPE), 1u);

    bus.cancelSubscription(secondId);
    EXPECT_FALSE(bus.hasSubscribers(ReservationCreatedEvent::TYPE));
}

TEST_F(InMemoryEventBusTest, CancelSubscription_UnknownId_Ignored) {
    int calls = 0;
    bus.subscribe(ReservationCreatedEvent::TYPE, [&](const DomainEvent&) { ++calls; });

    bus.cancelSubscription(9999);
    bus.publish(makeCreated("r-1"));

    EXPECT_EQ(calls, 1);
}

TEST_F(InMemoryEventBusTest, CreatedEvent_ToJsonCarriesPayload) {
    auto json = nlohmann::json::parse(makeCreated("r-9").toJson());

    EXPECT_EQ(json["eventType"], "reservation.created");
    EXPECT_EQ(json["reservationId"], "r-9");
    EXPECT_EQ(json["productId"], "SKU-1");
    EXPECT_EQ(json["quantity"], 3);
}

TEST_F(InMemoryEventBusTest, RejectedEvent_ToJsonCarriesReason) {
    ReservationRejectedEvent event;
    event.productId = "SKU-1";
    event.quantity = 50;
    event.reason = ReserveStatus::INSUFFICIENT_STOCK;

    auto json = nlohmann::json::parse(event.toJson());

    EXPECT_EQ(json["eventType"], "reservation.rejected");
    EXPECT_EQ(json["reason"], "INSUFFICIENT_STOCK");
}
