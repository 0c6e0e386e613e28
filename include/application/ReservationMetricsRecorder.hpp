#pragma once

#include "ports/input/IMetricsService.hpp"
#include "ports/output/IEventBus.hpp"
#include "domain/events/ReservationCreatedEvent.hpp"
#include "domain/events/ReservationReleasedEvent.hpp"
#include "domain/events/ReservationExpiredEvent.hpp"
#include "domain/events/ReservationRejectedEvent.hpp"

#include <iostream>
#include <memory>
#include <vector>

namespace inventory::application {

/**
 * @brief Подписчик событий резервирования, пишущий метрики
 *
 * Слушает IEventBus:
 * - reservation.created  -> reservations_total{outcome="reserved"}, units_reserved, outstanding +1
 * - reservation.released -> reservations_total{outcome="released"}, units_returned, outstanding -1
 * - reservation.expired  -> reservations_total{outcome="expired"}, units_returned, outstanding -1
 * - reservation.rejected -> reservations_total{outcome="insufficient_stock" | "product_not_found"}
 *
 * Handlers держат только shared_ptr на IMetricsService, поэтому publish,
 * начатый до разрушения recorder'а, безопасно допишет метрики.
 * Деструктор снимает только свои подписки.
 */
class ReservationMetricsRecorder {
public:
    ReservationMetricsRecorder(
        std::shared_ptr<ports::output::IEventBus> eventBus,
        std::shared_ptr<ports::input::IMetricsService> metrics)
        : eventBus_(std::move(eventBus))
        , metrics_(std::move(metrics))
    {
        subscribe();
    }

    ~ReservationMetricsRecorder() {
        for (auto id : subscriptions_) {
            eventBus_->cancelSubscription(id);
        }
    }

    ReservationMetricsRecorder(const ReservationMetricsRecorder&) = delete;
    ReservationMetricsRecorder& operator=(const ReservationMetricsRecorder&) = delete;

private:
    std::shared_ptr<ports::output::IEventBus> eventBus_;
    std::shared_ptr<ports::input::IMetricsService> metrics_;
    std::vector<ports::output::SubscriptionId> subscriptions_;

    void subscribe() {
        auto metrics = metrics_;

        subscriptions_.push_back(eventBus_->subscribe(domain::ReservationCreatedEvent::TYPE,
            [metrics](const domain::DomainEvent& e) {
                const auto& event = static_cast<const domain::ReservationCreatedEvent&>(e);
                metrics->increment("inventory_reservations_total", {{"outcome", "reserved"}});
                metrics->add("inventory_units_reserved_total", event.quantity);
                metrics->add("inventory_reservations_outstanding", 1);
            }));

        subscriptions_.push_back(eventBus_->subscribe(domain::ReservationReleasedEvent::TYPE,
            [metrics](const domain::DomainEvent& e) {
                const auto& event = static_cast<const domain::ReservationReleasedEvent&>(e);
                metrics->increment("inventory_reservations_total", {{"outcome", "released"}});
                metrics->add("inventory_units_returned_total", event.quantity);
                metrics->add("inventory_reservations_outstanding", -1);
            }));

        subscriptions_.push_back(eventBus_->subscribe(domain::ReservationExpiredEvent::TYPE,
            [metrics](const domain::DomainEvent& e) {
                const auto& event = static_cast<const domain::ReservationExpiredEvent&>(e);
                metrics->increment("inventory_reservations_total", {{"outcome", "expired"}});
                metrics->add("inventory_units_returned_total", event.quantity);
                metrics->add("inventory_reservations_outstanding", -1);
            }));

        subscriptions_.push_back(eventBus_->subscribe(domain::ReservationRejectedEvent::TYPE,
            [metrics](const domain::DomainEvent& e) {
                const auto& event = static_cast<const domain::ReservationRejectedEvent&>(e);
                std::string outcome = (event.reason == domain::ReserveStatus::PRODUCT_NOT_FOUND)
                    ? "product_not_found"
                    : "insufficient_stock";
                metrics->increment("inventory_reservations_total", {{"outcome", outcome}});
            }));

        std::cout << "[ReservationMetricsRecorder] Subscribed to 4 event types" << std::endl;
    }
};

} // namespace inventory::application
