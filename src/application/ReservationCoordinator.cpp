#include "application/ReservationCoordinator.hpp"

#include "domain/InvariantViolation.hpp"
#include "domain/events/ReservationCreatedEvent.hpp"
#include "domain/events/ReservationReleasedEvent.hpp"
#include "domain/events/ReservationExpiredEvent.hpp"
#include "domain/events/ReservationRejectedEvent.hpp"
#include "utils/UuidGenerator.hpp"

#include <iostream>
#include <sstream>

namespace inventory::application {

using domain::LedgerStatus;
using domain::ReleaseStatus;
using domain::ReservationState;
using domain::ReserveStatus;

ReservationCoordinator::ReservationCoordinator(
    std::shared_ptr<ports::output::IStockLedger> ledger,
    std::shared_ptr<ports::output::IReservationTable> reservations,
    std::shared_ptr<ports::output::IClock> clock,
    std::shared_ptr<ports::output::IEventBus> eventBus,
    std::shared_ptr<ports::output::IInventorySettings> settings)
    : ledger_(std::move(ledger))
    , reservations_(std::move(reservations))
    , clock_(std::move(clock))
    , eventBus_(std::move(eventBus))
    , settings_(std::move(settings))
{
    std::cout << "[ReservationCoordinator] Created, TTL="
              << settings_->getReservationTtl().count() << "ms" << std::endl;
}

// ============================================================================
// reserve
// ============================================================================

domain::ReserveResult ReservationCoordinator::reserve(const std::string& productId, int64_t quantity)
{
    domain::ReserveResult result;

    if (productId.empty()) {
        result.status = ReserveStatus::INVALID_REQUEST;
        result.message = "Product ID is required";
        return result;
    }
    if (quantity <= 0) {
        result.status = ReserveStatus::INVALID_REQUEST;
        result.message = "Quantity must be positive";
        return result;
    }

    auto mutex = productLock(productId);
    if (!mutex) {
        result.status = ReserveStatus::PRODUCT_NOT_FOUND;
        result.message = "Product not found";

        domain::ReservationRejectedEvent event;
        event.eventId = utils::UuidGenerator::generate();
        event.productId = productId;
        event.quantity = quantity;
        event.reason = ReserveStatus::PRODUCT_NOT_FOUND;
        eventBus_->publish(event);
        return result;
    }

    bool brokenBefore = false;
    domain::StockEntry snapshot;
    LedgerStatus status = LedgerStatus::NOT_FOUND;
    std::chrono::steady_clock::duration waited{};

    auto waitStart = std::chrono::steady_clock::now();
    {
        std::lock_guard<std::mutex> guard(*mutex);
        waited = std::chrono::steady_clock::now() - waitStart;

        auto entry = ledger_->get(productId);
        if (entry && !entry->isConsistent()) {
            brokenBefore = true;
            snapshot = *entry;
        } else {
            status = ledger_->tryReserve(productId, quantity);
            if (status == LedgerStatus::SUCCESS) {
                auto now = clock_->now();
                domain::Reservation reservation(
                    utils::UuidGenerator::generate(),
                    productId,
                    quantity,
                    now,
                    now.addMilliseconds(settings_->getReservationTtl().count()));
                reservations_->insert(reservation);
                result.reservation = reservation;
            }
            if (auto after = ledger_->get(productId)) {
                snapshot = *after;
            }
        }
    }

    warnIfSlow(productId, waited);

    if (brokenBefore) {
        std::ostringstream msg;
        msg << "Stock invariant broken for product " << productId
            << ": quantity=" << snapshot.quantity << " reserved=" << snapshot.reserved;
        failInvariant(msg.str());
    }

    result.available = snapshot.available();

    switch (status) {
        case LedgerStatus::SUCCESS: {
            const auto& reservation = *result.reservation;
            result.status = ReserveStatus::RESERVED;
            result.message = "Reserved";

            std::cout << "[ReservationCoordinator] Reserved " << quantity << " of " << productId
                      << " (" << reservation.id << "), available=" << result.available << std::endl;

            domain::ReservationCreatedEvent event;
            event.eventId = utils::UuidGenerator::generate();
            event.reservationId = reservation.id;
            event.productId = productId;
            event.quantity = quantity;
            event.expiresAt = reservation.expiresAt;
            eventBus_->publish(event);
            return result;
        }

        case LedgerStatus::INSUFFICIENT: {
            result.status = ReserveStatus::INSUFFICIENT_STOCK;
            result.message = "Insufficient stock";

            domain::ReservationRejectedEvent event;
            event.eventId = utils::UuidGenerator::generate();
            event.productId = productId;
            event.quantity = quantity;
            event.reason = ReserveStatus::INSUFFICIENT_STOCK;
            eventBus_->publish(event);
            return result;
        }

        case LedgerStatus::NOT_FOUND:
            result.status = ReserveStatus::PRODUCT_NOT_FOUND;
            result.message = "Product not found";
            return result;

        case LedgerStatus::UNDERFLOW:
            break;
    }

    failInvariant("Unexpected ledger status on reserve: " + domain::toString(status));
}

// ============================================================================
// release / expire
// ============================================================================

domain::ReleaseResult ReservationCoordinator::release(const std::string& reservationId)
{
    domain::ReleaseResult result;

    auto reservation = reservations_->get(reservationId);
    if (!reservation) {
        result.status = ReleaseStatus::NOT_FOUND;
        result.message = "Reservation not found";
        return result;
    }

    // Быстрый путь без секции; окончательная проверка всё равно внутри transition()
    if (domain::isTerminal(reservation->state)) {
        result.status = ReleaseStatus::ALREADY_TERMINAL;
        result.state = reservation->state;
        result.message = "Reservation already " + domain::toString(reservation->state);
        return result;
    }

    return transition(*reservation, ReservationState::RELEASED);
}

domain::ReleaseResult ReservationCoordinator::transition(
    const domain::Reservation& reservation,
    ReservationState target)
{
    domain::ReleaseResult result;

    auto mutex = productLock(reservation.productId);
    if (!mutex) {
        failInvariant("Reservation " + reservation.id + " refers to unknown product " + reservation.productId);
    }

    std::optional<ReservationState> previous;
    LedgerStatus ledgerStatus = LedgerStatus::SUCCESS;
    std::chrono::steady_clock::duration waited{};

    auto waitStart = std::chrono::steady_clock::now();
    {
        std::lock_guard<std::mutex> guard(*mutex);
        waited = std::chrono::steady_clock::now() - waitStart;

        auto now = clock_->now();
        previous = (target == ReservationState::RELEASED)
            ? reservations_->markReleased(reservation.id, now)
            : reservations_->markExpired(reservation.id, now);

        if (previous && *previous == ReservationState::ACTIVE) {
            ledgerStatus = ledger_->release(reservation.productId, reservation.quantity);
        }
    }

    warnIfSlow(reservation.productId, waited);

    if (!previous) {
        // Запись удалена retention'ом между get() и секцией
        result.status = ReleaseStatus::NOT_FOUND;
        result.message = "Reservation not found";
        return result;
    }

    if (*previous != ReservationState::ACTIVE) {
        result.status = ReleaseStatus::ALREADY_TERMINAL;
        result.state = *previous;
        result.message = "Reservation already " + domain::toString(*previous);
        return result;
    }

    if (ledgerStatus != LedgerStatus::SUCCESS) {
        std::ostringstream msg;
        msg << "Ledger " << domain::toString(ledgerStatus) << " while returning "
            << reservation.quantity << " of " << reservation.productId
            << " for reservation " << reservation.id;
        failInvariant(msg.str());
    }

    result.status = ReleaseStatus::RELEASED;
    result.state = target;

    if (target == ReservationState::RELEASED) {
        result.message = "Released";
        std::cout << "[ReservationCoordinator] Released " << reservation.quantity << " of "
                  << reservation.productId << " (" << reservation.id << ")" << std::endl;

        domain::ReservationReleasedEvent event;
        event.eventId = utils::UuidGenerator::generate();
        event.reservationId = reservation.id;
        event.productId = reservation.productId;
        event.quantity = reservation.quantity;
        eventBus_->publish(event);
    } else {
        result.message = "Expired";
        std::cout << "[ReservationCoordinator] Expired " << reservation.quantity << " of "
                  << reservation.productId << " (" << reservation.id << ")" << std::endl;

        domain::ReservationExpiredEvent event;
        event.eventId = utils::UuidGenerator::generate();
        event.reservationId = reservation.id;
        event.productId = reservation.productId;
        event.quantity = reservation.quantity;
        event.expiresAt = reservation.expiresAt;
        eventBus_->publish(event);
    }

    return result;
}

domain::SweepResult ReservationCoordinator::expireDue()
{
    domain::SweepResult sweep;

    auto now = clock_->now();
    auto due = reservations_->listActiveExpiring(now);
    sweep.scanned = due.size();

    for (const auto& reservation : due) {
        try {
            auto result = transition(reservation, ReservationState::EXPIRED);
            if (result.status == ReleaseStatus::RELEASED) {
                ++sweep.expired;
            }
        } catch (const domain::InvariantViolation&) {
            // Уже залогировано в failInvariant(); остальные резервы продолжаем
            ++sweep.violations;
        }
    }

    auto retention = settings_->getTerminalRetention();
    if (retention.count() > 0) {
        sweep.purged = reservations_->removeTerminalBefore(now.addMilliseconds(-retention.count()));
    }

    if (sweep.expired > 0 || sweep.purged > 0 || sweep.violations > 0) {
        std::cout << "[ReservationCoordinator] Sweep: scanned=" << sweep.scanned
                  << " expired=" << sweep.expired
                  << " purged=" << sweep.purged
                  << " violations=" << sweep.violations << std::endl;
    }

    return sweep;
}

// ============================================================================
// Чтение
// ============================================================================

std::optional<domain::Availability> ReservationCoordinator::getAvailability(const std::string& productId)
{
    auto mutex = productLock(productId);
    if (!mutex) {
        return std::nullopt;
    }

    std::optional<domain::StockEntry> entry;
    {
        std::lock_guard<std::mutex> guard(*mutex);
        entry = ledger_->get(productId);
    }

    if (!entry) {
        return std::nullopt;
    }

    domain::Availability availability;
    availability.productId = productId;
    availability.quantity = entry->quantity;
    availability.reserved = entry->reserved;
    availability.available = entry->available();
    return availability;
}

std::optional<domain::Reservation> ReservationCoordinator::getReservation(const std::string& reservationId)
{
    return reservations_->get(reservationId);
}

// ============================================================================
// Вспомогательные
// ============================================================================

std::shared_ptr<std::mutex> ReservationCoordinator::productLock(const std::string& productId)
{
    if (auto existing = productLocks_.find(productId)) {
        return existing;
    }
    // Секции создаются только для известных товаров: произвольные ID не раздувают map
    if (!ledger_->contains(productId)) {
        return nullptr;
    }
    return productLocks_.getOrInsert(productId, std::make_shared<std::mutex>());
}

void ReservationCoordinator::warnIfSlow(
    const std::string& productId,
    std::chrono::steady_clock::duration waited) const
{
    auto threshold = settings_->getLockWaitWarnThreshold();
    if (threshold.count() > 0 && waited > threshold) {
        std::cout << "[ReservationCoordinator] WARN: waited "
                  << std::chrono::duration_cast<std::chrono::milliseconds>(waited).count()
                  << "ms for section of " << productId << std::endl;
    }
}

void ReservationCoordinator::failInvariant(const std::string& message) const
{
    std::cerr << "[ReservationCoordinator] CRITICAL: " << message << std::endl;
    throw domain::InvariantViolation(message);
}

} // namespace inventory::application
