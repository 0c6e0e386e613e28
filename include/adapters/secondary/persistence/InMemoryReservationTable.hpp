#pragma once

#include "ports/output/IReservationTable.hpp"
#include <ThreadSafeMap.hpp>
#include <map>
#include <mutex>

namespace inventory::adapters::secondary {

/**
 * @brief In-memory реализация таблицы резервирований
 *
 * Записи лежат в ThreadSafeMap по ID и не меняются на месте:
 * переход состояния кладёт новую копию (как updateStatus в репозиториях ордеров).
 * Два индекса под indexMutex_:
 * - expiryIndex_   - ACTIVE резервы по expiresAt (для sweep)
 * - terminalIndex_ - финальные резервы по closedAt (для retention)
 */
class InMemoryReservationTable : public ports::output::IReservationTable {
public:
    void insert(const domain::Reservation& reservation) override {
        reservations_.insert(reservation.id, std::make_shared<domain::Reservation>(reservation));

        std::lock_guard<std::mutex> lock(indexMutex_);
        if (reservation.isActive()) {
            expiryIndex_.emplace(reservation.expiresAt.value, reservation.id);
        } else {
            auto closedAt = reservation.closedAt.value_or(reservation.createdAt);
            terminalIndex_.emplace(closedAt.value, reservation.id);
        }
    }

    std::optional<domain::Reservation> get(const std::string& id) const override {
        auto reservation = reservations_.find(id);
        return reservation ? std::optional(*reservation) : std::nullopt;
    }

    std::optional<domain::ReservationState> markReleased(
        const std::string& id,
        const domain::Timestamp& at
    ) override {
        return markTerminal(id, domain::ReservationState::RELEASED, at);
    }

    std::optional<domain::ReservationState> markExpired(
        const std::string& id,
        const domain::Timestamp& at
    ) override {
        return markTerminal(id, domain::ReservationState::EXPIRED, at);
    }

    std::vector<domain::Reservation> listActiveExpiring(
        const domain::Timestamp& before
    ) const override {
        std::vector<std::string> ids;
        {
            std::lock_guard<std::mutex> lock(indexMutex_);
            auto end = expiryIndex_.lower_bound(before.value);
            for (auto it = expiryIndex_.begin(); it != end; ++it) {
                ids.push_back(it->second);
            }
        }

        std::vector<domain::Reservation> result;
        result.reserve(ids.size());
        for (const auto& id : ids) {
            auto reservation = reservations_.find(id);
            if (reservation && reservation->isActive()) {
                result.push_back(*reservation);
            }
        }
        return result;
    }

    size_t removeTerminalBefore(const domain::Timestamp& before) override {
        std::vector<std::string> ids;
        {
            std::lock_guard<std::mutex> lock(indexMutex_);
            auto end = terminalIndex_.lower_bound(before.value);
            for (auto it = terminalIndex_.begin(); it != end; ++it) {
                ids.push_back(it->second);
            }
            terminalIndex_.erase(terminalIndex_.begin(), end);
        }

        size_t removed = 0;
        for (const auto& id : ids) {
            if (reservations_.remove(id)) {
                ++removed;
            }
        }
        return removed;
    }

    size_t size() const override {
        return reservations_.size();
    }

private:
    using TimePoint = std::chrono::system_clock::time_point;

    ThreadSafeMap<std::string, domain::Reservation> reservations_;

    mutable std::mutex indexMutex_;
    std::multimap<TimePoint, std::string> expiryIndex_;   // expiresAt -> id
    std::multimap<TimePoint, std::string> terminalIndex_; // closedAt -> id

    std::optional<domain::ReservationState> markTerminal(
        const std::string& id,
        domain::ReservationState target,
        const domain::Timestamp& at
    ) {
        auto current = reservations_.find(id);
        if (!current) {
            return std::nullopt;
        }

        auto previous = current->state;
        if (previous != domain::ReservationState::ACTIVE) {
            return previous;
        }

        auto updated = std::make_shared<domain::Reservation>(*current);
        updated->state = target;
        updated->closedAt = at;
        reservations_.insert(id, updated);

        std::lock_guard<std::mutex> lock(indexMutex_);
        auto range = expiryIndex_.equal_range(current->expiresAt.value);
        for (auto it = range.first; it != range.second; ++it) {
            if (it->second == id) {
                expiryIndex_.erase(it);
                break;
            }
        }
        terminalIndex_.emplace(at.value, id);

        return previous;
    }
};

} // namespace inventory::adapters::secondary
