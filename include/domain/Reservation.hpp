#pragma once

#include "enums/ReservationState.hpp"
#include "Timestamp.hpp"
#include <string>
#include <cstdint>
#include <optional>

namespace inventory::domain {

/**
 * @brief Резервирование товара
 *
 * Создаётся ACTIVE, переходит в RELEASED (отмена клиентом)
 * или EXPIRED (истёк TTL). Оба финальных перехода идемпотентны.
 */
struct Reservation {
    std::string id;                     ///< UUID, не переиспользуется
    std::string productId;
    int64_t quantity = 0;
    ReservationState state = ReservationState::ACTIVE;
    Timestamp createdAt;
    Timestamp expiresAt;
    std::optional<Timestamp> closedAt;  ///< Время финального перехода

    Reservation() = default;

    Reservation(
        std::string id,
        std::string productId,
        int64_t quantity,
        Timestamp createdAt,
        Timestamp expiresAt
    ) : id(std::move(id))
      , productId(std::move(productId))
      , quantity(quantity)
      , state(ReservationState::ACTIVE)
      , createdAt(createdAt)
      , expiresAt(expiresAt)
    {}

    bool isActive() const {
        return state == ReservationState::ACTIVE;
    }

    /**
     * @brief Истёк ли срок: now строго позже expiresAt
     */
    bool isExpiredAt(const Timestamp& now) const {
        return now > expiresAt;
    }
};

} // namespace inventory::domain
