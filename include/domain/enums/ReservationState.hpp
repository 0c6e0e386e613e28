#pragma once

#include <string>
#include <stdexcept>

namespace inventory::domain {

/**
 * @brief Состояние резервирования
 */
enum class ReservationState {
    ACTIVE,     ///< Товар удерживается
    RELEASED,   ///< Отменено клиентом
    EXPIRED     ///< Истёк TTL, снято sweep'ом
};

inline std::string toString(ReservationState state) {
    switch (state) {
        case ReservationState::ACTIVE:   return "ACTIVE";
        case ReservationState::RELEASED: return "RELEASED";
        case ReservationState::EXPIRED:  return "EXPIRED";
    }
    return "UNKNOWN";
}

/**
 * @brief Создать из строки
 * @throws std::invalid_argument если строка не распознана
 */
inline ReservationState reservationStateFromString(const std::string& str) {
    if (str == "ACTIVE")   return ReservationState::ACTIVE;
    if (str == "RELEASED") return ReservationState::RELEASED;
    if (str == "EXPIRED")  return ReservationState::EXPIRED;
    throw std::invalid_argument("Unknown ReservationState: " + str);
}

/**
 * @brief Финальное состояние: количество уже вернулось в available
 */
inline bool isTerminal(ReservationState state) {
    return state == ReservationState::RELEASED ||
           state == ReservationState::EXPIRED;
}

} // namespace inventory::domain
