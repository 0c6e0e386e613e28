#pragma once

#include "enums/ReserveStatus.hpp"
#include "enums/ReleaseStatus.hpp"
#include "enums/ReservationState.hpp"
#include "Reservation.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace inventory::domain {

/**
 * @brief Результат reserve
 *
 * reservation заполнен только при RESERVED.
 * available - остаток на момент решения (для INSUFFICIENT_STOCK).
 */
struct ReserveResult {
    ReserveStatus status = ReserveStatus::INVALID_REQUEST;
    std::optional<Reservation> reservation;
    int64_t available = 0;
    std::string message;

    bool isSuccess() const {
        return status == ReserveStatus::RESERVED;
    }
};

/**
 * @brief Результат release (и перехода в EXPIRED)
 *
 * state - состояние резерва после вызова, если он найден.
 */
struct ReleaseResult {
    ReleaseStatus status = ReleaseStatus::NOT_FOUND;
    std::optional<ReservationState> state;
    std::string message;

    bool isSuccess() const {
        return status != ReleaseStatus::NOT_FOUND;
    }
};

/**
 * @brief Итог одного прохода expiry sweep
 */
struct SweepResult {
    size_t scanned = 0;     ///< Кандидатов с истёкшим TTL
    size_t expired = 0;     ///< Переведено в EXPIRED этим проходом
    size_t purged = 0;      ///< Удалено финальных записей по retention
    size_t violations = 0;  ///< Нарушений инварианта при переходе
};

} // namespace inventory::domain
