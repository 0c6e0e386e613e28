#pragma once

#include "domain/Availability.hpp"
#include "domain/Reservation.hpp"
#include "domain/ReservationResult.hpp"
#include <string>
#include <optional>
#include <cstdint>

namespace inventory::ports::input {

/**
 * @brief Интерфейс сервиса резервирования
 *
 * Input Port: единственная точка изменения остатков и состояний резервов.
 * Ожидаемые исходы (нет товара, не хватает остатка, уже отменён)
 * возвращаются как значения, без исключений.
 *
 * @throws domain::InvariantViolation только при нарушении 0 <= reserved <= quantity
 */
class IReservationService {
public:
    virtual ~IReservationService() = default;

    /**
     * @brief Зарезервировать товар
     *
     * @param productId ID товара
     * @param quantity Количество (> 0)
     * @return RESERVED с резервом, либо INVALID_REQUEST / PRODUCT_NOT_FOUND / INSUFFICIENT_STOCK
     */
    virtual domain::ReserveResult reserve(const std::string& productId, int64_t quantity) = 0;

    /**
     * @brief Отменить резерв
     *
     * Повторная отмена (или отмена истёкшего) - ALREADY_TERMINAL без побочных эффектов.
     */
    virtual domain::ReleaseResult release(const std::string& reservationId) = 0;

    /**
     * @brief Снимок {quantity, reserved, available}
     * @return Availability или nullopt, если товара нет
     */
    virtual std::optional<domain::Availability> getAvailability(const std::string& productId) = 0;

    virtual std::optional<domain::Reservation> getReservation(const std::string& reservationId) = 0;

    /**
     * @brief Один проход expiry sweep по текущему времени часов
     */
    virtual domain::SweepResult expireDue() = 0;
};

} // namespace inventory::ports::input
