#pragma once

#include "domain/Reservation.hpp"
#include "domain/Timestamp.hpp"
#include <string>
#include <optional>
#include <vector>

namespace inventory::ports::output {

/**
 * @brief Интерфейс таблицы резервирований
 *
 * Output Port. Потокобезопасна для разных товаров; переходы одного
 * резерва сериализует вызывающий (секция товара).
 */
class IReservationTable {
public:
    virtual ~IReservationTable() = default;

    virtual void insert(const domain::Reservation& reservation) = 0;

    /**
     * @brief Найти резерв по ID
     * @return Reservation или nullopt
     */
    virtual std::optional<domain::Reservation> get(const std::string& id) const = 0;

    /**
     * @brief Перевести в RELEASED, если резерв ACTIVE
     *
     * @param id ID резерва
     * @param at Время перехода
     * @return Состояние ДО вызова или nullopt, если резерв не найден.
     *         Если вернулось не ACTIVE - ничего не изменилось.
     */
    virtual std::optional<domain::ReservationState> markReleased(
        const std::string& id,
        const domain::Timestamp& at
    ) = 0;

    /**
     * @brief Перевести в EXPIRED, если резерв ACTIVE
     *
     * Контракт как у markReleased.
     */
    virtual std::optional<domain::ReservationState> markExpired(
        const std::string& id,
        const domain::Timestamp& at
    ) = 0;

    /**
     * @brief ACTIVE резервы с expiresAt < before
     *
     * Конечный снимок на момент вызова. Не требует никаких блокировок
     * от вызывающего; повторный вызов начинает заново.
     */
    virtual std::vector<domain::Reservation> listActiveExpiring(
        const domain::Timestamp& before
    ) const = 0;

    /**
     * @brief Удалить финальные (RELEASED/EXPIRED) записи, закрытые раньше before
     * @return Количество удалённых
     */
    virtual size_t removeTerminalBefore(const domain::Timestamp& before) = 0;

    virtual size_t size() const = 0;
};

} // namespace inventory::ports::output
