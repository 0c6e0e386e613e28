#pragma once

#include "ports/input/IReservationService.hpp"
#include "ports/output/IStockLedger.hpp"
#include "ports/output/IReservationTable.hpp"
#include "ports/output/IClock.hpp"
#include "ports/output/IEventBus.hpp"
#include "ports/output/IInventorySettings.hpp"
#include <ThreadSafeMap.hpp>

#include <chrono>
#include <memory>
#include <mutex>
#include <string>

namespace inventory::application {

/**
 * @brief Координатор резервирования (Application Service)
 *
 * Реализует IReservationService. Владеет всеми путями изменения
 * StockEntry::reserved и Reservation::state.
 *
 * Синхронизация: по одному std::mutex на productId. Внутри секции:
 * чтение available, решение, запись reserved и вставка/переход резерва.
 * Запрос держит максимум одну секцию, поэтому порядок захвата не важен.
 * Логирование и публикация событий - только после выхода из секции.
 *
 * Зависимости через DI:
 * - IStockLedger, IReservationTable - пассивные хранилища
 * - IClock - текущее время (TTL, sweep)
 * - IEventBus - reservation.created / released / expired / rejected
 * - IInventorySettings - TTL, retention, порог ожидания секции
 */
class ReservationCoordinator : public ports::input::IReservationService {
public:
    ReservationCoordinator(
        std::shared_ptr<ports::output::IStockLedger> ledger,
        std::shared_ptr<ports::output::IReservationTable> reservations,
        std::shared_ptr<ports::output::IClock> clock,
        std::shared_ptr<ports::output::IEventBus> eventBus,
        std::shared_ptr<ports::output::IInventorySettings> settings);

    domain::ReserveResult reserve(const std::string& productId, int64_t quantity) override;

    domain::ReleaseResult release(const std::string& reservationId) override;

    std::optional<domain::Availability> getAvailability(const std::string& productId) override;

    std::optional<domain::Reservation> getReservation(const std::string& reservationId) override;

    domain::SweepResult expireDue() override;

private:
    std::shared_ptr<ports::output::IStockLedger> ledger_;
    std::shared_ptr<ports::output::IReservationTable> reservations_;
    std::shared_ptr<ports::output::IClock> clock_;
    std::shared_ptr<ports::output::IEventBus> eventBus_;
    std::shared_ptr<ports::output::IInventorySettings> settings_;

    /// Критические секции товаров, создаются при первом обращении
    ThreadSafeMap<std::string, std::mutex> productLocks_;

    /**
     * @brief Мьютекс секции товара
     * @return nullptr, если товара нет в журнале (секция не создаётся)
     */
    std::shared_ptr<std::mutex> productLock(const std::string& productId);

    /**
     * @brief Перевести ACTIVE резерв в RELEASED или EXPIRED под секцией товара
     *
     * Проверка состояния и уменьшение reserved - в одной секции, поэтому
     * гонка release и sweep уменьшает reserved ровно один раз.
     *
     * @throws domain::InvariantViolation если reserved оказался меньше quantity резерва
     */
    domain::ReleaseResult transition(
        const domain::Reservation& reservation,
        domain::ReservationState target);

    void warnIfSlow(const std::string& productId, std::chrono::steady_clock::duration waited) const;

    [[noreturn]] void failInvariant(const std::string& message) const;
};

} // namespace inventory::application
