#pragma once

#include "ports/output/IInventorySettings.hpp"
#include <IEnvironment.hpp>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>

namespace inventory::adapters::secondary {

/**
 * @brief Реализация IInventorySettings, получает данные из IEnvironment
 *
 * Ключи в config.json / Environment:
 * - inventory.reservation_ttl_seconds    (default: 300)
 * - inventory.sweep_interval_ms          (default: 5000)
 * - inventory.terminal_retention_seconds (default: 3600, 0 - хранить вечно)
 * - inventory.lock_wait_warn_ms          (default: 50, 0 - выключено)
 * - inventory.catalog_path               (default: "" - демо-каталог)
 */
class InventorySettings : public ports::output::IInventorySettings {
public:
    /**
     * @brief Сырые значения ключей, поля инициализированы значениями по умолчанию
     */
    struct Values {
        int reservationTtlSeconds = 300;
        int sweepIntervalMs = 5000;
        int terminalRetentionSeconds = 3600;
        int lockWaitWarnMs = 50;
        std::string catalogPath;
    };

    /**
     * @brief Конструктор с валидацией
     * @throws std::invalid_argument при неположительном TTL или интервале sweep,
     *         отрицательном retention или пороге ожидания блокировки
     */
    explicit InventorySettings(const Values& values)
        : reservationTtl_(std::chrono::seconds(values.reservationTtlSeconds))
        , sweepInterval_(values.sweepIntervalMs)
        , terminalRetention_(std::chrono::seconds(values.terminalRetentionSeconds))
        , lockWaitWarn_(values.lockWaitWarnMs)
        , catalogPath_(values.catalogPath)
    {
        if (reservationTtl_.count() <= 0) {
            throw std::invalid_argument("inventory.reservation_ttl_seconds must be positive");
        }
        if (sweepInterval_.count() <= 0) {
            throw std::invalid_argument("inventory.sweep_interval_ms must be positive");
        }
        if (terminalRetention_.count() < 0 || lockWaitWarn_.count() < 0) {
            throw std::invalid_argument("inventory retention and lock wait threshold must be non-negative");
        }
    }

    explicit InventorySettings(std::shared_ptr<IEnvironment> env)
        : InventorySettings(readValues(*env)) {}

    std::chrono::milliseconds getReservationTtl() const override { return reservationTtl_; }
    std::chrono::milliseconds getSweepInterval() const override { return sweepInterval_; }
    std::chrono::milliseconds getTerminalRetention() const override { return terminalRetention_; }
    std::chrono::milliseconds getLockWaitWarnThreshold() const override { return lockWaitWarn_; }
    std::string getCatalogPath() const override { return catalogPath_; }

private:
    static Values readValues(IEnvironment& env) {
        const Values defaults;
        Values values;
        values.reservationTtlSeconds =
            env.get<int>("inventory.reservation_ttl_seconds", defaults.reservationTtlSeconds);
        values.sweepIntervalMs =
            env.get<int>("inventory.sweep_interval_ms", defaults.sweepIntervalMs);
        values.terminalRetentionSeconds =
            env.get<int>("inventory.terminal_retention_seconds", defaults.terminalRetentionSeconds);
        values.lockWaitWarnMs =
            env.get<int>("inventory.lock_wait_warn_ms", defaults.lockWaitWarnMs);
        values.catalogPath =
            env.get<std::string>("inventory.catalog_path", defaults.catalogPath);
        return values;
    }

    std::chrono::milliseconds reservationTtl_;
    std::chrono::milliseconds sweepInterval_;
    std::chrono::milliseconds terminalRetention_;
    std::chrono::milliseconds lockWaitWarn_;
    std::string catalogPath_;
};

} // namespace inventory::adapters::secondary
