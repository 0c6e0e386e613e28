#pragma once

#include <chrono>
#include <string>

namespace inventory::ports::output {

/**
 * @brief Интерфейс настроек движка резервирования
 *
 * Реализация получает значения из IEnvironment (config.json).
 */
class IInventorySettings {
public:
    virtual ~IInventorySettings() = default;

    /// TTL нового резерва
    virtual std::chrono::milliseconds getReservationTtl() const = 0;

    /// Период expiry sweep
    virtual std::chrono::milliseconds getSweepInterval() const = 0;

    /// Сколько хранить RELEASED/EXPIRED записи (0 - вечно)
    virtual std::chrono::milliseconds getTerminalRetention() const = 0;

    /// Порог ожидания секции товара для предупреждения в лог (0 - выключено)
    virtual std::chrono::milliseconds getLockWaitWarnThreshold() const = 0;

    /// Путь к JSON каталогу (пусто - встроенный демо-каталог)
    virtual std::string getCatalogPath() const = 0;
};

} // namespace inventory::ports::output
