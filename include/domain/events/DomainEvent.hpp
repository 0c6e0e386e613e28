#pragma once

#include "domain/Timestamp.hpp"
#include <string>
#include <memory>

namespace inventory::domain {

/**
 * @brief Базовый класс для всех доменных событий
 *
 * Публикуется через IEventBus после выхода из критической секции товара.
 */
struct DomainEvent {
    std::string eventId;        ///< UUID события
    std::string eventType;      ///< Тип события (reservation.created, reservation.expired)
    Timestamp timestamp;        ///< Время создания события

    DomainEvent() : timestamp(Timestamp::now()) {}

    explicit DomainEvent(const std::string& type)
        : eventType(type), timestamp(Timestamp::now()) {}

    virtual ~DomainEvent() = default;

    virtual std::string toJson() const = 0;

    virtual std::unique_ptr<DomainEvent> clone() const = 0;
};

} // namespace inventory::domain
