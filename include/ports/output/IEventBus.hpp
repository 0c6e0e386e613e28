#pragma once

#include "domain/events/DomainEvent.hpp"
#include <cstdint>
#include <string>
#include <functional>
#include <memory>

namespace inventory::ports::output {

/**
 * @brief Callback для обработчиков событий
 */
using EventHandler = std::function<void(const domain::DomainEvent&)>;

/**
 * @brief Идентификатор подписки, возвращается subscribe()
 */
using SubscriptionId = uint64_t;

/**
 * @brief Интерфейс событийной шины
 *
 * Output Port для публикации и подписки на события жизненного цикла
 * резервов. Движок не зависит от подписчиков: метрики и аудит - их дело.
 */
class IEventBus {
public:
    virtual ~IEventBus() = default;

    /**
     * @brief Опубликовать событие
     *
     * @note Никогда не вызывается внутри критической секции товара
     */
    virtual void publish(const domain::DomainEvent& event) = 0;

    /**
     * @brief Подписаться на тип события
     *
     * @param eventType Тип события (например, "reservation.created")
     * @param handler Функция-обработчик
     * @return Идентификатор для cancelSubscription()
     */
    virtual SubscriptionId subscribe(const std::string& eventType, EventHandler handler) = 0;

    /**
     * @brief Снять одну подписку, остальные handlers того же типа остаются
     *
     * @note Publish, начатый до вызова, может ещё вызвать этот handler
     */
    virtual void cancelSubscription(SubscriptionId id) = 0;

    /**
     * @brief Отписаться (удаляет ВСЕ handlers для eventType)
     */
    virtual void unsubscribe(const std::string& eventType) = 0;

    virtual bool hasSubscribers(const std::string& eventType) const = 0;
};

} // namespace inventory::ports::output
