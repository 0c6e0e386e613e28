#pragma once

#include "ports/output/IEventBus.hpp"
#include <algorithm>
#include <iostream>
#include <mutex>
#include <unordered_map>
#include <vector>

namespace inventory::adapters::secondary {

/**
 * @brief In-memory реализация событийной шины
 *
 * Синхронная доставка: publish() вызывает handlers в потоке публикующего.
 * Исключение одного handler'а логируется и не мешает остальным.
 */
class InMemoryEventBus : public ports::output::IEventBus {
public:
    void publish(const domain::DomainEvent& event) override {
        std::vector<ports::output::EventHandler> handlers;
        {
            std::lock_guard<std::mutex> lock(handlersMutex_);
            auto it = handlers_.find(event.eventType);
            if (it == handlers_.end()) {
                return;
            }
            handlers.reserve(it->second.size());
            for (const auto& subscription : it->second) {
                handlers.push_back(subscription.handler);
            }
        }

        for (const auto& handler : handlers) {
            try {
                handler(event);
            } catch (const std::exception& e) {
                std::cerr << "[InMemoryEventBus] Handler for " << event.eventType
                          << " failed: " << e.what() << std::endl;
            }
        }
    }

    ports::output::SubscriptionId subscribe(
        const std::string& eventType, ports::output::EventHandler handler) override
    {
        std::lock_guard<std::mutex> lock(handlersMutex_);
        auto id = ++lastId_;
        handlers_[eventType].push_back({id, std::move(handler)});
        return id;
    }

    void cancelSubscription(ports::output::SubscriptionId id) override {
        std::lock_guard<std::mutex> lock(handlersMutex_);
        for (auto it = handlers_.begin(); it != handlers_.end(); ++it) {
            auto& subscriptions = it->second;
            auto found = std::find_if(subscriptions.begin(), subscriptions.end(),
                [id](const Subscription& s) { return s.id == id; });
            if (found != subscriptions.end()) {
                subscriptions.erase(found);
                if (subscriptions.empty()) {
                    handlers_.erase(it);
                }
                return;
            }
        }
    }

    void unsubscribe(const std::string& eventType) override {
        std::lock_guard<std::mutex> lock(handlersMutex_);
        handlers_.erase(eventType);
    }

    bool hasSubscribers(const std::string& eventType) const override {
        std::lock_guard<std::mutex> lock(handlersMutex_);
        auto it = handlers_.find(eventType);
        return it != handlers_.end() && !it->second.empty();
    }

    size_t subscriberCount(const std::string& eventType) const {
        std::lock_guard<std::mutex> lock(handlersMutex_);
        auto it = handlers_.find(eventType);
        return it != handlers_.end() ? it->second.size() : 0;
    }

private:
    struct Subscription {
        ports::output::SubscriptionId id;
        ports::output::EventHandler handler;
    };

    mutable std::mutex handlersMutex_;
    std::unordered_map<std::string, std::vector<Subscription>> handlers_;
    ports::output::SubscriptionId lastId_ = 0;
};

} // namespace inventory::adapters::secondary
