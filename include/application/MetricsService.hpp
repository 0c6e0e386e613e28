#pragma once

#include "ports/input/IMetricsService.hpp"

#include <atomic>
#include <chrono>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <sstream>
#include <string>
#include <vector>

namespace inventory::application {

/**
 * @brief Сервис сбора метрик движка резервирования
 *
 * Потокобезопасность: shared_mutex на структуру map, atomic на значения.
 * Fast path (ключ уже есть) идёт под shared_lock.
 */
class MetricsService : public ports::input::IMetricsService {
public:
    struct Definition {
        std::string name;
        std::string help;
        std::string type;
    };

    MetricsService()
        : startedAt_(std::chrono::steady_clock::now())
        , definitions_({
              {"inventory_uptime_seconds", "Seconds since service start", "gauge"},
              {"http_requests_total", "Total HTTP requests", "counter"},
              {"inventory_reservations_total", "Reservation attempts by outcome", "counter"},
              {"inventory_units_reserved_total", "Units moved into reserved", "counter"},
              {"inventory_units_returned_total", "Units returned to available by release or expiry", "counter"},
              {"inventory_reservations_outstanding", "Active reservations", "gauge"},
          })
    {
        std::cout << "[MetricsService] Initialized with "
                  << definitions_.size() << " metric families" << std::endl;
    }

    void increment(
        const std::string& name,
        const std::map<std::string, std::string>& labels = {}
    ) override {
        add(name, 1, labels);
    }

    void add(
        const std::string& name,
        int64_t delta,
        const std::map<std::string, std::string>& labels = {}
    ) override {
        std::string key = buildKey(name, labels);

        {
            std::shared_lock<std::shared_mutex> lock(mutex_);
            auto it = counters_.find(key);
            if (it != counters_.end()) {
                it->second->fetch_add(delta, std::memory_order_relaxed);
                return;
            }
        }

        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto it = counters_.find(key);
        if (it != counters_.end()) {
            it->second->fetch_add(delta, std::memory_order_relaxed);
        } else {
            counters_[key] = std::make_unique<std::atomic<int64_t>>(delta);
        }
    }

    int64_t value(
        const std::string& name,
        const std::map<std::string, std::string>& labels = {}
    ) const override {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = counters_.find(buildKey(name, labels));
        return it != counters_.end() ? it->second->load(std::memory_order_relaxed) : 0;
    }

    std::string toPrometheusFormat() const override {
        std::ostringstream oss;

        auto uptime = std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::steady_clock::now() - startedAt_).count();

        std::shared_lock<std::shared_mutex> lock(mutex_);
        for (const auto& def : definitions_) {
            oss << "# HELP " << def.name << " " << def.help << "\n";
            oss << "# TYPE " << def.name << " " << def.type << "\n";

            if (def.name == "inventory_uptime_seconds") {
                oss << def.name << " " << uptime << "\n";
                continue;
            }

            bool written = false;
            for (const auto& [key, counter] : counters_) {
                if (familyOf(key) == def.name) {
                    oss << key << " " << counter->load(std::memory_order_relaxed) << "\n";
                    written = true;
                }
            }
            // Семейство без labels выводим нулём, чтобы scrape видел метрику сразу
            if (!written && def.name.find("inventory_") == 0) {
                oss << def.name << " 0\n";
            }
        }

        return oss.str();
    }

private:
    std::chrono::steady_clock::time_point startedAt_;
    std::vector<Definition> definitions_;

    mutable std::shared_mutex mutex_;
    std::map<std::string, std::unique_ptr<std::atomic<int64_t>>> counters_;

    static std::string familyOf(const std::string& key) {
        return key.substr(0, key.find('{'));
    }

    static std::string buildKey(
        const std::string& name,
        const std::map<std::string, std::string>& labels
    ) {
        if (labels.empty()) {
            return name;
        }

        std::ostringstream oss;
        oss << name << "{";
        bool first = true;
        for (const auto& [k, v] : labels) {
            if (!first) oss << ",";
            oss << k << "=\"" << v << "\"";
            first = false;
        }
        oss << "}";
        return oss.str();
    }
};

} // namespace inventory::application
