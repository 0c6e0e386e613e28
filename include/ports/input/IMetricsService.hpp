#pragma once

#include <cstdint>
#include <map>
#include <string>

namespace inventory::ports::input {

/**
 * @brief Интерфейс сервиса метрик
 *
 * Counter и gauge метрики с опциональными labels, сериализация
 * в Prometheus text format.
 *
 * @example
 * ```cpp
 * metrics->increment("inventory_reservations_total", {{"outcome", "reserved"}});
 * metrics->add("inventory_reservations_outstanding", -1);
 * std::string output = metrics->toPrometheusFormat();
 * ```
 */
class IMetricsService {
public:
    virtual ~IMetricsService() = default;

    /**
     * @brief Инкрементировать счётчик на 1
     *
     * @note Ключ формируется как "name{label1=\"value1\",label2=\"value2\"}"
     */
    virtual void increment(
        const std::string& name,
        const std::map<std::string, std::string>& labels = {}
    ) = 0;

    /**
     * @brief Прибавить delta (для gauge допустимо отрицательное)
     */
    virtual void add(
        const std::string& name,
        int64_t delta,
        const std::map<std::string, std::string>& labels = {}
    ) = 0;

    /**
     * @brief Текущее значение по ключу (0, если метрики нет)
     */
    virtual int64_t value(
        const std::string& name,
        const std::map<std::string, std::string>& labels = {}
    ) const = 0;

    /**
     * @brief Сериализовать метрики в Prometheus формат (version 0.0.4)
     */
    virtual std::string toPrometheusFormat() const = 0;
};

} // namespace inventory::ports::input
