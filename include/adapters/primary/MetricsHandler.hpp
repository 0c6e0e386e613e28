#pragma once

#include <IHttpHandler.hpp>
#include <IRequest.hpp>
#include <IResponse.hpp>
#include "ports/input/IMetricsService.hpp"

#include <memory>
#include <iostream>

namespace inventory::adapters::primary {

/**
 * @brief GET /metrics - снимок метрик сервиса резервирования
 *
 * Семейства (Prometheus text format 0.0.4):
 * - inventory_reservations_total{outcome} - reserved / released / expired /
 *   insufficient_stock / product_not_found
 * - inventory_units_reserved_total, inventory_units_returned_total
 * - inventory_reservations_outstanding - активные резервы (gauge)
 * - inventory_uptime_seconds
 * - http_requests_total{method,path,status} - пишет RequestLogHandler
 *
 * Счётчики резервов обновляет ReservationMetricsRecorder по событиям шины,
 * сам handler только читает. Не-GET запросы получают 405.
 */
class MetricsHandler : public IHttpHandler {
public:
    explicit MetricsHandler(std::shared_ptr<ports::input::IMetricsService> metrics)
        : metrics_(std::move(metrics))
    {
        std::cout << "[MetricsHandler] Created" << std::endl;
    }

    void handle(IRequest& req, IResponse& res) override {
        if (req.getMethod() != "GET") {
            res.setResult(405, "text/plain; charset=utf-8", "Method not allowed\n");
            return;
        }

        res.setStatus(200);
        res.setHeader("Content-Type", "text/plain; version=0.0.4; charset=utf-8");
        res.setBody(metrics_->toPrometheusFormat());
    }

private:
    std::shared_ptr<ports::input::IMetricsService> metrics_;
};

} // namespace inventory::adapters::primary
