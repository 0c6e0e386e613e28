#pragma once

#include <IHttpHandler.hpp>
#include <IRequest.hpp>
#include <IResponse.hpp>
#include "ports/input/IMetricsService.hpp"

#include <chrono>
#include <iostream>
#include <memory>

namespace inventory::adapters::primary
{

    /**
     * @brief Декоратор: лог запроса и счётчик http_requests_total
     *
     * Оборачивает любой IHttpHandler. После обработки пишет строку
     * "[HTTP] POST /inventory/reserve -> 409 (0.42ms)" и инкрементирует
     * http_requests_total{method,path,status}.
     *
     * Path нормализуется для метрик:
     * - /inventory/GGOEAFKA087499 -> /inventory/{product_id}
     * - /reservations/5b1f...     -> /reservations/{reservation_id}
     * - /inventory/reserve, /inventory/release, /health, /metrics - без изменений
     */
    class RequestLogHandler : public IHttpHandler
    {
    public:
        RequestLogHandler(
            std::shared_ptr<IHttpHandler> inner,
            std::shared_ptr<ports::input::IMetricsService> metrics) : inner_(std::move(inner)), metrics_(std::move(metrics))
        {
        }

        void handle(IRequest &req, IResponse &res) override
        {
            auto start = std::chrono::steady_clock::now();

            inner_->handle(req, res);

            auto elapsed = std::chrono::duration<double, std::milli>(
                std::chrono::steady_clock::now() - start);

            std::cout << "[HTTP] " << req.getMethod() << " " << req.getPath()
                      << " -> " << res.getStatus()
                      << " (" << elapsed.count() << "ms)" << std::endl;

            metrics_->increment("http_requests_total", {{"method", req.getMethod()},
                                                        {"path", normalizePath(req.getPath())},
                                                        {"status", std::to_string(res.getStatus())}});
        }

        static std::string normalizePath(const std::string &path)
        {
            std::string cleanPath = path.substr(0, path.find('?'));

            if (cleanPath == "/inventory/reserve" || cleanPath == "/inventory/release")
            {
                return cleanPath;
            }

            if (cleanPath.find("/inventory/") == 0)
            {
                return "/inventory/{product_id}";
            }

            if (cleanPath.find("/reservations/") == 0)
            {
                return "/reservations/{reservation_id}";
            }

            return cleanPath;
        }

    private:
        std::shared_ptr<IHttpHandler> inner_;
        std::shared_ptr<ports::input::IMetricsService> metrics_;
    };

} // namespace inventory::adapters::primary
