#pragma once

#include <BoostBeastApplication.hpp>
#include <IHttpHandler.hpp>
#include <memory>

namespace inventory::ports::input {
    class IMetricsService;
}

namespace inventory::adapters::secondary {
    class ExpirySweeper;
}

namespace inventory::application {
    class ReservationMetricsRecorder;
}

namespace inventory {

/**
 * @class InventoryApp
 * @brief Главное приложение Inventory Service
 *
 * Наследует BoostBeastApplication с Template Method паттерном:
 * 1. loadEnvironment() - загрузка config.json в Environment
 * 2. configureInjection() - Boost.DI, загрузка каталога, регистрация handlers,
 *    запуск ExpirySweeper
 * 3. start() - запуск HTTP сервера (из базового класса)
 *
 * Все маршруты обёрнуты в RequestLogHandler.
 */
class InventoryApp : public BoostBeastApplication
{
public:
    InventoryApp();
    ~InventoryApp() override;

protected:
    void loadEnvironment(int argc, char* argv[]) override;

    void configureInjection() override;

private:
    std::shared_ptr<ports::input::IMetricsService> metrics_;
    std::unique_ptr<application::ReservationMetricsRecorder> metricsRecorder_;
    std::unique_ptr<adapters::secondary::ExpirySweeper> sweeper_;

    void route(const std::string& method, const std::string& path, std::shared_ptr<IHttpHandler> handler);

    void printStartupBanner();
};

} // namespace inventory
