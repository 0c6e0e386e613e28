#include "InventoryApp.hpp"

#include <IEnvironment.hpp>
#include <boost/di.hpp>

// Handlers (Primary Adapters)
#include "adapters/primary/ReserveHandler.hpp"
#include "adapters/primary/ReleaseHandler.hpp"
#include "adapters/primary/AvailabilityHandler.hpp"
#include "adapters/primary/GetReservationHandler.hpp"
#include "adapters/primary/HealthHandler.hpp"
#include "adapters/primary/MetricsHandler.hpp"
#include "adapters/primary/RequestLogHandler.hpp"

// Application Services
#include "application/ReservationCoordinator.hpp"
#include "application/MetricsService.hpp"
#include "application/ReservationMetricsRecorder.hpp"

// Secondary Adapters
#include "adapters/secondary/persistence/InMemoryStockLedger.hpp"
#include "adapters/secondary/persistence/InMemoryReservationTable.hpp"
#include "adapters/secondary/events/InMemoryEventBus.hpp"
#include "adapters/secondary/clock/SystemClock.hpp"
#include "adapters/secondary/settings/InventorySettings.hpp"
#include "adapters/secondary/catalog/CatalogLoader.hpp"
#include "adapters/secondary/scheduler/ExpirySweeper.hpp"

#include <iostream>

namespace di = boost::di;

namespace inventory {

InventoryApp::InventoryApp()
{
    std::cout << "[InventoryApp] Application created" << std::endl;
}

InventoryApp::~InventoryApp()
{
    // Sweeper держит coordinator, останавливаем до разрушения остального
    if (sweeper_) {
        sweeper_->stop();
    }
    std::cout << "[InventoryApp] Application destroyed" << std::endl;
}

void InventoryApp::loadEnvironment(int argc, char *argv[])
{
    std::cout << "[InventoryApp] Loading environment..." << std::endl;

    BoostBeastApplication::loadEnvironment(argc, argv);

    std::cout << "[InventoryApp] Environment loaded successfully" << std::endl;
}

void InventoryApp::configureInjection()
{
    printStartupBanner();

    std::cout << "[InventoryApp] Configuring Boost.DI injection..." << std::endl;

    auto injector = di::make_injector(

        // ====================================================================
        // Layer 1: Secondary Adapters (Output Ports implementations)
        // ====================================================================

        di::bind<IEnvironment>().to(env_),

        // IInventorySettings ← InventorySettings(IEnvironment), экземпляр создаётся явно
        di::bind<ports::output::IInventorySettings>()
            .to(std::make_shared<adapters::secondary::InventorySettings>(env_)),

        di::bind<ports::output::IStockLedger>()
            .to<adapters::secondary::InMemoryStockLedger>()
            .in(di::singleton),

        di::bind<ports::output::IReservationTable>()
            .to<adapters::secondary::InMemoryReservationTable>()
            .in(di::singleton),

        di::bind<ports::output::IClock>()
            .to<adapters::secondary::SystemClock>()
            .in(di::singleton),

        di::bind<ports::output::IEventBus>()
            .to<adapters::secondary::InMemoryEventBus>()
            .in(di::singleton),

        // ====================================================================
        // Layer 2: Application Services (Input Ports implementations)
        // ====================================================================

        di::bind<ports::input::IReservationService>()
            .to<application::ReservationCoordinator>()
            .in(di::singleton),

        di::bind<ports::input::IMetricsService>()
            .to<application::MetricsService>()
            .in(di::singleton));

    // ========================================================================
    // Каталог: загружается до регистрации маршрутов
    // ========================================================================

    auto settings = injector.create<std::shared_ptr<ports::output::IInventorySettings>>();
    auto ledger = injector.create<std::shared_ptr<ports::output::IStockLedger>>();

    size_t loaded = settings->getCatalogPath().empty()
        ? adapters::secondary::CatalogLoader::loadDefaults(*ledger)
        : adapters::secondary::CatalogLoader::loadFromFile(settings->getCatalogPath(), *ledger);

    std::cout << "[InventoryApp] Catalog loaded: " << loaded << " products" << std::endl;

    // ========================================================================
    // Метрики: подписка на события резервирования
    // ========================================================================

    metrics_ = injector.create<std::shared_ptr<ports::input::IMetricsService>>();
    metricsRecorder_ = std::make_unique<application::ReservationMetricsRecorder>(
        injector.create<std::shared_ptr<ports::output::IEventBus>>(),
        metrics_);

    // ========================================================================
    // Layer 3: Primary Adapters (HTTP Handlers)
    // ========================================================================

    std::cout << "[InventoryApp] Registering HTTP Handlers via DI..." << std::endl;

    route("POST", "/inventory/reserve",
          injector.create<std::shared_ptr<adapters::primary::ReserveHandler>>());
    route("POST", "/inventory/release",
          injector.create<std::shared_ptr<adapters::primary::ReleaseHandler>>());
    route("GET", "/inventory/*",
          injector.create<std::shared_ptr<adapters::primary::AvailabilityHandler>>());
    route("GET", "/reservations/*",
          injector.create<std::shared_ptr<adapters::primary::GetReservationHandler>>());
    route("GET", "/health",
          injector.create<std::shared_ptr<adapters::primary::HealthHandler>>());
    route("GET", "/metrics",
          injector.create<std::shared_ptr<adapters::primary::MetricsHandler>>());

    // ========================================================================
    // Expiry sweep
    // ========================================================================

    sweeper_ = std::make_unique<adapters::secondary::ExpirySweeper>(
        injector.create<std::shared_ptr<ports::input::IReservationService>>());
    sweeper_->start(settings->getSweepInterval());

    std::cout << "[InventoryApp] DI configuration completed - "
              << handlers_.size() << " routes registered" << std::endl;
}

void InventoryApp::route(const std::string& method, const std::string& path, std::shared_ptr<IHttpHandler> handler)
{
    handlers_[getHandlerKey(method, path)] =
        std::make_shared<adapters::primary::RequestLogHandler>(std::move(handler), metrics_);
    std::cout << "  ✓ " << method << " " << path << std::endl;
}

void InventoryApp::printStartupBanner()
{
    std::cout << std::endl;
    std::cout << "╔══════════════════════════════════════════════════════╗" << std::endl;
    std::cout << "║          Inventory Service - Reservation Engine      ║" << std::endl;
    std::cout << "║                                                      ║" << std::endl;
    std::cout << "║  Architecture: Hexagonal (Ports & Adapters)          ║" << std::endl;
    std::cout << "║  DI Framework: Boost.DI                              ║" << std::endl;
    std::cout << "║  HTTP Server:  Boost.Beast                           ║" << std::endl;
    std::cout << "╚══════════════════════════════════════════════════════╝" << std::endl;
    std::cout << std::endl;
}

} // namespace inventory
