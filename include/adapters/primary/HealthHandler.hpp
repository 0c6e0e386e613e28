#pragma once

#include <IHttpHandler.hpp>
#include <IRequest.hpp>
#include <IResponse.hpp>
#include "ports/output/IStockLedger.hpp"
#include <nlohmann/json.hpp>
#include <memory>

namespace inventory::adapters::primary {

class HealthHandler : public IHttpHandler {
public:
    explicit HealthHandler(std::shared_ptr<ports::output::IStockLedger> ledger)
        : ledger_(std::move(ledger)) {}

    void handle(IRequest& req, IResponse& res) override {
        nlohmann::json response;
        response["status"] = "healthy";
        response["service"] = "inventory-service";
        response["version"] = "1.0.0";
        response["products"] = ledger_->size();

        res.setResult(200, "application/json", response.dump());
    }

private:
    std::shared_ptr<ports::output::IStockLedger> ledger_;
};

} // namespace inventory::adapters::primary
