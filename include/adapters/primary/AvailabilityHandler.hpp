#pragma once

#include <IHttpHandler.hpp>
#include "ports/input/IReservationService.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <iostream>

namespace inventory::adapters::primary
{

    /**
     * @brief GET /inventory/{product_id} - остаток товара
     *
     * Роутер регистрирует с паттерном "/inventory/*"
     *
     * Response 200:
     * {
     *   "product_id": "GGOEAFKA087499",
     *   "quantity": 100,
     *   "reserved": 30,
     *   "available": 70
     * }
     */
    class AvailabilityHandler : public IHttpHandler
    {
    public:
        explicit AvailabilityHandler(std::shared_ptr<ports::input::IReservationService> service)
            : service_(std::move(service))
        {
            std::cout << "[AvailabilityHandler] Created" << std::endl;
        }

        void handle(IRequest &req, IResponse &res) override
        {
            if (req.getMethod() != "GET")
            {
                sendError(res, 405, "Method not allowed");
                return;
            }

            try
            {
                std::string productId = extractProductId(req.getPath());
                if (productId.empty())
                {
                    sendError(res, 400, "Product ID is required");
                    return;
                }

                auto availability = service_->getAvailability(productId);
                if (!availability)
                {
                    sendError(res, 404, "Product not found");
                    return;
                }

                nlohmann::json response;
                response["product_id"] = availability->productId;
                response["quantity"] = availability->quantity;
                response["reserved"] = availability->reserved;
                response["available"] = availability->available;
                res.setResult(200, "application/json", response.dump());
            }
            catch (const std::exception &e)
            {
                std::cerr << "[AvailabilityHandler] Error: " << e.what() << std::endl;
                sendError(res, 500, "Internal server error");
            }
        }

    private:
        std::shared_ptr<ports::input::IReservationService> service_;

        static constexpr const char *PREFIX = "/inventory/";

        std::string extractProductId(const std::string &fullPath) const
        {
            std::string path = fullPath.substr(0, fullPath.find('?'));
            const std::string prefix(PREFIX);
            if (path.compare(0, prefix.size(), prefix) != 0)
            {
                return "";
            }
            std::string productId = path.substr(prefix.size());
            if (productId.find('/') != std::string::npos)
            {
                return "";
            }
            return productId;
        }

        void sendError(IResponse &res, int status, const std::string &message)
        {
            nlohmann::json error;
            error["error"] = message;
            res.setResult(status, "application/json", error.dump());
        }
    };

} // namespace inventory::adapters::primary
