#pragma once

#include <IHttpHandler.hpp>
#include "ports/input/IReservationService.hpp"
#include "domain/InvariantViolation.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <iostream>

namespace inventory::adapters::primary
{

    /**
     * @brief POST /inventory/reserve - зарезервировать товар
     *
     * Request:
     * {
     *   "product_id": "GGOEAFKA087499",
     *   "quantity": 15
     * }
     *
     * Response 200:
     * {
     *   "reservation_id": "5b1f...",
     *   "product_id": "GGOEAFKA087499",
     *   "quantity": 15,
     *   "status": "reserved",
     *   "expires_at": "2025-12-16T10:35:00.000Z"
     * }
     *
     * 400 - невалидный запрос, 404 - нет товара,
     * 409 - не хватает остатка (в теле available), 500 - нарушен инвариант.
     */
    class ReserveHandler : public IHttpHandler
    {
    public:
        explicit ReserveHandler(std::shared_ptr<ports::input::IReservationService> service)
            : service_(std::move(service))
        {
            std::cout << "[ReserveHandler] Created" << std::endl;
        }

        void handle(IRequest &req, IResponse &res) override
        {
            if (req.getMethod() != "POST")
            {
                sendError(res, 405, "Method not allowed");
                return;
            }

            try
            {
                auto body = nlohmann::json::parse(req.getBody());

                if (!body.is_object())
                {
                    sendError(res, 400, "Request body must be a JSON object");
                    return;
                }
                if (!body.contains("product_id") || !body["product_id"].is_string() ||
                    body["product_id"].get<std::string>().empty())
                {
                    sendError(res, 400, "product_id is required");
                    return;
                }
                if (!body.contains("quantity") || !body["quantity"].is_number_integer())
                {
                    sendError(res, 400, "quantity must be an integer");
                    return;
                }

                auto productId = body["product_id"].get<std::string>();
                auto quantity = body["quantity"].get<int64_t>();

                if (quantity <= 0)
                {
                    sendError(res, 400, "Quantity must be positive");
                    return;
                }

                auto result = service_->reserve(productId, quantity);

                switch (result.status)
                {
                case domain::ReserveStatus::RESERVED:
                {
                    const auto &reservation = *result.reservation;
                    nlohmann::json response;
                    response["reservation_id"] = reservation.id;
                    response["product_id"] = reservation.productId;
                    response["quantity"] = reservation.quantity;
                    response["status"] = "reserved";
                    response["expires_at"] = reservation.expiresAt.toString();
                    res.setResult(200, "application/json", response.dump());
                    return;
                }
                case domain::ReserveStatus::PRODUCT_NOT_FOUND:
                    sendError(res, 404, "Product not found");
                    return;
                case domain::ReserveStatus::INSUFFICIENT_STOCK:
                {
                    nlohmann::json error;
                    error["error"] = "Insufficient stock";
                    error["product_id"] = productId;
                    error["requested"] = quantity;
                    error["available"] = result.available;
                    res.setResult(409, "application/json", error.dump());
                    return;
                }
                case domain::ReserveStatus::INVALID_REQUEST:
                    sendError(res, 400, result.message);
                    return;
                }

                sendError(res, 500, "Internal server error");
            }
            catch (const nlohmann::json::exception &e)
            {
                sendError(res, 400, "Invalid JSON");
            }
            catch (const domain::InvariantViolation &e)
            {
                sendError(res, 500, "Inventory state inconsistent");
            }
            catch (const std::exception &e)
            {
                std::cerr << "[ReserveHandler] Error: " << e.what() << std::endl;
                sendError(res, 500, "Internal server error");
            }
        }

    private:
        std::shared_ptr<ports::input::IReservationService> service_;

        void sendError(IResponse &res, int status, const std::string &message)
        {
            nlohmann::json error;
            error["error"] = message;
            res.setResult(status, "application/json", error.dump());
        }
    };

} // namespace inventory::adapters::primary
