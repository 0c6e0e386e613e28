#pragma once

#include <IHttpHandler.hpp>
#include "ports/input/IReservationService.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <iostream>

namespace inventory::adapters::primary
{

    /**
     * @brief GET /reservations/{id} - резерв по ID
     *
     * Роутер регистрирует с паттерном "/reservations/*"
     */
    class GetReservationHandler : public IHttpHandler
    {
    public:
        explicit GetReservationHandler(std::shared_ptr<ports::input::IReservationService> service)
            : service_(std::move(service))
        {
            std::cout << "[GetReservationHandler] Created" << std::endl;
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
                std::string path = req.getPath();
                path = path.substr(0, path.find('?'));

                const std::string prefix = "/reservations/";
                std::string reservationId = (path.compare(0, prefix.size(), prefix) == 0)
                                                ? path.substr(prefix.size())
                                                : "";

                if (reservationId.empty())
                {
                    sendError(res, 400, "Reservation ID is required");
                    return;
                }

                auto reservation = service_->getReservation(reservationId);
                if (!reservation)
                {
                    sendError(res, 404, "Reservation not found");
                    return;
                }

                res.setResult(200, "application/json", reservationToJson(*reservation).dump());
            }
            catch (const std::exception &e)
            {
                std::cerr << "[GetReservationHandler] Error: " << e.what() << std::endl;
                sendError(res, 500, "Internal server error");
            }
        }

    private:
        std::shared_ptr<ports::input::IReservationService> service_;

        nlohmann::json reservationToJson(const domain::Reservation &reservation)
        {
            nlohmann::json j;
            j["reservation_id"] = reservation.id;
            j["product_id"] = reservation.productId;
            j["quantity"] = reservation.quantity;
            j["state"] = domain::toString(reservation.state);
            j["created_at"] = reservation.createdAt.toString();
            j["expires_at"] = reservation.expiresAt.toString();
            if (reservation.closedAt)
            {
                j["closed_at"] = reservation.closedAt->toString();
            }
            return j;
        }

        void sendError(IResponse &res, int status, const std::string &message)
        {
            nlohmann::json error;
            error["error"] = message;
            res.setResult(status, "application/json", error.dump());
        }
    };

} // namespace inventory::adapters::primary
