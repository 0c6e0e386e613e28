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
     * @brief POST /inventory/release - отменить резерв
     *
     * Request: {"reservation_id": "5b1f..."}
     *
     * 200 {"status": "released"} - резерв отменён;
     * 200 {"status": "already_terminal", "state": "EXPIRED"} - повторная отмена, без изменений;
     * 404 - резерв не найден (в том числе удалён после terminal retention);
     * 400 - нет reservation_id.
     */
    class ReleaseHandler : public IHttpHandler
    {
    public:
        explicit ReleaseHandler(std::shared_ptr<ports::input::IReservationService> service)
            : service_(std::move(service))
        {
            std::cout << "[ReleaseHandler] Created" << std::endl;
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

                if (!body.is_object() || !body.contains("reservation_id") ||
                    !body["reservation_id"].is_string() ||
                    body["reservation_id"].get<std::string>().empty())
                {
                    sendError(res, 400, "reservation_id is required");
                    return;
                }

                auto reservationId = body["reservation_id"].get<std::string>();
                auto result = service_->release(reservationId);

                nlohmann::json response;
                response["reservation_id"] = reservationId;

                switch (result.status)
                {
                case domain::ReleaseStatus::RELEASED:
                    response["status"] = "released";
                    res.setResult(200, "application/json", response.dump());
                    return;
                case domain::ReleaseStatus::ALREADY_TERMINAL:
                    response["status"] = "already_terminal";
                    if (result.state)
                    {
                        response["state"] = domain::toString(*result.state);
                    }
                    res.setResult(200, "application/json", response.dump());
                    return;
                case domain::ReleaseStatus::NOT_FOUND:
                    sendError(res, 404,
                              "Reservation not found (unknown id, or purged after terminal retention)");
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
                std::cerr << "[ReleaseHandler] Error: " << e.what() << std::endl;
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
