/**
 * @file ReserveHandlerTest.cpp
 * @brief Unit-тесты для ReserveHandler
 *
 * POST /inventory/reserve
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "adapters/primary/ReserveHandler.hpp"
#include "domain/InvariantViolation.hpp"
#include "mocks/MockReservationService.hpp"

#include <SimpleRequest.hpp>
#include <SimpleResponse.hpp>
#include <nlohmann/json.hpp>

using namespace inventory;
using namespace inventory::adapters::primary;
using ::testing::_;
using ::testing::Return;
using ::testing::Throw;

class ReserveHandlerTest : public ::testing::Test
{
protected:
    struct Reply
    {
        int status;
        std::string body;
    };

    void SetUp() override
    {
        service_ = std::make_shared<tests::MockReservationService>();
        handler_ = std::make_unique<ReserveHandler>(service_);
    }

    Reply post(const std::string &body)
    {
        SimpleRequest req;
        req.setMethod("POST");
        req.setPath("/inventory/reserve");
        req.setBody(body);

        SimpleResponse res;
        handler_->handle(req, res);
        return {res.getStatus(), res.getBody()};
    }

    domain::ReserveResult reserved(const std::string &productId, int64_t quantity)
    {
        domain::ReserveResult result;
        result.status = domain::ReserveStatus::RESERVED;
        result.reservation = domain::Reservation(
            "res-1", productId, quantity,
            domain::Timestamp::fromUnixMillis(0),
            domain::Timestamp::fromUnixMillis(300000));
        result.available = 85;
        return result;
    }

    std::shared_ptr<tests::MockReservationService> service_;
    std::unique_ptr<ReserveHandler> handler_;
};

TEST_F(ReserveHandlerTest, Success_Returns200WithReservation)
{
    EXPECT_CALL(*service_, reserve("GGOEAFKA087499", 15))
        .WillOnce(Return(reserved("GGOEAFKA087499", 15)));

    auto res = post(R"({"product_id": "GGOEAFKA087499", "quantity": 15})");

    EXPECT_EQ(res.status, 200);
    auto json = nlohmann::json::parse(res.body);
    EXPECT_EQ(json["reservation_id"], "res-1");
    EXPECT_EQ(json["product_id"], "GGOEAFKA087499");
    EXPECT_EQ(json["quantity"], 15);
    EXPECT_EQ(json["status"], "reserved");
    EXPECT_EQ(json["expires_at"], "1970-01-01T00:05:00.000Z");
}

TEST_F(ReserveHandlerTest, InsufficientStock_Returns409WithAvailable)
{
    domain::ReserveResult result;
    result.status = domain::ReserveStatus::INSUFFICIENT_STOCK;
    result.available = 10;
    EXPECT_CALL(*service_, reserve("SKU", 15)).WillOnce(Return(result));

    auto res = post(R"({"product_id": "SKU", "quantity": 15})");

    EXPECT_EQ(res.status, 409);
    auto json = nlohmann::json::parse(res.body);
    EXPECT_EQ(json["error"], "Insufficient stock");
    EXPECT_EQ(json["requested"], 15);
    EXPECT_EQ(json["available"], 10);
}

TEST_F(ReserveHandlerTest, ProductNotFound_Returns404)
{
    domain::ReserveResult result;
    result.status = domain::ReserveStatus::PRODUCT_NOT_FOUND;
    EXPECT_CALL(*service_, reserve("UNKNOWN", 1)).WillOnce(Return(result));

    auto res = post(R"({"product_id": "UNKNOWN", "quantity": 1})");

    EXPECT_EQ(res.status, 404);
}

TEST_F(ReserveHandlerTest, InvariantViolation_Returns500)
{
    EXPECT_CALL(*service_, reserve(_, _))
        .WillOnce(Throw(domain::InvariantViolation("reserved > quantity")));

    auto res = post(R"({"product_id": "SKU", "quantity": 1})");

    EXPECT_EQ(res.status, 500);
    EXPECT_EQ(nlohmann::json::parse(res.body)["error"], "Inventory state inconsistent");
}

// ================================================================
// Валидация запроса (до сервиса не доходит)
// ================================================================

TEST_F(ReserveHandlerTest, InvalidJson_Returns400)
{
    EXPECT_CALL(*service_, reserve(_, _)).Times(0);
    EXPECT_EQ(post("{not json").status, 400);
}

TEST_F(ReserveHandlerTest, BodyNotObject_Returns400)
{
    EXPECT_CALL(*service_, reserve(_, _)).Times(0);
    EXPECT_EQ(post("[1, 2]").status, 400);
}

TEST_F(ReserveHandlerTest, MissingProductId_Returns400)
{
    EXPECT_CALL(*service_, reserve(_, _)).Times(0);
    EXPECT_EQ(post(R"({"quantity": 1})").status, 400);
    EXPECT_EQ(post(R"({"product_id": "", "quantity": 1})").status, 400);
    EXPECT_EQ(post(R"({"product_id": 42, "quantity": 1})").status, 400);
}

TEST_F(ReserveHandlerTest, NonIntegerQuantity_Returns400)
{
    EXPECT_CALL(*service_, reserve(_, _)).Times(0);
    EXPECT_EQ(post(R"({"product_id": "SKU"})").status, 400);
    EXPECT_EQ(post(R"({"product_id": "SKU", "quantity": 1.5})").status, 400);
    EXPECT_EQ(post(R"({"product_id": "SKU", "quantity": "3"})").status, 400);
}

TEST_F(ReserveHandlerTest, NonPositiveQuantity_Returns400)
{
    EXPECT_CALL(*service_, reserve(_, _)).Times(0);
    EXPECT_EQ(post(R"({"product_id": "SKU", "quantity": 0})").status, 400);
    EXPECT_EQ(post(R"({"product_id": "SKU", "quantity": -5})").status, 400);
}

TEST_F(ReserveHandlerTest, WrongMethod_Returns405)
{
    SimpleRequest req;
    req.setMethod("GET");
    req.setPath("/inventory/reserve");
    SimpleResponse res;

    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 405);
}
