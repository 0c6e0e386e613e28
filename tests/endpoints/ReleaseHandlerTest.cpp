/**
 * @file ReleaseHandlerTest.cpp
 * @brief Unit-тесты для ReleaseHandler
 *
 * POST /inventory/release
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "adapters/primary/ReleaseHandler.hpp"
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

class ReleaseHandlerTest : public ::testing::Test
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
        handler_ = std::make_unique<ReleaseHandler>(service_);
    }

    Reply post(const std::string &body)
    {
        SimpleRequest req;
        req.setMethod("POST");
        req.setPath("/inventory/release");
        req.setBody(body);

        SimpleResponse res;
        handler_->handle(req, res);
        return {res.getStatus(), res.getBody()};
    }

    domain::ReleaseResult result(domain::ReleaseStatus status,
                                 std::optional<domain::ReservationState> state = std::nullopt)
    {
        domain::ReleaseResult r;
        r.status = status;
        r.state = state;
        return r;
    }

    std::shared_ptr<tests::MockReservationService> service_;
    std::unique_ptr<ReleaseHandler> handler_;
};

TEST_F(ReleaseHandlerTest, Released_Returns200)
{
    EXPECT_CALL(*service_, release("res-1"))
        .WillOnce(Return(result(domain::ReleaseStatus::RELEASED, domain::ReservationState::RELEASED)));

    auto res = post(R"({"reservation_id": "res-1"})");

    EXPECT_EQ(res.status, 200);
    auto json = nlohmann::json::parse(res.body);
    EXPECT_EQ(json["status"], "released");
    EXPECT_EQ(json["reservation_id"], "res-1");
}

TEST_F(ReleaseHandlerTest, AlreadyTerminal_Returns200WithState)
{
    EXPECT_CALL(*service_, release("res-1"))
        .WillOnce(Return(result(domain::ReleaseStatus::ALREADY_TERMINAL, domain::ReservationState::EXPIRED)));

    auto res = post(R"({"reservation_id": "res-1"})");

    EXPECT_EQ(res.status, 200);
    auto json = nlohmann::json::parse(res.body);
    EXPECT_EQ(json["status"], "already_terminal");
    EXPECT_EQ(json["state"], "EXPIRED");
}

TEST_F(ReleaseHandlerTest, NotFound_Returns404)
{
    EXPECT_CALL(*service_, release("missing"))
        .WillOnce(Return(result(domain::ReleaseStatus::NOT_FOUND)));

    auto res = post(R"({"reservation_id": "missing"})");
    EXPECT_EQ(res.status, 404);
    auto json = nlohmann::json::parse(res.body);
    EXPECT_NE(json["error"].get<std::string>().find("purged after terminal retention"),
              std::string::npos);
}

TEST_F(ReleaseHandlerTest, MissingReservationId_Returns400)
{
    EXPECT_CALL(*service_, release(_)).Times(0);

    EXPECT_EQ(post("{}").status, 400);
    EXPECT_EQ(post(R"({"reservation_id": ""})").status, 400);
    EXPECT_EQ(post(R"({"reservation_id": 7})").status, 400);
}

TEST_F(ReleaseHandlerTest, InvalidJson_Returns400)
{
    EXPECT_CALL(*service_, release(_)).Times(0);
    EXPECT_EQ(post("not json").status, 400);
}

TEST_F(ReleaseHandlerTest, InvariantViolation_Returns500)
{
    EXPECT_CALL(*service_, release(_))
        .WillOnce(Throw(domain::InvariantViolation("underflow")));

    EXPECT_EQ(post(R"({"reservation_id": "res-1"})").status, 500);
}
