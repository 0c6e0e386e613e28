/**
 * @file ReservationConcurrencyTest.cpp
 * @brief Многопоточные тесты: нет перепродажи, 0 <= reserved <= quantity,
 *        гонка release и expiry уменьшает reserved ровно один раз
 */

#include <gtest/gtest.h>

#include "application/ReservationCoordinator.hpp"
#include "adapters/secondary/persistence/InMemoryStockLedger.hpp"
#include "adapters/secondary/persistence/InMemoryReservationTable.hpp"
#include "adapters/secondary/events/InMemoryEventBus.hpp"
#include "domain/events/ReservationReleasedEvent.hpp"
#include "domain/events/ReservationExpiredEvent.hpp"
#include "mocks/ManualClock.hpp"
#include "mocks/FakeInventorySettings.hpp"

#include <atomic>
#include <mutex>
#include <thread>
#include <vector>

using namespace inventory;
using namespace inventory::domain;
using namespace inventory::adapters::secondary;
using namespace std::chrono_literals;

class ReservationConcurrencyTest : public ::testing::Test {
protected:
    std::shared_ptr<InMemoryStockLedger> ledger;
    std::shared_ptr<InMemoryReservationTable> table;
    std::shared_ptr<tests::ManualClock> clock;
    std::shared_ptr<InMemoryEventBus> eventBus;
    std::shared_ptr<tests::FakeInventorySettings> settings;
    std::shared_ptr<application::ReservationCoordinator> coordinator;

    void SetUp() override {
        ledger = std::make_shared<InMemoryStockLedger>();
        table = std::make_shared<InMemoryReservationTable>();
        clock = std::make_shared<tests::ManualClock>();
        eventBus = std::make_shared<InMemoryEventBus>();
        settings = std::make_shared<tests::FakeInventorySettings>();
        settings->reservationTtl = 60s;

        coordinator = std::make_shared<application::ReservationCoordinator>(
            ledger, table, clock, eventBus, settings);
    }

    template <typename Fn>
    static void runWorkers(int count, Fn fn) {
        std::vector<std::thread> workers;
        workers.reserve(count);
        for (int i = 0; i < count; ++i) {
            workers.emplace_back(fn, i);
        }
        for (auto& worker : workers) {
            worker.join();
        }
    }
};

// ================================================================
// Overselling
// ================================================================

TEST_F(ReservationConcurrencyTest, TwentyWorkersFiveCallsEach_ExactlySixSucceed) {
    ledger->addProduct("SKU", 100);
    std::atomic<int> succeeded{0};
    std::atomic<int> insufficient{0};
    std::atomic<int> other{0};

    runWorkers(20, [&](int) {
        for (int call = 0; call < 5; ++call) {
            auto result = coordinator->reserve("SKU", 15);
            if (result.status == ReserveStatus::RESERVED) {
                ++succeeded;
            } else if (result.status == ReserveStatus::INSUFFICIENT_STOCK) {
                ++insufficient;
            } else {
                ++other;
            }
        }
    });

    EXPECT_EQ(succeeded.load(), 6);
    EXPECT_EQ(insufficient.load(), 94);
    EXPECT_EQ(other.load(), 0);

    auto availability = coordinator->getAvailability("SKU");
    EXPECT_EQ(availability->reserved, 90);
    EXPECT_EQ(availability->available, 10);
    EXPECT_EQ(table->size(), 6u);
}

TEST_F(ReservationConcurrencyTest, SingleUnitContention_GrantsExactlyQuantity) {
    ledger->addProduct("SKU", 37);
    std::atomic<int> succeeded{0};

    runWorkers(16, [&](int) {
        for (int call = 0; call < 10; ++call) {
            if (coordinator->reserve("SKU", 1).isSuccess()) {
                ++succeeded;
            }
        }
    });

    EXPECT_EQ(succeeded.load(), 37);
    EXPECT_EQ(coordinator->getAvailability("SKU")->available, 0);
}

TEST_F(ReservationConcurrencyTest, IndependentProducts_DoNotInterfere) {
    ledger->addProduct("A", 50);
    ledger->addProduct("B", 50);
    std::atomic<int> succeededA{0};
    std::atomic<int> succeededB{0};

    runWorkers(8, [&](int worker) {
        for (int call = 0; call < 20; ++call) {
            if (worker % 2 == 0) {
                if (coordinator->reserve("A", 1).isSuccess()) ++succeededA;
            } else {
                if (coordinator->reserve("B", 2).isSuccess()) ++succeededB;
            }
        }
    });

    EXPECT_EQ(succeededA.load(), 50);
    EXPECT_EQ(succeededB.load(), 25);
}

// ================================================================
// Invariant under mixed load
// ================================================================

TEST_F(ReservationConcurrencyTest, MixedReserveRelease_InvariantHoldsAtEverySample) {
    ledger->addProduct("SKU", 40);
    std::atomic<bool> done{false};
    std::atomic<int> violations{0};
    std::atomic<int> samples{0};

    std::thread sampler([&]() {
        while (!done.load()) {
            auto a = coordinator->getAvailability("SKU");
            if (a->reserved < 0 || a->reserved > a->quantity || a->available != a->quantity - a->reserved) {
                ++violations;
            }
            ++samples;
        }
    });

    runWorkers(12, [&](int worker) {
        for (int call = 0; call < 200; ++call) {
            auto result = coordinator->reserve("SKU", 1 + (worker + call) % 5);
            if (result.isSuccess()) {
                coordinator->release(result.reservation->id);
            }
        }
    });

    done = true;
    sampler.join();

    EXPECT_EQ(violations.load(), 0);
    EXPECT_GT(samples.load(), 0);
    EXPECT_EQ(coordinator->getAvailability("SKU")->available, 40);
}

// ================================================================
// Terminal transitions
// ================================================================

TEST_F(ReservationConcurrencyTest, ConcurrentReleaseOfSameReservation_DecrementsOnce) {
    ledger->addProduct("SKU", 50);
    auto reserved = coordinator->reserve("SKU", 30);
    ASSERT_TRUE(reserved.isSuccess());

    std::atomic<int> released{0};
    std::atomic<int> alreadyTerminal{0};

    runWorkers(10, [&](int) {
        auto result = coordinator->release(reserved.reservation->id);
        if (result.status == ReleaseStatus::RELEASED) ++released;
        if (result.status == ReleaseStatus::ALREADY_TERMINAL) ++alreadyTerminal;
    });

    EXPECT_EQ(released.load(), 1);
    EXPECT_EQ(alreadyTerminal.load(), 9);
    EXPECT_EQ(coordinator->getAvailability("SKU")->available, 50);
}

TEST_F(ReservationConcurrencyTest, ReleaseRacingExpiry_ExactlyOneTransitionWins) {
    ledger->addProduct("SKU", 1000);

    std::vector<std::string> ids;
    for (int i = 0; i < 100; ++i) {
        ids.push_back(coordinator->reserve("SKU", 10).reservation->id);
    }
    ASSERT_EQ(coordinator->getAvailability("SKU")->available, 0);

    std::atomic<int> releasedEvents{0};
    std::atomic<int> expiredEvents{0};
    eventBus->subscribe(ReservationReleasedEvent::TYPE, [&](const DomainEvent&) { ++releasedEvents; });
    eventBus->subscribe(ReservationExpiredEvent::TYPE, [&](const DomainEvent&) { ++expiredEvents; });

    clock->advance(61s);

    std::atomic<size_t> violations{0};
    std::thread sweeper([&]() {
        violations += coordinator->expireDue().violations;
    });
    runWorkers(4, [&](int worker) {
        for (size_t i = worker; i < ids.size(); i += 4) {
            coordinator->release(ids[i]);
        }
    });
    sweeper.join();

    EXPECT_EQ(violations.load(), 0u);
    EXPECT_EQ(releasedEvents.load() + expiredEvents.load(), 100);

    auto availability = coordinator->getAvailability("SKU");
    EXPECT_EQ(availability->reserved, 0);
    EXPECT_EQ(availability->available, 1000);

    for (const auto& id : ids) {
        EXPECT_TRUE(isTerminal(coordinator->getReservation(id)->state));
    }
}
