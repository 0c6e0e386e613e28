#pragma once

#include "ports/output/IClock.hpp"
#include <chrono>
#include <mutex>

namespace inventory::tests {

/**
 * @brief Управляемые часы для детерминированных тестов TTL
 */
class ManualClock : public ports::output::IClock {
public:
    ManualClock() : now_(domain::Timestamp::fromUnixMillis(1700000000000)) {}

    domain::Timestamp now() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return now_;
    }

    void advance(std::chrono::milliseconds delta) {
        std::lock_guard<std::mutex> lock(mutex_);
        now_ = now_.addMilliseconds(delta.count());
    }

    void set(const domain::Timestamp& at) {
        std::lock_guard<std::mutex> lock(mutex_);
        now_ = at;
    }

private:
    mutable std::mutex mutex_;
    domain::Timestamp now_;
};

} // namespace inventory::tests
