#pragma once

#include "ports/input/IReservationService.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <iostream>
#include <memory>
#include <mutex>
#include <thread>

namespace inventory::adapters::secondary {

/**
 * @brief Фоновый поток для expiry sweep
 *
 * Периодически вызывает IReservationService::expireDue().
 * Время истечения берётся из IClock сервиса, поэтому в тестах
 * sweep запускается вручную через sweepNow() без ожидания.
 *
 * @example
 * ```cpp
 * ExpirySweeper sweeper(coordinator);
 * sweeper.start(std::chrono::seconds{5});
 * // ... обработка запросов ...
 * sweeper.stop();
 * ```
 *
 * Thread-safe: да
 */
class ExpirySweeper {
public:
    explicit ExpirySweeper(std::shared_ptr<ports::input::IReservationService> service)
        : service_(std::move(service))
        , running_(false)
        , sweepCount_(0)
        , expiredTotal_(0)
    {}

    ~ExpirySweeper() {
        stop();
    }

    ExpirySweeper(const ExpirySweeper&) = delete;
    ExpirySweeper& operator=(const ExpirySweeper&) = delete;

    /**
     * @brief Запустить фоновый sweep
     * @param interval Интервал между проходами
     */
    void start(std::chrono::milliseconds interval = std::chrono::milliseconds{5000}) {
        if (running_.exchange(true)) {
            return;  // Уже запущен
        }

        interval_ = interval;
        workerThread_ = std::thread([this]() {
            runLoop();
        });

        std::cout << "[ExpirySweeper] Started, interval=" << interval.count() << "ms" << std::endl;
    }

    /**
     * @brief Остановить sweep (прерывает ожидание, не ждёт интервал)
     */
    void stop() {
        {
            std::lock_guard<std::mutex> lock(waitMutex_);
            if (!running_.exchange(false)) {
                return;  // Уже остановлен
            }
        }
        wakeUp_.notify_all();

        if (workerThread_.joinable()) {
            workerThread_.join();
        }

        std::cout << "[ExpirySweeper] Stopped after " << sweepCount_.load() << " sweeps" << std::endl;
    }

    bool isRunning() const {
        return running_.load();
    }

    uint64_t sweepCount() const {
        return sweepCount_.load();
    }

    uint64_t expiredTotal() const {
        return expiredTotal_.load();
    }

    /**
     * @brief Выполнить один проход синхронно (для тестов и ручного запуска)
     */
    domain::SweepResult sweepNow() {
        return doSweep();
    }

    std::chrono::milliseconds interval() const {
        return interval_.load();
    }

private:
    std::shared_ptr<ports::input::IReservationService> service_;

    std::atomic<bool> running_;
    std::thread workerThread_;
    std::atomic<std::chrono::milliseconds> interval_{std::chrono::milliseconds{5000}};
    std::atomic<uint64_t> sweepCount_;
    std::atomic<uint64_t> expiredTotal_;

    std::mutex waitMutex_;
    std::condition_variable wakeUp_;

    void runLoop() {
        while (running_.load()) {
            auto start = std::chrono::steady_clock::now();

            try {
                doSweep();
            } catch (const std::exception& e) {
                std::cerr << "[ExpirySweeper] Sweep failed: " << e.what() << std::endl;
            }

            auto deadline = start + interval_.load();
            std::unique_lock<std::mutex> lock(waitMutex_);
            wakeUp_.wait_until(lock, deadline, [this]() { return !running_.load(); });
        }
    }

    domain::SweepResult doSweep() {
        auto result = service_->expireDue();
        ++sweepCount_;
        expiredTotal_ += result.expired;
        return result;
    }
};

} // namespace inventory::adapters::secondary
