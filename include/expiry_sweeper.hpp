#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <utility>

#include <spdlog/spdlog.h>

#include "booking_service.hpp"

namespace parking {

/**
 * @brief Background task that expires abandoned reservations.
 *
 * @details
 * Wakes every @p interval (independent of the lock TTL) and runs
 * BookingService::expire_stale(). This is the liveness guarantee that an
 * abandoned initiate never starves a slot.
 *
 * start() and stop() are idempotent; the destructor stops and joins.
 */
class ExpirySweeper {
public:
    ExpirySweeper(BookingService& bookings, std::chrono::milliseconds interval);
    ~ExpirySweeper();

    ExpirySweeper(const ExpirySweeper&) = delete;
    ExpirySweeper& operator=(const ExpirySweeper&) = delete;

    /** @brief Called after every sweep that expired at least one booking. Set before start(). */
    void set_listener(std::function<void(int expired)> listener) { listener_ = std::move(listener); }

    void start();
    void stop();

    bool running() const { return running_.load(); }

    /** @brief Runs one sweep on the calling thread. @return Bookings expired. */
    int sweep_once();

    /** @brief Total bookings expired by this sweeper since construction. */
    long long total_expired() const { return total_expired_.load(); }

private:
    BookingService& bookings_;
    std::chrono::milliseconds interval_;
    std::shared_ptr<spdlog::logger> logger_;
    std::function<void(int)> listener_;

    std::atomic<bool> running_{false};
    std::atomic<long long> total_expired_{0};

    std::mutex mu_;
    std::condition_variable cv_;
    bool stop_requested_ = false;
    std::thread worker_;

    void run();
};

} // namespace parking
