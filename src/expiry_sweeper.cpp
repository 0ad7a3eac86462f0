#include "expiry_sweeper.hpp"

#include <exception>
#include <utility>

#include "logging.hpp"

namespace parking {

ExpirySweeper::ExpirySweeper(BookingService& bookings, std::chrono::milliseconds interval)
    : bookings_(bookings), interval_(interval), logger_(get_logger("sweeper")) {}

ExpirySweeper::~ExpirySweeper() {
    stop();
}

void ExpirySweeper::start() {
    std::lock_guard<std::mutex> guard(mu_);
    if (worker_.joinable()) return;

    stop_requested_ = false;
    running_.store(true);
    worker_ = std::thread(&ExpirySweeper::run, this);
    logger_->info("Expiry sweeper started (interval {} ms)", interval_.count());
}

void ExpirySweeper::stop() {
    std::thread worker;
    {
        std::lock_guard<std::mutex> guard(mu_);
        if (!worker_.joinable()) return;
        stop_requested_ = true;
        worker = std::move(worker_);
    }
    cv_.notify_all();
    worker.join();
    running_.store(false);
    logger_->info("Expiry sweeper stopped");
}

int ExpirySweeper::sweep_once() {
    const int n = bookings_.expire_stale();
    total_expired_.fetch_add(n);
    if (n > 0) {
        logger_->info("Cleaned up {} expired bookings", n);
        if (listener_) listener_(n);
    }
    return n;
}

void ExpirySweeper::run() {
    std::unique_lock<std::mutex> lock(mu_);
    while (!stop_requested_) {
        if (cv_.wait_for(lock, interval_, [this] { return stop_requested_; })) {
            break;
        }

        lock.unlock();
        try {
            sweep_once();
        } catch (const std::exception& e) {
            // Keep the loop alive; the next tick retries
            logger_->error("Expiry sweep failed: {}", e.what());
        }
        lock.lock();
    }
}

} // namespace parking
