#pragma once

#include <chrono>
#include <mutex>

#include "slot_types.hpp"

namespace parking {

/**
 * @brief Source of "now" for every time-dependent decision in the engine
 *        (lock TTLs, booking expiry, opening hours, session cost).
 */
class Clock {
public:
    virtual ~Clock() = default;
    virtual TimePoint now() const = 0;
};

/** @brief Wall clock. */
class SystemClock : public Clock {
public:
    TimePoint now() const override { return std::chrono::system_clock::now(); }
};

/**
 * @brief Clock that only moves when told to. Thread-safe.
 *
 * Used by tests and by the CLI simulation to step through expiry windows
 * without sleeping.
 */
class ManualClock : public Clock {
public:
    explicit ManualClock(TimePoint start) : now_(start) {}

    TimePoint now() const override {
        std::lock_guard<std::mutex> guard(mu_);
        return now_;
    }

    void advance(std::chrono::seconds delta) {
        std::lock_guard<std::mutex> guard(mu_);
        now_ += delta;
    }

    void set(TimePoint tp) {
        std::lock_guard<std::mutex> guard(mu_);
        now_ = tp;
    }

private:
    mutable std::mutex mu_;
    TimePoint now_;
};

} // namespace parking
