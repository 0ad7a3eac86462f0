#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <random>
#include <string>

#include <spdlog/spdlog.h>

#include "key_value_store.hpp"
#include "slot_types.hpp"

/**
 * @file slot_lock.hpp
 * @brief Short-TTL per-slot mutual exclusion over a shared KeyValueStore.
 *
 * Lock key:   "slot:{slotId}:lock"
 * Lock value: "{holderId}:{randomToken}" (8 hex chars)
 *
 * The lock only serializes the reservation decision; the Booking record is
 * the system of record. Acquisition is a single non-blocking attempt.
 */

namespace parking {

/**
 * @brief Outcome of a lock acquisition attempt.
 */
enum class LockOutcome {
    Acquired,  /**< Key created; caller holds the slot until release or TTL. */
    Contended, /**< Key already present; someone else is mid-booking. */
    Degraded   /**< Store unreachable; proceeding without exclusion (fail-open). */
};

/**
 * @brief Distributed lock keyed by slot id.
 *
 * ### Failure semantics
 * - Store outage during acquire degrades to success (LockOutcome::Degraded),
 *   logged as a warning. Double-initiation races are then caught by the
 *   storage uniqueness constraint on non-terminal bookings.
 * - release() is best-effort: store-reported failures are logged, never
 *   raised; the TTL is the fallback cleanup.
 */
class SlotLock {
public:
    static constexpr std::chrono::seconds kDefaultTtl{60};

    explicit SlotLock(KeyValueStore& store, std::chrono::seconds ttl = kDefaultTtl);

    /**
     * @brief Attempts to take the slot lock once, without waiting.
     * @param slot_id Slot to lock.
     * @param holder_id Identity recorded in the lock value.
     */
    LockOutcome acquire(SlotId slot_id, RequesterId holder_id);

    /** @brief Deletes the slot lock. Missing keys and outages are logged only. */
    void release(SlotId slot_id);

    /** @brief True if a live lock key exists for the slot (false on outage). */
    bool is_locked(SlotId slot_id) const;

    std::chrono::seconds ttl() const { return ttl_; }

    /** @brief Builds "slot:{slotId}:lock". */
    static std::string key_for(SlotId slot_id);

private:
    KeyValueStore& store_;
    std::chrono::seconds ttl_;
    std::shared_ptr<spdlog::logger> logger_;

    std::mutex rng_mu_;
    std::mt19937_64 rng_;

    std::string make_holder_value(RequesterId holder_id);
};

} // namespace parking
