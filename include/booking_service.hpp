#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "clock.hpp"
#include "engine_result.hpp"
#include "parking_repository.hpp"
#include "slot_lock.hpp"
#include "slot_types.hpp"

/**
 * @file booking_service.hpp
 * @brief Public API of the slot booking state machine.
 *
 * This header defines BookingService: the reservation lifecycle
 * (initiate -> confirm / cancel / expire) for single parking slots.
 *
 * Concurrency model:
 * - Requests for different slots never contend.
 * - Requests for the same slot are serialized by the per-slot SlotLock,
 *   taken once (non-blocking) at initiate and released once the decision
 *   is made (confirm, cancel, expiry or any failure).
 * - The repository's uniqueness constraint on non-terminal bookings is the
 *   second line of defense when the lock store is degraded.
 *
 * State machine:
 *   initiated --confirm--> confirmed
 *   initiated --cancel---> canceled
 *   initiated --sweep----> expired
 *   locked    --(same transitions as initiated)
 *   confirmed --cancel---> canceled
 */

namespace parking {

/**
 * @brief Booking state machine for parking slots.
 *
 * @details
 * All operations return a BookingResult instead of throwing. No in-process
 * lock is held across repository calls; each repository call is atomic on
 * its own and every slot/booking write is conditional on the prior state.
 *
 * ### Thread-safety
 * - Any number of threads may call any method concurrently.
 * - For one slot, at most one initiate succeeds until the resulting booking
 *   reaches a terminal state.
 */
class BookingService {
public:
    /**
     * @brief Constructs the service over shared collaborators.
     *
     * @param repo System of record for slots, lots, vehicles and bookings.
     * @param lock Per-slot distributed lock; its TTL is also the reservation window.
     * @param clock Time source for expiry and opening hours.
     */
    BookingService(ParkingRepository& repo, SlotLock& lock, const Clock& clock);

    /**
     * @brief Starts a reservation of @p slot_id for @p requester_id.
     *
     * @param requester_id Driver making the request.
     * @param license_plate Plate of one of the driver's registered vehicles (any formatting).
     * @param slot_id Slot to reserve.
     * @return On success the new booking in status initiated, expiring after the lock TTL.
     *
     * @details
     * 1. Acquires the slot lock; contention fails immediately with LockContention.
     * 2. Validates: plate non-empty and registered to the requester, slot exists and is
     *    available/reserved, lot open now, no other non-terminal booking on the slot.
     * 3. Inserts the booking. The slot status is not changed; only confirm does that.
     * Any failure after step 1 releases the lock before returning.
     */
    BookingResult initiate(RequesterId requester_id, const std::string& license_plate, SlotId slot_id);

    /**
     * @brief Confirms a pending booking and marks its slot reserved.
     *
     * @details
     * - NotFound / Forbidden if the booking is absent or not the requester's.
     * - Conflict if the booking is not initiated/locked.
     * - Gone if the reservation window has elapsed (booking becomes expired).
     * - Conflict if the slot is no longer available/reserved, e.g. a walk-in
     *   was detected meanwhile (booking becomes canceled).
     * The slot lock is released on every outcome.
     */
    BookingResult confirm(RequesterId requester_id, BookingId booking_id);

    /**
     * @brief Cancels a booking on behalf of its holder.
     *
     * @param reason Optional free text stored on the booking.
     *
     * @details
     * Idempotent: canceling an expired or canceled booking succeeds without any
     * state change. Canceling a confirmed booking returns its reserved slot to
     * available.
     */
    BookingResult cancel(RequesterId requester_id, BookingId booking_id, const std::string& reason = "");

    /**
     * @brief Expires every initiated/locked booking whose window has elapsed.
     *
     * @return Number of bookings moved to expired.
     *
     * @details
     * Each booking is handled independently; a failure on one is logged and the
     * sweep continues with the next. The slot lock is released for every
     * expired booking (a no-op if the TTL already removed it).
     */
    int expire_stale();

    /** @brief Loads one of the requester's bookings (NotFound / Forbidden otherwise). */
    BookingResult get_booking(RequesterId requester_id, BookingId booking_id) const;

    /**
     * @brief Lists the requester's bookings, newest first.
     * @param status_filter When set, only bookings in that status.
     */
    std::vector<Booking> list_bookings(RequesterId requester_id,
                                       std::optional<BookingStatus> status_filter = std::nullopt) const;

private:
    ParkingRepository& repo_;
    SlotLock& lock_;
    const Clock& clock_;
    std::shared_ptr<spdlog::logger> logger_;

    /**
     * @brief Validates an initiate request against current state.
     *
     * @param out_slot Slot record on success.
     * @param out_lot Lot record on success.
     * @param out_error Filled with a message on failure; cleared on entry.
     * @return ErrorCode::None if the request may proceed.
     *
     * This helper only reads; it never changes state.
     */
    ErrorCode validate_request(RequesterId requester_id,
                               const std::string& normalized_plate,
                               SlotId slot_id,
                               Slot& out_slot,
                               ParkingLot& out_lot,
                               std::string& out_error) const;

    /** @brief Conditionally moves a pending booking to canceled (used by confirm's re-validation). */
    void cancel_pending(const Booking& booking, const std::string& reason);

    /** @brief Re-reads a booking after a rejected conditional write. */
    Booking reload(const Booking& fallback) const;

    /** @brief Returns a reserved slot to available unless a confirmed booking still holds it. */
    void release_reserved_slot(SlotId slot_id);
};

} // namespace parking
