#pragma once

#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "slot_types.hpp"

/**
 * @file parking_repository.hpp
 * @brief In-memory system of record for lots, slots, vehicles, bookings and sessions.
 *
 * Every method is atomic with respect to every other method (one internal
 * mutex). Records are returned by value; callers never hold references into
 * the repository.
 *
 * Writers express the state they expect to replace:
 * - slot status updates name the expected prior status
 * - booking/session updates name the expected prior lifecycle status
 * A mismatch rejects the write (returns false) instead of overwriting, so
 * conflicting writers are detected rather than silently clobbered.
 */

namespace parking {

/**
 * @brief Storage layer with conditional read-modify-write and uniqueness constraints.
 *
 * ### Constraints enforced at insertion
 * - at most one non-terminal booking (initiated/locked/confirmed) per slot
 * - at most one active session per slot
 *
 * ### Identity directory
 * Vehicles are indexed by normalized plate; @ref match_vehicle resolves a
 * sensor-read plate with OCR tolerance.
 */
class ParkingRepository {
public:
    ParkingRepository() = default;

    ParkingRepository(const ParkingRepository&) = delete;
    ParkingRepository& operator=(const ParkingRepository&) = delete;

    // ---------- Lots ----------
    void upsert_lot(const ParkingLot& lot);
    bool find_lot(LotId id, ParkingLot& out) const;

    // ---------- Slots ----------
    void upsert_slot(const Slot& slot);
    bool find_slot(SlotId id, Slot& out) const;

    /** @brief All slots, sorted by id (stable, deterministic output). */
    std::vector<Slot> list_slots() const;

    /**
     * @brief Conditional slot status write.
     *
     * @param id Slot to update.
     * @param expected Status the writer believes is current.
     * @param desired New status.
     * @param at Stored as last_updated_at on success.
     * @return True if the slot exists and its status was @p expected; false otherwise
     *         (nothing is written).
     */
    bool update_slot_status(SlotId id, SlotStatus expected, SlotStatus desired, TimePoint at);

    // ---------- Vehicles (identity directory) ----------

    /**
     * @brief Registers a vehicle, normalizing its plate.
     * @return The new vehicle id.
     */
    VehicleId add_vehicle(RequesterId owner_id, const std::string& plate);

    /** @brief Inserts or replaces a vehicle with a caller-chosen id (plate is normalized). */
    void upsert_vehicle(const Vehicle& vehicle);

    bool find_vehicle(VehicleId id, Vehicle& out) const;

    /** @brief Vehicle of @p owner_id whose normalized plate equals normalize(@p plate). */
    bool find_vehicle_for_owner(RequesterId owner_id, const std::string& plate, Vehicle& out) const;

    /**
     * @brief Resolves a sensor-read plate to a registered vehicle.
     *
     * @details
     * Exact normalized match first; otherwise the first vehicle (lowest id)
     * whose plate fuzzy-matches (edit distance < 2).
     */
    bool match_vehicle(const std::string& detected_plate, Vehicle& out) const;

    std::vector<Vehicle> vehicles_of(RequesterId owner_id) const;

    // ---------- Bookings ----------

    /**
     * @brief Inserts a booking, assigning its id.
     *
     * @param booking Booking to insert (id is ignored).
     * @param out Stored booking (with id) on success.
     * @return False if a non-terminal booking already exists for the slot, or the
     *         new booking itself is terminal.
     */
    bool insert_booking(const Booking& booking, Booking& out);

    bool find_booking(BookingId id, Booking& out) const;

    /** @brief The slot's non-terminal booking, if any. */
    bool find_non_terminal_booking(SlotId slot_id, Booking& out) const;

    /**
     * @brief Conditional booking write.
     * @return True if the stored booking still had status @p expected; the whole
     *         record is then replaced by @p updated.
     */
    bool update_booking(const Booking& updated, BookingStatus expected);

    /** @brief Bookings of a requester, newest booked_at first. */
    std::vector<Booking> bookings_of(RequesterId requester_id) const;

    /** @brief Bookings on a slot in the given status, lowest id first. */
    std::vector<Booking> bookings_for_slot(SlotId slot_id, BookingStatus status) const;

    /** @brief Initiated/locked bookings whose expires_at is strictly before @p now. */
    std::vector<Booking> expired_pending_bookings(TimePoint now) const;

    // ---------- Sessions ----------

    /**
     * @brief Inserts a session, assigning its id.
     * @return False if an active session already exists for the slot.
     */
    bool insert_session(const ParkingSession& session, ParkingSession& out);

    bool find_session(SessionId id, ParkingSession& out) const;
    bool find_active_session_for_slot(SlotId slot_id, ParkingSession& out) const;

    /** @brief Active session whose stored plate equals normalize(@p plate). */
    bool find_active_session_for_plate(const std::string& plate, ParkingSession& out) const;

    /** @brief Conditional session write (see update_booking). */
    bool update_session(const ParkingSession& updated, SessionStatus expected);

    /** @brief Sessions of the given vehicles, newest start_time first. */
    std::vector<ParkingSession> sessions_for_vehicles(const std::vector<VehicleId>& vehicle_ids) const;

private:
    mutable std::mutex mu_;

    std::unordered_map<LotId, ParkingLot> lots_;
    std::unordered_map<SlotId, Slot> slots_;
    std::unordered_map<VehicleId, Vehicle> vehicles_;
    std::unordered_map<BookingId, Booking> bookings_;
    std::unordered_map<SessionId, ParkingSession> sessions_;

    VehicleId next_vehicle_id_ = 1;
    BookingId next_booking_id_ = 1;
    SessionId next_session_id_ = 1;

    // Caller holds mu_.
    bool has_non_terminal_booking_locked(SlotId slot_id) const;
    bool has_active_session_locked(SlotId slot_id) const;
};

} // namespace parking
