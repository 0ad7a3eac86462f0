#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "booking_service.hpp"
#include "clock.hpp"
#include "engine_config.hpp"
#include "engine_result.hpp"
#include "expiry_sweeper.hpp"
#include "key_value_store.hpp"
#include "occupancy_reconciler.hpp"
#include "parking_repository.hpp"
#include "session_manager.hpp"
#include "slot_lock.hpp"
#include "status_publisher.hpp"

/**
 * @file parking_engine.hpp
 * @brief One object that owns and wires every engine component.
 *
 * Driver-facing operations go through the BookingService, camera frames
 * through the OccupancyReconciler, and verified transitions reach the
 * SessionManager. Slot status changes made by the booking side (reserve on
 * confirm, release on cancel or expiry, check-in) are published on the same
 * StatusBus as sensor transitions, so LotAvailability stays exact.
 */

namespace parking {

class ParkingEngine {
public:
    /** @brief Builds the engine with an in-process lock store. */
    ParkingEngine(const EngineConfig& config, const Clock& clock);

    /** @brief Builds the engine over an external lock store (must outlive the engine). */
    ParkingEngine(const EngineConfig& config, const Clock& clock, KeyValueStore& lock_store);

    ~ParkingEngine();

    ParkingEngine(const ParkingEngine&) = delete;
    ParkingEngine& operator=(const ParkingEngine&) = delete;

    // ---------- Reservations ----------

    BookingResult initiate(RequesterId requester_id, const std::string& license_plate, SlotId slot_id);
    BookingResult confirm(RequesterId requester_id, BookingId booking_id);
    BookingResult cancel(RequesterId requester_id, BookingId booking_id, const std::string& reason = "");

    /**
     * @brief Lets the holder of a confirmed booking drive into the reserved slot.
     *
     * The slot goes back to occupancy tracking at available; the next verified
     * arrival of the booked plate opens a booked session.
     *
     * @return NotFound / Forbidden as get_booking; Conflict if the booking is
     *         not confirmed or the slot could not be reset.
     */
    BookingResult check_in(RequesterId requester_id, BookingId booking_id);

    // ---------- Occupancy ----------

    /** @brief Feeds one camera frame observed at the engine clock's "now". */
    std::vector<SlotTransition> observe(const std::vector<TrackedVehicle>& vehicles);
    std::vector<SlotTransition> observe(const std::vector<TrackedVehicle>& vehicles, TimePoint observed_at);

    /**
     * @brief Operator override of a slot's status (e.g. unavailable for maintenance).
     * @return False if the slot is unknown or its status moved meanwhile.
     */
    bool set_slot_status(SlotId slot_id, SlotStatus status);

    // ---------- Expiry ----------

    /** @brief Runs one expiry sweep now. @return Bookings expired. */
    int sweep();

    void start_sweeper();
    void stop_sweeper();

    // ---------- Components ----------

    ParkingRepository& repository() { return repo_; }
    const ParkingRepository& repository() const { return repo_; }
    BookingService& bookings() { return bookings_; }
    SessionManager& sessions() { return sessions_; }
    OccupancyReconciler& reconciler() { return reconciler_; }
    ExpirySweeper& sweeper() { return sweeper_; }
    SlotLock& lock() { return lock_; }
    StatusBus& bus() { return bus_; }
    const LotAvailability& availability() const { return availability_; }
    const Clock& clock() const { return clock_; }

private:
    const Clock& clock_;
    std::unique_ptr<KeyValueStore> owned_store_;
    KeyValueStore& store_;
    SlotLock lock_;
    ParkingRepository repo_;
    StatusBus bus_;
    LotAvailability availability_;
    SessionManager sessions_;
    OccupancyReconciler reconciler_;
    BookingService bookings_;
    ExpirySweeper sweeper_;
    std::shared_ptr<spdlog::logger> logger_;

    std::mutex publish_mu_;

    void seed(const EngineConfig& config);

    // Publishes every slot whose stored status differs from the last published one,
    // then lets the reconciler adopt the stored statuses.
    void publish_booking_changes();
};

} // namespace parking
