#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "clock.hpp"
#include "engine_result.hpp"
#include "occupancy_reconciler.hpp"
#include "parking_repository.hpp"
#include "slot_types.hpp"

namespace parking {

/**
 * @brief Opens and closes parking sessions from verified slot transitions.
 *
 * @details
 * - available -> occupied with a plate: arrival. The plate is resolved to a
 *   registered vehicle with OCR tolerance; unidentified plates open nothing.
 *   A confirmed booking on the slot for the same plate makes it a booked
 *   session, otherwise a walk-in.
 * - occupied -> available: departure. The slot's active session is closed and
 *   priced in 30-minute blocks, rounded up.
 *
 * Reads bookings but never takes the slot lock.
 */
class SessionManager : public TransitionHandler {
public:
    /** @brief Billing unit: every started block is charged in full. */
    static constexpr int kBlockMinutes = 30;

    SessionManager(ParkingRepository& repo, const Clock& clock);

    /** @brief Routes a reconciler transition to on_arrival / on_departure. */
    void on_transition(const SlotTransition& transition) override;

    /**
     * @brief Handles a verified arrival.
     *
     * @param plate Plate text read at the slot (any formatting).
     * @param out Session that is active for the slot afterwards (new or pre-existing).
     * @return False if no session is active for the slot afterwards (unknown slot,
     *         unidentified plate).
     */
    bool on_arrival(const std::string& plate, SlotId slot_id, TimePoint observed_at, ParkingSession& out);

    /**
     * @brief Handles a verified departure.
     *
     * @param out Completed session.
     * @return False if the slot had no active session (no-op).
     */
    bool on_departure(SlotId slot_id, TimePoint observed_at, ParkingSession& out);

    /**
     * @brief Price of a stay.
     *
     * cost = ceil(duration / 30 min) * price_per_hour / 2.
     * 1, 30, 31, 60, 61 minutes at 10/h cost 5, 5, 10, 10, 15. The ceiling is
     * taken at full clock precision: 30:00.5 is two blocks.
     */
    static double calculate_cost(TimePoint::duration duration, double price_per_hour);

    /**
     * @brief Cost-so-far of a session: recomputed up to @p now while active,
     *        the stored cost once completed.
     * @return False if the session or its lot is unknown.
     */
    bool current_cost(SessionId session_id, TimePoint now, double& out_cost) const;

    /** @brief current_cost() at the engine clock's "now". */
    bool current_cost(SessionId session_id, double& out_cost) const;

    /** @brief Loads a session of one of @p owner_id's vehicles (NotFound / Forbidden otherwise). */
    SessionResult get_session(RequesterId owner_id, SessionId session_id) const;

    /** @brief Sessions of @p owner_id's vehicles, newest first. */
    std::vector<ParkingSession> list_sessions(RequesterId owner_id,
                                              std::optional<SessionStatus> status_filter = std::nullopt) const;

    bool active_session_for_slot(SlotId slot_id, ParkingSession& out) const;
    bool active_session_for_plate(const std::string& plate, ParkingSession& out) const;

private:
    ParkingRepository& repo_;
    const Clock& clock_;
    std::shared_ptr<spdlog::logger> logger_;

    // Confirmed booking on the slot for this vehicle / detected plate, if any.
    std::optional<BookingId> find_confirmed_booking(SlotId slot_id, const Vehicle& vehicle,
                                                    const std::string& detected_plate) const;
};

} // namespace parking
