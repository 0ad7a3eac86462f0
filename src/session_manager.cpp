#include "session_manager.hpp"

#include <ratio>

#include "logging.hpp"
#include "plate_normalizer.hpp"

namespace parking {

SessionManager::SessionManager(ParkingRepository& repo, const Clock& clock)
    : repo_(repo), clock_(clock), logger_(get_logger("session")) {}

void SessionManager::on_transition(const SlotTransition& transition) {
    ParkingSession session;

    if (transition.old_status == SlotStatus::Available && transition.new_status == SlotStatus::Occupied) {
        if (!transition.plate) {
            logger_->warn("Slot {} occupied without a plate reading; no session opened", transition.slot_id);
            return;
        }
        if (!on_arrival(*transition.plate, transition.slot_id, transition.observed_at, session)) {
            logger_->debug("Arrival at slot {} not attributed", transition.slot_id);
        }
        return;
    }

    if (transition.old_status == SlotStatus::Occupied && transition.new_status == SlotStatus::Available) {
        if (!on_departure(transition.slot_id, transition.observed_at, session)) {
            logger_->debug("Departure at slot {} closed no session", transition.slot_id);
        }
    }
}

std::optional<BookingId> SessionManager::find_confirmed_booking(SlotId slot_id, const Vehicle& vehicle,
                                                                const std::string& detected_plate) const {
    for (const auto& b : repo_.bookings_for_slot(slot_id, BookingStatus::Confirmed)) {
        if (b.license_plate == vehicle.license_plate || PlateNormalizer::fuzzy_equals(b.license_plate, detected_plate)) {
            return b.id;
        }
    }
    return std::nullopt;
}

bool SessionManager::on_arrival(const std::string& plate, SlotId slot_id, TimePoint observed_at, ParkingSession& out) {
    // Idempotent: a slot holds at most one active session
    if (repo_.find_active_session_for_slot(slot_id, out)) {
        logger_->debug("Active session already exists for slot {}: session {}", slot_id, out.id);
        return true;
    }

    const std::string normalized = PlateNormalizer::normalize(plate);
    Vehicle vehicle;
    if (!repo_.match_vehicle(normalized, vehicle)) {
        logger_->warn("No vehicle found for license plate: {} (normalized: {})", plate, normalized);
        return false;
    }
    if (vehicle.license_plate != normalized) {
        logger_->info("Fuzzy match: '{}' matched '{}'", normalized, vehicle.license_plate);
    }

    Slot slot;
    if (!repo_.find_slot(slot_id, slot)) {
        logger_->error("Parking slot {} not found", slot_id);
        return false;
    }

    ParkingSession session;
    session.vehicle_id = vehicle.id;
    session.license_plate = normalized;
    session.slot_id = slot_id;
    session.lot_id = slot.lot_id;
    session.status = SessionStatus::Active;
    session.start_time = observed_at;

    const std::optional<BookingId> booking_id = find_confirmed_booking(slot_id, vehicle, normalized);
    if (booking_id) {
        session.origin = BookedSession{*booking_id};
    } else {
        session.origin = WalkInSession{};
    }

    if (!repo_.insert_session(session, out)) {
        // Lost a race with another arrival for the same slot
        return repo_.find_active_session_for_slot(slot_id, out);
    }

    logger_->info("Created {} parking session {} for license plate {} in slot {}",
                  booking_id ? "booked" : "walk-in", out.id, normalized, slot_id);
    return true;
}

bool SessionManager::on_departure(SlotId slot_id, TimePoint observed_at, ParkingSession& out) {
    ParkingSession session;
    if (!repo_.find_active_session_for_slot(slot_id, session)) {
        logger_->debug("No active session for slot {} on departure", slot_id);
        return false;
    }

    ParkingLot lot;
    double price_per_hour = 0.0;
    if (repo_.find_lot(session.lot_id, lot)) {
        price_per_hour = lot.price_per_hour;
    } else {
        logger_->error("Parking lot {} not found; session {} priced at 0", session.lot_id, session.id);
    }

    const TimePoint::duration duration = observed_at - session.start_time;

    ParkingSession completed = session;
    completed.status = SessionStatus::Completed;
    completed.end_time = observed_at;
    completed.total_duration_minutes = std::chrono::duration<double, std::ratio<60>>(duration).count();
    completed.parking_cost = calculate_cost(duration, price_per_hour);

    if (!repo_.update_session(completed, SessionStatus::Active)) {
        logger_->warn("Session {} changed concurrently; departure ignored", session.id);
        return false;
    }

    logger_->info("Ended parking session {}. Duration: {:.2f} minutes, Cost: ${:.2f}",
                  completed.id, *completed.total_duration_minutes, *completed.parking_cost);
    out = completed;
    return true;
}

double SessionManager::calculate_cost(TimePoint::duration duration, double price_per_hour) {
    const auto ticks = duration.count();
    if (ticks <= 0) return 0.0;

    // Ceiling over whole blocks in integer clock ticks, so 30:00 is exactly one block
    const auto block_ticks = TimePoint::duration(std::chrono::minutes(kBlockMinutes)).count();
    const auto blocks = (ticks + block_ticks - 1) / block_ticks;
    return price_per_hour * (static_cast<double>(blocks) * kBlockMinutes / 60.0);
}

bool SessionManager::current_cost(SessionId session_id, TimePoint now, double& out_cost) const {
    ParkingSession session;
    if (!repo_.find_session(session_id, session)) return false;

    if (session.status == SessionStatus::Completed && session.parking_cost) {
        out_cost = *session.parking_cost;
        return true;
    }

    ParkingLot lot;
    if (!repo_.find_lot(session.lot_id, lot)) return false;

    const TimePoint end = session.end_time ? *session.end_time : now;
    out_cost = calculate_cost(end - session.start_time, lot.price_per_hour);
    return true;
}

bool SessionManager::current_cost(SessionId session_id, double& out_cost) const {
    return current_cost(session_id, clock_.now(), out_cost);
}

SessionResult SessionManager::get_session(RequesterId owner_id, SessionId session_id) const {
    ParkingSession session;
    if (!repo_.find_session(session_id, session)) {
        return SessionResult::fail(ErrorCode::NotFound, "Parking session not found");
    }

    Vehicle vehicle;
    if (!repo_.find_vehicle(session.vehicle_id, vehicle) || vehicle.owner_id != owner_id) {
        return SessionResult::fail(ErrorCode::Forbidden, "Parking session does not belong to driver");
    }
    return SessionResult::ok(session);
}

std::vector<ParkingSession> SessionManager::list_sessions(RequesterId owner_id,
                                                          std::optional<SessionStatus> status_filter) const {
    std::vector<VehicleId> ids;
    for (const auto& v : repo_.vehicles_of(owner_id)) {
        ids.push_back(v.id);
    }
    if (ids.empty()) return {};

    std::vector<ParkingSession> result;
    for (const auto& s : repo_.sessions_for_vehicles(ids)) {
        if (!status_filter || s.status == *status_filter) {
            result.push_back(s);
        }
    }
    return result;
}

bool SessionManager::active_session_for_slot(SlotId slot_id, ParkingSession& out) const {
    return repo_.find_active_session_for_slot(slot_id, out);
}

bool SessionManager::active_session_for_plate(const std::string& plate, ParkingSession& out) const {
    return repo_.find_active_session_for_plate(plate, out);
}

} // namespace parking
