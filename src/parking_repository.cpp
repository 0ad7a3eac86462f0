#include "parking_repository.hpp"

#include <algorithm>
#include <unordered_set>

#include "plate_normalizer.hpp"

namespace parking {

// ---------- Lots ----------

void ParkingRepository::upsert_lot(const ParkingLot& lot) {
    std::lock_guard<std::mutex> guard(mu_);
    lots_[lot.id] = lot;
}

bool ParkingRepository::find_lot(LotId id, ParkingLot& out) const {
    std::lock_guard<std::mutex> guard(mu_);
    auto it = lots_.find(id);
    if (it == lots_.end()) return false;
    out = it->second;
    return true;
}

// ---------- Slots ----------

void ParkingRepository::upsert_slot(const Slot& slot) {
    std::lock_guard<std::mutex> guard(mu_);
    slots_[slot.id] = slot;
}

bool ParkingRepository::find_slot(SlotId id, Slot& out) const {
    std::lock_guard<std::mutex> guard(mu_);
    auto it = slots_.find(id);
    if (it == slots_.end()) return false;
    out = it->second;
    return true;
}

std::vector<Slot> ParkingRepository::list_slots() const {
    std::vector<Slot> result;
    {
        std::lock_guard<std::mutex> guard(mu_);
        result.reserve(slots_.size());
        for (const auto& kv : slots_) {
            result.push_back(kv.second);
        }
    }
    std::sort(result.begin(), result.end(),
              [](const Slot& a, const Slot& b) { return a.id < b.id; });
    return result;
}

bool ParkingRepository::update_slot_status(SlotId id, SlotStatus expected, SlotStatus desired, TimePoint at) {
    std::lock_guard<std::mutex> guard(mu_);
    auto it = slots_.find(id);
    if (it == slots_.end()) return false;
    if (it->second.status != expected) return false;

    it->second.status = desired;
    it->second.last_updated_at = at;
    return true;
}

// ---------- Vehicles ----------

VehicleId ParkingRepository::add_vehicle(RequesterId owner_id, const std::string& plate) {
    std::lock_guard<std::mutex> guard(mu_);
    const VehicleId id = next_vehicle_id_++;
    vehicles_[id] = Vehicle{id, owner_id, PlateNormalizer::normalize(plate)};
    return id;
}

void ParkingRepository::upsert_vehicle(const Vehicle& vehicle) {
    std::lock_guard<std::mutex> guard(mu_);
    Vehicle stored = vehicle;
    stored.license_plate = PlateNormalizer::normalize(vehicle.license_plate);
    vehicles_[stored.id] = stored;
    if (stored.id >= next_vehicle_id_) {
        next_vehicle_id_ = stored.id + 1;
    }
}

bool ParkingRepository::find_vehicle(VehicleId id, Vehicle& out) const {
    std::lock_guard<std::mutex> guard(mu_);
    auto it = vehicles_.find(id);
    if (it == vehicles_.end()) return false;
    out = it->second;
    return true;
}

bool ParkingRepository::find_vehicle_for_owner(RequesterId owner_id, const std::string& plate, Vehicle& out) const {
    const std::string normalized = PlateNormalizer::normalize(plate);
    if (normalized.empty()) return false;

    std::lock_guard<std::mutex> guard(mu_);
    for (const auto& kv : vehicles_) {
        if (kv.second.owner_id == owner_id && kv.second.license_plate == normalized) {
            out = kv.second;
            return true;
        }
    }
    return false;
}

bool ParkingRepository::match_vehicle(const std::string& detected_plate, Vehicle& out) const {
    const std::string normalized = PlateNormalizer::normalize(detected_plate);
    if (normalized.empty()) return false;

    std::lock_guard<std::mutex> guard(mu_);

    // Walk candidates in id order so the fuzzy pick is deterministic
    std::vector<const Vehicle*> ordered;
    ordered.reserve(vehicles_.size());
    for (const auto& kv : vehicles_) {
        ordered.push_back(&kv.second);
    }
    std::sort(ordered.begin(), ordered.end(),
              [](const Vehicle* a, const Vehicle* b) { return a->id < b->id; });

    for (const Vehicle* v : ordered) {
        if (v->license_plate == normalized) {
            out = *v;
            return true;
        }
    }
    for (const Vehicle* v : ordered) {
        if (PlateNormalizer::fuzzy_equals(v->license_plate, normalized)) {
            out = *v;
            return true;
        }
    }
    return false;
}

std::vector<Vehicle> ParkingRepository::vehicles_of(RequesterId owner_id) const {
    std::vector<Vehicle> result;
    {
        std::lock_guard<std::mutex> guard(mu_);
        for (const auto& kv : vehicles_) {
            if (kv.second.owner_id == owner_id) {
                result.push_back(kv.second);
            }
        }
    }
    std::sort(result.begin(), result.end(),
              [](const Vehicle& a, const Vehicle& b) { return a.id < b.id; });
    return result;
}

// ---------- Bookings ----------

bool ParkingRepository::has_non_terminal_booking_locked(SlotId slot_id) const {
    for (const auto& kv : bookings_) {
        if (kv.second.slot_id == slot_id && is_non_terminal(kv.second.status)) {
            return true;
        }
    }
    return false;
}

bool ParkingRepository::insert_booking(const Booking& booking, Booking& out) {
    std::lock_guard<std::mutex> guard(mu_);
    if (!is_non_terminal(booking.status)) return false;
    // Uniqueness constraint on (slot_id, non-terminal status): the loser of a race is rejected
    if (has_non_terminal_booking_locked(booking.slot_id)) return false;

    Booking stored = booking;
    stored.id = next_booking_id_++;
    bookings_[stored.id] = stored;
    out = stored;
    return true;
}

bool ParkingRepository::find_booking(BookingId id, Booking& out) const {
    std::lock_guard<std::mutex> guard(mu_);
    auto it = bookings_.find(id);
    if (it == bookings_.end()) return false;
    out = it->second;
    return true;
}

bool ParkingRepository::find_non_terminal_booking(SlotId slot_id, Booking& out) const {
    std::lock_guard<std::mutex> guard(mu_);
    for (const auto& kv : bookings_) {
        if (kv.second.slot_id == slot_id && is_non_terminal(kv.second.status)) {
            out = kv.second;
            return true;
        }
    }
    return false;
}

bool ParkingRepository::update_booking(const Booking& updated, BookingStatus expected) {
    std::lock_guard<std::mutex> guard(mu_);
    auto it = bookings_.find(updated.id);
    if (it == bookings_.end()) return false;
    if (it->second.status != expected) return false;

    it->second = updated;
    return true;
}

std::vector<Booking> ParkingRepository::bookings_of(RequesterId requester_id) const {
    std::vector<Booking> result;
    {
        std::lock_guard<std::mutex> guard(mu_);
        for (const auto& kv : bookings_) {
            if (kv.second.requester_id == requester_id) {
                result.push_back(kv.second);
            }
        }
    }
    std::sort(result.begin(), result.end(), [](const Booking& a, const Booking& b) {
        if (a.booked_at != b.booked_at) return a.booked_at > b.booked_at;
        return a.id > b.id;
    });
    return result;
}

std::vector<Booking> ParkingRepository::bookings_for_slot(SlotId slot_id, BookingStatus status) const {
    std::vector<Booking> result;
    {
        std::lock_guard<std::mutex> guard(mu_);
        for (const auto& kv : bookings_) {
            if (kv.second.slot_id == slot_id && kv.second.status == status) {
                result.push_back(kv.second);
            }
        }
    }
    std::sort(result.begin(), result.end(),
              [](const Booking& a, const Booking& b) { return a.id < b.id; });
    return result;
}

std::vector<Booking> ParkingRepository::expired_pending_bookings(TimePoint now) const {
    std::vector<Booking> result;
    {
        std::lock_guard<std::mutex> guard(mu_);
        for (const auto& kv : bookings_) {
            const Booking& b = kv.second;
            if (is_pending(b.status) && b.expires_at && *b.expires_at < now) {
                result.push_back(b);
            }
        }
    }
    std::sort(result.begin(), result.end(),
              [](const Booking& a, const Booking& b) { return a.id < b.id; });
    return result;
}

// ---------- Sessions ----------

bool ParkingRepository::has_active_session_locked(SlotId slot_id) const {
    for (const auto& kv : sessions_) {
        if (kv.second.slot_id == slot_id && kv.second.status == SessionStatus::Active) {
            return true;
        }
    }
    return false;
}

bool ParkingRepository::insert_session(const ParkingSession& session, ParkingSession& out) {
    std::lock_guard<std::mutex> guard(mu_);
    if (session.status == SessionStatus::Active && has_active_session_locked(session.slot_id)) {
        return false;
    }

    ParkingSession stored = session;
    stored.id = next_session_id_++;
    sessions_[stored.id] = stored;
    out = stored;
    return true;
}

bool ParkingRepository::find_session(SessionId id, ParkingSession& out) const {
    std::lock_guard<std::mutex> guard(mu_);
    auto it = sessions_.find(id);
    if (it == sessions_.end()) return false;
    out = it->second;
    return true;
}

bool ParkingRepository::find_active_session_for_slot(SlotId slot_id, ParkingSession& out) const {
    std::lock_guard<std::mutex> guard(mu_);
    for (const auto& kv : sessions_) {
        if (kv.second.slot_id == slot_id && kv.second.status == SessionStatus::Active) {
            out = kv.second;
            return true;
        }
    }
    return false;
}

bool ParkingRepository::find_active_session_for_plate(const std::string& plate, ParkingSession& out) const {
    const std::string normalized = PlateNormalizer::normalize(plate);
    if (normalized.empty()) return false;

    std::lock_guard<std::mutex> guard(mu_);
    for (const auto& kv : sessions_) {
        if (kv.second.license_plate == normalized && kv.second.status == SessionStatus::Active) {
            out = kv.second;
            return true;
        }
    }
    return false;
}

bool ParkingRepository::update_session(const ParkingSession& updated, SessionStatus expected) {
    std::lock_guard<std::mutex> guard(mu_);
    auto it = sessions_.find(updated.id);
    if (it == sessions_.end()) return false;
    if (it->second.status != expected) return false;

    it->second = updated;
    return true;
}

std::vector<ParkingSession> ParkingRepository::sessions_for_vehicles(const std::vector<VehicleId>& vehicle_ids) const {
    const std::unordered_set<VehicleId> wanted(vehicle_ids.begin(), vehicle_ids.end());

    std::vector<ParkingSession> result;
    {
        std::lock_guard<std::mutex> guard(mu_);
        for (const auto& kv : sessions_) {
            if (wanted.find(kv.second.vehicle_id) != wanted.end()) {
                result.push_back(kv.second);
            }
        }
    }
    std::sort(result.begin(), result.end(), [](const ParkingSession& a, const ParkingSession& b) {
        if (a.start_time != b.start_time) return a.start_time > b.start_time;
        return a.id > b.id;
    });
    return result;
}

} // namespace parking
