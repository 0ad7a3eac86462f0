#include "occupancy_reconciler.hpp"

#include <algorithm>
#include <cmath>

#include "logging.hpp"
#include "plate_normalizer.hpp"

namespace parking {

namespace {

constexpr double kEdgeEpsilon = 1e-9;

// True if p lies on segment a-b (within kEdgeEpsilon).
bool on_segment(Point a, Point b, Point p) {
    const double cross = (b.x - a.x) * (p.y - a.y) - (b.y - a.y) * (p.x - a.x);
    if (std::fabs(cross) > kEdgeEpsilon) return false;
    return p.x >= std::min(a.x, b.x) - kEdgeEpsilon && p.x <= std::max(a.x, b.x) + kEdgeEpsilon
        && p.y >= std::min(a.y, b.y) - kEdgeEpsilon && p.y <= std::max(a.y, b.y) + kEdgeEpsilon;
}

} // namespace

OccupancyReconciler::OccupancyReconciler(ParkingRepository& repo,
                                         StatusPublisher& publisher,
                                         TransitionHandler* handler,
                                         Thresholds thresholds)
    : repo_(repo),
      publisher_(publisher),
      handler_(handler),
      thresholds_(thresholds),
      logger_(get_logger("occupancy")) {}

bool OccupancyReconciler::contains(const std::vector<Point>& polygon, Point p) {
    if (polygon.size() < 3) return false;

    bool inside = false;
    for (std::size_t i = 0, j = polygon.size() - 1; i < polygon.size(); j = i++) {
        const Point a = polygon[i];
        const Point b = polygon[j];
        if (on_segment(a, b, p)) return true;

        const bool crosses = ((a.y > p.y) != (b.y > p.y))
            && (p.x < (b.x - a.x) * (p.y - a.y) / (b.y - a.y) + a.x);
        if (crosses) inside = !inside;
    }
    return inside;
}

void OccupancyReconciler::register_slot(const Slot& slot) {
    SlotTrackState state;
    state.slot_id = slot.id;
    state.lot_id = slot.lot_id;
    state.polygon = slot.polygon;
    state.status = slot.status;
    state.last_published_status = slot.status;

    std::lock_guard<std::mutex> guard(mu_);
    slots_[slot.id] = state;
    slot_plates_.erase(slot.id);
}

void OccupancyReconciler::remember_plates_locked(const std::vector<TrackedVehicle>& vehicles) {
    for (const auto& v : vehicles) {
        if (!v.plate_text) continue;
        const std::string text = PlateNormalizer::clean_ocr_text(*v.plate_text);
        if (text.empty()) continue;

        const double confidence = v.confidence.value_or(0.0);
        auto it = best_plates_.find(v.track_id);
        if (it == best_plates_.end() || confidence > it->second.confidence) {
            best_plates_[v.track_id] = PlateReading{text, confidence};
        }
    }
}

bool OccupancyReconciler::publish_transition_locked(SlotTrackState& state, TimePoint observed_at, SlotTransition& out) {
    if (repo_.update_slot_status(state.slot_id, state.last_published_status, state.status, observed_at)) {
        out.slot_id = state.slot_id;
        out.lot_id = state.lot_id;
        out.old_status = state.last_published_status;
        out.new_status = state.status;
        out.observed_at = observed_at;
        auto plate = slot_plates_.find(state.slot_id);
        if (plate != slot_plates_.end()) {
            out.plate = plate->second;
        }
        state.last_published_status = state.status;
        return true;
    }

    // Someone else owns the stored status now: adopt it instead of overwriting
    Slot stored;
    if (!repo_.find_slot(state.slot_id, stored)) {
        logger_->error("Slot {} missing from repository; dropping {} transition",
                       state.slot_id, to_string(state.status));
        state.last_published_status = state.status;
        return false;
    }

    logger_->info("Slot {} is {} in storage; sensor {} not applied",
                  state.slot_id, to_string(stored.status), to_string(state.status));
    state.status = stored.status;
    state.last_published_status = stored.status;
    state.occupied_count = 0;
    state.empty_count = 0;
    return false;
}

std::vector<SlotTransition> OccupancyReconciler::process_frame(const std::vector<TrackedVehicle>& vehicles,
                                                               TimePoint observed_at) {
    std::vector<SlotTransition> transitions;
    {
        std::lock_guard<std::mutex> guard(mu_);
        remember_plates_locked(vehicles);

        for (auto& kv : slots_) {
            SlotTrackState& state = kv.second;
            if (!is_sensor_mutable(state.last_published_status)) continue;

            // First vehicle whose centroid falls inside the polygon
            const TrackedVehicle* inside = nullptr;
            for (const auto& v : vehicles) {
                if (contains(state.polygon, v.centroid)) {
                    inside = &v;
                    break;
                }
            }

            if (inside) {
                auto best = best_plates_.find(inside->track_id);
                if (best != best_plates_.end()) {
                    slot_plates_[state.slot_id] = best->second.text;
                }
                state.occupied_count++;
                state.empty_count = 0;
                if (state.status != SlotStatus::Occupied && state.occupied_count >= thresholds_.occupied_frames) {
                    state.status = SlotStatus::Occupied;
                }
            } else {
                state.empty_count++;
                state.occupied_count = 0;
                slot_plates_.erase(state.slot_id);
                if (state.status != SlotStatus::Available && state.empty_count >= thresholds_.empty_frames) {
                    state.status = SlotStatus::Available;
                }
            }

            logger_->trace("Slot {} occupied_count={} empty_count={}",
                           state.slot_id, state.occupied_count, state.empty_count);

            if (state.status != state.last_published_status) {
                SlotTransition t;
                if (publish_transition_locked(state, observed_at, t)) {
                    transitions.push_back(t);
                }
            }
        }
    }

    // Fan out without holding the reconciler lock
    for (const auto& t : transitions) {
        logger_->info("Slot {} {} -> {}{}", t.slot_id, to_string(t.old_status), to_string(t.new_status),
                      t.plate ? " (plate " + *t.plate + ")" : std::string());
        publisher_.publish(SlotStatusEvent{t.slot_id, t.lot_id, t.new_status, t.observed_at});
        if (handler_) {
            handler_->on_transition(t);
        }
    }
    return transitions;
}

bool OccupancyReconciler::reset_slot(SlotId slot_id, SlotStatus expected, SlotStatus baseline, TimePoint at) {
    if (!is_sensor_mutable(baseline)) return false;

    std::lock_guard<std::mutex> guard(mu_);
    auto it = slots_.find(slot_id);
    if (it == slots_.end()) return false;

    if (expected == baseline) {
        Slot stored;
        if (!repo_.find_slot(slot_id, stored) || stored.status != expected) return false;
    } else if (!repo_.update_slot_status(slot_id, expected, baseline, at)) {
        logger_->warn("Slot {} is no longer {}; not reset to {}", slot_id, to_string(expected), to_string(baseline));
        return false;
    }

    SlotTrackState& state = it->second;
    state.status = baseline;
    state.last_published_status = baseline;
    state.occupied_count = 0;
    state.empty_count = 0;
    slot_plates_.erase(slot_id);

    logger_->info("Slot {} reset to {} for occupancy tracking", slot_id, to_string(baseline));
    return true;
}

void OccupancyReconciler::resync() {
    std::lock_guard<std::mutex> guard(mu_);
    for (auto& kv : slots_) {
        Slot stored;
        if (!repo_.find_slot(kv.first, stored)) continue;
        if (stored.status == kv.second.last_published_status) continue;

        kv.second.status = stored.status;
        kv.second.last_published_status = stored.status;
        kv.second.occupied_count = 0;
        kv.second.empty_count = 0;
    }
}

bool OccupancyReconciler::slot_state(SlotId slot_id, SlotTrackState& out) const {
    std::lock_guard<std::mutex> guard(mu_);
    auto it = slots_.find(slot_id);
    if (it == slots_.end()) return false;
    out = it->second;
    return true;
}

std::optional<std::string> OccupancyReconciler::best_plate(std::int64_t track_id) const {
    std::lock_guard<std::mutex> guard(mu_);
    auto it = best_plates_.find(track_id);
    if (it == best_plates_.end()) return std::nullopt;
    return it->second.text;
}

} // namespace parking
