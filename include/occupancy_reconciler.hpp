#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <spdlog/spdlog.h>

#include "parking_repository.hpp"
#include "slot_types.hpp"
#include "status_publisher.hpp"

/**
 * @file occupancy_reconciler.hpp
 * @brief Turns per-frame vehicle detections into debounced slot status changes.
 *
 * Input is the vision oracle's output contract only: for each frame, the
 * tracked vehicles with their centroid and (optionally) a plate reading.
 * Detection, tracking and OCR themselves happen elsewhere.
 */

namespace parking {

/**
 * @brief One vehicle as reported by the vision oracle for one frame.
 */
struct TrackedVehicle {
    Point centroid{0.0, 0.0};
    std::int64_t track_id = 0;
    std::optional<std::string> plate_text; /**< Raw OCR text, if a plate was read this frame. */
    std::optional<double> confidence;      /**< OCR confidence for plate_text. */
};

/**
 * @brief A published slot status flip, handed to the session lifecycle.
 */
struct SlotTransition {
    SlotId slot_id = 0;
    LotId lot_id = 0;
    SlotStatus old_status = SlotStatus::Available;
    SlotStatus new_status = SlotStatus::Available;
    std::optional<std::string> plate; /**< Best plate of the vehicle inside the slot, if known. */
    TimePoint observed_at{};
};

/**
 * @brief Receiver of slot transitions (implemented by SessionManager).
 *
 * Called synchronously from OccupancyReconciler::process_frame; implementations
 * must not call back into the reconciler.
 */
class TransitionHandler {
public:
    virtual ~TransitionHandler() = default;
    virtual void on_transition(const SlotTransition& transition) = 0;
};

/**
 * @brief Hysteresis-filtered occupancy state machine, one entry per slot.
 *
 * @details
 * For every slot whose last published status is available or occupied:
 * - a frame with a vehicle centroid inside the polygon increments
 *   occupied_count and resets empty_count; at the threshold the status
 *   becomes occupied
 * - a frame without one does the opposite; at the threshold the status
 *   becomes available
 * When the status differs from the last published one, the reconciler
 * writes it (conditional on the last published status), publishes a
 * SlotStatusEvent and hands a SlotTransition to the handler.
 *
 * Slots published as reserved or unavailable are left alone: those statuses
 * belong to the booking side and the operator. If a conditional write finds
 * the stored status moved (for example a booking reserved the slot), the
 * reconciler adopts the stored status and emits nothing.
 *
 * ### Threading
 * Frames are expected sequentially (one camera stream). An internal mutex
 * makes reset_slot / slot_state safe to call from other threads.
 */
class OccupancyReconciler {
public:
    struct Thresholds {
        int occupied_frames = 3;
        int empty_frames = 3;
    };

    /** @brief Per-slot tracking state. */
    struct SlotTrackState {
        SlotId slot_id = 0;                                        /**< Tracked slot. */
        LotId lot_id = 0;                                          /**< Lot the slot belongs to. */
        std::vector<Point> polygon;                                /**< Slot outline in frame coordinates. */
        SlotStatus status = SlotStatus::Available;                 /**< Debounced status. */
        SlotStatus last_published_status = SlotStatus::Available;  /**< Last status written and published. */
        int occupied_count = 0;                                    /**< Consecutive frames with a vehicle inside. */
        int empty_count = 0;                                       /**< Consecutive frames without one. */
    };

    OccupancyReconciler(ParkingRepository& repo,
                        StatusPublisher& publisher,
                        TransitionHandler* handler,
                        Thresholds thresholds);

    /** @brief Starts (or restarts) tracking a slot from its stored status. */
    void register_slot(const Slot& slot);

    /**
     * @brief Processes one frame.
     *
     * @param vehicles Tracked vehicles visible in the frame.
     * @param observed_at Frame timestamp; stored on slot writes and events.
     * @return Transitions emitted by this frame, in slot id order.
     */
    std::vector<SlotTransition> process_frame(const std::vector<TrackedVehicle>& vehicles, TimePoint observed_at);

    /**
     * @brief Puts a slot back into occupancy tracking at @p baseline.
     *
     * Used when a reserved car is allowed to arrive: the stored status is moved
     * from @p expected to the baseline and the counters are cleared. The write
     * is conditional; any other stored status is left untouched.
     *
     * @param expected Status the slot must currently hold.
     * @param baseline available or occupied.
     * @return False if the slot is unknown, the baseline is not trackable, or
     *         the stored status is not @p expected.
     */
    bool reset_slot(SlotId slot_id, SlotStatus expected, SlotStatus baseline, TimePoint at);

    /** @brief Re-reads every tracked slot's status from the repository. */
    void resync();

    bool slot_state(SlotId slot_id, SlotTrackState& out) const;

    /** @brief Highest-confidence plate read so far for a track, if any. */
    std::optional<std::string> best_plate(std::int64_t track_id) const;

    /**
     * @brief Point-in-polygon test (ray casting); points on an edge count as inside.
     */
    static bool contains(const std::vector<Point>& polygon, Point p);

private:
    struct PlateReading {
        std::string text;  /**< Normalized plate text. */
        double confidence; /**< OCR confidence of the reading. */
    };

    ParkingRepository& repo_;
    StatusPublisher& publisher_;
    TransitionHandler* handler_;
    Thresholds thresholds_;
    std::shared_ptr<spdlog::logger> logger_;

    mutable std::mutex mu_;
    std::map<SlotId, SlotTrackState> slots_;
    std::unordered_map<std::int64_t, PlateReading> best_plates_;
    std::unordered_map<SlotId, std::string> slot_plates_;

    // Caller holds mu_.
    void remember_plates_locked(const std::vector<TrackedVehicle>& vehicles);
    bool publish_transition_locked(SlotTrackState& state, TimePoint observed_at, SlotTransition& out);
};

} // namespace parking
