#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

/**
 * @file slot_types.hpp
 * @brief Domain types shared by the reservation and occupancy engine.
 *
 * This header defines:
 * - identifier aliases (slots, lots, bookings, sessions, vehicles, requesters)
 * - status enums together with their wire names
 * - records: ParkingLot, Slot, Vehicle, Booking, ParkingSession
 *
 * All timestamps are UTC wall-clock instants (std::chrono::system_clock).
 */

namespace parking {

using SlotId = std::int64_t;
using LotId = std::int64_t;
using BookingId = std::int64_t;
using SessionId = std::int64_t;
using VehicleId = std::int64_t;
using RequesterId = std::int64_t;

using TimePoint = std::chrono::system_clock::time_point;

/**
 * @brief Status of a physical slot.
 *
 * available/reserved are driven by bookings, available/occupied by sensing.
 * unavailable is set by the lot operator and is never touched by the engine.
 */
enum class SlotStatus { Available, Occupied, Reserved, Unavailable };

/**
 * @brief Booking lifecycle state.
 *
 * Initiated, Locked and Confirmed are non-terminal: at most one booking per
 * slot may be in one of them at any time.
 */
enum class BookingStatus { Initiated, Locked, Confirmed, Expired, Canceled };

enum class SessionStatus { Active, Completed, Canceled };

/** @brief Wire name of a slot status ("available", "occupied", ...). */
std::string to_string(SlotStatus status);
/** @brief Wire name of a booking status ("initiated", "locked", ...). */
std::string to_string(BookingStatus status);
/** @brief Wire name of a session status ("active", "completed", "canceled"). */
std::string to_string(SessionStatus status);

/**
 * @brief Parses a slot status wire name.
 * @param text Wire value, case-sensitive.
 * @param out Parsed status on success.
 * @return True if @p text is a known slot status.
 */
bool try_parse_slot_status(const std::string& text, SlotStatus& out);
bool try_parse_booking_status(const std::string& text, BookingStatus& out);
bool try_parse_session_status(const std::string& text, SessionStatus& out);

/** @brief True for Initiated, Locked and Confirmed. */
bool is_non_terminal(BookingStatus status);

/** @brief True for Initiated and Locked (the states that carry an expiry). */
bool is_pending(BookingStatus status);

/** @brief True for the statuses the vision pipeline may overwrite. */
bool is_sensor_mutable(SlotStatus status);

/**
 * @brief Formats an instant as ISO-8601 UTC with second precision.
 *
 * Example: "2024-05-01T09:30:00Z".
 */
std::string format_iso8601(TimePoint tp);

/** @brief Time elapsed since 00:00 UTC on the day of @p tp, at full clock precision. */
TimePoint::duration time_of_day_utc(TimePoint tp);

/** @brief A point in image (or map) coordinates. */
struct Point {
    double x;
    double y;
};

/**
 * @brief A parking lot: pricing and operating window.
 */
struct ParkingLot {
    LotId id = 0;
    std::string name;
    double price_per_hour = 0.0;
    int open_minute = 0;            /**< Opening time, minutes since midnight UTC. */
    int close_minute = 24 * 60 - 1; /**< Closing time, minutes since midnight UTC. */
    bool is_open = true;            /**< Operator switch; false closes the lot outright. */

    /**
     * @brief Checks whether the lot accepts reservations at @p tp.
     *
     * @details
     * Both window edges are inclusive and compared at full clock precision,
     * so 23:00:30 is outside a window closing at 23:00. A window with
     * close < open wraps past midnight (e.g. 22:00 - 06:00).
     */
    bool is_open_at(TimePoint tp) const;
};

/**
 * @brief A single physical parking space.
 */
struct Slot {
    SlotId id = 0;
    LotId lot_id = 0;
    std::string label;
    std::vector<Point> polygon;   /**< Geofence used for containment only. */
    SlotStatus status = SlotStatus::Available;
    TimePoint last_updated_at{};
};

/**
 * @brief A registered vehicle; the identity directory entry for a plate.
 */
struct Vehicle {
    VehicleId id = 0;
    RequesterId owner_id = 0;
    std::string license_plate; /**< Normalized plate. */
};

/**
 * @brief A driver's reservation of one slot.
 */
struct Booking {
    BookingId id = 0;
    RequesterId requester_id = 0;
    SlotId slot_id = 0;
    LotId lot_id = 0;
    std::string license_plate; /**< Normalized plate. */
    BookingStatus status = BookingStatus::Initiated;
    TimePoint booked_at{};
    std::optional<TimePoint> expires_at;   /**< Set only while Initiated/Locked. */
    std::optional<TimePoint> confirmed_at;
    std::optional<TimePoint> canceled_at;
    std::string cancel_reason;
};

/** @brief Session opened against a confirmed booking. */
struct BookedSession {
    BookingId booking_id;
};

/** @brief Session with no reservation behind it. */
struct WalkInSession {};

using SessionOrigin = std::variant<BookedSession, WalkInSession>;

/**
 * @brief One stay of a vehicle in a slot, from verified arrival to departure.
 */
struct ParkingSession {
    SessionId id = 0;
    SessionOrigin origin = WalkInSession{};
    VehicleId vehicle_id = 0;
    std::string license_plate;
    SlotId slot_id = 0;
    LotId lot_id = 0;
    SessionStatus status = SessionStatus::Active;
    TimePoint start_time{};
    std::optional<TimePoint> end_time;
    std::optional<double> total_duration_minutes;
    std::optional<double> parking_cost;

    bool is_walk_in() const { return std::holds_alternative<WalkInSession>(origin); }

    /** @brief Booking id for a booked session, std::nullopt for a walk-in. */
    std::optional<BookingId> booking_id() const;
};

} // namespace parking
