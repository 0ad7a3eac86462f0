#pragma once

#include <string>
#include <utility>

#include "slot_types.hpp"

/**
 * @file engine_result.hpp
 * @brief Result types returned by the booking and session APIs.
 *
 * Operations never throw across the public API; they return a result struct
 * carrying a success flag, an error code and a human-readable message
 * (useful for the CLI and for tests).
 */

namespace parking {

/**
 * @brief Error taxonomy of the engine.
 *
 * - LockContention: the slot is momentarily locked by another request (retryable).
 * - NotFound: slot, lot, vehicle, booking or session absent.
 * - Conflict: slot not in an acceptable state, or a non-terminal booking exists.
 * - Gone: the reservation window elapsed; the caller must initiate again.
 * - ClosedLot: the lot is outside its operating hours (retryable later).
 * - Forbidden: the record belongs to someone else.
 * - InvalidArgument: malformed request (e.g. empty plate).
 */
enum class ErrorCode {
    None,
    LockContention,
    NotFound,
    Conflict,
    Gone,
    ClosedLot,
    Forbidden,
    InvalidArgument
};

/** @brief Stable name of an error code ("lock_contention", "gone", ...). */
std::string to_string(ErrorCode code);

/**
 * @brief True if the same request may succeed if simply retried later.
 *
 * Gone, NotFound and Conflict require the caller to restart the reservation
 * flow from scratch instead.
 */
bool is_retryable(ErrorCode code);

/**
 * @brief Result of a booking operation.
 */
struct BookingResult {
    bool success = false;       /**< True if the operation took effect (or was an idempotent no-op). */
    ErrorCode error = ErrorCode::None;
    std::string message;        /**< Human-readable result description. */
    Booking booking;            /**< Booking state after the operation, when one was loaded. */
    bool lock_degraded = false; /**< Set when the lock store was unreachable and the request ran without mutual exclusion. */

    static BookingResult ok(const Booking& b, std::string msg) {
        BookingResult r;
        r.success = true;
        r.booking = b;
        r.message = std::move(msg);
        return r;
    }

    static BookingResult fail(ErrorCode code, std::string msg) {
        BookingResult r;
        r.error = code;
        r.message = std::move(msg);
        return r;
    }
};

/**
 * @brief Result of a session query.
 */
struct SessionResult {
    bool success = false;
    ErrorCode error = ErrorCode::None;
    std::string message;
    ParkingSession session;

    static SessionResult ok(const ParkingSession& s) {
        SessionResult r;
        r.success = true;
        r.session = s;
        return r;
    }

    static SessionResult fail(ErrorCode code, std::string msg) {
        SessionResult r;
        r.error = code;
        r.message = std::move(msg);
        return r;
    }
};

} // namespace parking
