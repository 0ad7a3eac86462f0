#include "booking_service.hpp"

#include <exception>

#include "logging.hpp"
#include "plate_normalizer.hpp"

namespace parking {

BookingService::BookingService(ParkingRepository& repo, SlotLock& lock, const Clock& clock)
    : repo_(repo), lock_(lock), clock_(clock), logger_(get_logger("booking")) {}

ErrorCode BookingService::validate_request(RequesterId requester_id,
                                           const std::string& normalized_plate,
                                           SlotId slot_id,
                                           Slot& out_slot,
                                           ParkingLot& out_lot,
                                           std::string& out_error) const {
    out_error.clear();

    Vehicle vehicle;
    if (!repo_.find_vehicle_for_owner(requester_id, normalized_plate, vehicle)) {
        out_error = "Vehicle with license plate '" + normalized_plate + "' not found or does not belong to driver";
        return ErrorCode::NotFound;
    }

    if (!repo_.find_slot(slot_id, out_slot)) {
        out_error = "Parking slot not found";
        return ErrorCode::NotFound;
    }

    if (out_slot.status != SlotStatus::Available && out_slot.status != SlotStatus::Reserved) {
        out_error = "Parking slot is not available (status: " + to_string(out_slot.status) + ")";
        return ErrorCode::Conflict;
    }

    if (!repo_.find_lot(out_slot.lot_id, out_lot)) {
        out_error = "Parking lot not found";
        return ErrorCode::NotFound;
    }

    if (!out_lot.is_open_at(clock_.now())) {
        out_error = "Parking lot is closed";
        return ErrorCode::ClosedLot;
    }

    Booking existing;
    if (repo_.find_non_terminal_booking(slot_id, existing)) {
        out_error = "Slot is already booked or locked by another driver";
        return ErrorCode::Conflict;
    }

    return ErrorCode::None;
}

BookingResult BookingService::initiate(RequesterId requester_id, const std::string& license_plate, SlotId slot_id) {
    const std::string plate = PlateNormalizer::normalize(license_plate);
    if (plate.empty()) {
        return BookingResult::fail(ErrorCode::InvalidArgument, "License plate is required");
    }

    // Step 1: lock (single non-blocking attempt)
    const LockOutcome outcome = lock_.acquire(slot_id, requester_id);
    if (outcome == LockOutcome::Contended) {
        return BookingResult::fail(ErrorCode::LockContention,
                                   "Slot is temporarily locked by another driver. Please try again.");
    }
    const bool degraded = (outcome == LockOutcome::Degraded);

    // Step 2: validate
    Slot slot;
    ParkingLot lot;
    std::string err;
    const ErrorCode code = validate_request(requester_id, plate, slot_id, slot, lot, err);
    if (code != ErrorCode::None) {
        lock_.release(slot_id);
        BookingResult r = BookingResult::fail(code, err);
        r.lock_degraded = degraded;
        return r;
    }

    // Step 3: create the booking; the storage constraint rejects a racing loser
    const TimePoint now = clock_.now();
    Booking booking;
    booking.requester_id = requester_id;
    booking.slot_id = slot_id;
    booking.lot_id = lot.id;
    booking.license_plate = plate;
    booking.status = BookingStatus::Initiated;
    booking.booked_at = now;
    booking.expires_at = now + lock_.ttl();

    Booking stored;
    if (!repo_.insert_booking(booking, stored)) {
        lock_.release(slot_id);
        BookingResult r = BookingResult::fail(ErrorCode::Conflict, "Slot is already booked or locked by another driver");
        r.lock_degraded = degraded;
        return r;
    }

    logger_->info("Booking {} initiated for slot {} by driver {}", stored.id, slot_id, requester_id);

    BookingResult r = BookingResult::ok(stored, "Booking initiated");
    r.lock_degraded = degraded;
    return r;
}

void BookingService::cancel_pending(const Booking& booking, const std::string& reason) {
    Booking canceled = booking;
    canceled.status = BookingStatus::Canceled;
    canceled.canceled_at = clock_.now();
    canceled.expires_at.reset();
    canceled.cancel_reason = reason;
    if (!repo_.update_booking(canceled, booking.status)) {
        logger_->warn("Booking {} changed concurrently while canceling", booking.id);
    }
}

Booking BookingService::reload(const Booking& fallback) const {
    Booking current;
    if (!repo_.find_booking(fallback.id, current)) {
        logger_->error("Booking {} disappeared from the repository", fallback.id);
        return fallback;
    }
    return current;
}

void BookingService::release_reserved_slot(SlotId slot_id) {
    Slot slot;
    if (!repo_.find_slot(slot_id, slot) || slot.status != SlotStatus::Reserved) return;

    // Another confirmed booking still owns the reservation
    if (!repo_.bookings_for_slot(slot_id, BookingStatus::Confirmed).empty()) return;

    if (!repo_.update_slot_status(slot_id, SlotStatus::Reserved, SlotStatus::Available, clock_.now())) {
        logger_->warn("Slot {} changed concurrently; not reverting reservation", slot_id);
    }
}

BookingResult BookingService::confirm(RequesterId requester_id, BookingId booking_id) {
    Booking booking;
    if (!repo_.find_booking(booking_id, booking)) {
        return BookingResult::fail(ErrorCode::NotFound, "Booking not found");
    }
    if (booking.requester_id != requester_id) {
        return BookingResult::fail(ErrorCode::Forbidden, "Booking does not belong to driver");
    }
    if (!is_pending(booking.status)) {
        BookingResult r = BookingResult::fail(ErrorCode::Conflict,
                                              "Cannot confirm booking in status: " + to_string(booking.status));
        r.booking = booking;
        return r;
    }

    const SlotId slot_id = booking.slot_id;
    const TimePoint now = clock_.now();

    // Reservation window elapsed
    if (booking.expires_at && *booking.expires_at < now) {
        Booking expired = booking;
        expired.status = BookingStatus::Expired;
        expired.expires_at.reset();
        if (!repo_.update_booking(expired, booking.status)) {
            // The sweeper got there first; report whatever is stored now
            expired = reload(booking);
        }
        lock_.release(slot_id);
        logger_->info("Booking {} expired before confirmation", booking_id);

        BookingResult r = BookingResult::fail(ErrorCode::Gone,
                                              "Booking lock has expired. Please initiate a new booking.");
        r.booking = expired;
        return r;
    }

    // Re-validate the slot (sweeper, walk-in detection or operator may have moved it)
    Slot slot;
    if (!repo_.find_slot(slot_id, slot)) {
        lock_.release(slot_id);
        return BookingResult::fail(ErrorCode::NotFound, "Parking slot not found");
    }

    const std::string unavailable_msg = "Slot is no longer available (status: " + to_string(slot.status) + ")";
    if ((slot.status != SlotStatus::Available && slot.status != SlotStatus::Reserved)
        || !repo_.update_slot_status(slot_id, slot.status, SlotStatus::Reserved, now)) {
        cancel_pending(booking, "slot no longer available");
        lock_.release(slot_id);
        logger_->info("Booking {} canceled on confirm: {}", booking_id, unavailable_msg);

        BookingResult r = BookingResult::fail(ErrorCode::Conflict, unavailable_msg);
        r.booking = reload(booking);
        return r;
    }

    Booking confirmed = booking;
    confirmed.status = BookingStatus::Confirmed;
    confirmed.confirmed_at = now;
    confirmed.expires_at.reset();

    if (!repo_.update_booking(confirmed, booking.status)) {
        // Lost a race with the sweeper or a cancel: undo the reservation
        if (!repo_.update_slot_status(slot_id, SlotStatus::Reserved, slot.status, now)) {
            logger_->warn("Slot {} changed concurrently; reservation not reverted", slot_id);
        }
        lock_.release(slot_id);

        const Booking current = reload(booking);
        const ErrorCode code = current.status == BookingStatus::Expired ? ErrorCode::Gone : ErrorCode::Conflict;
        BookingResult r = BookingResult::fail(code, "Booking changed concurrently (status: " + to_string(current.status) + ")");
        r.booking = current;
        return r;
    }

    // Booking is now the system of record; the lock's job is done
    lock_.release(slot_id);
    logger_->info("Booking {} confirmed for slot {}", booking_id, slot_id);
    return BookingResult::ok(confirmed, "Booking confirmed");
}

BookingResult BookingService::cancel(RequesterId requester_id, BookingId booking_id, const std::string& reason) {
    Booking booking;
    if (!repo_.find_booking(booking_id, booking)) {
        return BookingResult::fail(ErrorCode::NotFound, "Booking not found");
    }
    if (booking.requester_id != requester_id) {
        return BookingResult::fail(ErrorCode::Forbidden, "Booking does not belong to driver");
    }

    // Idempotent for terminal states
    if (booking.status == BookingStatus::Expired || booking.status == BookingStatus::Canceled) {
        return BookingResult::ok(booking, "Booking already " + to_string(booking.status));
    }

    Booking canceled = booking;
    canceled.status = BookingStatus::Canceled;
    canceled.canceled_at = clock_.now();
    canceled.expires_at.reset();
    canceled.cancel_reason = reason;

    if (!repo_.update_booking(canceled, booking.status)) {
        const Booking current = reload(booking);
        if (current.status == BookingStatus::Expired || current.status == BookingStatus::Canceled) {
            return BookingResult::ok(current, "Booking already " + to_string(current.status));
        }
        BookingResult r = BookingResult::fail(ErrorCode::Conflict, "Booking changed concurrently");
        r.booking = current;
        return r;
    }

    if (booking.status == BookingStatus::Confirmed) {
        release_reserved_slot(booking.slot_id);
    }
    lock_.release(booking.slot_id);

    logger_->info("Booking {} canceled by driver {}", booking_id, requester_id);
    return BookingResult::ok(canceled, "Booking canceled");
}

int BookingService::expire_stale() {
    const TimePoint now = clock_.now();
    const std::vector<Booking> stale = repo_.expired_pending_bookings(now);

    int count = 0;
    for (const auto& booking : stale) {
        try {
            Booking expired = booking;
            expired.status = BookingStatus::Expired;
            expired.expires_at.reset();

            if (!repo_.update_booking(expired, booking.status)) {
                // Confirmed or canceled since the scan; nothing to clean up
                logger_->error("Error cleaning up booking {}: status changed concurrently", booking.id);
                continue;
            }

            release_reserved_slot(booking.slot_id);
            lock_.release(booking.slot_id);

            logger_->info("Booking {} expired (slot {})", booking.id, booking.slot_id);
            ++count;
        } catch (const std::exception& e) {
            logger_->error("Error cleaning up booking {}: {}", booking.id, e.what());
        }
    }
    return count;
}

BookingResult BookingService::get_booking(RequesterId requester_id, BookingId booking_id) const {
    Booking booking;
    if (!repo_.find_booking(booking_id, booking)) {
        return BookingResult::fail(ErrorCode::NotFound, "Booking not found");
    }
    if (booking.requester_id != requester_id) {
        return BookingResult::fail(ErrorCode::Forbidden, "Booking does not belong to driver");
    }
    return BookingResult::ok(booking, "OK");
}

std::vector<Booking> BookingService::list_bookings(RequesterId requester_id,
                                                   std::optional<BookingStatus> status_filter) const {
    std::vector<Booking> all = repo_.bookings_of(requester_id);
    if (!status_filter) return all;

    std::vector<Booking> result;
    for (const auto& b : all) {
        if (b.status == *status_filter) {
            result.push_back(b);
        }
    }
    return result;
}

} // namespace parking
