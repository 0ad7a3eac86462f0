#include "slot_types.hpp"

#include <ctime>

namespace parking {

std::string to_string(SlotStatus status) {
    switch (status) {
        case SlotStatus::Available: return "available";
        case SlotStatus::Occupied: return "occupied";
        case SlotStatus::Reserved: return "reserved";
        case SlotStatus::Unavailable: return "unavailable";
    }
    return "unknown";
}

std::string to_string(BookingStatus status) {
    switch (status) {
        case BookingStatus::Initiated: return "initiated";
        case BookingStatus::Locked: return "locked";
        case BookingStatus::Confirmed: return "confirmed";
        case BookingStatus::Expired: return "expired";
        case BookingStatus::Canceled: return "canceled";
    }
    return "unknown";
}

std::string to_string(SessionStatus status) {
    switch (status) {
        case SessionStatus::Active: return "active";
        case SessionStatus::Completed: return "completed";
        case SessionStatus::Canceled: return "canceled";
    }
    return "unknown";
}

bool try_parse_slot_status(const std::string& text, SlotStatus& out) {
    if (text == "available") { out = SlotStatus::Available; return true; }
    if (text == "occupied") { out = SlotStatus::Occupied; return true; }
    if (text == "reserved") { out = SlotStatus::Reserved; return true; }
    if (text == "unavailable") { out = SlotStatus::Unavailable; return true; }
    return false;
}

bool try_parse_booking_status(const std::string& text, BookingStatus& out) {
    if (text == "initiated") { out = BookingStatus::Initiated; return true; }
    if (text == "locked") { out = BookingStatus::Locked; return true; }
    if (text == "confirmed") { out = BookingStatus::Confirmed; return true; }
    if (text == "expired") { out = BookingStatus::Expired; return true; }
    if (text == "canceled") { out = BookingStatus::Canceled; return true; }
    return false;
}

bool try_parse_session_status(const std::string& text, SessionStatus& out) {
    if (text == "active") { out = SessionStatus::Active; return true; }
    if (text == "completed") { out = SessionStatus::Completed; return true; }
    if (text == "canceled") { out = SessionStatus::Canceled; return true; }
    return false;
}

bool is_non_terminal(BookingStatus status) {
    return status == BookingStatus::Initiated
        || status == BookingStatus::Locked
        || status == BookingStatus::Confirmed;
}

bool is_pending(BookingStatus status) {
    return status == BookingStatus::Initiated || status == BookingStatus::Locked;
}

bool is_sensor_mutable(SlotStatus status) {
    return status == SlotStatus::Available || status == SlotStatus::Occupied;
}

std::string format_iso8601(TimePoint tp) {
    const std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm utc{};
    gmtime_r(&t, &utc);

    char buf[32];
    const std::size_t n = std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &utc);
    return std::string(buf, n);
}

TimePoint::duration time_of_day_utc(TimePoint tp) {
    const TimePoint::duration day = std::chrono::hours(24);
    TimePoint::duration since_midnight = tp.time_since_epoch() % day;
    if (since_midnight < TimePoint::duration::zero()) since_midnight += day; // instants before the epoch
    return since_midnight;
}

bool ParkingLot::is_open_at(TimePoint tp) const {
    if (!is_open) return false;

    const TimePoint::duration now = time_of_day_utc(tp);
    const TimePoint::duration open = std::chrono::minutes(open_minute);
    const TimePoint::duration close = std::chrono::minutes(close_minute);
    if (open <= close) {
        return open <= now && now <= close;
    }
    // Overnight window, e.g. 22:00 - 06:00
    return now >= open || now <= close;
}

std::optional<BookingId> ParkingSession::booking_id() const {
    if (const auto* booked = std::get_if<BookedSession>(&origin)) {
        return booked->booking_id;
    }
    return std::nullopt;
}

} // namespace parking
