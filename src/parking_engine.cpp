#include "parking_engine.hpp"

#include "logging.hpp"

namespace parking {

namespace {

OccupancyReconciler::Thresholds thresholds_of(const EngineConfig& config) {
    OccupancyReconciler::Thresholds t;
    t.occupied_frames = config.occupied_frame_threshold;
    t.empty_frames = config.empty_frame_threshold;
    return t;
}

} // namespace

ParkingEngine::ParkingEngine(const EngineConfig& config, const Clock& clock)
    : clock_(clock),
      owned_store_(std::make_unique<MemoryKeyValueStore>(clock)),
      store_(*owned_store_),
      lock_(store_, config.lock_ttl),
      bus_(config.availability_channel),
      sessions_(repo_, clock_),
      reconciler_(repo_, bus_, &sessions_, thresholds_of(config)),
      bookings_(repo_, lock_, clock_),
      sweeper_(bookings_, config.sweep_interval),
      logger_(get_logger("engine")) {
    seed(config);
}

ParkingEngine::ParkingEngine(const EngineConfig& config, const Clock& clock, KeyValueStore& lock_store)
    : clock_(clock),
      store_(lock_store),
      lock_(store_, config.lock_ttl),
      bus_(config.availability_channel),
      sessions_(repo_, clock_),
      reconciler_(repo_, bus_, &sessions_, thresholds_of(config)),
      bookings_(repo_, lock_, clock_),
      sweeper_(bookings_, config.sweep_interval),
      logger_(get_logger("engine")) {
    seed(config);
}

ParkingEngine::~ParkingEngine() {
    sweeper_.stop();
}

void ParkingEngine::seed(const EngineConfig& config) {
    if (!set_log_level(config.log_level)) {
        logger_->warn("Unknown log level '{}', keeping the current level", config.log_level);
    }

    for (const auto& lot : config.lots) repo_.upsert_lot(lot);
    for (const auto& slot : config.slots) repo_.upsert_slot(slot);
    for (const auto& v : config.vehicles) repo_.upsert_vehicle(v);

    const std::vector<Slot> slots = repo_.list_slots();
    availability_.seed(slots);
    bus_.subscribe([this](const SlotStatusEvent& e) { availability_.apply(e); });

    for (const auto& slot : slots) reconciler_.register_slot(slot);

    sweeper_.set_listener([this](int) { publish_booking_changes(); });

    logger_->info("Engine ready: {} lots, {} slots, {} vehicles, lock TTL {}s, channel '{}'",
                  config.lots.size(), slots.size(), config.vehicles.size(),
                  config.lock_ttl.count(), bus_.channel());
}

BookingResult ParkingEngine::initiate(RequesterId requester_id, const std::string& license_plate, SlotId slot_id) {
    return bookings_.initiate(requester_id, license_plate, slot_id);
}

BookingResult ParkingEngine::confirm(RequesterId requester_id, BookingId booking_id) {
    BookingResult r = bookings_.confirm(requester_id, booking_id);
    publish_booking_changes();
    return r;
}

BookingResult ParkingEngine::cancel(RequesterId requester_id, BookingId booking_id, const std::string& reason) {
    BookingResult r = bookings_.cancel(requester_id, booking_id, reason);
    publish_booking_changes();
    return r;
}

BookingResult ParkingEngine::check_in(RequesterId requester_id, BookingId booking_id) {
    BookingResult loaded = bookings_.get_booking(requester_id, booking_id);
    if (!loaded.success) return loaded;

    const Booking& booking = loaded.booking;
    if (booking.status != BookingStatus::Confirmed) {
        return BookingResult::fail(ErrorCode::Conflict,
                                   "Only confirmed bookings can check in (status: " + to_string(booking.status) + ")");
    }

    if (!reconciler_.reset_slot(booking.slot_id, SlotStatus::Reserved, SlotStatus::Available, clock_.now())) {
        return BookingResult::fail(ErrorCode::Conflict, "Slot is not reserved; check-in refused");
    }

    logger_->info("Booking {} checked in; slot {} is tracked for arrival", booking.id, booking.slot_id);
    publish_booking_changes();
    return BookingResult::ok(booking, "Checked in");
}

std::vector<SlotTransition> ParkingEngine::observe(const std::vector<TrackedVehicle>& vehicles) {
    return observe(vehicles, clock_.now());
}

std::vector<SlotTransition> ParkingEngine::observe(const std::vector<TrackedVehicle>& vehicles,
                                                   TimePoint observed_at) {
    return reconciler_.process_frame(vehicles, observed_at);
}

bool ParkingEngine::set_slot_status(SlotId slot_id, SlotStatus status) {
    Slot slot;
    if (!repo_.find_slot(slot_id, slot)) return false;
    if (slot.status == status) return true;

    if (!repo_.update_slot_status(slot_id, slot.status, status, clock_.now())) {
        logger_->warn("Slot {} changed while setting it to {}", slot_id, to_string(status));
        return false;
    }

    logger_->info("Slot {} set to {} by operator", slot_id, to_string(status));
    publish_booking_changes();
    return true;
}

int ParkingEngine::sweep() {
    return sweeper_.sweep_once();
}

void ParkingEngine::start_sweeper() {
    sweeper_.start();
}

void ParkingEngine::stop_sweeper() {
    sweeper_.stop();
}

void ParkingEngine::publish_booking_changes() {
    std::lock_guard<std::mutex> guard(publish_mu_);

    const TimePoint now = clock_.now();
    for (const auto& slot : repo_.list_slots()) {
        SlotStatus known = SlotStatus::Available;
        if (availability_.status_of(slot.id, known) && known == slot.status) continue;

        SlotStatusEvent event;
        event.slot_id = slot.id;
        event.lot_id = slot.lot_id;
        event.status = slot.status;
        event.observed_at = now;
        bus_.publish(event);
    }

    reconciler_.resync();
}

} // namespace parking
