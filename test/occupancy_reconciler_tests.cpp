#include <gtest/gtest.h>

#include "occupancy_reconciler.hpp"
#include "test_support.hpp"

#include <vector>

using parking::OccupancyReconciler;
using parking::ParkingRepository;
using parking::Point;
using parking::Slot;
using parking::SlotStatus;
using parking::SlotTransition;
using parking::TrackedVehicle;

// ---------- Helpers ----------
namespace {

struct RecordingPublisher : parking::StatusPublisher {
    std::vector<parking::SlotStatusEvent> events;
    void publish(const parking::SlotStatusEvent& event) override { events.push_back(event); }
};

struct RecordingHandler : parking::TransitionHandler {
    std::vector<SlotTransition> seen;
    void on_transition(const SlotTransition& t) override { seen.push_back(t); }
};

TrackedVehicle car_in_slot5(const char* plate = nullptr, double confidence = 0.9) {
    TrackedVehicle v;
    v.centroid = parking::testing::center_of(0, 0, 10);
    v.track_id = 7;
    if (plate) {
        v.plate_text = plate;
        v.confidence = confidence;
    }
    return v;
}

struct World {
    ParkingRepository repo;
    RecordingPublisher publisher;
    RecordingHandler handler;
    OccupancyReconciler rec{repo, publisher, &handler, OccupancyReconciler::Thresholds{}};
    parking::TimePoint now = parking::testing::t0();

    World() {
        parking::testing::seed_basic_lot(repo);
        for (const auto& s : repo.list_slots()) rec.register_slot(s);
    }

    std::vector<SlotTransition> frame(const std::vector<TrackedVehicle>& vs) {
        now += std::chrono::seconds(1);
        return rec.process_frame(vs, now);
    }

    SlotStatus stored(parking::SlotId id) const {
        Slot s;
        EXPECT_TRUE(repo.find_slot(id, s));
        return s.status;
    }
};

} // namespace

// ---------- Tests: containment ----------
TEST(PolygonContains, InsideOutsideAndBoundary) {
    const std::vector<Point> sq = parking::testing::square(0, 0, 10);
    EXPECT_TRUE(OccupancyReconciler::contains(sq, Point{5, 5}));
    EXPECT_FALSE(OccupancyReconciler::contains(sq, Point{15, 5}));
    EXPECT_FALSE(OccupancyReconciler::contains(sq, Point{-0.1, 5}));

    // Edges and vertices count as inside
    EXPECT_TRUE(OccupancyReconciler::contains(sq, Point{0, 5}));
    EXPECT_TRUE(OccupancyReconciler::contains(sq, Point{10, 10}));
}

TEST(PolygonContains, ConcaveAndDegenerate) {
    // L-shape: the notch at (7, 7) is outside
    const std::vector<Point> l = {{0, 0}, {10, 0}, {10, 5}, {5, 5}, {5, 10}, {0, 10}};
    EXPECT_TRUE(OccupancyReconciler::contains(l, Point{2, 8}));
    EXPECT_FALSE(OccupancyReconciler::contains(l, Point{7, 7}));

    EXPECT_FALSE(OccupancyReconciler::contains({{0, 0}, {10, 0}}, Point{5, 0}));
}

// ---------- Tests: hysteresis ----------
TEST(Hysteresis, NeedsThreeConsecutiveOccupiedFrames) {
    World w;
    EXPECT_TRUE(w.frame({car_in_slot5()}).empty());
    EXPECT_TRUE(w.frame({car_in_slot5()}).empty());
    EXPECT_EQ(w.stored(5), SlotStatus::Available);

    auto ts = w.frame({car_in_slot5()});
    ASSERT_EQ(ts.size(), 1u);
    EXPECT_EQ(ts[0].slot_id, 5);
    EXPECT_EQ(ts[0].old_status, SlotStatus::Available);
    EXPECT_EQ(ts[0].new_status, SlotStatus::Occupied);
    EXPECT_EQ(w.stored(5), SlotStatus::Occupied);

    // Slot 6 saw only empty frames and never changed
    EXPECT_EQ(w.stored(6), SlotStatus::Available);
}

TEST(Hysteresis, FlickerNeverFlips) {
    World w;
    for (int i = 0; i < 10; ++i) {
        EXPECT_TRUE(w.frame({car_in_slot5()}).empty());
        EXPECT_TRUE(w.frame({car_in_slot5()}).empty());
        EXPECT_TRUE(w.frame({}).empty());
    }
    EXPECT_EQ(w.stored(5), SlotStatus::Available);
    EXPECT_TRUE(w.publisher.events.empty());
    EXPECT_TRUE(w.handler.seen.empty());
}

TEST(Hysteresis, DepartureNeedsThreeEmptyFrames) {
    World w;
    for (int i = 0; i < 3; ++i) w.frame({car_in_slot5()});
    ASSERT_EQ(w.stored(5), SlotStatus::Occupied);

    EXPECT_TRUE(w.frame({}).empty());
    EXPECT_TRUE(w.frame({}).empty());
    EXPECT_TRUE(w.frame({car_in_slot5()}).empty()); // resets the empty run
    EXPECT_TRUE(w.frame({}).empty());
    EXPECT_TRUE(w.frame({}).empty());

    auto ts = w.frame({});
    ASSERT_EQ(ts.size(), 1u);
    EXPECT_EQ(ts[0].old_status, SlotStatus::Occupied);
    EXPECT_EQ(ts[0].new_status, SlotStatus::Available);
    EXPECT_EQ(w.stored(5), SlotStatus::Available);
}

TEST(Hysteresis, CustomThresholds) {
    ParkingRepository repo;
    parking::testing::seed_basic_lot(repo);
    RecordingPublisher publisher;
    OccupancyReconciler rec(repo, publisher, nullptr, OccupancyReconciler::Thresholds{1, 2});
    for (const auto& s : repo.list_slots()) rec.register_slot(s);

    const auto now = parking::testing::t0();
    EXPECT_EQ(rec.process_frame({car_in_slot5()}, now).size(), 1u);
    EXPECT_TRUE(rec.process_frame({}, now).empty());
    EXPECT_EQ(rec.process_frame({}, now).size(), 1u);
}

// ---------- Tests: publication ----------
TEST(Transitions, PublishedAndHandedOffWithPlate) {
    World w;
    w.frame({car_in_slot5("ab c-123", 0.8)});
    w.frame({car_in_slot5()});
    w.frame({car_in_slot5()});

    ASSERT_EQ(w.publisher.events.size(), 1u);
    EXPECT_EQ(w.publisher.events[0].slot_id, 5);
    EXPECT_EQ(w.publisher.events[0].lot_id, 1);
    EXPECT_EQ(w.publisher.events[0].status, SlotStatus::Occupied);
    EXPECT_EQ(w.publisher.events[0].observed_at, w.now);

    ASSERT_EQ(w.handler.seen.size(), 1u);
    ASSERT_TRUE(w.handler.seen[0].plate.has_value());
    EXPECT_EQ(*w.handler.seen[0].plate, "ABC123");
}

TEST(Transitions, BestPlateIsHighestConfidence) {
    World w;
    w.frame({car_in_slot5("ABC12", 0.4)});
    w.frame({car_in_slot5("ABC123", 0.9)});
    w.frame({car_in_slot5("ABC124", 0.5)});

    ASSERT_EQ(w.handler.seen.size(), 1u);
    ASSERT_TRUE(w.handler.seen[0].plate.has_value());
    EXPECT_EQ(*w.handler.seen[0].plate, "ABC123");
    EXPECT_EQ(w.rec.best_plate(7).value_or(""), "ABC123");
    EXPECT_FALSE(w.rec.best_plate(99).has_value());
}

TEST(Transitions, NoPlateWhenNothingWasRead) {
    World w;
    for (int i = 0; i < 3; ++i) w.frame({car_in_slot5()});
    ASSERT_EQ(w.handler.seen.size(), 1u);
    EXPECT_FALSE(w.handler.seen[0].plate.has_value());
}

// ---------- Tests: booking-owned statuses ----------
TEST(BookingOwned, ReservedSlotIgnoresFrames) {
    World w;
    ASSERT_TRUE(w.repo.update_slot_status(5, SlotStatus::Available, SlotStatus::Reserved, w.now));
    w.rec.resync();

    for (int i = 0; i < 5; ++i) EXPECT_TRUE(w.frame({car_in_slot5()}).empty());
    EXPECT_EQ(w.stored(5), SlotStatus::Reserved);

    OccupancyReconciler::SlotTrackState st;
    ASSERT_TRUE(w.rec.slot_state(5, st));
    EXPECT_EQ(st.last_published_status, SlotStatus::Reserved);
    EXPECT_EQ(st.occupied_count, 0);
}

TEST(BookingOwned, RejectedWriteAdoptsStoredStatus) {
    World w;
    w.frame({car_in_slot5()});
    w.frame({car_in_slot5()});

    // A booking reserves the slot between frames; the reconciler has not resynced
    ASSERT_TRUE(w.repo.update_slot_status(5, SlotStatus::Available, SlotStatus::Reserved, w.now));

    EXPECT_TRUE(w.frame({car_in_slot5()}).empty());
    EXPECT_EQ(w.stored(5), SlotStatus::Reserved);
    EXPECT_TRUE(w.publisher.events.empty());

    OccupancyReconciler::SlotTrackState st;
    ASSERT_TRUE(w.rec.slot_state(5, st));
    EXPECT_EQ(st.status, SlotStatus::Reserved);
    EXPECT_EQ(st.last_published_status, SlotStatus::Reserved);
}

TEST(BookingOwned, ResetSlotReturnsReservedSlotToTracking) {
    World w;
    ASSERT_TRUE(w.repo.update_slot_status(5, SlotStatus::Available, SlotStatus::Reserved, w.now));
    w.rec.resync();

    EXPECT_FALSE(w.rec.reset_slot(5, SlotStatus::Reserved, SlotStatus::Reserved, w.now));
    EXPECT_FALSE(w.rec.reset_slot(999, SlotStatus::Reserved, SlotStatus::Available, w.now));
    EXPECT_FALSE(w.rec.reset_slot(5, SlotStatus::Unavailable, SlotStatus::Available, w.now));
    EXPECT_EQ(w.stored(5), SlotStatus::Reserved);

    ASSERT_TRUE(w.rec.reset_slot(5, SlotStatus::Reserved, SlotStatus::Available, w.now));
    EXPECT_EQ(w.stored(5), SlotStatus::Available);

    for (int i = 0; i < 2; ++i) w.frame({car_in_slot5()});
    EXPECT_EQ(w.frame({car_in_slot5()}).size(), 1u);
    EXPECT_EQ(w.stored(5), SlotStatus::Occupied);
}

TEST(BookingOwned, ResetSlotLeavesOtherStatusesAlone) {
    World w;
    ASSERT_TRUE(w.repo.update_slot_status(5, SlotStatus::Available, SlotStatus::Unavailable, w.now));
    w.rec.resync();

    EXPECT_FALSE(w.rec.reset_slot(5, SlotStatus::Reserved, SlotStatus::Available, w.now));
    EXPECT_EQ(w.stored(5), SlotStatus::Unavailable);

    OccupancyReconciler::SlotTrackState st;
    ASSERT_TRUE(w.rec.slot_state(5, st));
    EXPECT_EQ(st.last_published_status, SlotStatus::Unavailable);
}
