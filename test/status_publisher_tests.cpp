#include <gtest/gtest.h>

#include "status_publisher.hpp"
#include "test_support.hpp"

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

using parking::LotAvailability;
using parking::Slot;
using parking::SlotStatus;
using parking::SlotStatusEvent;
using parking::StatusBus;

namespace {

SlotStatusEvent event(parking::SlotId slot, parking::LotId lot, SlotStatus status) {
    SlotStatusEvent e;
    e.slot_id = slot;
    e.lot_id = lot;
    e.status = status;
    e.observed_at = parking::testing::t0();
    return e;
}

} // namespace

// ---------- Tests: wire format ----------
TEST(StatusEventJson, MatchesChannelContract) {
    const auto j = nlohmann::json::parse(event(5, 1, SlotStatus::Occupied).to_json());
    ASSERT_TRUE(j.is_object());
    EXPECT_EQ(j.size(), 4u);
    EXPECT_EQ(j.at("slot_id").get<parking::SlotId>(), 5);
    EXPECT_EQ(j.at("parking_lot_id").get<parking::LotId>(), 1);
    EXPECT_EQ(j.at("status").get<std::string>(), "occupied");
    EXPECT_EQ(j.at("observed_at").get<std::string>(), "2024-05-01T09:30:00Z");

    const auto k = nlohmann::json::parse(event(12, 3, SlotStatus::Available).to_json());
    EXPECT_EQ(k.at("slot_id").get<parking::SlotId>(), 12);
    EXPECT_EQ(k.at("status").get<std::string>(), "available");
}

TEST(StatusEventJson, IsCompactSingleLine) {
    const std::string msg = event(5, 1, SlotStatus::Reserved).to_json();
    EXPECT_EQ(msg.find('\n'), std::string::npos);
    EXPECT_EQ(msg.find(' '), std::string::npos);
}

// ---------- Tests: bus ----------
TEST(StatusBusFanOut, DeliversToEverySubscriberInOrder) {
    StatusBus bus;
    EXPECT_EQ(bus.channel(), "slot_updates");

    std::vector<parking::SlotId> a;
    std::vector<parking::SlotId> b;
    bus.subscribe([&](const SlotStatusEvent& e) { a.push_back(e.slot_id); });
    bus.subscribe([&](const SlotStatusEvent& e) { b.push_back(e.slot_id); });

    bus.publish(event(5, 1, SlotStatus::Occupied));
    bus.publish(event(6, 1, SlotStatus::Reserved));

    EXPECT_EQ(a, (std::vector<parking::SlotId>{5, 6}));
    EXPECT_EQ(b, (std::vector<parking::SlotId>{5, 6}));

    auto history = bus.history();
    ASSERT_EQ(history.size(), 2u);
    EXPECT_NE(history[1].find("\"status\":\"reserved\""), std::string::npos);
}

TEST(StatusBusFanOut, HistoryIsBounded) {
    StatusBus bus("custom", 2);
    EXPECT_EQ(bus.channel(), "custom");

    bus.publish(event(1, 1, SlotStatus::Occupied));
    bus.publish(event(2, 1, SlotStatus::Occupied));
    bus.publish(event(3, 1, SlotStatus::Occupied));

    auto history = bus.history();
    ASSERT_EQ(history.size(), 2u);
    EXPECT_NE(history[0].find("\"slot_id\":2"), std::string::npos);
    EXPECT_NE(history[1].find("\"slot_id\":3"), std::string::npos);
}

// ---------- Tests: lot availability ----------
TEST(LotAvailabilityCounts, SeedThenApplyEvents) {
    Slot s1;
    s1.id = 1;
    s1.lot_id = 1;
    Slot s2;
    s2.id = 2;
    s2.lot_id = 1;
    Slot s3;
    s3.id = 3;
    s3.lot_id = 2;
    s3.status = SlotStatus::Unavailable;

    LotAvailability avail;
    avail.seed({s1, s2, s3});
    EXPECT_EQ(avail.count(1, SlotStatus::Available), 2);
    EXPECT_EQ(avail.count(2, SlotStatus::Available), 0);
    EXPECT_EQ(avail.count(2, SlotStatus::Unavailable), 1);

    avail.apply(event(1, 1, SlotStatus::Occupied));
    EXPECT_EQ(avail.count(1, SlotStatus::Available), 1);
    EXPECT_EQ(avail.count(1, SlotStatus::Occupied), 1);

    SlotStatus st = SlotStatus::Available;
    ASSERT_TRUE(avail.status_of(1, st));
    EXPECT_EQ(st, SlotStatus::Occupied);
    EXPECT_FALSE(avail.status_of(99, st));
}
