#include <gtest/gtest.h>

#include "engine_config.hpp"

using parking::ConfigError;
using parking::EngineConfig;
using parking::SlotStatus;

// ---------- Tests: time parsing ----------
TEST(HhmmParsing, ValidTimes) {
    int m = -1;
    EXPECT_TRUE(parking::try_parse_hhmm("00:00", m));
    EXPECT_EQ(m, 0);
    EXPECT_TRUE(parking::try_parse_hhmm("06:30", m));
    EXPECT_EQ(m, 390);
    EXPECT_TRUE(parking::try_parse_hhmm("23:59", m));
    EXPECT_EQ(m, 1439);
}

TEST(HhmmParsing, InvalidTimes) {
    int m = -1;
    EXPECT_FALSE(parking::try_parse_hhmm("", m));
    EXPECT_FALSE(parking::try_parse_hhmm("6:30", m));
    EXPECT_FALSE(parking::try_parse_hhmm("24:00", m));
    EXPECT_FALSE(parking::try_parse_hhmm("12:60", m));
    EXPECT_FALSE(parking::try_parse_hhmm("12-30", m));
    EXPECT_FALSE(parking::try_parse_hhmm("ab:cd", m));
    EXPECT_FALSE(parking::try_parse_hhmm("1 :30", m));
    EXPECT_EQ(m, -1);
}

// ---------- Tests: parsing ----------
TEST(ConfigParsing, EmptyDocumentKeepsDefaults) {
    EngineConfig cfg = parking::parse_config("{}");
    EXPECT_EQ(cfg.lock_ttl, std::chrono::seconds(60));
    EXPECT_EQ(cfg.sweep_interval, std::chrono::milliseconds(5000));
    EXPECT_EQ(cfg.occupied_frame_threshold, 3);
    EXPECT_EQ(cfg.empty_frame_threshold, 3);
    EXPECT_EQ(cfg.availability_channel, "slot_updates");
    EXPECT_EQ(cfg.log_level, "info");
    EXPECT_TRUE(cfg.lots.empty());
    EXPECT_TRUE(cfg.slots.empty());
}

TEST(ConfigParsing, FullDocument) {
    const char* yaml = R"(
engine:
  lock_ttl_seconds: 30
  sweep_interval_ms: 250
  occupied_frame_threshold: 4
  empty_frame_threshold: 5
  availability_channel: lot_events
  log_level: debug
lots:
  - {id: 1, name: Central, price_per_hour: 10.0, open: "06:00", close: "23:00"}
  - {id: 2, name: Night, price_per_hour: 6.5, open: "22:00", close: "06:00", is_open: false}
slots:
  - {id: 5, lot_id: 1, label: A5, polygon: [[0,0],[10,0],[10,10],[0,10]]}
  - {id: 6, lot_id: 2, status: unavailable, polygon: [[0,0],[10,0],[5,8]]}
vehicles:
  - {id: 1, owner_id: 100, plate: "abc-123"}
)";
    EngineConfig cfg = parking::parse_config(yaml);

    EXPECT_EQ(cfg.lock_ttl, std::chrono::seconds(30));
    EXPECT_EQ(cfg.sweep_interval, std::chrono::milliseconds(250));
    EXPECT_EQ(cfg.occupied_frame_threshold, 4);
    EXPECT_EQ(cfg.empty_frame_threshold, 5);
    EXPECT_EQ(cfg.availability_channel, "lot_events");
    EXPECT_EQ(cfg.log_level, "debug");

    ASSERT_EQ(cfg.lots.size(), 2u);
    EXPECT_EQ(cfg.lots[0].name, "Central");
    EXPECT_DOUBLE_EQ(cfg.lots[0].price_per_hour, 10.0);
    EXPECT_EQ(cfg.lots[0].open_minute, 360);
    EXPECT_EQ(cfg.lots[0].close_minute, 1380);
    EXPECT_TRUE(cfg.lots[0].is_open);
    EXPECT_FALSE(cfg.lots[1].is_open);

    ASSERT_EQ(cfg.slots.size(), 2u);
    EXPECT_EQ(cfg.slots[0].label, "A5");
    EXPECT_EQ(cfg.slots[0].status, SlotStatus::Available);
    EXPECT_EQ(cfg.slots[0].polygon.size(), 4u);
    EXPECT_EQ(cfg.slots[1].label, "Slot 6");
    EXPECT_EQ(cfg.slots[1].status, SlotStatus::Unavailable);

    ASSERT_EQ(cfg.vehicles.size(), 1u);
    EXPECT_EQ(cfg.vehicles[0].license_plate, "ABC123");
}

// ---------- Tests: validation ----------
TEST(ConfigValidation, RejectsMalformedValues) {
    EXPECT_THROW(parking::parse_config("engine: {lock_ttl_seconds: 0}"), ConfigError);
    EXPECT_THROW(parking::parse_config("engine: {occupied_frame_threshold: -1}"), ConfigError);
    EXPECT_THROW(parking::parse_config("engine: {lock_ttl_seconds: soon}"), ConfigError);
    EXPECT_THROW(parking::parse_config("lots: [{id: 1, open: \"25:00\"}]"), ConfigError);
    EXPECT_THROW(parking::parse_config("lots: [{id: 1, price_per_hour: -2}]"), ConfigError);
    EXPECT_THROW(parking::parse_config("lots: [{id: 1}, {id: 1}]"), ConfigError);
}

TEST(ConfigValidation, RejectsBadSlots) {
    const std::string lot = "lots: [{id: 1}]\n";
    EXPECT_THROW(parking::parse_config(lot + "slots: [{id: 5, lot_id: 1, polygon: [[0,0],[1,1]]}]"), ConfigError);
    EXPECT_THROW(parking::parse_config(lot + "slots: [{id: 5, lot_id: 1}]"), ConfigError);
    EXPECT_THROW(parking::parse_config(lot + "slots: [{id: 5, lot_id: 1, status: parked, "
                                             "polygon: [[0,0],[1,0],[1,1]]}]"),
                 ConfigError);
    EXPECT_THROW(parking::parse_config(lot + "slots: [{id: 5, lot_id: 9, polygon: [[0,0],[1,0],[1,1]]}]"),
                 ConfigError);
}

TEST(ConfigValidation, RejectsEmptyPlateAndBrokenYaml) {
    EXPECT_THROW(parking::parse_config("vehicles: [{id: 1, owner_id: 1, plate: \"--\"}]"), ConfigError);
    EXPECT_THROW(parking::parse_config("engine: [unclosed"), ConfigError);
}

TEST(ConfigValidation, RejectsDuplicateVehicleIds) {
    EXPECT_THROW(parking::parse_config("vehicles: [{id: 1, owner_id: 100, plate: ABC123},"
                                       " {id: 1, owner_id: 200, plate: XYZ789}]"),
                 ConfigError);
    EXPECT_NO_THROW(parking::parse_config("vehicles: [{id: 1, owner_id: 100, plate: ABC123},"
                                          " {id: 2, owner_id: 200, plate: XYZ789}]"));
}

TEST(ConfigLoading, MissingFileIsConfigError) {
    EXPECT_THROW(parking::load_config("/nonexistent/parking.yaml"), ConfigError);
}
