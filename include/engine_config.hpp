#pragma once

#include <chrono>
#include <stdexcept>
#include <string>
#include <vector>

#include "slot_types.hpp"

/**
 * @file engine_config.hpp
 * @brief YAML configuration of the engine and its seed data.
 *
 * Example:
 * @code
 * engine:
 *   lock_ttl_seconds: 60
 *   sweep_interval_ms: 5000
 *   occupied_frame_threshold: 3
 *   empty_frame_threshold: 3
 *   availability_channel: slot_updates
 *   log_level: info
 * lots:
 *   - {id: 1, name: Central, price_per_hour: 10.0, open: "06:00", close: "23:00", is_open: true}
 * slots:
 *   - {id: 5, lot_id: 1, label: A5, status: available, polygon: [[0,0],[10,0],[10,10],[0,10]]}
 * vehicles:
 *   - {id: 1, owner_id: 100, plate: "ABC 123"}
 * @endcode
 *
 * Every key is optional; missing keys keep the defaults below.
 */

namespace parking {

/**
 * @brief Raised for unreadable or malformed configuration.
 */
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct EngineConfig {
    std::chrono::seconds lock_ttl{60};
    std::chrono::milliseconds sweep_interval{5000};
    int occupied_frame_threshold = 3;
    int empty_frame_threshold = 3;
    std::string availability_channel = "slot_updates";
    std::string log_level = "info";

    std::vector<ParkingLot> lots;
    std::vector<Slot> slots;
    std::vector<Vehicle> vehicles;
};

/** @brief Loads and validates a YAML file. @throws ConfigError */
EngineConfig load_config(const std::string& path);

/** @brief Parses and validates YAML text. @throws ConfigError */
EngineConfig parse_config(const std::string& yaml_text);

/**
 * @brief Parses "HH:MM" into minutes since midnight.
 * @return False unless 00:00 <= value <= 23:59.
 */
bool try_parse_hhmm(const std::string& text, int& out_minutes);

} // namespace parking
