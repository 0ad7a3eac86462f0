#include "engine_config.hpp"

#include <set>

#include <yaml-cpp/yaml.h>

#include "plate_normalizer.hpp"

namespace parking {

namespace {

template <typename T>
T get_or(const YAML::Node& node, const char* key, T fallback) {
    const YAML::Node child = node[key];
    if (!child || child.IsNull()) return fallback;
    return child.as<T>();
}

std::vector<Point> parse_polygon(const YAML::Node& node, SlotId slot_id) {
    std::vector<Point> polygon;
    if (!node || !node.IsSequence()) {
        throw ConfigError("slot " + std::to_string(slot_id) + ": polygon must be a list of [x, y] points");
    }
    for (const auto& pt : node) {
        if (!pt.IsSequence() || pt.size() != 2) {
            throw ConfigError("slot " + std::to_string(slot_id) + ": polygon point must be [x, y]");
        }
        polygon.push_back(Point{pt[0].as<double>(), pt[1].as<double>()});
    }
    if (polygon.size() < 3) {
        throw ConfigError("slot " + std::to_string(slot_id) + ": polygon needs at least 3 points");
    }
    return polygon;
}

int parse_time_field(const YAML::Node& node, const char* key, int fallback, LotId lot_id) {
    const YAML::Node child = node[key];
    if (!child) return fallback;

    int minutes = 0;
    if (!try_parse_hhmm(child.as<std::string>(), minutes)) {
        throw ConfigError("lot " + std::to_string(lot_id) + ": invalid " + key + " time '" +
                          child.as<std::string>() + "' (expected HH:MM)");
    }
    return minutes;
}

EngineConfig from_node(const YAML::Node& root) {
    EngineConfig cfg;

    if (const YAML::Node engine = root["engine"]) {
        cfg.lock_ttl = std::chrono::seconds(get_or<long long>(engine, "lock_ttl_seconds", cfg.lock_ttl.count()));
        cfg.sweep_interval = std::chrono::milliseconds(
            get_or<long long>(engine, "sweep_interval_ms", cfg.sweep_interval.count()));
        cfg.occupied_frame_threshold = get_or<int>(engine, "occupied_frame_threshold", cfg.occupied_frame_threshold);
        cfg.empty_frame_threshold = get_or<int>(engine, "empty_frame_threshold", cfg.empty_frame_threshold);
        cfg.availability_channel = get_or<std::string>(engine, "availability_channel", cfg.availability_channel);
        cfg.log_level = get_or<std::string>(engine, "log_level", cfg.log_level);
    }

    if (cfg.lock_ttl.count() <= 0) throw ConfigError("engine.lock_ttl_seconds must be positive");
    if (cfg.sweep_interval.count() <= 0) throw ConfigError("engine.sweep_interval_ms must be positive");
    if (cfg.occupied_frame_threshold <= 0 || cfg.empty_frame_threshold <= 0) {
        throw ConfigError("engine frame thresholds must be positive");
    }

    std::set<LotId> lot_ids;
    for (const auto& n : root["lots"]) {
        ParkingLot lot;
        lot.id = n["id"].as<LotId>();
        lot.name = get_or<std::string>(n, "name", "");
        lot.price_per_hour = get_or<double>(n, "price_per_hour", 0.0);
        lot.open_minute = parse_time_field(n, "open", lot.open_minute, lot.id);
        lot.close_minute = parse_time_field(n, "close", lot.close_minute, lot.id);
        lot.is_open = get_or<bool>(n, "is_open", true);
        if (lot.price_per_hour < 0.0) {
            throw ConfigError("lot " + std::to_string(lot.id) + ": price_per_hour must not be negative");
        }
        if (!lot_ids.insert(lot.id).second) {
            throw ConfigError("duplicate lot id " + std::to_string(lot.id));
        }
        cfg.lots.push_back(lot);
    }

    std::set<SlotId> slot_ids;
    for (const auto& n : root["slots"]) {
        Slot slot;
        slot.id = n["id"].as<SlotId>();
        slot.lot_id = n["lot_id"].as<LotId>();
        slot.label = get_or<std::string>(n, "label", "Slot " + std::to_string(slot.id));
        slot.polygon = parse_polygon(n["polygon"], slot.id);

        const std::string status = get_or<std::string>(n, "status", "available");
        if (!try_parse_slot_status(status, slot.status)) {
            throw ConfigError("slot " + std::to_string(slot.id) + ": unknown status '" + status + "'");
        }
        if (lot_ids.find(slot.lot_id) == lot_ids.end()) {
            throw ConfigError("slot " + std::to_string(slot.id) + ": unknown lot " + std::to_string(slot.lot_id));
        }
        if (!slot_ids.insert(slot.id).second) {
            throw ConfigError("duplicate slot id " + std::to_string(slot.id));
        }
        cfg.slots.push_back(slot);
    }

    std::set<VehicleId> vehicle_ids;
    for (const auto& n : root["vehicles"]) {
        Vehicle v;
        v.id = n["id"].as<VehicleId>();
        v.owner_id = n["owner_id"].as<RequesterId>();
        v.license_plate = PlateNormalizer::normalize(n["plate"].as<std::string>());
        if (v.license_plate.empty()) {
            throw ConfigError("vehicle " + std::to_string(v.id) + ": plate is empty after normalization");
        }
        if (!vehicle_ids.insert(v.id).second) {
            throw ConfigError("duplicate vehicle id " + std::to_string(v.id));
        }
        cfg.vehicles.push_back(v);
    }

    return cfg;
}

} // namespace

bool try_parse_hhmm(const std::string& text, int& out_minutes) {
    // Expected format: HH:MM
    if (text.size() != 5 || text[2] != ':') return false;

    try {
        std::size_t pos = 0;
        const int hh = std::stoi(text.substr(0, 2), &pos);
        if (pos != 2) return false;
        const int mm = std::stoi(text.substr(3, 2), &pos);
        if (pos != 2) return false;

        if (hh < 0 || hh > 23 || mm < 0 || mm > 59) return false;
        out_minutes = hh * 60 + mm;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

EngineConfig parse_config(const std::string& yaml_text) {
    try {
        return from_node(YAML::Load(yaml_text));
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("invalid configuration: ") + e.what());
    }
}

EngineConfig load_config(const std::string& path) {
    try {
        return from_node(YAML::LoadFile(path));
    } catch (const YAML::BadFile&) {
        throw ConfigError("cannot read configuration file: " + path);
    } catch (const YAML::Exception& e) {
        throw ConfigError(path + ": " + e.what());
    }
}

} // namespace parking
