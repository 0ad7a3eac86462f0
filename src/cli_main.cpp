#include "parking_engine.hpp"

#include <algorithm>
#include <iostream>
#include <map>
#include <sstream>

namespace {

const char* kDemoConfig = R"(
engine:
  lock_ttl_seconds: 60
  sweep_interval_ms: 5000
  log_level: info
lots:
  - {id: 1, name: Central, price_per_hour: 10.0, open: "00:00", close: "23:59"}
slots:
  - {id: 1, lot_id: 1, label: A1, polygon: [[0,0],[10,0],[10,20],[0,20]]}
  - {id: 2, lot_id: 1, label: A2, polygon: [[10,0],[20,0],[20,20],[10,20]]}
  - {id: 3, lot_id: 1, label: A3, polygon: [[20,0],[30,0],[30,20],[20,20]]}
vehicles:
  - {id: 1, owner_id: 100, plate: "ABC 123"}
  - {id: 2, owner_id: 200, plate: "XYZ 789"}
)";

void print_help() {
    std::cout
        << "Commands:\n"
        << "  slots\n"
        << "  initiate <driver_id> <plate> <slot_id>\n"
        << "  confirm <driver_id> <booking_id>\n"
        << "  cancel <driver_id> <booking_id> [reason...]\n"
        << "  checkin <driver_id> <booking_id>\n"
        << "  bookings <driver_id>\n"
        << "  park <slot_id> <plate>       (car enters, frames until verified)\n"
        << "  leave <slot_id>              (car exits, frames until verified)\n"
        << "  frames <n>                   (n frames of the current scene)\n"
        << "  sessions <driver_id>\n"
        << "  cost <session_id>\n"
        << "  set <slot_id> <status>\n"
        << "  advance <minutes>\n"
        << "  sweep\n"
        << "  events\n"
        << "  exit \n";
}

parking::Point centroid_of(const std::vector<parking::Point>& polygon) {
    parking::Point c{0.0, 0.0};
    for (std::size_t i = 0; i < polygon.size(); ++i) {
        c.x += polygon[i].x;
        c.y += polygon[i].y;
    }
    if (!polygon.empty()) {
        c.x /= static_cast<double>(polygon.size());
        c.y /= static_cast<double>(polygon.size());
    }
    return c;
}

void print_booking(const parking::BookingResult& r) {
    std::cout << (r.success ? "OK: " : "FAIL: ") << r.message;
    if (!r.success) std::cout << " [" << parking::to_string(r.error) << "]";
    if (r.lock_degraded) std::cout << " (lock degraded)";
    std::cout << "\n";
    if (r.success && r.booking.id > 0) {
        std::cout << "  booking " << r.booking.id << " slot " << r.booking.slot_id << " "
                  << parking::to_string(r.booking.status) << "\n";
    }
}

} // namespace

int main(int argc, char** argv) {
    parking::EngineConfig config;
    try {
        config = argc > 1 ? parking::load_config(argv[1]) : parking::parse_config(kDemoConfig);
    } catch (const parking::ConfigError& e) {
        std::cerr << "Configuration error: " << e.what() << "\n";
        return 1;
    }

    parking::ManualClock clock(std::chrono::system_clock::now());
    parking::ParkingEngine engine(config, clock);

    // Scene seen by the camera: slot -> plate of the car standing in it
    std::map<parking::SlotId, std::string> scene;
    const int verify_frames = std::max(config.occupied_frame_threshold, config.empty_frame_threshold);

    auto run_frames = [&](int n) {
        for (int i = 0; i < n; ++i) {
            std::vector<parking::TrackedVehicle> vehicles;
            for (const auto& kv : scene) {
                parking::Slot slot;
                if (!engine.repository().find_slot(kv.first, slot)) continue;
                parking::TrackedVehicle v;
                v.centroid = centroid_of(slot.polygon);
                v.track_id = kv.first;
                v.plate_text = kv.second;
                v.confidence = 0.9;
                vehicles.push_back(v);
            }
            std::vector<parking::SlotTransition> ts = engine.observe(vehicles);
            for (std::size_t j = 0; j < ts.size(); ++j) {
                std::cout << "  slot " << ts[j].slot_id << ": " << parking::to_string(ts[j].old_status) << " -> "
                          << parking::to_string(ts[j].new_status) << "\n";
            }
        }
    };

    std::cout << "Parking Engine CLI\n";
    print_help();

    std::string line;
    while (true) {
        std::cout << "\n> ";
        if (!std::getline(std::cin, line)) break;
        if (line == "exit") break;
        if (line.empty()) continue;

        std::istringstream iss(line);
        std::string cmd;
        iss >> cmd;

        if (cmd == "help") {
            print_help();
        } else if (cmd == "slots") {
            std::vector<parking::Slot> slots = engine.repository().list_slots();
            for (std::size_t i = 0; i < slots.size(); ++i) {
                std::cout << slots[i].id << ": " << slots[i].label << " (lot " << slots[i].lot_id << ") "
                          << parking::to_string(slots[i].status) << "\n";
            }
        } else if (cmd == "initiate") {
            parking::RequesterId driver = -1;
            std::string plate;
            parking::SlotId slot_id = -1;
            iss >> driver >> plate >> slot_id;
            print_booking(engine.initiate(driver, plate, slot_id));
        } else if (cmd == "confirm" || cmd == "checkin") {
            parking::RequesterId driver = -1;
            parking::BookingId booking_id = -1;
            iss >> driver >> booking_id;
            print_booking(cmd == "confirm" ? engine.confirm(driver, booking_id) : engine.check_in(driver, booking_id));
        } else if (cmd == "cancel") {
            parking::RequesterId driver = -1;
            parking::BookingId booking_id = -1;
            iss >> driver >> booking_id;
            std::string reason;
            std::getline(iss >> std::ws, reason);
            print_booking(engine.cancel(driver, booking_id, reason));
        } else if (cmd == "bookings") {
            parking::RequesterId driver = -1;
            iss >> driver;
            std::vector<parking::Booking> bs = engine.bookings().list_bookings(driver);
            if (bs.empty()) {
                std::cout << "No bookings for driver " << driver << "\n";
            }
            for (std::size_t i = 0; i < bs.size(); ++i) {
                std::cout << bs[i].id << ": slot " << bs[i].slot_id << " " << bs[i].license_plate << " "
                          << parking::to_string(bs[i].status) << "\n";
            }
        } else if (cmd == "park") {
            parking::SlotId slot_id = -1;
            std::string plate;
            iss >> slot_id >> plate;
            scene[slot_id] = plate;
            run_frames(verify_frames);
        } else if (cmd == "leave") {
            parking::SlotId slot_id = -1;
            iss >> slot_id;
            scene.erase(slot_id);
            run_frames(verify_frames);
        } else if (cmd == "frames") {
            int n = 1;
            iss >> n;
            run_frames(n);
        } else if (cmd == "sessions") {
            parking::RequesterId driver = -1;
            iss >> driver;
            std::vector<parking::ParkingSession> ss = engine.sessions().list_sessions(driver);
            if (ss.empty()) {
                std::cout << "No sessions for driver " << driver << "\n";
            }
            for (std::size_t i = 0; i < ss.size(); ++i) {
                std::cout << ss[i].id << ": slot " << ss[i].slot_id << " " << ss[i].license_plate << " "
                          << parking::to_string(ss[i].status) << (ss[i].is_walk_in() ? " walk-in" : " booked");
                if (ss[i].parking_cost) std::cout << " cost " << *ss[i].parking_cost;
                std::cout << "\n";
            }
        } else if (cmd == "cost") {
            parking::SessionId session_id = -1;
            iss >> session_id;
            double cost = 0.0;
            if (engine.sessions().current_cost(session_id, cost)) {
                std::cout << "Cost so far: " << cost << "\n";
            } else {
                std::cout << "Unknown session " << session_id << "\n";
            }
        } else if (cmd == "set") {
            parking::SlotId slot_id = -1;
            std::string text;
            iss >> slot_id >> text;
            parking::SlotStatus status;
            if (!parking::try_parse_slot_status(text, status)) {
                std::cout << "Unknown status '" << text << "'\n";
                continue;
            }
            std::cout << (engine.set_slot_status(slot_id, status) ? "OK\n" : "FAIL\n");
        } else if (cmd == "advance") {
            long long minutes = 0;
            iss >> minutes;
            clock.advance(std::chrono::minutes(minutes));
            std::cout << "Now " << parking::format_iso8601(clock.now()) << "\n";
        } else if (cmd == "sweep") {
            std::cout << "Expired " << engine.sweep() << " bookings\n";
        } else if (cmd == "events") {
            std::vector<std::string> msgs = engine.bus().history();
            for (std::size_t i = 0; i < msgs.size(); ++i) {
                std::cout << engine.bus().channel() << " " << msgs[i] << "\n";
            }
        } else {
            std::cout << "Unknown command. Type 'help'.\n";
        }
    }

    return 0;
}
