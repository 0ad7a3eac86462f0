#include "status_publisher.hpp"

#include <utility>

#include <nlohmann/json.hpp>

#include "logging.hpp"

namespace parking {

std::string SlotStatusEvent::to_json() const {
    nlohmann::json j;
    j["slot_id"] = slot_id;
    j["parking_lot_id"] = lot_id;
    j["status"] = to_string(status);
    j["observed_at"] = format_iso8601(observed_at);
    return j.dump();
}

StatusBus::StatusBus(std::string channel, std::size_t history_limit)
    : channel_(std::move(channel)), history_limit_(history_limit) {}

void StatusBus::publish(const SlotStatusEvent& event) {
    const std::string message = event.to_json();

    std::vector<Subscriber> subscribers;
    {
        std::lock_guard<std::mutex> guard(mu_);
        history_.push_back(message);
        if (history_.size() > history_limit_) {
            history_.erase(history_.begin());
        }
        subscribers = subscribers_;
    }

    get_logger("status_bus")->debug("[{}] {}", channel_, message);

    // Deliver outside the lock so subscribers may publish or query freely
    for (const auto& sub : subscribers) {
        sub(event);
    }
}

void StatusBus::subscribe(Subscriber subscriber) {
    std::lock_guard<std::mutex> guard(mu_);
    subscribers_.push_back(std::move(subscriber));
}

std::vector<std::string> StatusBus::history() const {
    std::lock_guard<std::mutex> guard(mu_);
    return history_;
}

void LotAvailability::seed(const std::vector<Slot>& slots) {
    std::lock_guard<std::mutex> guard(mu_);
    slots_.clear();
    for (const auto& s : slots) {
        slots_[s.id] = Entry{s.lot_id, s.status};
    }
}

void LotAvailability::apply(const SlotStatusEvent& event) {
    std::lock_guard<std::mutex> guard(mu_);
    slots_[event.slot_id] = Entry{event.lot_id, event.status};
}

int LotAvailability::count(LotId lot_id, SlotStatus status) const {
    std::lock_guard<std::mutex> guard(mu_);
    int n = 0;
    for (const auto& kv : slots_) {
        if (kv.second.lot_id == lot_id && kv.second.status == status) ++n;
    }
    return n;
}

bool LotAvailability::status_of(SlotId slot_id, SlotStatus& out) const {
    std::lock_guard<std::mutex> guard(mu_);
    auto it = slots_.find(slot_id);
    if (it == slots_.end()) return false;
    out = it->second.status;
    return true;
}

} // namespace parking
