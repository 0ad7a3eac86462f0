#include "slot_lock.hpp"

#include <cstdio>

#include "logging.hpp"

namespace parking {

SlotLock::SlotLock(KeyValueStore& store, std::chrono::seconds ttl)
    : store_(store),
      ttl_(ttl),
      logger_(get_logger("slot_lock")),
      rng_(std::random_device{}()) {}

std::string SlotLock::key_for(SlotId slot_id) {
    return "slot:" + std::to_string(slot_id) + ":lock";
}

std::string SlotLock::make_holder_value(RequesterId holder_id) {
    std::uint32_t token = 0;
    {
        std::lock_guard<std::mutex> guard(rng_mu_);
        token = static_cast<std::uint32_t>(rng_());
    }
    char hex[9];
    std::snprintf(hex, sizeof(hex), "%08x", token);
    return std::to_string(holder_id) + ":" + hex;
}

LockOutcome SlotLock::acquire(SlotId slot_id, RequesterId holder_id) {
    const std::string key = key_for(slot_id);
    const StoreStatus st = store_.set_if_absent(key, make_holder_value(holder_id), ttl_);

    switch (st) {
        case StoreStatus::Ok:
            logger_->debug("Lock {} acquired by holder {}", key, holder_id);
            return LockOutcome::Acquired;
        case StoreStatus::Exists:
            logger_->debug("Lock {} contended (holder {})", key, holder_id);
            return LockOutcome::Contended;
        case StoreStatus::Unavailable:
        case StoreStatus::NotFound:
            break;
    }
    // Fail-open: bookings keep flowing, the uniqueness constraint is the backstop
    logger_->warn("Lock store unavailable, proceeding without lock for slot {}", slot_id);
    return LockOutcome::Degraded;
}

void SlotLock::release(SlotId slot_id) {
    const std::string key = key_for(slot_id);
    const StoreStatus st = store_.erase(key);
    if (st == StoreStatus::Unavailable) {
        logger_->error("Error releasing lock for slot {}: store unavailable", slot_id);
    } else if (st == StoreStatus::Ok) {
        logger_->debug("Lock {} released", key);
    }
}

bool SlotLock::is_locked(SlotId slot_id) const {
    std::string value;
    return store_.get(key_for(slot_id), value) == StoreStatus::Ok;
}

} // namespace parking
