#include "key_value_store.hpp"

namespace parking {

bool MemoryKeyValueStore::is_live_locked(std::unordered_map<std::string, Entry>::iterator it,
                                         TimePoint now) const {
    if (it->second.expires_at <= now) {
        entries_.erase(it);
        return false;
    }
    return true;
}

StoreStatus MemoryKeyValueStore::set_if_absent(const std::string& key,
                                               const std::string& value,
                                               std::chrono::seconds ttl) {
    const TimePoint now = clock_.now();
    std::lock_guard<std::mutex> guard(mu_);

    auto it = entries_.find(key);
    if (it != entries_.end() && is_live_locked(it, now)) {
        return StoreStatus::Exists;
    }
    entries_[key] = Entry{value, now + ttl};
    return StoreStatus::Ok;
}

StoreStatus MemoryKeyValueStore::erase(const std::string& key) {
    const TimePoint now = clock_.now();
    std::lock_guard<std::mutex> guard(mu_);

    auto it = entries_.find(key);
    if (it == entries_.end() || !is_live_locked(it, now)) {
        return StoreStatus::NotFound;
    }
    entries_.erase(it);
    return StoreStatus::Ok;
}

StoreStatus MemoryKeyValueStore::get(const std::string& key, std::string& out_value) const {
    const TimePoint now = clock_.now();
    std::lock_guard<std::mutex> guard(mu_);

    auto it = entries_.find(key);
    if (it == entries_.end() || !is_live_locked(it, now)) {
        return StoreStatus::NotFound;
    }
    out_value = it->second.value;
    return StoreStatus::Ok;
}

std::size_t MemoryKeyValueStore::size() const {
    const TimePoint now = clock_.now();
    std::lock_guard<std::mutex> guard(mu_);

    std::size_t live = 0;
    for (const auto& kv : entries_) {
        if (kv.second.expires_at > now) ++live;
    }
    return live;
}

} // namespace parking
