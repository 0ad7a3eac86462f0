#pragma once

#include <chrono>
#include <mutex>
#include <string>
#include <unordered_map>

#include "clock.hpp"

/**
 * @file key_value_store.hpp
 * @brief Contract of the shared store backing the slot lock, plus an
 *        in-process implementation.
 *
 * The contract mirrors what a networked cache (SET key value NX EX ttl / DEL)
 * offers; a networked client implements KeyValueStore and reports
 * StoreStatus::Unavailable when the server cannot be reached.
 */

namespace parking {

/**
 * @brief Outcome of a store call.
 */
enum class StoreStatus {
    Ok,          /**< The operation was applied. */
    Exists,      /**< set_if_absent: the key is already present (and not expired). */
    NotFound,    /**< get/erase: no such key. */
    Unavailable  /**< The store could not be reached; nothing is known. */
};

/**
 * @brief Shared key/value store with per-key expiry.
 */
class KeyValueStore {
public:
    virtual ~KeyValueStore() = default;

    /**
     * @brief Atomically stores @p value under @p key iff the key is absent.
     * @param ttl Expiry applied in the same atomic step.
     * @return Ok if stored, Exists if a live key is present, Unavailable on outage.
     */
    virtual StoreStatus set_if_absent(const std::string& key,
                                      const std::string& value,
                                      std::chrono::seconds ttl) = 0;

    /** @brief Deletes @p key. NotFound is not an error for callers that only want it gone. */
    virtual StoreStatus erase(const std::string& key) = 0;

    /** @brief Reads @p key into @p out_value. */
    virtual StoreStatus get(const std::string& key, std::string& out_value) const = 0;
};

/**
 * @brief Thread-safe in-process KeyValueStore with lazy TTL expiry.
 *
 * @details
 * Expired entries are treated as absent on every access and purged lazily.
 * Time comes from the injected Clock so expiry can be driven by tests.
 */
class MemoryKeyValueStore : public KeyValueStore {
public:
    explicit MemoryKeyValueStore(const Clock& clock) : clock_(clock) {}

    StoreStatus set_if_absent(const std::string& key,
                              const std::string& value,
                              std::chrono::seconds ttl) override;
    StoreStatus erase(const std::string& key) override;
    StoreStatus get(const std::string& key, std::string& out_value) const override;

    /** @brief Number of live (non-expired) keys. */
    std::size_t size() const;

private:
    struct Entry {
        std::string value;
        TimePoint expires_at;
    };

    const Clock& clock_;
    mutable std::mutex mu_;
    mutable std::unordered_map<std::string, Entry> entries_;

    // Caller holds mu_. Drops the entry if it has expired.
    bool is_live_locked(std::unordered_map<std::string, Entry>::iterator it, TimePoint now) const;
};

} // namespace parking
