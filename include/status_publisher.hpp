#pragma once

#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "slot_types.hpp"

/**
 * @file status_publisher.hpp
 * @brief Slot status-change events and their pub/sub fan-out.
 *
 * Message (JSON, one per transition) on a single well-known channel:
 *   {"slot_id":5,"parking_lot_id":1,"status":"occupied","observed_at":"2024-05-01T09:30:00Z"}
 */

namespace parking {

/** @brief Default channel name for status-change messages. */
inline constexpr const char* kDefaultAvailabilityChannel = "slot_updates";

/**
 * @brief A published slot status change.
 */
struct SlotStatusEvent {
    SlotId slot_id = 0;
    LotId lot_id = 0;
    SlotStatus status = SlotStatus::Available;
    TimePoint observed_at{};

    /** @brief Wire encoding of the event (see file comment). */
    std::string to_json() const;
};

/**
 * @brief Sink for slot status changes.
 */
class StatusPublisher {
public:
    virtual ~StatusPublisher() = default;
    virtual void publish(const SlotStatusEvent& event) = 0;
};

/**
 * @brief In-process publisher: encodes each event, keeps a bounded history of
 *        raw messages and forwards events to subscribers synchronously.
 */
class StatusBus : public StatusPublisher {
public:
    using Subscriber = std::function<void(const SlotStatusEvent&)>;

    explicit StatusBus(std::string channel = kDefaultAvailabilityChannel, std::size_t history_limit = 1024);

    void publish(const SlotStatusEvent& event) override;

    /** @brief Registers a callback invoked for every subsequent event. */
    void subscribe(Subscriber subscriber);

    const std::string& channel() const { return channel_; }

    /** @brief Encoded messages published so far, oldest first (bounded). */
    std::vector<std::string> history() const;

private:
    std::string channel_;
    std::size_t history_limit_;

    mutable std::mutex mu_;
    std::vector<std::string> history_;
    std::vector<Subscriber> subscribers_;
};

/**
 * @brief Per-lot availability counts recomputed from status events.
 *
 * Seed with the current slot table, then feed every event; the counts for a
 * lot always reflect the latest known status of each of its slots.
 */
class LotAvailability {
public:
    void seed(const std::vector<Slot>& slots);
    void apply(const SlotStatusEvent& event);

    /** @brief Number of slots of @p lot_id currently in @p status. */
    int count(LotId lot_id, SlotStatus status) const;

    /** @brief Latest known status of one slot. */
    bool status_of(SlotId slot_id, SlotStatus& out) const;

private:
    struct Entry {
        LotId lot_id;
        SlotStatus status;
    };

    mutable std::mutex mu_;
    std::map<SlotId, Entry> slots_;
};

} // namespace parking
