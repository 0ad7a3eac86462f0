#include <gtest/gtest.h>

#include "clock.hpp"
#include "key_value_store.hpp"
#include "slot_lock.hpp"
#include "test_support.hpp"

#include <string>

using parking::LockOutcome;
using parking::ManualClock;
using parking::MemoryKeyValueStore;
using parking::SlotLock;
using parking::StoreStatus;

// ---------- Helpers ----------
namespace {

// Store whose server is down: every call reports Unavailable.
class UnreachableStore : public parking::KeyValueStore {
public:
    StoreStatus set_if_absent(const std::string&, const std::string&, std::chrono::seconds) override {
        return StoreStatus::Unavailable;
    }
    StoreStatus erase(const std::string&) override { return StoreStatus::Unavailable; }
    StoreStatus get(const std::string&, std::string&) const override { return StoreStatus::Unavailable; }
};

} // namespace

// ---------- Tests: key/value store ----------
TEST(MemoryStore, SetIfAbsentRespectsLiveKeys) {
    ManualClock clock(parking::testing::t0());
    MemoryKeyValueStore store(clock);

    EXPECT_EQ(store.set_if_absent("k", "v1", std::chrono::seconds(10)), StoreStatus::Ok);
    EXPECT_EQ(store.set_if_absent("k", "v2", std::chrono::seconds(10)), StoreStatus::Exists);

    std::string value;
    ASSERT_EQ(store.get("k", value), StoreStatus::Ok);
    EXPECT_EQ(value, "v1");
    EXPECT_EQ(store.size(), 1u);
}

TEST(MemoryStore, EntriesExpireWithTheClock) {
    ManualClock clock(parking::testing::t0());
    MemoryKeyValueStore store(clock);

    ASSERT_EQ(store.set_if_absent("k", "v", std::chrono::seconds(60)), StoreStatus::Ok);
    clock.advance(std::chrono::seconds(59));
    EXPECT_EQ(store.set_if_absent("k", "other", std::chrono::seconds(60)), StoreStatus::Exists);

    clock.advance(std::chrono::seconds(1));
    std::string value;
    EXPECT_EQ(store.get("k", value), StoreStatus::NotFound);
    EXPECT_EQ(store.set_if_absent("k", "other", std::chrono::seconds(60)), StoreStatus::Ok);
}

TEST(MemoryStore, EraseMissingKeyIsNotFound) {
    ManualClock clock(parking::testing::t0());
    MemoryKeyValueStore store(clock);
    EXPECT_EQ(store.erase("missing"), StoreStatus::NotFound);
}

// ---------- Tests: slot lock ----------
TEST(SlotLockKey, Format) {
    EXPECT_EQ(SlotLock::key_for(5), "slot:5:lock");
}

TEST(SlotLockAcquire, SecondHolderIsContended) {
    ManualClock clock(parking::testing::t0());
    MemoryKeyValueStore store(clock);
    SlotLock lock(store);

    EXPECT_EQ(lock.acquire(5, 100), LockOutcome::Acquired);
    EXPECT_EQ(lock.acquire(5, 200), LockOutcome::Contended);
    EXPECT_TRUE(lock.is_locked(5));

    // Other slots never contend
    EXPECT_EQ(lock.acquire(6, 200), LockOutcome::Acquired);
}

TEST(SlotLockAcquire, ValueCarriesHolderAndToken) {
    ManualClock clock(parking::testing::t0());
    MemoryKeyValueStore store(clock);
    SlotLock lock(store);

    ASSERT_EQ(lock.acquire(5, 100), LockOutcome::Acquired);

    std::string value;
    ASSERT_EQ(store.get(SlotLock::key_for(5), value), StoreStatus::Ok);
    ASSERT_EQ(value.size(), 4u + 8u);
    EXPECT_EQ(value.substr(0, 4), "100:");
    EXPECT_EQ(value.find_first_not_of("0123456789abcdef", 4), std::string::npos);
}

TEST(SlotLockAcquire, ReleaseFreesTheSlot) {
    ManualClock clock(parking::testing::t0());
    MemoryKeyValueStore store(clock);
    SlotLock lock(store);

    ASSERT_EQ(lock.acquire(5, 100), LockOutcome::Acquired);
    lock.release(5);
    EXPECT_FALSE(lock.is_locked(5));
    EXPECT_EQ(lock.acquire(5, 200), LockOutcome::Acquired);

    // Releasing an absent lock is harmless
    lock.release(5);
    lock.release(5);
}

TEST(SlotLockAcquire, TtlBoundsAbandonedLocks) {
    ManualClock clock(parking::testing::t0());
    MemoryKeyValueStore store(clock);
    SlotLock lock(store, std::chrono::seconds(60));

    ASSERT_EQ(lock.acquire(5, 100), LockOutcome::Acquired);
    clock.advance(std::chrono::seconds(61));
    EXPECT_FALSE(lock.is_locked(5));
    EXPECT_EQ(lock.acquire(5, 200), LockOutcome::Acquired);
}

TEST(SlotLockAcquire, StoreOutageFailsOpen) {
    UnreachableStore store;
    SlotLock lock(store);

    EXPECT_EQ(lock.acquire(5, 100), LockOutcome::Degraded);
    EXPECT_EQ(lock.acquire(5, 200), LockOutcome::Degraded);
    EXPECT_FALSE(lock.is_locked(5));

    // Best-effort release never throws
    EXPECT_NO_THROW(lock.release(5));
}
