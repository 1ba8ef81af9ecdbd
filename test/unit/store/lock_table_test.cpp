#include <gtest/gtest.h>
#include "bitsdb/store/lock_table.h"
#include <atomic>
#include <chrono>
#include <thread>

namespace bitsdb {
namespace store {
namespace {

using namespace std::chrono_literals;
using Clock = std::chrono::steady_clock;

CellKey MakeKey(const std::string& batch, core::SeriesID series) {
    CellKey key;
    key.batch_id = batch;
    key.tenant_id = "t";
    key.valid_time = 0;
    key.series_id = series;
    return key;
}

TEST(CellKeyTest, OrderedByTypedFields) {
    CellKey a = MakeKey("b1", 2);
    CellKey b = MakeKey("b1", 10);
    // Numeric series order, not string order ("10" < "2")
    EXPECT_TRUE(a < b);

    CellKey earlier = MakeKey("b1", 10);
    earlier.valid_time = -5;
    EXPECT_TRUE(earlier < a);

    EXPECT_TRUE(MakeKey("a", 99) < MakeKey("b", 1));
    EXPECT_EQ(MakeKey("b1", 2), a);
}

TEST(LockTableTest, AcquireAndReacquire) {
    LockTable locks(true);
    auto key = MakeKey("b1", 1);
    ASSERT_TRUE(locks.acquire(1, key, Clock::now() + 100ms).ok());
    EXPECT_TRUE(locks.acquire(1, key, Clock::now() + 100ms).ok());
    EXPECT_EQ(locks.held_count(), 1u);

    locks.release_all(1, {key});
    EXPECT_EQ(locks.held_count(), 0u);
}

TEST(LockTableTest, TimesOutWhileHeld) {
    LockTable locks(true);
    auto key = MakeKey("b1", 1);
    ASSERT_TRUE(locks.acquire(1, key, Clock::now() + 100ms).ok());

    auto result = locks.acquire(2, key, Clock::now() + 50ms);
    EXPECT_FALSE(result.ok());
    EXPECT_EQ(result.code(), core::Error::Code::TIMEOUT);
    EXPECT_TRUE(result.retryable());
    EXPECT_EQ(locks.timeouts(), 1u);
}

TEST(LockTableTest, WaiterProceedsAfterRelease) {
    LockTable locks(true);
    auto key = MakeKey("b1", 1);
    ASSERT_TRUE(locks.acquire(1, key, Clock::now() + 100ms).ok());

    std::atomic<bool> acquired{false};
    std::thread waiter([&] {
        acquired = locks.acquire(2, key, Clock::now() + 5s).ok();
    });
    std::this_thread::sleep_for(50ms);
    EXPECT_FALSE(acquired.load());
    locks.release_all(1, {key});
    waiter.join();

    EXPECT_TRUE(acquired.load());
    EXPECT_EQ(locks.held_count(), 1u);
    locks.release_all(2, {key});
}

TEST(LockTableTest, DetectsDeadlockCycle) {
    LockTable locks(true);
    auto first = MakeKey("b1", 1);
    auto second = MakeKey("b1", 2);
    ASSERT_TRUE(locks.acquire(1, first, Clock::now() + 100ms).ok());
    ASSERT_TRUE(locks.acquire(2, second, Clock::now() + 100ms).ok());

    // txn 1 waits for second (held by 2)
    std::atomic<bool> first_done{false};
    core::Error::Code first_code = core::Error::Code::UNKNOWN;
    std::thread waiter([&] {
        auto result = locks.acquire(1, second, Clock::now() + 5s);
        first_code = result.ok() ? core::Error::Code::UNKNOWN : result.code();
        first_done = true;
    });
    std::this_thread::sleep_for(50ms);

    // txn 2 asking for first would close the cycle
    auto result = locks.acquire(2, first, Clock::now() + 5s);
    EXPECT_FALSE(result.ok());
    EXPECT_EQ(result.code(), core::Error::Code::ABORTED);
    EXPECT_EQ(locks.deadlocks_detected(), 1u);

    // Aborting txn 2 lets txn 1 through
    locks.release_all(2, {second});
    waiter.join();
    EXPECT_TRUE(first_done.load());
    EXPECT_EQ(first_code, core::Error::Code::UNKNOWN);
    locks.release_all(1, {first, second});
    EXPECT_EQ(locks.held_count(), 0u);
}

} // namespace
} // namespace store
} // namespace bitsdb
