#ifndef BITSDB_STORE_LOCK_TABLE_H_
#define BITSDB_STORE_LOCK_TABLE_H_

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <mutex>
#include <set>

#include "bitsdb/core/result.h"
#include "bitsdb/store/records.h"

namespace bitsdb {
namespace store {

using TxnID = uint64_t;

/**
 * @brief Exclusive row locks on cells, owned by transactions.
 *
 * A transaction waits on at most one lock at a time, so the waits-for graph
 * is a set of chains; a request that would close a cycle is refused instead
 * of waiting.
 */
class LockTable {
public:
    explicit LockTable(bool detect_deadlocks);

    /**
     * @brief Blocks until @p key is owned by @p txn or @p deadline passes.
     * Re-acquiring a lock already held by @p txn succeeds immediately.
     */
    core::Result<void> acquire(TxnID txn, const CellKey& key,
                               std::chrono::steady_clock::time_point deadline);

    void release_all(TxnID txn, const std::set<CellKey>& keys);

    size_t held_count() const;
    uint64_t deadlocks_detected() const { return deadlocks_.load(std::memory_order_relaxed); }
    uint64_t timeouts() const { return timeouts_.load(std::memory_order_relaxed); }

private:
    // Requires mutex_
    bool would_deadlock(TxnID txn, const CellKey& key) const;

    const bool detect_deadlocks_;
    mutable std::mutex mutex_;
    std::condition_variable released_;
    std::map<CellKey, TxnID> owners_;
    std::map<TxnID, CellKey> waiting_;
    std::atomic<uint64_t> deadlocks_{0};
    std::atomic<uint64_t> timeouts_{0};
};

} // namespace store
} // namespace bitsdb

#endif // BITSDB_STORE_LOCK_TABLE_H_
