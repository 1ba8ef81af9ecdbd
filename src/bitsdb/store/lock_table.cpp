#include "bitsdb/store/lock_table.h"
#include "bitsdb/common/logger.h"

namespace bitsdb {
namespace store {

LockTable::LockTable(bool detect_deadlocks) : detect_deadlocks_(detect_deadlocks) {}

core::Result<void> LockTable::acquire(TxnID txn, const CellKey& key,
                                      std::chrono::steady_clock::time_point deadline) {
    std::unique_lock<std::mutex> lock(mutex_);

    while (true) {
        auto it = owners_.find(key);
        if (it == owners_.end()) {
            owners_.emplace(key, txn);
            waiting_.erase(txn);
            return core::Result<void>();
        }
        if (it->second == txn) {
            waiting_.erase(txn);
            return core::Result<void>();
        }

        if (detect_deadlocks_ && would_deadlock(txn, key)) {
            waiting_.erase(txn);
            deadlocks_.fetch_add(1, std::memory_order_relaxed);
            BITSDB_DEBUG("txn {} refused lock on {}: deadlock", txn, key.to_string());
            return core::Result<void>::error(
                "Deadlock detected while locking cell " + key.to_string(),
                core::Error::Code::ABORTED);
        }

        waiting_[txn] = key;
        if (released_.wait_until(lock, deadline) == std::cv_status::timeout) {
            // One last look; the owner may have released right at the deadline
            if (owners_.find(key) == owners_.end()) {
                continue;
            }
            waiting_.erase(txn);
            timeouts_.fetch_add(1, std::memory_order_relaxed);
            return core::Result<void>::error(
                "Lock wait timeout on cell " + key.to_string(),
                core::Error::Code::TIMEOUT);
        }
    }
}

void LockTable::release_all(TxnID txn, const std::set<CellKey>& keys) {
    if (keys.empty()) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& key : keys) {
            auto it = owners_.find(key);
            if (it != owners_.end() && it->second == txn) {
                owners_.erase(it);
            }
        }
        waiting_.erase(txn);
    }
    released_.notify_all();
}

size_t LockTable::held_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return owners_.size();
}

bool LockTable::would_deadlock(TxnID txn, const CellKey& key) const {
    auto owner = owners_.find(key);
    // Every hop moves to a distinct waiter, so the chain is bounded
    for (size_t hops = 0; owner != owners_.end() && hops <= waiting_.size(); ++hops) {
        if (owner->second == txn) {
            return true;
        }
        auto wait = waiting_.find(owner->second);
        if (wait == waiting_.end()) {
            return false;
        }
        owner = owners_.find(wait->second);
    }
    return false;
}

} // namespace store
} // namespace bitsdb
