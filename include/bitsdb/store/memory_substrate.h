#ifndef BITSDB_STORE_MEMORY_SUBSTRATE_H_
#define BITSDB_STORE_MEMORY_SUBSTRATE_H_

#include <atomic>
#include <map>
#include <memory>
#include <set>
#include <shared_mutex>
#include <string>
#include <utility>

#include "bitsdb/core/config.h"
#include "bitsdb/store/lock_table.h"
#include "bitsdb/store/substrate.h"

namespace bitsdb {
namespace store {

/**
 * @brief Counters exposed for tests and diagnostics
 */
struct SubstrateStats {
    uint64_t commits = 0;
    uint64_t rollbacks = 0;
    uint64_t conflicts = 0;
    uint64_t lock_timeouts = 0;
    uint64_t deadlocks = 0;
    size_t versions = 0;
    size_t current_cells = 0;
    size_t locks_held = 0;
};

/**
 * @brief In-process transactional substrate.
 *
 * Committed tables are guarded by one reader/writer mutex that is held only
 * for the duration of a lookup or of applying a commit; row locks live in a
 * separate LockTable so readers never wait on writers' cell locks.
 * The substrate must outlive every transaction it hands out.
 */
class MemorySubstrate : public Substrate {
public:
    explicit MemorySubstrate(const core::SubstrateConfig& config = core::SubstrateConfig::Default());
    ~MemorySubstrate() override;

    core::Result<std::unique_ptr<Transaction>> begin() override;

    /**
     * @brief Makes the next @p count commits that carry writes fail with
     * ABORTED, as a store would on a transient failure.
     */
    void fail_next_commits(size_t count);

    SubstrateStats stats() const;

private:
    class Txn;
    friend class Txn;

    using Identity = std::pair<std::string, core::Labels>;

    const core::SubstrateConfig config_;
    LockTable locks_;

    mutable std::shared_mutex mutex_;
    std::map<core::SeriesID, SeriesRecord> series_;
    std::map<Identity, core::SeriesID> series_identity_;
    std::map<core::BatchID, BatchRecord> batches_;
    std::map<core::ValueID, ValueVersion> versions_;
    std::map<CellKey, core::ValueID> current_;

    std::atomic<uint64_t> next_txn_id_{1};
    std::atomic<core::SeriesID> next_series_id_{1};
    std::atomic<core::ValueID> next_value_id_{1};
    std::atomic<uint64_t> next_batch_seq_{1};

    std::atomic<size_t> injected_failures_{0};
    std::atomic<uint64_t> commits_{0};
    std::atomic<uint64_t> rollbacks_{0};
    std::atomic<uint64_t> conflicts_{0};
};

} // namespace store
} // namespace bitsdb

#endif // BITSDB_STORE_MEMORY_SUBSTRATE_H_
