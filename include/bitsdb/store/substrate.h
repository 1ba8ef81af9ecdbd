#ifndef BITSDB_STORE_SUBSTRATE_H_
#define BITSDB_STORE_SUBSTRATE_H_

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "bitsdb/core/result.h"
#include "bitsdb/core/types.h"
#include "bitsdb/store/records.h"

namespace bitsdb {
namespace store {

using Deadline = std::optional<std::chrono::steady_clock::time_point>;

/**
 * @brief Filter for series scans. Empty labels match everything; otherwise a
 * series matches when its labels contain every filter label.
 */
struct SeriesScan {
    std::optional<core::SeriesID> series_id;
    std::optional<std::string> name;
    std::optional<std::string> unit;
    core::Labels labels;
};

/**
 * @brief Filter for version scans
 */
struct ValueScan {
    std::optional<core::TenantID> tenant_id;
    std::optional<core::BatchID> batch_id;
    std::vector<core::SeriesID> series_ids;  // empty: all series
    core::TimeRange valid;                   // on valid_time
    bool include_retired = false;
};

/**
 * @brief A unit of work against the substrate.
 *
 * Reads see committed state plus this transaction's own writes. Writes become
 * visible to others only on commit(), all at once. Row locks taken with
 * lock_cell() are held until commit() or rollback(). Destroying an unfinished
 * transaction rolls it back.
 */
class Transaction {
public:
    virtual ~Transaction() = default;

    // Series table; unique on (name, labels)
    virtual core::Result<core::SeriesID> insert_series(SeriesRecord record) = 0;
    virtual core::Result<std::optional<SeriesRecord>> find_series(
        const std::string& name, const core::Labels& labels) = 0;
    virtual core::Result<std::optional<SeriesRecord>> get_series(core::SeriesID id) = 0;
    virtual core::Result<std::vector<SeriesRecord>> scan_series(const SeriesScan& scan) = 0;
    virtual core::Result<void> set_series_description(
        core::SeriesID id, std::optional<std::string> description) = 0;

    // Batch table; insert-on-conflict-do-nothing keyed by batch_id.
    // Returns false when the batch already existed. If another transaction
    // commits the same batch_id first, commit() fails with ALREADY_EXISTS.
    virtual core::Result<bool> insert_batch_if_absent(BatchRecord record) = 0;
    virtual core::Result<std::optional<BatchRecord>> get_batch(const core::BatchID& id) = 0;
    virtual core::Result<std::vector<BatchRecord>> scan_batches(
        const core::TenantID& tenant_id, const std::optional<std::string>& workflow_id) = 0;

    /**
     * @brief Pessimistic row lock on a cell (SELECT ... FOR UPDATE).
     * Fails with TIMEOUT when the deadline passes and ABORTED when waiting
     * would close a deadlock cycle.
     */
    virtual core::Result<void> lock_cell(const CellKey& key, Deadline deadline) = 0;

    virtual core::Result<std::optional<ValueVersion>> current_version(const CellKey& key) = 0;
    virtual core::Result<std::optional<ValueVersion>> get_version(core::ValueID id) = 0;

    /**
     * @brief Inserts a new current version and returns its fresh value_id.
     * The cell must be locked and must not already have a current version.
     */
    virtual core::Result<core::ValueID> insert_version(ValueVersion version) = 0;

    /**
     * @brief Flips is_current to false. The cell must be locked.
     */
    virtual core::Result<void> retire_version(core::ValueID id) = 0;

    virtual core::Result<std::vector<ValueVersion>> scan_versions(const ValueScan& scan) = 0;

    virtual core::Result<void> commit() = 0;
    virtual void rollback() = 0;
};

/**
 * @brief Transactional store the engine runs on
 */
class Substrate {
public:
    virtual ~Substrate() = default;

    virtual core::Result<std::unique_ptr<Transaction>> begin() = 0;
};

} // namespace store
} // namespace bitsdb

#endif // BITSDB_STORE_SUBSTRATE_H_
