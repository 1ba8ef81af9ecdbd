#ifndef BITSDB_STORE_VERSION_STORE_H_
#define BITSDB_STORE_VERSION_STORE_H_

#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "bitsdb/core/config.h"
#include "bitsdb/core/result.h"
#include "bitsdb/core/tri_state.h"
#include "bitsdb/core/types.h"
#include "bitsdb/registry/series_registry.h"
#include "bitsdb/store/canonical.h"
#include "bitsdb/store/records.h"
#include "bitsdb/store/substrate.h"

namespace bitsdb {
namespace store {

/**
 * @brief One row of an initial ingestion
 */
struct InsertRow {
    core::ZonedTime valid_time;
    std::optional<core::ZonedTime> valid_time_end;
    core::SeriesID series_id = 0;
    std::optional<core::Value> value;
    std::optional<std::string> metadata;  // JSON object
};

struct InsertOptions {
    std::optional<std::string> changed_by;  // recorded on every inserted version
};

/**
 * @brief Outcome of creating a batch together with its values
 */
struct BatchInsertResult {
    bool batch_created = false;  // false when batch_id already existed
    size_t inserted = 0;
};

/**
 * @brief Addresses a cell through any of its versions
 */
struct ByValueId {
    core::ValueID value_id = 0;
};

/**
 * @brief Addresses a cell directly
 */
struct ByCellKey {
    core::BatchID batch_id;
    core::TenantID tenant_id;
    core::ZonedTime valid_time;
    core::SeriesID series_id = 0;
};

using UpdateTarget = std::variant<ByValueId, ByCellKey>;

/**
 * @brief A correction to one cell. Unset fields keep the current value,
 * Clear sets them to null. An empty tag list clears the tags.
 */
struct CellUpdate {
    UpdateTarget target;
    core::TriState<core::Value> value;
    core::TriState<std::string> annotation;
    core::TriState<Tags> tags;
    std::optional<std::string> changed_by;  // overrides UpdateOptions::changed_by
};

struct UpdateOptions {
    std::optional<std::string> changed_by;
    Deadline deadline;  // bounds every lock wait of the call
};

/**
 * @brief A version written by update(); replaced is the version it retired
 */
struct VersionRef {
    core::ValueID value_id = 0;
    CellKey key;
    std::optional<core::ValueID> replaced;
};

/**
 * @brief A cell left untouched because the merged state equals the current one
 */
struct CellRef {
    CellKey key;
    std::optional<core::ValueID> value_id;
};

struct UpdateResult {
    std::vector<VersionRef> updated;
    std::vector<CellRef> skipped_no_op;
    size_t attempts = 0;
};

/**
 * @brief Holds every version of every cell and implements the write paths.
 *
 * Each call runs in a single substrate transaction. Cells are locked in
 * CellKey order, so concurrent calls over overlapping cell sets never wait
 * on each other in a cycle. Lock timeouts, detected deadlocks and transient
 * commit failures abort the attempt, which is then rerun from scratch with
 * exponential backoff; validation and lookup failures are returned at once.
 */
class VersionStore {
public:
    VersionStore(std::shared_ptr<Substrate> substrate,
                 std::shared_ptr<registry::SeriesRegistry> registry,
                 const core::UpdateConfig& config = core::UpdateConfig::Default());

    /**
     * @brief Inserts the first version of each row's cell.
     *
     * All rows are validated before anything is written. Cells that already
     * have a current version are skipped, as are later duplicates of a cell
     * within @p rows.
     * @return Number of versions actually inserted
     */
    core::Result<size_t> insert_values(const core::BatchID& batch_id,
                                       const std::vector<InsertRow>& rows,
                                       const InsertOptions& options = InsertOptions());

    /**
     * @brief Records @p batch (insert-if-absent) and inserts @p rows into it
     * in one transaction.
     *
     * The rows are validated before anything is written. If the call fails,
     * neither the batch nor any of its values is left behind. An existing
     * batch_id is reused, as BatchLedger::create_batch does.
     */
    core::Result<BatchInsertResult> insert_batch_with_values(
        const BatchRecord& batch, const std::vector<InsertRow>& rows,
        const InsertOptions& options = InsertOptions());

    /**
     * @brief Applies tri-state corrections atomically.
     *
     * Updates addressing the same cell are applied in the order given, each
     * on top of the previous one.
     */
    core::Result<UpdateResult> update(const std::vector<CellUpdate>& updates,
                                      const UpdateOptions& options = UpdateOptions());

    /**
     * @brief Every version of a cell, oldest first
     */
    core::Result<std::vector<ValueVersion>> history(const CellKey& key);

    /**
     * @brief Checks one update without touching the substrate
     */
    static core::Result<void> validate(const CellUpdate& update);

    static core::Result<void> validate(const InsertRow& row);

private:
    core::Result<std::vector<InsertRow>> prepare_rows(const std::vector<InsertRow>& rows);
    core::Result<BatchInsertResult> insert_attempt(const BatchRecord* create,
                                                   const core::BatchID& batch_id,
                                                   const std::vector<InsertRow>& rows,
                                                   const InsertOptions& options,
                                                   Deadline lock_deadline);
    core::Result<UpdateResult> update_attempt(const std::vector<CellUpdate>& updates,
                                              const UpdateOptions& options,
                                              Deadline lock_deadline);
    core::Result<void> check_creatable(Transaction& txn, const CellKey& key);

    template<typename T, typename Attempt>
    core::Result<T> with_retry(const char* operation, Deadline deadline, Attempt&& attempt);

    std::shared_ptr<Substrate> substrate_;
    std::shared_ptr<registry::SeriesRegistry> registry_;
    const core::UpdateConfig config_;
};

/**
 * @brief Cell key addressed by a ByCellKey target
 */
CellKey to_cell_key(const ByCellKey& target);

} // namespace store
} // namespace bitsdb

#endif // BITSDB_STORE_VERSION_STORE_H_
