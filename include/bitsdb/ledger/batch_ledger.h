#ifndef BITSDB_LEDGER_BATCH_LEDGER_H_
#define BITSDB_LEDGER_BATCH_LEDGER_H_

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "bitsdb/core/result.h"
#include "bitsdb/core/types.h"
#include "bitsdb/store/records.h"
#include "bitsdb/store/substrate.h"

namespace bitsdb {
namespace ledger {

/**
 * @brief One ingestion batch as supplied by the caller
 */
struct BatchSpec {
    core::BatchID batch_id;
    core::TenantID tenant_id;
    std::string workflow_id;
    core::ZonedTime start_time;
    std::optional<core::ZonedTime> finish_time;
    std::optional<core::ZonedTime> known_time;  // defaults to insertion time
    std::optional<std::string> params;          // JSON object
};

/**
 * @brief Records ingestion batches. Batches are written once and never
 * mutated; re-creating an existing batch_id is a silent no-op so retried
 * ingestions are safe.
 */
class BatchLedger {
public:
    explicit BatchLedger(std::shared_ptr<store::Substrate> substrate);

    /**
     * @brief Validates and records a batch.
     * @return true if the batch was inserted, false if batch_id already existed
     */
    core::Result<bool> create_batch(const BatchSpec& spec);

    core::Result<store::BatchRecord> get_batch(const core::BatchID& batch_id);

    /**
     * @brief Batches of a tenant (optionally one workflow), newest known_time first
     */
    core::Result<std::vector<store::BatchRecord>> find_batches(
        const core::TenantID& tenant_id,
        const std::optional<std::string>& workflow_id = std::nullopt);

    /**
     * @brief Checks a batch request without touching the substrate
     */
    static core::Result<store::BatchRecord> validate(const BatchSpec& spec);

private:
    std::shared_ptr<store::Substrate> substrate_;
};

} // namespace ledger
} // namespace bitsdb

#endif // BITSDB_LEDGER_BATCH_LEDGER_H_
