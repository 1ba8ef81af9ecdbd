#ifndef BITSDB_STORE_RECORDS_H_
#define BITSDB_STORE_RECORDS_H_

#include <optional>
#include <string>
#include <tuple>
#include <vector>

#include "bitsdb/core/types.h"

namespace bitsdb {
namespace store {

/**
 * @brief Retention class recorded on a series. Descriptive only: the engine
 * stores and returns it but keeps every version regardless of tier.
 */
enum class RetentionTier {
    SHORT,
    MEDIUM,
    LONG
};

const char* retention_tier_name(RetentionTier tier);

/**
 * @brief One logical fact slot: a batch's view of one series at one instant
 *
 * Ordering is lexicographic over (batch_id, tenant_id, valid_time, series_id)
 * and is the order in which cells are locked.
 */
struct CellKey {
    core::BatchID batch_id;
    core::TenantID tenant_id;
    core::Timestamp valid_time = 0;
    core::SeriesID series_id = 0;

    bool operator<(const CellKey& other) const {
        return std::tie(batch_id, tenant_id, valid_time, series_id) <
               std::tie(other.batch_id, other.tenant_id, other.valid_time, other.series_id);
    }
    bool operator==(const CellKey& other) const {
        return batch_id == other.batch_id && tenant_id == other.tenant_id &&
               valid_time == other.valid_time && series_id == other.series_id;
    }
    bool operator!=(const CellKey& other) const { return !(*this == other); }

    std::string to_string() const;
};

/**
 * @brief Row of the series table
 */
struct SeriesRecord {
    core::SeriesID series_id = 0;
    std::string name;
    std::string unit;
    core::Labels labels;
    std::optional<std::string> description;
    bool overlapping = false;
    RetentionTier retention_tier = RetentionTier::MEDIUM;
    core::Timestamp inserted_at = 0;
};

/**
 * @brief Row of the batch table. Never mutated after insertion.
 */
struct BatchRecord {
    core::BatchID batch_id;
    core::TenantID tenant_id;
    std::string workflow_id;
    core::Timestamp start_time = 0;
    std::optional<core::Timestamp> finish_time;
    core::Timestamp known_time = 0;
    std::optional<std::string> params;  // compact JSON object
    uint64_t inserted_seq = 0;          // assigned by the substrate, monotonic
    core::Timestamp inserted_at = 0;
};

/**
 * @brief One recorded version of a cell
 */
struct ValueVersion {
    core::ValueID value_id = 0;
    CellKey key;
    std::optional<core::Timestamp> valid_time_end;
    std::optional<core::Value> value;
    std::optional<std::string> annotation;
    std::optional<std::vector<std::string>> tags;
    std::optional<std::string> metadata;  // compact JSON object
    std::optional<std::string> changed_by;
    core::Timestamp change_time = 0;
    bool is_current = true;
};

} // namespace store
} // namespace bitsdb

#endif // BITSDB_STORE_RECORDS_H_
