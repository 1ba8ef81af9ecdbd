#ifndef BITSDB_PROJECTION_PROJECTOR_H_
#define BITSDB_PROJECTION_PROJECTOR_H_

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "bitsdb/core/result.h"
#include "bitsdb/core/types.h"
#include "bitsdb/registry/series_registry.h"
#include "bitsdb/store/records.h"
#include "bitsdb/store/substrate.h"

namespace bitsdb {
namespace projection {

/**
 * @brief Read filter shared by both projections. Ranges are half-open
 * [start, end); unset bounds are open.
 */
struct ReadQuery {
    std::optional<core::TenantID> tenant_id;
    std::vector<core::SeriesID> series_ids;  // empty: all series
    std::optional<core::ZonedTime> start_valid;
    std::optional<core::ZonedTime> end_valid;
    std::optional<core::ZonedTime> start_known;
    std::optional<core::ZonedTime> end_known;
    bool all_versions = false;
};

/**
 * @brief One version joined with its batch and series
 */
struct ProjectedRow {
    core::ValueID value_id = 0;
    core::BatchID batch_id;
    core::TenantID tenant_id;
    core::SeriesID series_id = 0;
    std::string series_key;
    std::string series_unit;
    core::Labels series_labels;
    core::Timestamp valid_time = 0;
    std::optional<core::Timestamp> valid_time_end;
    core::Timestamp known_time = 0;
    std::optional<core::Value> value;
    std::optional<std::string> annotation;
    std::optional<std::vector<std::string>> tags;
    std::optional<std::string> metadata;
    std::optional<std::string> changed_by;
    core::Timestamp change_time = 0;
    bool is_current = true;
};

/**
 * @brief Derives the flat and overlapping views from the version log
 */
class Projector {
public:
    Projector(std::shared_ptr<store::Substrate> substrate,
              std::shared_ptr<registry::SeriesRegistry> registry);

    /**
     * @brief Best-known value per (valid_time, series).
     *
     * Among the current versions of the instant in every batch the query
     * covers, the one whose batch has the greatest known_time wins; equal
     * known_times go to the batch inserted last. Set tenant_id to restrict
     * the competition to one tenant's batches. Rows are ordered by (valid_time, series_id). With all_versions,
     * every version of each winning cell is returned, ordered by
     * (valid_time, series_id, value_id).
     */
    core::Result<std::vector<ProjectedRow>> read_flat(const ReadQuery& query);

    /**
     * @brief Every current version, ordered by (known_time, valid_time,
     * series_id, batch insertion order). all_versions adds retired versions.
     */
    core::Result<std::vector<ProjectedRow>> read_overlapping(const ReadQuery& query);

private:
    struct Scanned;

    core::Result<Scanned> scan(const ReadQuery& query);
    core::Result<std::vector<ProjectedRow>> join(const Scanned& scanned,
                                                 const std::vector<size_t>& order);

    std::shared_ptr<store::Substrate> substrate_;
    std::shared_ptr<registry::SeriesRegistry> registry_;
};

} // namespace projection
} // namespace bitsdb

#endif // BITSDB_PROJECTION_PROJECTOR_H_
