#ifndef BITSDB_REGISTRY_SERIES_REGISTRY_H_
#define BITSDB_REGISTRY_SERIES_REGISTRY_H_

#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

#include <absl/container/flat_hash_map.h>

#include "bitsdb/core/config.h"
#include "bitsdb/core/result.h"
#include "bitsdb/core/types.h"
#include "bitsdb/store/records.h"
#include "bitsdb/store/substrate.h"

namespace bitsdb {
namespace registry {

/**
 * @brief Request to create (or find) a series
 */
struct SeriesSpec {
    std::string name;
    std::string unit;
    core::Labels labels;
    std::optional<std::string> description;
    // Descriptive metadata; both read views work on every series
    bool overlapping = false;
    store::RetentionTier retention_tier = store::RetentionTier::MEDIUM;
};

/**
 * @brief Series lookup criteria; unset fields match everything and labels
 * match by containment
 */
struct SeriesFilter {
    std::optional<core::SeriesID> series_id;
    std::optional<std::string> name;
    std::optional<std::string> unit;
    core::Labels labels;
};

/**
 * @brief The immutable part of a series row
 */
struct SeriesIdentity {
    core::SeriesID series_id = 0;
    std::string name;
    std::string unit;
    core::Labels labels;
    bool overlapping = false;
    store::RetentionTier retention_tier = store::RetentionTier::MEDIUM;
};

/**
 * @brief Maps (name, labels) to stable series ids and canonical units.
 *
 * Identities are cached for the life of the registry. The cache is only ever
 * added to: identity and unit never change after creation. Descriptions are
 * mutable and always read from the substrate.
 */
class SeriesRegistry {
public:
    SeriesRegistry(std::shared_ptr<store::Substrate> substrate,
                   const core::RegistryConfig& config = core::RegistryConfig::Default());

    /**
     * @brief Returns the id of the series named (name, labels), creating it if
     * needed. A concurrent creation of the same identity is resolved by
     * looking the winner up again.
     */
    core::Result<core::SeriesID> create_or_get(const SeriesSpec& spec);

    /**
     * @brief Ids of all matching series ordered by (name, unit, series_id)
     */
    core::Result<std::vector<core::SeriesID>> resolve(const SeriesFilter& filter);

    core::Result<SeriesIdentity> identity(core::SeriesID id);

    /**
     * @brief Display key of a series, its name
     */
    core::Result<std::string> series_key(core::SeriesID id);

    /**
     * @brief Full row including description; not cached
     */
    core::Result<store::SeriesRecord> get(core::SeriesID id);

    core::Result<void> set_description(core::SeriesID id, std::optional<std::string> description);

    size_t cache_size() const;

private:
    std::optional<SeriesIdentity> cached(core::SeriesID id) const;
    SeriesIdentity remember(const store::SeriesRecord& record);
    core::Result<core::SeriesID> accept_existing(const store::SeriesRecord& existing,
                                                 const SeriesSpec& spec);

    std::shared_ptr<store::Substrate> substrate_;
    const core::RegistryConfig config_;

    mutable std::shared_mutex cache_mutex_;
    absl::flat_hash_map<core::SeriesID, SeriesIdentity> cache_;
};

} // namespace registry
} // namespace bitsdb

#endif // BITSDB_REGISTRY_SERIES_REGISTRY_H_
