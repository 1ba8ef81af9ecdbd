#ifndef BITSDB_ENGINE_H_
#define BITSDB_ENGINE_H_

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "bitsdb/core/config.h"
#include "bitsdb/core/result.h"
#include "bitsdb/core/types.h"
#include "bitsdb/ledger/batch_ledger.h"
#include "bitsdb/projection/projector.h"
#include "bitsdb/registry/series_registry.h"
#include "bitsdb/store/substrate.h"
#include "bitsdb/store/version_store.h"

namespace bitsdb {

/**
 * @brief Bitemporal value store.
 *
 * Wires the series registry, batch ledger, version store and projector to
 * one substrate. All methods are thread-safe; the engine starts no threads
 * of its own and blocks only on substrate row locks and commits.
 */
class Engine {
public:
    explicit Engine(std::shared_ptr<store::Substrate> substrate,
                    const core::EngineConfig& config = core::EngineConfig::Default());

    /**
     * @brief Engine over a fresh MemorySubstrate
     */
    static std::unique_ptr<Engine> InMemory(
        const core::EngineConfig& config = core::EngineConfig::Default(),
        const core::SubstrateConfig& substrate_config = core::SubstrateConfig::Default());

    // Series
    core::Result<core::SeriesID> create_series(const registry::SeriesSpec& spec);
    core::Result<std::vector<core::SeriesID>> resolve_series(const registry::SeriesFilter& filter);
    core::Result<store::SeriesRecord> get_series(core::SeriesID id);
    core::Result<void> set_series_description(core::SeriesID id,
                                              std::optional<std::string> description);

    // Batches; an empty tenant_id is replaced by the configured default tenant
    core::Result<bool> create_batch(ledger::BatchSpec spec);
    core::Result<store::BatchRecord> get_batch(const core::BatchID& batch_id);
    core::Result<std::vector<store::BatchRecord>> find_batches(
        const core::TenantID& tenant_id,
        const std::optional<std::string>& workflow_id = std::nullopt);

    /**
     * @brief Creates a batch and inserts its values in one transaction;
     * a failure leaves neither behind
     */
    core::Result<store::BatchInsertResult> create_batch_with_values(
        ledger::BatchSpec spec, const std::vector<store::InsertRow>& rows,
        const store::InsertOptions& options = store::InsertOptions());

    // Values
    core::Result<size_t> insert_values(const core::BatchID& batch_id,
                                       const std::vector<store::InsertRow>& rows,
                                       const store::InsertOptions& options = store::InsertOptions());
    core::Result<store::UpdateResult> update(
        const std::vector<store::CellUpdate>& updates,
        const store::UpdateOptions& options = store::UpdateOptions());
    core::Result<std::vector<store::ValueVersion>> history(const store::CellKey& key);

    // Reads
    core::Result<std::vector<projection::ProjectedRow>> read_flat(
        const projection::ReadQuery& query);
    core::Result<std::vector<projection::ProjectedRow>> read_overlapping(
        const projection::ReadQuery& query);

    const core::EngineConfig& config() const { return config_; }
    registry::SeriesRegistry& registry() { return *registry_; }
    std::shared_ptr<store::Substrate> substrate() const { return substrate_; }

private:
    const core::EngineConfig config_;
    std::shared_ptr<store::Substrate> substrate_;
    std::shared_ptr<registry::SeriesRegistry> registry_;
    std::unique_ptr<ledger::BatchLedger> ledger_;
    std::unique_ptr<store::VersionStore> versions_;
    std::unique_ptr<projection::Projector> projector_;
};

} // namespace bitsdb

#endif // BITSDB_ENGINE_H_
