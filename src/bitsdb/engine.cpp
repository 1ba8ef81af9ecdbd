#include "bitsdb/engine.h"
#include "bitsdb/store/memory_substrate.h"

namespace bitsdb {

Engine::Engine(std::shared_ptr<store::Substrate> substrate, const core::EngineConfig& config)
    : config_(config),
      substrate_(std::move(substrate)),
      registry_(std::make_shared<registry::SeriesRegistry>(substrate_, config_.registry)),
      ledger_(std::make_unique<ledger::BatchLedger>(substrate_)),
      versions_(std::make_unique<store::VersionStore>(substrate_, registry_, config_.update)),
      projector_(std::make_unique<projection::Projector>(substrate_, registry_)) {}

std::unique_ptr<Engine> Engine::InMemory(const core::EngineConfig& config,
                                         const core::SubstrateConfig& substrate_config) {
    return std::make_unique<Engine>(std::make_shared<store::MemorySubstrate>(substrate_config),
                                    config);
}

core::Result<core::SeriesID> Engine::create_series(const registry::SeriesSpec& spec) {
    return registry_->create_or_get(spec);
}

core::Result<std::vector<core::SeriesID>> Engine::resolve_series(
    const registry::SeriesFilter& filter) {
    return registry_->resolve(filter);
}

core::Result<store::SeriesRecord> Engine::get_series(core::SeriesID id) {
    return registry_->get(id);
}

core::Result<void> Engine::set_series_description(core::SeriesID id,
                                                  std::optional<std::string> description) {
    return registry_->set_description(id, std::move(description));
}

core::Result<bool> Engine::create_batch(ledger::BatchSpec spec) {
    if (spec.tenant_id.empty()) {
        spec.tenant_id = config_.default_tenant;
    }
    return ledger_->create_batch(spec);
}

core::Result<store::BatchInsertResult> Engine::create_batch_with_values(
    ledger::BatchSpec spec, const std::vector<store::InsertRow>& rows,
    const store::InsertOptions& options) {
    if (spec.tenant_id.empty()) {
        spec.tenant_id = config_.default_tenant;
    }
    auto batch = ledger::BatchLedger::validate(spec);
    if (!batch.ok()) {
        return core::Result<store::BatchInsertResult>::error_from(batch);
    }
    return versions_->insert_batch_with_values(batch.value(), rows, options);
}

core::Result<store::BatchRecord> Engine::get_batch(const core::BatchID& batch_id) {
    return ledger_->get_batch(batch_id);
}

core::Result<std::vector<store::BatchRecord>> Engine::find_batches(
    const core::TenantID& tenant_id, const std::optional<std::string>& workflow_id) {
    return ledger_->find_batches(tenant_id, workflow_id);
}

core::Result<size_t> Engine::insert_values(const core::BatchID& batch_id,
                                           const std::vector<store::InsertRow>& rows,
                                           const store::InsertOptions& options) {
    return versions_->insert_values(batch_id, rows, options);
}

core::Result<store::UpdateResult> Engine::update(const std::vector<store::CellUpdate>& updates,
                                                 const store::UpdateOptions& options) {
    return versions_->update(updates, options);
}

core::Result<std::vector<store::ValueVersion>> Engine::history(const store::CellKey& key) {
    return versions_->history(key);
}

core::Result<std::vector<projection::ProjectedRow>> Engine::read_flat(
    const projection::ReadQuery& query) {
    return projector_->read_flat(query);
}

core::Result<std::vector<projection::ProjectedRow>> Engine::read_overlapping(
    const projection::ReadQuery& query) {
    return projector_->read_overlapping(query);
}

} // namespace bitsdb
