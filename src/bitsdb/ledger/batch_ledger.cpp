#include "bitsdb/ledger/batch_ledger.h"
#include "bitsdb/common/logger.h"
#include "bitsdb/core/json.h"

namespace bitsdb {
namespace ledger {

namespace {

core::Result<void> require_zoned(const core::ZonedTime& time, const char* field) {
    if (!time.zoned()) {
        return core::Result<void>::error(
            std::string(field) + " must be timezone-qualified, got " + time.to_string(),
            core::Error::Code::INVALID_ARGUMENT);
    }
    return core::Result<void>();
}

} // namespace

BatchLedger::BatchLedger(std::shared_ptr<store::Substrate> substrate)
    : substrate_(std::move(substrate)) {}

core::Result<store::BatchRecord> BatchLedger::validate(const BatchSpec& spec) {
    using R = core::Result<store::BatchRecord>;

    if (spec.batch_id.empty()) {
        return R::error("batch_id cannot be empty", core::Error::Code::INVALID_ARGUMENT);
    }
    if (spec.tenant_id.empty()) {
        return R::error("tenant_id cannot be empty", core::Error::Code::INVALID_ARGUMENT);
    }
    if (auto r = require_zoned(spec.start_time, "batch_start_time"); !r.ok()) {
        return R::error_from(r);
    }
    if (spec.finish_time) {
        if (auto r = require_zoned(*spec.finish_time, "batch_finish_time"); !r.ok()) {
            return R::error_from(r);
        }
    }
    if (spec.known_time) {
        if (auto r = require_zoned(*spec.known_time, "known_time"); !r.ok()) {
            return R::error_from(r);
        }
    }

    store::BatchRecord record;
    record.batch_id = spec.batch_id;
    record.tenant_id = spec.tenant_id;
    record.workflow_id = spec.workflow_id;
    record.start_time = spec.start_time.micros();
    if (spec.finish_time) {
        record.finish_time = spec.finish_time->micros();
    }
    record.known_time = spec.known_time ? spec.known_time->micros()
                                        : core::ZonedTime::Now().micros();
    if (spec.params) {
        auto params = core::normalize_json_object(*spec.params, "batch params");
        if (!params.ok()) {
            return R::error_from(params);
        }
        record.params = params.take_value();
    }
    return R(std::move(record));
}

core::Result<bool> BatchLedger::create_batch(const BatchSpec& spec) {
    auto validated = validate(spec);
    if (!validated.ok()) {
        return core::Result<bool>::error_from(validated);
    }

    auto begun = substrate_->begin();
    if (!begun.ok()) {
        return core::Result<bool>::error_from(begun);
    }
    auto txn = begun.take_value();
    auto inserted = txn->insert_batch_if_absent(validated.take_value());
    if (!inserted.ok()) {
        return inserted;
    }
    auto committed = txn->commit();
    if (!committed.ok()) {
        if (committed.code() != core::Error::Code::ALREADY_EXISTS) {
            return core::Result<bool>::error_from(committed);
        }
        BITSDB_DEBUG("Batch {} created concurrently; create ignored", spec.batch_id);
        return core::Result<bool>(false);
    }

    if (inserted.value()) {
        BITSDB_INFO("Created batch {} for tenant {} (workflow '{}')", spec.batch_id,
                    spec.tenant_id, spec.workflow_id);
    } else {
        BITSDB_DEBUG("Batch {} already exists; create ignored", spec.batch_id);
    }
    return inserted;
}

core::Result<store::BatchRecord> BatchLedger::get_batch(const core::BatchID& batch_id) {
    auto begun = substrate_->begin();
    if (!begun.ok()) {
        return core::Result<store::BatchRecord>::error_from(begun);
    }
    auto txn = begun.take_value();
    auto found = txn->get_batch(batch_id);
    if (!found.ok()) {
        return core::Result<store::BatchRecord>::error_from(found);
    }
    if (!found.value()) {
        return core::Result<store::BatchRecord>::error("Batch " + batch_id + " not found",
                                                       core::Error::Code::NOT_FOUND);
    }
    auto committed = txn->commit();
    if (!committed.ok()) {
        return core::Result<store::BatchRecord>::error_from(committed);
    }
    return core::Result<store::BatchRecord>(std::move(*found.value()));
}

core::Result<std::vector<store::BatchRecord>> BatchLedger::find_batches(
    const core::TenantID& tenant_id, const std::optional<std::string>& workflow_id) {
    auto begun = substrate_->begin();
    if (!begun.ok()) {
        return core::Result<std::vector<store::BatchRecord>>::error_from(begun);
    }
    auto txn = begun.take_value();
    auto rows = txn->scan_batches(tenant_id, workflow_id);
    if (!rows.ok()) {
        return rows;
    }
    auto committed = txn->commit();
    if (!committed.ok()) {
        return core::Result<std::vector<store::BatchRecord>>::error_from(committed);
    }
    return rows;
}

} // namespace ledger
} // namespace bitsdb
