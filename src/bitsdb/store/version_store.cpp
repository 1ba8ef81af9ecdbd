#include "bitsdb/store/version_store.h"
#include "bitsdb/common/logger.h"
#include "bitsdb/core/json.h"

#include <algorithm>
#include <chrono>
#include <map>
#include <set>
#include <thread>

namespace bitsdb {
namespace store {

namespace {

using Clock = std::chrono::steady_clock;

std::string row_prefix(size_t index) {
    return "Row " + std::to_string(index) + ": ";
}

std::string update_prefix(size_t index) {
    return "Update " + std::to_string(index) + ": ";
}

} // namespace

CellKey to_cell_key(const ByCellKey& target) {
    CellKey key;
    key.batch_id = target.batch_id;
    key.tenant_id = target.tenant_id;
    key.valid_time = target.valid_time.micros();
    key.series_id = target.series_id;
    return key;
}

VersionStore::VersionStore(std::shared_ptr<Substrate> substrate,
                           std::shared_ptr<registry::SeriesRegistry> registry,
                           const core::UpdateConfig& config)
    : substrate_(std::move(substrate)), registry_(std::move(registry)), config_(config) {}

core::Result<void> VersionStore::validate(const InsertRow& row) {
    if (row.series_id == 0) {
        return core::Result<void>(core::ValidationError("series_id must be set"));
    }
    if (!row.valid_time.zoned()) {
        return core::Result<void>(core::ValidationError(
            "valid_time must be timezone-qualified, got " + row.valid_time.to_string()));
    }
    if (row.valid_time_end) {
        if (!row.valid_time_end->zoned()) {
            return core::Result<void>(core::ValidationError(
                "valid_time_end must be timezone-qualified, got " +
                row.valid_time_end->to_string()));
        }
        if (row.valid_time_end->micros() <= row.valid_time.micros()) {
            return core::Result<void>(core::ValidationError(
                "valid_time_end " + row.valid_time_end->to_string() +
                " must be after valid_time " + row.valid_time.to_string()));
        }
    }
    if (row.metadata) {
        auto metadata = core::normalize_json_object(*row.metadata, "metadata");
        if (!metadata.ok()) {
            return core::Result<void>::error_from(metadata);
        }
    }
    return core::Result<void>();
}

core::Result<void> VersionStore::validate(const CellUpdate& update) {
    if (const auto* by_id = std::get_if<ByValueId>(&update.target)) {
        if (by_id->value_id == 0) {
            return core::Result<void>(core::ValidationError("value_id must be set"));
        }
    } else {
        const auto& key = std::get<ByCellKey>(update.target);
        if (key.batch_id.empty()) {
            return core::Result<void>(core::ValidationError("batch_id cannot be empty"));
        }
        if (key.tenant_id.empty()) {
            return core::Result<void>(core::ValidationError("tenant_id cannot be empty"));
        }
        if (key.series_id == 0) {
            return core::Result<void>(core::ValidationError("series_id must be set"));
        }
        if (!key.valid_time.zoned()) {
            return core::Result<void>(core::ValidationError(
                "valid_time must be timezone-qualified, got " + key.valid_time.to_string()));
        }
    }
    if (update.value.is_unset() && update.annotation.is_unset() && update.tags.is_unset()) {
        return core::Result<void>(
            core::ValidationError("No updates supplied: set at least one of value, annotation, tags"));
    }
    return core::Result<void>();
}

template<typename T, typename Attempt>
core::Result<T> VersionStore::with_retry(const char* operation, Deadline deadline,
                                         Attempt&& attempt) {
    const size_t max_attempts = std::max<size_t>(config_.max_attempts, 1);
    auto backoff = config_.initial_backoff;
    std::string last_error;

    for (size_t n = 1; n <= max_attempts; ++n) {
        auto now = Clock::now();
        if (deadline && now >= *deadline) {
            BITSDB_WARN("{} abandoned after {} attempt(s): deadline expired", operation, n - 1);
            return core::Result<T>(core::RetryableTransactionError(
                std::string(operation) + " deadline expired" +
                (last_error.empty() ? "" : " (last error: " + last_error + ")")));
        }

        Deadline lock_deadline = now + config_.lock_wait_timeout;
        if (deadline && *deadline < *lock_deadline) {
            lock_deadline = deadline;
        }

        auto result = attempt(lock_deadline, n);
        if (result.ok() || !result.retryable()) {
            return result;
        }
        last_error = result.error();
        BITSDB_DEBUG("{} attempt {}/{} failed ({}): {}", operation, n, max_attempts,
                     core::code_name(result.code()), last_error);

        if (n == max_attempts) {
            break;
        }
        auto pause = backoff;
        if (deadline) {
            auto remaining =
                std::chrono::duration_cast<std::chrono::milliseconds>(*deadline - Clock::now());
            pause = std::max(std::chrono::milliseconds(0), std::min(pause, remaining));
        }
        std::this_thread::sleep_for(pause);
        backoff = std::min(backoff * 2, config_.max_backoff);
    }

    BITSDB_WARN("{} failed after {} attempts: {}", operation, max_attempts, last_error);
    return core::Result<T>(core::RetryableTransactionError(
        std::string(operation) + " failed after " + std::to_string(max_attempts) +
        " attempts: " + last_error));
}

core::Result<std::vector<InsertRow>> VersionStore::prepare_rows(
    const std::vector<InsertRow>& rows) {
    using R = core::Result<std::vector<InsertRow>>;

    std::vector<InsertRow> prepared;
    prepared.reserve(rows.size());
    std::set<core::SeriesID> series;
    for (size_t i = 0; i < rows.size(); ++i) {
        auto valid = validate(rows[i]);
        if (!valid.ok()) {
            return R::error(row_prefix(i) + valid.error(), valid.code());
        }
        prepared.push_back(rows[i]);
        if (rows[i].metadata) {
            auto metadata = core::normalize_json_object(*rows[i].metadata, "metadata");
            if (!metadata.ok()) {
                return R::error_from(metadata);
            }
            prepared.back().metadata = metadata.take_value();
        }
        series.insert(rows[i].series_id);
    }

    for (auto id : series) {
        auto identity = registry_->identity(id);
        if (!identity.ok()) {
            return R::error_from(identity);
        }
    }
    return R(std::move(prepared));
}

core::Result<size_t> VersionStore::insert_values(const core::BatchID& batch_id,
                                                 const std::vector<InsertRow>& rows,
                                                 const InsertOptions& options) {
    if (batch_id.empty()) {
        return core::Result<size_t>(core::ValidationError("batch_id cannot be empty"));
    }
    auto prepared = prepare_rows(rows);
    if (!prepared.ok()) {
        return core::Result<size_t>::error_from(prepared);
    }
    if (prepared.value().empty()) {
        return core::Result<size_t>(size_t{0});
    }

    auto done = with_retry<BatchInsertResult>(
        "insert_values", std::nullopt, [&](Deadline lock_deadline, size_t) {
            return insert_attempt(nullptr, batch_id, prepared.value(), options, lock_deadline);
        });
    if (!done.ok()) {
        return core::Result<size_t>::error_from(done);
    }
    return core::Result<size_t>(done.value().inserted);
}

core::Result<BatchInsertResult> VersionStore::insert_batch_with_values(
    const BatchRecord& batch, const std::vector<InsertRow>& rows, const InsertOptions& options) {
    if (batch.batch_id.empty()) {
        return core::Result<BatchInsertResult>(core::ValidationError("batch_id cannot be empty"));
    }
    if (batch.tenant_id.empty()) {
        return core::Result<BatchInsertResult>(core::ValidationError("tenant_id cannot be empty"));
    }
    auto prepared = prepare_rows(rows);
    if (!prepared.ok()) {
        return core::Result<BatchInsertResult>::error_from(prepared);
    }

    auto done = with_retry<BatchInsertResult>(
        "insert_batch_with_values", std::nullopt, [&](Deadline lock_deadline, size_t) {
            return insert_attempt(&batch, batch.batch_id, prepared.value(), options,
                                  lock_deadline);
        });
    if (done.ok() && done.value().batch_created) {
        BITSDB_INFO("Created batch {} for tenant {} (workflow '{}') with {} value(s)",
                    batch.batch_id, batch.tenant_id, batch.workflow_id, done.value().inserted);
    }
    return done;
}

core::Result<BatchInsertResult> VersionStore::insert_attempt(const BatchRecord* create,
                                                             const core::BatchID& batch_id,
                                                             const std::vector<InsertRow>& rows,
                                                             const InsertOptions& options,
                                                             Deadline lock_deadline) {
    using R = core::Result<BatchInsertResult>;

    auto begun = substrate_->begin();
    if (!begun.ok()) {
        return R::error_from(begun);
    }
    auto txn = begun.take_value();

    BatchInsertResult out;
    if (create) {
        auto created = txn->insert_batch_if_absent(*create);
        if (!created.ok()) {
            return R::error_from(created);
        }
        out.batch_created = created.value();
    }

    auto batch = txn->get_batch(batch_id);
    if (!batch.ok()) {
        return R::error_from(batch);
    }
    if (!batch.value()) {
        return R(core::NotFoundError("Batch " + batch_id + " not found"));
    }
    const auto tenant_id = batch.value()->tenant_id;

    // First occurrence of a cell wins; the map also yields lock order
    std::map<CellKey, const InsertRow*> cells;
    for (const auto& row : rows) {
        CellKey key;
        key.batch_id = batch_id;
        key.tenant_id = tenant_id;
        key.valid_time = row.valid_time.micros();
        key.series_id = row.series_id;
        cells.emplace(std::move(key), &row);
    }

    const auto now = core::ZonedTime::Now().micros();
    for (const auto& [key, row] : cells) {
        auto locked = txn->lock_cell(key, lock_deadline);
        if (!locked.ok()) {
            return R::error_from(locked);
        }
        auto current = txn->current_version(key);
        if (!current.ok()) {
            return R::error_from(current);
        }
        if (current.value()) {
            continue;
        }

        ValueVersion version;
        version.key = key;
        if (row->valid_time_end) {
            version.valid_time_end = row->valid_time_end->micros();
        }
        version.value = row->value;
        version.metadata = row->metadata;
        version.changed_by = options.changed_by;
        version.change_time = now;
        auto id = txn->insert_version(std::move(version));
        if (!id.ok()) {
            return R::error_from(id);
        }
        ++out.inserted;
    }

    auto committed = txn->commit();
    if (!committed.ok()) {
        if (create && out.batch_created &&
            committed.code() == core::Error::Code::ALREADY_EXISTS) {
            // Lost the batch to a concurrent creator; rerun against its row
            return R(core::RetryableTransactionError(committed.error()));
        }
        return R::error_from(committed);
    }
    BITSDB_DEBUG("Inserted {} of {} cells into batch {}", out.inserted, cells.size(), batch_id);
    return R(std::move(out));
}

core::Result<UpdateResult> VersionStore::update(const std::vector<CellUpdate>& updates,
                                                const UpdateOptions& options) {
    for (size_t i = 0; i < updates.size(); ++i) {
        auto valid = validate(updates[i]);
        if (!valid.ok()) {
            return core::Result<UpdateResult>::error(update_prefix(i) + valid.error(), valid.code());
        }
    }
    if (updates.empty()) {
        return core::Result<UpdateResult>(UpdateResult());
    }

    return with_retry<UpdateResult>("update", options.deadline,
                                    [&](Deadline lock_deadline, size_t attempt) {
                                        auto result = update_attempt(updates, options, lock_deadline);
                                        if (result.ok()) {
                                            result.value().attempts = attempt;
                                        }
                                        return result;
                                    });
}

core::Result<void> VersionStore::check_creatable(Transaction& txn, const CellKey& key) {
    auto batch = txn.get_batch(key.batch_id);
    if (!batch.ok()) {
        return core::Result<void>::error_from(batch);
    }
    if (!batch.value()) {
        return core::Result<void>(core::NotFoundError("Batch " + key.batch_id + " not found"));
    }
    if (batch.value()->tenant_id != key.tenant_id) {
        return core::Result<void>(core::ValidationError(
            "Batch " + key.batch_id + " belongs to tenant " + batch.value()->tenant_id +
            ", not " + key.tenant_id));
    }
    auto identity = registry_->identity(key.series_id);
    if (!identity.ok()) {
        return core::Result<void>::error_from(identity);
    }
    return core::Result<void>();
}

core::Result<UpdateResult> VersionStore::update_attempt(const std::vector<CellUpdate>& updates,
                                                        const UpdateOptions& options,
                                                        Deadline lock_deadline) {
    using R = core::Result<UpdateResult>;

    auto begun = substrate_->begin();
    if (!begun.ok()) {
        return R::error_from(begun);
    }
    auto txn = begun.take_value();

    // Resolve every target to its cell before any lock is taken
    std::map<CellKey, std::vector<size_t>> cells;
    for (size_t i = 0; i < updates.size(); ++i) {
        if (const auto* by_id = std::get_if<ByValueId>(&updates[i].target)) {
            auto version = txn->get_version(by_id->value_id);
            if (!version.ok()) {
                return R::error_from(version);
            }
            if (!version.value()) {
                return R(core::NotFoundError(update_prefix(i) + "value " +
                                             std::to_string(by_id->value_id) + " not found"));
            }
            cells[version.value()->key].push_back(i);
        } else {
            cells[to_cell_key(std::get<ByCellKey>(updates[i].target))].push_back(i);
        }
    }

    BITSDB_DEBUG("Locking {} cell(s) for {} update(s)", cells.size(), updates.size());
    for (const auto& entry : cells) {
        auto locked = txn->lock_cell(entry.first, lock_deadline);
        if (!locked.ok()) {
            return R::error_from(locked);
        }
    }

    UpdateResult out;
    const auto now = core::ZonedTime::Now().micros();
    for (const auto& [key, indices] : cells) {
        auto found = txn->current_version(key);
        if (!found.ok()) {
            return R::error_from(found);
        }
        std::optional<ValueVersion> current = found.take_value();

        for (auto i : indices) {
            const auto& update = updates[i];
            if (!current) {
                if (update.value.is_unset()) {
                    return R(core::ValidationError(
                        update_prefix(i) + "cell " + key.to_string() +
                        " has no current version; 'value' must be supplied to create it"));
                }
                auto creatable = check_creatable(*txn, key);
                if (!creatable.ok()) {
                    return R::error(update_prefix(i) + creatable.error(), creatable.code());
                }
            }

            std::optional<core::Value> current_value;
            std::optional<std::string> current_annotation;
            std::optional<Tags> current_tags;
            if (current) {
                current_value = current->value;
                current_annotation = current->annotation;
                current_tags = current->tags;
            }

            auto merged = CanonicalTriple::of(update.value.merge(current_value),
                                              update.annotation.merge(current_annotation),
                                              update.tags.merge(current_tags));
            if (current &&
                merged == CanonicalTriple::of(current_value, current_annotation, current_tags)) {
                out.skipped_no_op.push_back(CellRef{key, current->value_id});
                continue;
            }

            ValueVersion next;
            next.key = key;
            next.value = merged.value;
            next.annotation = std::move(merged.annotation);
            next.tags = std::move(merged.tags);
            next.changed_by = update.changed_by ? update.changed_by : options.changed_by;
            next.change_time = now;

            std::optional<core::ValueID> replaced;
            if (current) {
                next.valid_time_end = current->valid_time_end;
                next.metadata = current->metadata;
                auto retired = txn->retire_version(current->value_id);
                if (!retired.ok()) {
                    return R::error_from(retired);
                }
                replaced = current->value_id;
            }

            auto id = txn->insert_version(next);
            if (!id.ok()) {
                return R::error_from(id);
            }
            next.value_id = id.value();
            next.is_current = true;
            out.updated.push_back(VersionRef{next.value_id, key, replaced});
            current = std::move(next);
        }
    }

    auto committed = txn->commit();
    if (!committed.ok()) {
        return R::error_from(committed);
    }
    BITSDB_DEBUG("Update committed: {} written, {} unchanged", out.updated.size(),
                 out.skipped_no_op.size());
    return R(std::move(out));
}

core::Result<std::vector<ValueVersion>> VersionStore::history(const CellKey& key) {
    using R = core::Result<std::vector<ValueVersion>>;

    ValueScan scan;
    scan.tenant_id = key.tenant_id;
    scan.batch_id = key.batch_id;
    scan.series_ids.push_back(key.series_id);
    scan.valid.start = key.valid_time;
    scan.valid.end = key.valid_time + 1;
    scan.include_retired = true;

    auto begun = substrate_->begin();
    if (!begun.ok()) {
        return R::error_from(begun);
    }
    auto txn = begun.take_value();
    auto versions = txn->scan_versions(scan);
    if (!versions.ok()) {
        return versions;
    }
    auto committed = txn->commit();
    if (!committed.ok()) {
        return R::error_from(committed);
    }

    auto out = versions.take_value();
    std::sort(out.begin(), out.end(), [](const ValueVersion& a, const ValueVersion& b) {
        return a.value_id < b.value_id;
    });
    return R(std::move(out));
}

} // namespace store
} // namespace bitsdb
