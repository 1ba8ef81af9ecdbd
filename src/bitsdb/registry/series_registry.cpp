#include "bitsdb/registry/series_registry.h"
#include "bitsdb/common/logger.h"
#include "bitsdb/core/json.h"

#include <mutex>

#include <absl/strings/ascii.h>

namespace bitsdb {
namespace registry {

namespace {

// A lost creation race is retried this many times before giving up
constexpr int kCreateAttempts = 3;

std::string trimmed(const std::string& text) {
    return std::string(absl::StripAsciiWhitespace(text));
}

core::Result<store::SeriesRecord> not_found(core::SeriesID id) {
    return core::Result<store::SeriesRecord>::error(
        "Series " + std::to_string(id) + " not found", core::Error::Code::NOT_FOUND);
}

} // namespace

SeriesRegistry::SeriesRegistry(std::shared_ptr<store::Substrate> substrate,
                               const core::RegistryConfig& config)
    : substrate_(std::move(substrate)), config_(config) {}

core::Result<core::SeriesID> SeriesRegistry::create_or_get(const SeriesSpec& spec) {
    store::SeriesRecord record;
    record.name = trimmed(spec.name);
    record.unit = trimmed(spec.unit);
    record.labels = spec.labels;
    record.overlapping = spec.overlapping;
    record.retention_tier = spec.retention_tier;
    if (spec.description) {
        auto description = trimmed(*spec.description);
        if (!description.empty()) {
            record.description = std::move(description);
        }
    }

    if (record.name.empty()) {
        return core::Result<core::SeriesID>::error("Series name cannot be empty",
                                                   core::Error::Code::INVALID_ARGUMENT);
    }
    if (record.unit.empty()) {
        return core::Result<core::SeriesID>::error("Series unit cannot be empty",
                                                   core::Error::Code::INVALID_ARGUMENT);
    }

    for (int attempt = 0; attempt < kCreateAttempts; ++attempt) {
        auto begun = substrate_->begin();
        if (!begun.ok()) {
            return core::Result<core::SeriesID>::error_from(begun);
        }
        auto txn = begun.take_value();

        auto existing = txn->find_series(record.name, record.labels);
        if (!existing.ok()) {
            return core::Result<core::SeriesID>::error_from(existing);
        }
        if (existing.value()) {
            txn->rollback();
            return accept_existing(*existing.value(), spec);
        }

        auto inserted = txn->insert_series(record);
        if (inserted.ok()) {
            auto committed = txn->commit();
            if (committed.ok()) {
                record.series_id = inserted.value();
                remember(record);
                BITSDB_INFO("Created series {} '{}' {} [{}]", record.series_id, record.name,
                            core::labels_to_json(record.labels), record.unit);
                return core::Result<core::SeriesID>(record.series_id);
            }
            if (committed.code() != core::Error::Code::ALREADY_EXISTS) {
                return core::Result<core::SeriesID>::error_from(committed);
            }
        } else if (inserted.code() != core::Error::Code::ALREADY_EXISTS) {
            return core::Result<core::SeriesID>::error_from(inserted);
        }

        // Lost the race on the (name, labels) constraint; the winner is visible now
        BITSDB_DEBUG("Series '{}' {} created concurrently, looking it up again", record.name,
                     core::labels_to_json(record.labels));
    }

    return core::Result<core::SeriesID>::error(
        "Series '" + record.name + "' could not be created or found", core::Error::Code::INTERNAL);
}

core::Result<core::SeriesID> SeriesRegistry::accept_existing(const store::SeriesRecord& existing,
                                                             const SeriesSpec& spec) {
    auto requested_unit = trimmed(spec.unit);
    if (existing.unit != requested_unit) {
        if (config_.strict_unit) {
            return core::Result<core::SeriesID>::error(
                "Series '" + existing.name + "' " + core::labels_to_json(existing.labels) +
                    " has unit '" + existing.unit + "', not '" + requested_unit + "'",
                core::Error::Code::INVALID_ARGUMENT);
        }
        BITSDB_WARN("Series '{}' {} already exists with unit '{}'; requested unit '{}' ignored",
                    existing.name, core::labels_to_json(existing.labels), existing.unit,
                    requested_unit);
    }
    remember(existing);
    return core::Result<core::SeriesID>(existing.series_id);
}

core::Result<std::vector<core::SeriesID>> SeriesRegistry::resolve(const SeriesFilter& filter) {
    store::SeriesScan scan;
    scan.series_id = filter.series_id;
    scan.name = filter.name;
    scan.unit = filter.unit;
    scan.labels = filter.labels;

    auto begun = substrate_->begin();
    if (!begun.ok()) {
        return core::Result<std::vector<core::SeriesID>>::error_from(begun);
    }
    auto txn = begun.take_value();
    auto rows = txn->scan_series(scan);
    if (!rows.ok()) {
        return core::Result<std::vector<core::SeriesID>>::error_from(rows);
    }
    auto committed = txn->commit();
    if (!committed.ok()) {
        return core::Result<std::vector<core::SeriesID>>::error_from(committed);
    }

    std::vector<core::SeriesID> ids;
    ids.reserve(rows.value().size());
    for (const auto& record : rows.value()) {
        remember(record);
        ids.push_back(record.series_id);
    }
    return core::Result<std::vector<core::SeriesID>>(std::move(ids));
}

core::Result<SeriesIdentity> SeriesRegistry::identity(core::SeriesID id) {
    if (auto hit = cached(id)) {
        return core::Result<SeriesIdentity>(std::move(*hit));
    }
    auto record = get(id);
    if (!record.ok()) {
        return core::Result<SeriesIdentity>::error_from(record);
    }
    return core::Result<SeriesIdentity>(remember(record.value()));
}

core::Result<std::string> SeriesRegistry::series_key(core::SeriesID id) {
    auto found = identity(id);
    if (!found.ok()) {
        return core::Result<std::string>::error_from(found);
    }
    return core::Result<std::string>(found.value().name);
}

core::Result<store::SeriesRecord> SeriesRegistry::get(core::SeriesID id) {
    auto begun = substrate_->begin();
    if (!begun.ok()) {
        return core::Result<store::SeriesRecord>::error_from(begun);
    }
    auto txn = begun.take_value();
    auto found = txn->get_series(id);
    if (!found.ok()) {
        return core::Result<store::SeriesRecord>::error_from(found);
    }
    auto committed = txn->commit();
    if (!committed.ok()) {
        return core::Result<store::SeriesRecord>::error_from(committed);
    }
    if (!found.value()) {
        return not_found(id);
    }
    return core::Result<store::SeriesRecord>(std::move(*found.value()));
}

core::Result<void> SeriesRegistry::set_description(core::SeriesID id,
                                                   std::optional<std::string> description) {
    if (description) {
        description = trimmed(*description);
        if (description->empty()) {
            description.reset();
        }
    }

    auto begun = substrate_->begin();
    if (!begun.ok()) {
        return core::Result<void>::error_from(begun);
    }
    auto txn = begun.take_value();
    auto updated = txn->set_series_description(id, std::move(description));
    if (!updated.ok()) {
        return updated;
    }
    return txn->commit();
}

size_t SeriesRegistry::cache_size() const {
    std::shared_lock<std::shared_mutex> lock(cache_mutex_);
    return cache_.size();
}

std::optional<SeriesIdentity> SeriesRegistry::cached(core::SeriesID id) const {
    std::shared_lock<std::shared_mutex> lock(cache_mutex_);
    auto it = cache_.find(id);
    if (it == cache_.end()) {
        return std::nullopt;
    }
    return it->second;
}

SeriesIdentity SeriesRegistry::remember(const store::SeriesRecord& record) {
    SeriesIdentity identity;
    identity.series_id = record.series_id;
    identity.name = record.name;
    identity.unit = record.unit;
    identity.labels = record.labels;
    identity.overlapping = record.overlapping;
    identity.retention_tier = record.retention_tier;

    std::unique_lock<std::shared_mutex> lock(cache_mutex_);
    // First entry wins; identities never change
    return cache_.emplace(identity.series_id, identity).first->second;
}

} // namespace registry
} // namespace bitsdb
