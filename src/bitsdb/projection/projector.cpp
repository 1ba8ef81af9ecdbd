#include "bitsdb/projection/projector.h"
#include "bitsdb/common/logger.h"

#include <algorithm>
#include <map>
#include <set>
#include <tuple>
#include <utility>

namespace bitsdb {
namespace projection {

namespace {

using Rows = std::vector<ProjectedRow>;

core::Result<std::optional<core::Timestamp>> bound(const std::optional<core::ZonedTime>& time,
                                                   const char* field) {
    using R = core::Result<std::optional<core::Timestamp>>;
    if (!time) {
        return R(std::nullopt);
    }
    if (!time->zoned()) {
        return R(core::ValidationError(std::string(field) + " must be timezone-qualified, got " +
                                       time->to_string()));
    }
    return R(time->micros());
}

} // namespace

/**
 * @brief Versions matching a query together with their batches
 */
struct Projector::Scanned {
    std::vector<store::ValueVersion> versions;
    std::map<core::BatchID, store::BatchRecord> batches;

    const store::BatchRecord& batch_of(size_t index) const {
        return batches.at(versions[index].key.batch_id);
    }
};

Projector::Projector(std::shared_ptr<store::Substrate> substrate,
                     std::shared_ptr<registry::SeriesRegistry> registry)
    : substrate_(std::move(substrate)), registry_(std::move(registry)) {}

core::Result<Projector::Scanned> Projector::scan(const ReadQuery& query) {
    using R = core::Result<Scanned>;

    store::ValueScan filter;
    filter.tenant_id = query.tenant_id;
    filter.series_ids = query.series_ids;
    filter.include_retired = query.all_versions;

    auto start_valid = bound(query.start_valid, "start_valid");
    if (!start_valid.ok()) {
        return R::error_from(start_valid);
    }
    auto end_valid = bound(query.end_valid, "end_valid");
    if (!end_valid.ok()) {
        return R::error_from(end_valid);
    }
    auto start_known = bound(query.start_known, "start_known");
    if (!start_known.ok()) {
        return R::error_from(start_known);
    }
    auto end_known = bound(query.end_known, "end_known");
    if (!end_known.ok()) {
        return R::error_from(end_known);
    }
    filter.valid.start = start_valid.value();
    filter.valid.end = end_valid.value();
    core::TimeRange known;
    known.start = start_known.value();
    known.end = end_known.value();

    auto begun = substrate_->begin();
    if (!begun.ok()) {
        return R::error_from(begun);
    }
    auto txn = begun.take_value();
    auto versions = txn->scan_versions(filter);
    if (!versions.ok()) {
        return R::error_from(versions);
    }

    Scanned scanned;
    for (auto& version : versions.value()) {
        auto it = scanned.batches.find(version.key.batch_id);
        if (it == scanned.batches.end()) {
            auto batch = txn->get_batch(version.key.batch_id);
            if (!batch.ok()) {
                return R::error_from(batch);
            }
            if (!batch.value()) {
                return R(core::NotFoundError("Batch " + version.key.batch_id + " of value " +
                                             std::to_string(version.value_id) + " not found"));
            }
            it = scanned.batches.emplace(version.key.batch_id, std::move(*batch.value())).first;
        }
        if (known.contains(it->second.known_time)) {
            scanned.versions.push_back(std::move(version));
        }
    }

    auto committed = txn->commit();
    if (!committed.ok()) {
        return R::error_from(committed);
    }
    return R(std::move(scanned));
}

core::Result<Rows> Projector::join(const Scanned& scanned, const std::vector<size_t>& order) {
    std::map<core::SeriesID, registry::SeriesIdentity> series;
    Rows rows;
    rows.reserve(order.size());

    for (auto index : order) {
        const auto& version = scanned.versions[index];
        auto known = series.find(version.key.series_id);
        if (known == series.end()) {
            auto identity = registry_->identity(version.key.series_id);
            if (!identity.ok()) {
                return core::Result<Rows>::error(
                    "Value " + std::to_string(version.value_id) +
                        " references an unresolvable series: " + identity.error(),
                    identity.code());
            }
            known = series.emplace(version.key.series_id, identity.take_value()).first;
        }

        ProjectedRow row;
        row.value_id = version.value_id;
        row.batch_id = version.key.batch_id;
        row.tenant_id = version.key.tenant_id;
        row.series_id = version.key.series_id;
        row.series_key = known->second.name;
        row.series_unit = known->second.unit;
        row.series_labels = known->second.labels;
        row.valid_time = version.key.valid_time;
        row.valid_time_end = version.valid_time_end;
        row.known_time = scanned.batch_of(index).known_time;
        row.value = version.value;
        row.annotation = version.annotation;
        row.tags = version.tags;
        row.metadata = version.metadata;
        row.changed_by = version.changed_by;
        row.change_time = version.change_time;
        row.is_current = version.is_current;
        rows.push_back(std::move(row));
    }
    return core::Result<Rows>(std::move(rows));
}

core::Result<Rows> Projector::read_flat(const ReadQuery& query) {
    auto scanned = scan(query);
    if (!scanned.ok()) {
        return core::Result<Rows>::error_from(scanned);
    }
    const auto& data = scanned.value();
    const auto& versions = data.versions;

    // One winner per (valid_time, series_id) across every batch in scope
    using Instant = std::pair<core::Timestamp, core::SeriesID>;
    std::map<Instant, size_t> winners;
    for (size_t i = 0; i < versions.size(); ++i) {
        const auto& version = versions[i];
        if (!version.is_current) {
            continue;
        }
        Instant instant(version.key.valid_time, version.key.series_id);
        auto it = winners.find(instant);
        if (it == winners.end()) {
            winners.emplace(std::move(instant), i);
            continue;
        }
        const auto& challenger = data.batch_of(i);
        const auto& holder = data.batch_of(it->second);
        if (std::tie(challenger.known_time, challenger.inserted_seq) >
            std::tie(holder.known_time, holder.inserted_seq)) {
            it->second = i;
        }
    }

    std::vector<size_t> order;
    if (!query.all_versions) {
        // map order is already (valid_time, series_id)
        for (const auto& entry : winners) {
            order.push_back(entry.second);
        }
    } else {
        std::set<store::CellKey> cells;
        for (const auto& entry : winners) {
            cells.insert(versions[entry.second].key);
        }
        for (size_t i = 0; i < versions.size(); ++i) {
            if (cells.count(versions[i].key) > 0) {
                order.push_back(i);
            }
        }
        std::sort(order.begin(), order.end(), [&](size_t a, size_t b) {
            const auto& x = versions[a];
            const auto& y = versions[b];
            return std::tie(x.key.valid_time, x.key.series_id, x.value_id) <
                   std::tie(y.key.valid_time, y.key.series_id, y.value_id);
        });
    }

    BITSDB_DEBUG("Flat read: {} instants from {} versions", winners.size(), versions.size());
    return join(data, order);
}

core::Result<Rows> Projector::read_overlapping(const ReadQuery& query) {
    auto scanned = scan(query);
    if (!scanned.ok()) {
        return core::Result<Rows>::error_from(scanned);
    }
    const auto& data = scanned.value();

    std::vector<size_t> order(data.versions.size());
    for (size_t i = 0; i < order.size(); ++i) {
        order[i] = i;
    }
    std::sort(order.begin(), order.end(), [&](size_t a, size_t b) {
        const auto& x = data.versions[a];
        const auto& y = data.versions[b];
        const auto& xb = data.batch_of(a);
        const auto& yb = data.batch_of(b);
        return std::tie(xb.known_time, x.key.valid_time, x.key.series_id, xb.inserted_seq,
                        x.value_id) <
               std::tie(yb.known_time, y.key.valid_time, y.key.series_id, yb.inserted_seq,
                        y.value_id);
    });
    return join(data, order);
}

} // namespace projection
} // namespace bitsdb
