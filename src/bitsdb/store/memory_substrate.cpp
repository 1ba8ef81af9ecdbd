#include "bitsdb/store/memory_substrate.h"
#include "bitsdb/common/logger.h"

#include <algorithm>
#include <mutex>
#include <shared_mutex>
#include <tuple>

namespace bitsdb {
namespace store {

namespace {

core::Timestamp now_micros() {
    return core::ZonedTime::Now().micros();
}

bool matches(const ValueScan& scan, const ValueVersion& version) {
    if (scan.tenant_id && version.key.tenant_id != *scan.tenant_id) {
        return false;
    }
    if (scan.batch_id && version.key.batch_id != *scan.batch_id) {
        return false;
    }
    if (!scan.series_ids.empty() &&
        std::find(scan.series_ids.begin(), scan.series_ids.end(), version.key.series_id) ==
            scan.series_ids.end()) {
        return false;
    }
    return scan.valid.contains(version.key.valid_time);
}

bool matches(const SeriesScan& scan, const SeriesRecord& record) {
    if (scan.series_id && record.series_id != *scan.series_id) {
        return false;
    }
    if (scan.name && record.name != *scan.name) {
        return false;
    }
    if (scan.unit && record.unit != *scan.unit) {
        return false;
    }
    return record.labels.contains(scan.labels);
}

} // namespace

/**
 * @brief Transaction over MemorySubstrate: buffers writes, applies them
 * under the exclusive table lock on commit.
 */
class MemorySubstrate::Txn : public Transaction {
public:
    Txn(MemorySubstrate& owner, TxnID id) : owner_(owner), id_(id) {}

    ~Txn() override {
        if (!finished_) {
            rollback();
        }
    }

    core::Result<core::SeriesID> insert_series(SeriesRecord record) override {
        if (finished_) {
            return finished_error<core::SeriesID>();
        }
        auto existing = find_series(record.name, record.labels);
        if (!existing.ok()) {
            return core::Result<core::SeriesID>::error_from(existing);
        }
        if (existing.value()) {
            owner_.conflicts_.fetch_add(1, std::memory_order_relaxed);
            return core::Result<core::SeriesID>::error(
                "Series '" + record.name + "' " + record.labels.to_string() + " already exists",
                core::Error::Code::ALREADY_EXISTS);
        }
        record.series_id = owner_.next_series_id_.fetch_add(1);
        record.inserted_at = now_micros();
        auto id = record.series_id;
        new_series_.emplace(id, std::move(record));
        return core::Result<core::SeriesID>(id);
    }

    core::Result<std::optional<SeriesRecord>> find_series(
        const std::string& name, const core::Labels& labels) override {
        for (const auto& [id, record] : new_series_) {
            if (record.name == name && record.labels == labels) {
                return core::Result<std::optional<SeriesRecord>>(record);
            }
        }
        std::optional<SeriesRecord> found;
        {
            std::shared_lock<std::shared_mutex> lock(owner_.mutex_);
            auto it = owner_.series_identity_.find(Identity(name, labels));
            if (it != owner_.series_identity_.end()) {
                found = owner_.series_.at(it->second);
            }
        }
        if (found) {
            apply_description(*found);
        }
        return core::Result<std::optional<SeriesRecord>>(std::move(found));
    }

    core::Result<std::optional<SeriesRecord>> get_series(core::SeriesID id) override {
        auto pending = new_series_.find(id);
        if (pending != new_series_.end()) {
            return core::Result<std::optional<SeriesRecord>>(pending->second);
        }
        std::optional<SeriesRecord> found;
        {
            std::shared_lock<std::shared_mutex> lock(owner_.mutex_);
            auto it = owner_.series_.find(id);
            if (it != owner_.series_.end()) {
                found = it->second;
            }
        }
        if (found) {
            apply_description(*found);
        }
        return core::Result<std::optional<SeriesRecord>>(std::move(found));
    }

    core::Result<std::vector<SeriesRecord>> scan_series(const SeriesScan& scan) override {
        std::vector<SeriesRecord> out;
        {
            std::shared_lock<std::shared_mutex> lock(owner_.mutex_);
            for (const auto& [id, record] : owner_.series_) {
                if (matches(scan, record)) {
                    out.push_back(record);
                }
            }
        }
        for (auto& record : out) {
            apply_description(record);
        }
        for (const auto& [id, record] : new_series_) {
            if (matches(scan, record)) {
                out.push_back(record);
            }
        }
        std::sort(out.begin(), out.end(), [](const SeriesRecord& a, const SeriesRecord& b) {
            return std::tie(a.name, a.unit, a.series_id) < std::tie(b.name, b.unit, b.series_id);
        });
        return core::Result<std::vector<SeriesRecord>>(std::move(out));
    }

    core::Result<void> set_series_description(
        core::SeriesID id, std::optional<std::string> description) override {
        if (finished_) {
            return finished_error<void>();
        }
        auto pending = new_series_.find(id);
        if (pending != new_series_.end()) {
            pending->second.description = std::move(description);
            return core::Result<void>();
        }
        auto existing = get_series(id);
        if (!existing.ok()) {
            return core::Result<void>::error_from(existing);
        }
        if (!existing.value()) {
            return core::Result<void>::error("Series " + std::to_string(id) + " not found",
                                             core::Error::Code::NOT_FOUND);
        }
        description_changes_[id] = std::move(description);
        return core::Result<void>();
    }

    core::Result<bool> insert_batch_if_absent(BatchRecord record) override {
        if (finished_) {
            return finished_error<bool>();
        }
        auto existing = get_batch(record.batch_id);
        if (!existing.ok()) {
            return core::Result<bool>::error_from(existing);
        }
        if (existing.value()) {
            return core::Result<bool>(false);
        }
        record.inserted_seq = owner_.next_batch_seq_.fetch_add(1);
        record.inserted_at = now_micros();
        auto id = record.batch_id;
        new_batches_.emplace(std::move(id), std::move(record));
        return core::Result<bool>(true);
    }

    core::Result<std::optional<BatchRecord>> get_batch(const core::BatchID& id) override {
        auto pending = new_batches_.find(id);
        if (pending != new_batches_.end()) {
            return core::Result<std::optional<BatchRecord>>(pending->second);
        }
        std::shared_lock<std::shared_mutex> lock(owner_.mutex_);
        auto it = owner_.batches_.find(id);
        if (it == owner_.batches_.end()) {
            return core::Result<std::optional<BatchRecord>>(std::nullopt);
        }
        return core::Result<std::optional<BatchRecord>>(it->second);
    }

    core::Result<std::vector<BatchRecord>> scan_batches(
        const core::TenantID& tenant_id, const std::optional<std::string>& workflow_id) override {
        auto wanted = [&](const BatchRecord& record) {
            return record.tenant_id == tenant_id &&
                   (!workflow_id || record.workflow_id == *workflow_id);
        };
        std::vector<BatchRecord> out;
        {
            std::shared_lock<std::shared_mutex> lock(owner_.mutex_);
            for (const auto& [id, record] : owner_.batches_) {
                if (wanted(record)) {
                    out.push_back(record);
                }
            }
        }
        for (const auto& [id, record] : new_batches_) {
            if (wanted(record)) {
                out.push_back(record);
            }
        }
        std::sort(out.begin(), out.end(), [](const BatchRecord& a, const BatchRecord& b) {
            return std::tie(a.known_time, a.inserted_seq) > std::tie(b.known_time, b.inserted_seq);
        });
        return core::Result<std::vector<BatchRecord>>(std::move(out));
    }

    core::Result<void> lock_cell(const CellKey& key, Deadline deadline) override {
        if (finished_) {
            return finished_error<void>();
        }
        if (held_.count(key) > 0) {
            return core::Result<void>();
        }
        auto until = deadline ? *deadline
                              : std::chrono::steady_clock::now() + owner_.config_.default_lock_wait;
        auto result = owner_.locks_.acquire(id_, key, until);
        if (result.ok()) {
            held_.insert(key);
        }
        return result;
    }

    core::Result<std::optional<ValueVersion>> current_version(const CellKey& key) override {
        auto overlay = current_overlay_.find(key);
        if (overlay != current_overlay_.end()) {
            return core::Result<std::optional<ValueVersion>>(new_versions_.at(overlay->second));
        }
        std::shared_lock<std::shared_mutex> lock(owner_.mutex_);
        auto it = owner_.current_.find(key);
        if (it == owner_.current_.end() || retired_.count(it->second) > 0) {
            return core::Result<std::optional<ValueVersion>>(std::nullopt);
        }
        return core::Result<std::optional<ValueVersion>>(owner_.versions_.at(it->second));
    }

    core::Result<std::optional<ValueVersion>> get_version(core::ValueID id) override {
        auto pending = new_versions_.find(id);
        if (pending != new_versions_.end()) {
            return core::Result<std::optional<ValueVersion>>(pending->second);
        }
        std::optional<ValueVersion> found;
        {
            std::shared_lock<std::shared_mutex> lock(owner_.mutex_);
            auto it = owner_.versions_.find(id);
            if (it != owner_.versions_.end()) {
                found = it->second;
            }
        }
        if (found && retired_.count(id) > 0) {
            found->is_current = false;
        }
        return core::Result<std::optional<ValueVersion>>(std::move(found));
    }

    core::Result<core::ValueID> insert_version(ValueVersion version) override {
        if (finished_) {
            return finished_error<core::ValueID>();
        }
        if (held_.count(version.key) == 0) {
            return core::Result<core::ValueID>::error(
                "Cell " + version.key.to_string() + " must be locked before insert",
                core::Error::Code::INTERNAL);
        }
        auto current = current_version(version.key);
        if (!current.ok()) {
            return core::Result<core::ValueID>::error_from(current);
        }
        if (current.value()) {
            return core::Result<core::ValueID>::error(
                "Cell " + version.key.to_string() + " already has a current version",
                core::Error::Code::ALREADY_EXISTS);
        }
        version.value_id = owner_.next_value_id_.fetch_add(1);
        version.is_current = true;
        auto id = version.value_id;
        current_overlay_[version.key] = id;
        new_versions_.emplace(id, std::move(version));
        return core::Result<core::ValueID>(id);
    }

    core::Result<void> retire_version(core::ValueID id) override {
        if (finished_) {
            return finished_error<void>();
        }
        auto found = get_version(id);
        if (!found.ok()) {
            return core::Result<void>::error_from(found);
        }
        if (!found.value()) {
            return core::Result<void>::error("Version " + std::to_string(id) + " not found",
                                             core::Error::Code::NOT_FOUND);
        }
        const auto& version = *found.value();
        if (held_.count(version.key) == 0) {
            return core::Result<void>::error(
                "Cell " + version.key.to_string() + " must be locked before retire",
                core::Error::Code::INTERNAL);
        }
        if (!version.is_current) {
            return core::Result<void>::error("Version " + std::to_string(id) + " is already retired",
                                             core::Error::Code::INVALID_ARGUMENT);
        }

        auto pending = new_versions_.find(id);
        if (pending != new_versions_.end()) {
            pending->second.is_current = false;
            current_overlay_.erase(version.key);
        } else {
            retired_.insert(id);
        }
        return core::Result<void>();
    }

    core::Result<std::vector<ValueVersion>> scan_versions(const ValueScan& scan) override {
        std::vector<ValueVersion> out;
        {
            std::shared_lock<std::shared_mutex> lock(owner_.mutex_);
            for (const auto& [id, version] : owner_.versions_) {
                if (!matches(scan, version)) {
                    continue;
                }
                bool current = version.is_current && retired_.count(id) == 0;
                if (!current && !scan.include_retired) {
                    continue;
                }
                out.push_back(version);
                out.back().is_current = current;
            }
        }
        for (const auto& [id, version] : new_versions_) {
            if (matches(scan, version) && (version.is_current || scan.include_retired)) {
                out.push_back(version);
            }
        }
        return core::Result<std::vector<ValueVersion>>(std::move(out));
    }

    core::Result<void> commit() override {
        if (finished_) {
            return finished_error<void>();
        }
        bool has_writes = !new_series_.empty() || !description_changes_.empty() ||
                          !new_batches_.empty() || !new_versions_.empty() || !retired_.empty();

        if (has_writes && take_injected_failure()) {
            rollback();
            return core::Result<void>::error("Transaction aborted by the store",
                                             core::Error::Code::ABORTED);
        }

        if (has_writes) {
            std::unique_lock<std::shared_mutex> lock(owner_.mutex_);

            // Constraint checks before anything is applied
            for (const auto& [id, record] : new_series_) {
                if (owner_.series_identity_.count(Identity(record.name, record.labels)) > 0) {
                    auto message = "Series '" + record.name + "' " + record.labels.to_string() +
                                   " was created concurrently";
                    lock.unlock();
                    owner_.conflicts_.fetch_add(1, std::memory_order_relaxed);
                    rollback();
                    return core::Result<void>::error(message, core::Error::Code::ALREADY_EXISTS);
                }
            }

            for (const auto& [id, record] : new_batches_) {
                if (owner_.batches_.count(id) > 0) {
                    auto message = "Batch " + id + " was created concurrently";
                    lock.unlock();
                    owner_.conflicts_.fetch_add(1, std::memory_order_relaxed);
                    rollback();
                    return core::Result<void>::error(message, core::Error::Code::ALREADY_EXISTS);
                }
            }

            for (auto& [id, record] : new_series_) {
                owner_.series_identity_.emplace(Identity(record.name, record.labels), id);
                owner_.series_.emplace(id, std::move(record));
            }
            for (auto& [id, description] : description_changes_) {
                auto it = owner_.series_.find(id);
                if (it != owner_.series_.end()) {
                    it->second.description = std::move(description);
                }
            }
            for (auto& [id, record] : new_batches_) {
                owner_.batches_.emplace(id, std::move(record));
            }
            for (auto id : retired_) {
                auto& version = owner_.versions_.at(id);
                version.is_current = false;
                auto current = owner_.current_.find(version.key);
                if (current != owner_.current_.end() && current->second == id) {
                    owner_.current_.erase(current);
                }
            }
            for (auto& [id, version] : new_versions_) {
                if (version.is_current) {
                    owner_.current_[version.key] = id;
                }
                owner_.versions_.emplace(id, std::move(version));
            }
        }

        finish();
        owner_.commits_.fetch_add(1, std::memory_order_relaxed);
        return core::Result<void>();
    }

    void rollback() override {
        if (finished_) {
            return;
        }
        finish();
        owner_.rollbacks_.fetch_add(1, std::memory_order_relaxed);
    }

private:
    template<typename T>
    core::Result<T> finished_error() const {
        return core::Result<T>::error("Transaction " + std::to_string(id_) + " already finished",
                                      core::Error::Code::INTERNAL);
    }

    void apply_description(SeriesRecord& record) const {
        auto it = description_changes_.find(record.series_id);
        if (it != description_changes_.end()) {
            record.description = it->second;
        }
    }

    bool take_injected_failure() {
        auto remaining = owner_.injected_failures_.load();
        while (remaining > 0 &&
               !owner_.injected_failures_.compare_exchange_weak(remaining, remaining - 1)) {
        }
        return remaining > 0;
    }

    void finish() {
        finished_ = true;
        new_series_.clear();
        description_changes_.clear();
        new_batches_.clear();
        new_versions_.clear();
        retired_.clear();
        current_overlay_.clear();
        owner_.locks_.release_all(id_, held_);
        held_.clear();
    }

    MemorySubstrate& owner_;
    const TxnID id_;
    bool finished_ = false;

    std::map<core::SeriesID, SeriesRecord> new_series_;
    std::map<core::SeriesID, std::optional<std::string>> description_changes_;
    std::map<core::BatchID, BatchRecord> new_batches_;
    std::map<core::ValueID, ValueVersion> new_versions_;
    std::set<core::ValueID> retired_;
    std::map<CellKey, core::ValueID> current_overlay_;
    std::set<CellKey> held_;
};

MemorySubstrate::MemorySubstrate(const core::SubstrateConfig& config)
    : config_(config), locks_(config.detect_deadlocks) {}

MemorySubstrate::~MemorySubstrate() = default;

core::Result<std::unique_ptr<Transaction>> MemorySubstrate::begin() {
    auto id = next_txn_id_.fetch_add(1);
    return core::Result<std::unique_ptr<Transaction>>(std::make_unique<Txn>(*this, id));
}

void MemorySubstrate::fail_next_commits(size_t count) {
    injected_failures_.store(count);
}

SubstrateStats MemorySubstrate::stats() const {
    SubstrateStats stats;
    stats.commits = commits_.load(std::memory_order_relaxed);
    stats.rollbacks = rollbacks_.load(std::memory_order_relaxed);
    stats.conflicts = conflicts_.load(std::memory_order_relaxed);
    stats.lock_timeouts = locks_.timeouts();
    stats.deadlocks = locks_.deadlocks_detected();
    stats.locks_held = locks_.held_count();
    std::shared_lock<std::shared_mutex> lock(mutex_);
    stats.versions = versions_.size();
    stats.current_cells = current_.size();
    return stats;
}

} // namespace store
} // namespace bitsdb
