#include "bitsdb/engine.h"
#include "bitsdb/common/logger.h"
#include <cstdlib>
#include <iostream>

using namespace bitsdb;

namespace {

core::ZonedTime at(const std::string& text) {
    auto parsed = core::ZonedTime::Parse(text);
    if (!parsed.ok()) {
        std::cerr << "Bad time " << text << ": " << parsed.error() << std::endl;
        std::exit(1);
    }
    return parsed.value();
}

void print_rows(const std::vector<projection::ProjectedRow>& rows) {
    for (const auto& row : rows) {
        std::cout << "  " << core::format_timestamp(row.valid_time)
                  << " known " << core::format_timestamp(row.known_time)
                  << " " << row.series_key << " = ";
        if (row.value) {
            std::cout << *row.value << " " << row.series_unit;
        } else {
            std::cout << "null";
        }
        if (row.annotation) {
            std::cout << " (" << *row.annotation << ")";
        }
        std::cout << " [batch " << row.batch_id << ", value " << row.value_id << "]" << std::endl;
    }
}

} // namespace

int main() {
    std::cout << "=== bitsdb Quick Start Example ===" << std::endl;

    common::Logger::Init(spdlog::level::info);

    auto engine = Engine::InMemory();

    // Create series
    registry::SeriesSpec spec;
    spec.name = "wind_power";
    spec.unit = "MW";
    spec.labels.add("site", "north");
    auto series = engine->create_series(spec);
    if (!series.ok()) {
        std::cerr << "Create series failed: " << series.error() << std::endl;
        return 1;
    }
    std::cout << "✅ Series " << series.value() << " created" << std::endl;

    // Two forecast runs for the same hours
    const auto tenant = core::TenantID(core::kDefaultTenant);
    const auto hour = at("2025-01-01T12:00:00Z");
    for (int run = 0; run < 2; ++run) {
        ledger::BatchSpec batch;
        batch.batch_id = "forecast-run-" + std::to_string(run);
        batch.tenant_id = tenant;
        batch.workflow_id = "wind-forecast";
        batch.start_time = at("2025-01-01T06:00:00Z").plus_micros(run * 3600000000LL);
        batch.known_time = batch.start_time;
        batch.params = "{\"model\": \"v" + std::to_string(run + 1) + "\"}";
        auto created = engine->create_batch(batch);
        if (!created.ok()) {
            std::cerr << "Create batch failed: " << created.error() << std::endl;
            return 1;
        }

        std::vector<store::InsertRow> rows;
        for (int h = 0; h < 3; ++h) {
            store::InsertRow row;
            row.valid_time = hour.plus_micros(h * 3600000000LL);
            row.series_id = series.value();
            row.value = 100.0 + 10.0 * run + h;
            rows.push_back(row);
        }
        auto inserted = engine->insert_values(batch.batch_id, rows);
        if (!inserted.ok()) {
            std::cerr << "Insert failed: " << inserted.error() << std::endl;
            return 1;
        }
        std::cout << "✅ Batch " << batch.batch_id << ": " << inserted.value()
                  << " values inserted" << std::endl;
    }

    // Correct one value of the first run
    store::CellUpdate correction;
    correction.target = store::ByCellKey{"forecast-run-0", tenant, hour, series.value()};
    correction.value = 95.5;
    correction.annotation = std::string("curtailment");
    correction.tags = store::Tags{"Reviewed", " manual "};
    store::UpdateOptions options;
    options.changed_by = "analyst@example.com";
    auto updated = [&] {
        // Show lock order and commit of the correction
        common::ScopedLogLevel debug(spdlog::level::debug);
        return engine->update({correction}, options);
    }();
    if (!updated.ok()) {
        std::cerr << "Update failed: " << updated.error() << std::endl;
        return 1;
    }
    std::cout << "✅ " << updated.value().updated.size() << " cell(s) corrected" << std::endl;

    // Same correction again is a no-op
    auto repeated = engine->update({correction}, options);
    if (!repeated.ok()) {
        std::cerr << "Repeated update failed: " << repeated.error() << std::endl;
        return 1;
    }
    std::cout << "✅ Resubmitted correction skipped for "
              << repeated.value().skipped_no_op.size() << " cell(s)" << std::endl;

    projection::ReadQuery query;
    query.tenant_id = tenant;

    std::cout << "Flat view (latest known value per hour):" << std::endl;
    auto flat = engine->read_flat(query);
    if (!flat.ok()) {
        std::cerr << "Flat read failed: " << flat.error() << std::endl;
        return 1;
    }
    print_rows(flat.value());

    std::cout << "Overlapping view (every run):" << std::endl;
    auto overlapping = engine->read_overlapping(query);
    if (!overlapping.ok()) {
        std::cerr << "Overlapping read failed: " << overlapping.error() << std::endl;
        return 1;
    }
    print_rows(overlapping.value());

    std::cout << "✅ Quick start complete!" << std::endl;
    return 0;
}
