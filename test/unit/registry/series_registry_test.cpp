#include <gtest/gtest.h>
#include "bitsdb/registry/series_registry.h"
#include "bitsdb/store/memory_substrate.h"
#include <atomic>
#include <set>
#include <thread>
#include <vector>

namespace bitsdb {
namespace registry {
namespace {

class SeriesRegistryTest : public ::testing::Test {
protected:
    void SetUp() override {
        substrate_ = std::make_shared<store::MemorySubstrate>();
        registry_ = std::make_unique<SeriesRegistry>(substrate_);
    }

    static SeriesSpec Spec(const std::string& name, const std::string& unit,
                           const core::Labels::Map& labels = {}) {
        SeriesSpec spec;
        spec.name = name;
        spec.unit = unit;
        spec.labels = core::Labels(labels);
        return spec;
    }

    std::shared_ptr<store::MemorySubstrate> substrate_;
    std::unique_ptr<SeriesRegistry> registry_;
};

TEST_F(SeriesRegistryTest, CreateOrGetIsIdempotent) {
    auto first = registry_->create_or_get(Spec("wind_power", "MW", {{"site", "north"}}));
    ASSERT_TRUE(first.ok()) << first.error();
    auto second = registry_->create_or_get(Spec("wind_power", "MW", {{"site", "north"}}));
    ASSERT_TRUE(second.ok());
    EXPECT_EQ(first.value(), second.value());

    auto other = registry_->create_or_get(Spec("wind_power", "MW", {{"site", "south"}}));
    ASSERT_TRUE(other.ok());
    EXPECT_NE(first.value(), other.value());
}

TEST_F(SeriesRegistryTest, NameAndUnitAreTrimmedAndRequired) {
    auto padded = registry_->create_or_get(Spec("  load  ", " MW "));
    ASSERT_TRUE(padded.ok());
    auto record = registry_->get(padded.value());
    ASSERT_TRUE(record.ok());
    EXPECT_EQ(record.value().name, "load");
    EXPECT_EQ(record.value().unit, "MW");

    EXPECT_EQ(registry_->create_or_get(Spec("  ", "MW")).code(),
              core::Error::Code::INVALID_ARGUMENT);
    EXPECT_EQ(registry_->create_or_get(Spec("load", "")).code(),
              core::Error::Code::INVALID_ARGUMENT);
}

TEST_F(SeriesRegistryTest, UnitMismatchReturnsExistingByDefault) {
    auto created = registry_->create_or_get(Spec("price", "EUR/MWh"));
    ASSERT_TRUE(created.ok());
    auto mismatched = registry_->create_or_get(Spec("price", "USD/MWh"));
    ASSERT_TRUE(mismatched.ok());
    EXPECT_EQ(mismatched.value(), created.value());

    auto identity = registry_->identity(created.value());
    ASSERT_TRUE(identity.ok());
    EXPECT_EQ(identity.value().unit, "EUR/MWh");
}

TEST_F(SeriesRegistryTest, StrictUnitRejectsMismatch) {
    core::RegistryConfig config;
    config.strict_unit = true;
    SeriesRegistry strict(substrate_, config);

    ASSERT_TRUE(strict.create_or_get(Spec("price", "EUR/MWh")).ok());
    auto mismatched = strict.create_or_get(Spec("price", "USD/MWh"));
    EXPECT_FALSE(mismatched.ok());
    EXPECT_EQ(mismatched.code(), core::Error::Code::INVALID_ARGUMENT);
    EXPECT_TRUE(strict.create_or_get(Spec("price", "EUR/MWh")).ok());
}

TEST_F(SeriesRegistryTest, ResolveByLabelContainment) {
    auto north = registry_->create_or_get(Spec("wind", "MW", {{"site", "north"}, {"model", "a"}}));
    auto south = registry_->create_or_get(Spec("wind", "MW", {{"site", "south"}, {"model", "a"}}));
    auto solar = registry_->create_or_get(Spec("solar", "MW", {{"site", "north"}}));
    ASSERT_TRUE(north.ok() && south.ok() && solar.ok());

    SeriesFilter by_model;
    by_model.labels.add("model", "a");
    auto ids = registry_->resolve(by_model);
    ASSERT_TRUE(ids.ok());
    EXPECT_EQ(ids.value(), (std::vector<core::SeriesID>{north.value(), south.value()}));

    SeriesFilter by_site;
    by_site.labels.add("site", "north");
    ids = registry_->resolve(by_site);
    ASSERT_TRUE(ids.ok());
    // ordered by name: solar before wind
    EXPECT_EQ(ids.value(), (std::vector<core::SeriesID>{solar.value(), north.value()}));

    SeriesFilter by_name;
    by_name.name = "wind";
    by_name.unit = "MW";
    EXPECT_EQ(registry_->resolve(by_name).value().size(), 2u);

    SeriesFilter by_id;
    by_id.series_id = solar.value();
    EXPECT_EQ(registry_->resolve(by_id).value(), (std::vector<core::SeriesID>{solar.value()}));

    SeriesFilter nothing;
    nothing.name = "hydro";
    EXPECT_TRUE(registry_->resolve(nothing).value().empty());
}

TEST_F(SeriesRegistryTest, IdentityIsCached) {
    auto id = registry_->create_or_get(Spec("load", "MW"));
    ASSERT_TRUE(id.ok());
    EXPECT_EQ(registry_->cache_size(), 1u);

    auto identity = registry_->identity(id.value());
    ASSERT_TRUE(identity.ok());
    EXPECT_EQ(identity.value().name, "load");
    EXPECT_EQ(registry_->cache_size(), 1u);

    auto key = registry_->series_key(id.value());
    ASSERT_TRUE(key.ok());
    EXPECT_EQ(key.value(), "load");

    // A second registry on the same substrate loads on demand
    SeriesRegistry fresh(substrate_);
    EXPECT_EQ(fresh.cache_size(), 0u);
    ASSERT_TRUE(fresh.identity(id.value()).ok());
    EXPECT_EQ(fresh.cache_size(), 1u);
}

TEST_F(SeriesRegistryTest, UnknownSeriesIsNotFound) {
    EXPECT_EQ(registry_->identity(404).code(), core::Error::Code::NOT_FOUND);
    EXPECT_EQ(registry_->get(404).code(), core::Error::Code::NOT_FOUND);
    EXPECT_EQ(registry_->series_key(404).code(), core::Error::Code::NOT_FOUND);
    EXPECT_EQ(registry_->set_description(404, std::string("x")).code(),
              core::Error::Code::NOT_FOUND);
}

TEST_F(SeriesRegistryTest, DescriptionIsMutable) {
    auto spec = Spec("load", "MW");
    spec.description = "  total load ";
    auto id = registry_->create_or_get(spec);
    ASSERT_TRUE(id.ok());
    EXPECT_EQ(registry_->get(id.value()).value().description, std::optional<std::string>("total load"));

    ASSERT_TRUE(registry_->set_description(id.value(), std::string("system load")).ok());
    EXPECT_EQ(registry_->get(id.value()).value().description, std::optional<std::string>("system load"));

    ASSERT_TRUE(registry_->set_description(id.value(), std::string("   ")).ok());
    EXPECT_FALSE(registry_->get(id.value()).value().description.has_value());
}

TEST_F(SeriesRegistryTest, OverlappingAndRetentionKept) {
    auto spec = Spec("forecast", "MW");
    spec.overlapping = true;
    spec.retention_tier = store::RetentionTier::LONG;
    auto id = registry_->create_or_get(spec);
    ASSERT_TRUE(id.ok());
    auto identity = registry_->identity(id.value());
    ASSERT_TRUE(identity.ok());
    EXPECT_TRUE(identity.value().overlapping);
    EXPECT_EQ(identity.value().retention_tier, store::RetentionTier::LONG);
}

TEST_F(SeriesRegistryTest, ConcurrentCreateYieldsOneSeries) {
    constexpr int kThreads = 8;
    std::vector<core::SeriesID> ids(kThreads, 0);
    std::atomic<int> failures{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < kThreads; ++i) {
        threads.emplace_back([&, i] {
            auto id = registry_->create_or_get(Spec("race", "MW", {{"k", "v"}}));
            if (id.ok()) {
                ids[i] = id.value();
            } else {
                failures++;
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(failures.load(), 0);
    std::set<core::SeriesID> distinct(ids.begin(), ids.end());
    EXPECT_EQ(distinct.size(), 1u);
    EXPECT_NE(*distinct.begin(), 0u);

    SeriesFilter filter;
    filter.name = "race";
    EXPECT_EQ(registry_->resolve(filter).value().size(), 1u);
}

} // namespace
} // namespace registry
} // namespace bitsdb
