#include <gtest/gtest.h>
#include "bitsdb/core/config.h"
#include <chrono>

namespace bitsdb {
namespace core {
namespace {

using std::chrono::milliseconds;

TEST(UpdateConfigTest, DefaultConstructionIsZero) {
    UpdateConfig config;
    EXPECT_EQ(config.max_attempts, 0u);
    EXPECT_EQ(config.initial_backoff, milliseconds(0));
    EXPECT_EQ(config.max_backoff, milliseconds(0));
    EXPECT_EQ(config.lock_wait_timeout, milliseconds(0));
}

TEST(UpdateConfigTest, DefaultRetries) {
    auto config = UpdateConfig::Default();
    EXPECT_EQ(config.max_attempts, 5u);
    EXPECT_EQ(config.initial_backoff, milliseconds(5));
    EXPECT_EQ(config.max_backoff, milliseconds(200));
    EXPECT_EQ(config.lock_wait_timeout, milliseconds(2000));
    EXPECT_LE(config.initial_backoff, config.max_backoff);
}

TEST(SubstrateConfigTest, DefaultWaitsAndDetectsDeadlocks) {
    SubstrateConfig plain;
    EXPECT_EQ(plain.default_lock_wait, milliseconds(0));
    EXPECT_FALSE(plain.detect_deadlocks);

    auto config = SubstrateConfig::Default();
    EXPECT_EQ(config.default_lock_wait, milliseconds(2000));
    EXPECT_TRUE(config.detect_deadlocks);
}

TEST(EngineConfigTest, DefaultFillsEverySection) {
    EngineConfig plain;
    EXPECT_TRUE(plain.default_tenant.empty());
    EXPECT_EQ(plain.update.max_attempts, 0u);

    auto config = EngineConfig::Default();
    EXPECT_EQ(config.default_tenant, kDefaultTenant);
    EXPECT_EQ(config.update.max_attempts, UpdateConfig::Default().max_attempts);
    EXPECT_FALSE(config.registry.strict_unit);
}

TEST(EngineConfigTest, OverrideAfterDefault) {
    auto config = EngineConfig::Default();
    config.update.lock_wait_timeout = milliseconds(50);
    config.registry.strict_unit = true;
    config.default_tenant = "tenant-a";

    EXPECT_EQ(config.update.lock_wait_timeout, milliseconds(50));
    EXPECT_EQ(config.update.max_attempts, 5u);
    EXPECT_TRUE(config.registry.strict_unit);
    EXPECT_EQ(config.default_tenant, "tenant-a");
}

} // namespace
} // namespace core
} // namespace bitsdb
