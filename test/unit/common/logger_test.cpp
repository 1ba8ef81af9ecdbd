#include <gtest/gtest.h>
#include "bitsdb/common/logger.h"

namespace bitsdb {
namespace common {
namespace {

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override { saved_ = Logger::Level(); }
    void TearDown() override { Logger::SetLevel(saved_); }

    spdlog::level::level_enum saved_ = spdlog::level::info;
};

TEST_F(LoggerTest, InitIsRepeatable) {
    auto first = Logger::Init();
    ASSERT_NE(first, nullptr);
    EXPECT_EQ(first->name(), kLoggerName);

    auto second = Logger::Init(spdlog::level::warn);
    EXPECT_EQ(second, first);
    EXPECT_EQ(spdlog::default_logger(), first);
    EXPECT_EQ(Logger::Level(), spdlog::level::warn);
}

TEST_F(LoggerTest, ScopedLevelRestoresPrevious) {
    Logger::Init(spdlog::level::info);
    {
        ScopedLogLevel verbose(spdlog::level::trace);
        EXPECT_EQ(Logger::Level(), spdlog::level::trace);
        EXPECT_TRUE(spdlog::should_log(spdlog::level::debug));
        {
            ScopedLogLevel quiet(spdlog::level::off);
            EXPECT_FALSE(spdlog::should_log(spdlog::level::critical));
        }
        EXPECT_EQ(Logger::Level(), spdlog::level::trace);
    }
    EXPECT_EQ(Logger::Level(), spdlog::level::info);
}

} // namespace
} // namespace common
} // namespace bitsdb
