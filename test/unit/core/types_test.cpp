#include <gtest/gtest.h>
#include "bitsdb/core/types.h"
#include "bitsdb/core/json.h"
#include "bitsdb/core/tri_state.h"
#include <optional>
#include <string>
#include <type_traits>

namespace bitsdb {
namespace core {
namespace {

TEST(ZonedTimeTest, ParsesUtcDesignator) {
    auto parsed = ZonedTime::Parse("2025-01-01T00:00:00Z");
    ASSERT_TRUE(parsed.ok()) << parsed.error();
    EXPECT_TRUE(parsed.value().zoned());
    EXPECT_EQ(parsed.value().micros(), 1735689600LL * 1000000LL);
}

TEST(ZonedTimeTest, OffsetIsNormalizedToUtc) {
    auto utc = ZonedTime::Parse("2025-01-01T00:00:00Z");
    auto plus_one = ZonedTime::Parse("2025-01-01T01:00:00+01:00");
    ASSERT_TRUE(utc.ok());
    ASSERT_TRUE(plus_one.ok());
    EXPECT_EQ(utc.value().micros(), plus_one.value().micros());
    EXPECT_EQ(utc.value(), plus_one.value());
}

TEST(ZonedTimeTest, FractionalSeconds) {
    auto parsed = ZonedTime::Parse("2025-01-01T00:00:00.250Z");
    ASSERT_TRUE(parsed.ok());
    EXPECT_EQ(parsed.value().micros() % 1000000LL, 250000);
}

TEST(ZonedTimeTest, MissingOffsetParsesAsNaive) {
    auto parsed = ZonedTime::Parse("2025-01-01T00:00:00");
    ASSERT_TRUE(parsed.ok());
    EXPECT_FALSE(parsed.value().zoned());
    EXPECT_NE(parsed.value().to_string().find("naive"), std::string::npos);
}

TEST(ZonedTimeTest, GarbageIsRejected) {
    auto parsed = ZonedTime::Parse("yesterday");
    EXPECT_FALSE(parsed.ok());
    EXPECT_EQ(parsed.code(), Error::Code::INVALID_ARGUMENT);
}

TEST(ZonedTimeTest, NaiveAndZonedDiffer) {
    EXPECT_NE(ZonedTime::Naive(0), ZonedTime::FromUnixMicros(0));
    EXPECT_TRUE(ZonedTime::Now().zoned());
}

TEST(ZonedTimeTest, FormatsAsRfc3339) {
    EXPECT_EQ(format_timestamp(0), "1970-01-01T00:00:00+00:00");
}

TEST(TimeRangeTest, HalfOpen) {
    TimeRange range;
    range.start = 10;
    range.end = 20;
    EXPECT_FALSE(range.contains(9));
    EXPECT_TRUE(range.contains(10));
    EXPECT_TRUE(range.contains(19));
    EXPECT_FALSE(range.contains(20));

    TimeRange open;
    EXPECT_TRUE(open.contains(-5));
}

TEST(LabelsTest, Containment) {
    Labels series;
    series.add("site", "north");
    series.add("model", "v2");

    Labels filter;
    EXPECT_TRUE(series.contains(filter));
    filter.add("site", "north");
    EXPECT_TRUE(series.contains(filter));
    filter.add("model", "v1");
    EXPECT_FALSE(series.contains(filter));
}

TEST(LabelsTest, EmptyNameRejected) {
    Labels labels;
    EXPECT_THROW(labels.add("", "x"), InvalidArgumentError);
}

TEST(TriStateTest, MergeSemantics) {
    std::optional<double> current = 10.0;

    TriState<double> unset;
    EXPECT_TRUE(unset.is_unset());
    EXPECT_EQ(unset.merge(current), current);

    TriState<double> cleared = Clear{};
    EXPECT_TRUE(cleared.is_clear());
    EXPECT_EQ(cleared.merge(current), std::nullopt);

    TriState<double> set = 12.5;
    EXPECT_TRUE(set.is_set());
    EXPECT_EQ(set.merge(current), 12.5);
    EXPECT_EQ(set.merge(std::nullopt), 12.5);
}

TEST(TriStateTest, FromOptional) {
    EXPECT_TRUE(TriState<std::string>::from_optional(std::nullopt).is_clear());
    auto set = TriState<std::string>::from_optional(std::string("x"));
    ASSERT_TRUE(set.is_set());
    EXPECT_EQ(set.get(), "x");
}

TEST(TriStateTest, VisitSeesEachState) {
    auto name = [](const TriState<int>& field) {
        return field.visit([](const auto& state) -> std::string {
            using S = std::decay_t<decltype(state)>;
            if constexpr (std::is_same_v<S, Unset>) {
                return "unset";
            } else if constexpr (std::is_same_v<S, Clear>) {
                return "clear";
            } else {
                return "set";
            }
        });
    };
    EXPECT_EQ(name(TriState<int>::unset()), "unset");
    EXPECT_EQ(name(TriState<int>::clear()), "clear");
    EXPECT_EQ(name(TriState<int>::set(1)), "set");
}

TEST(JsonTest, NormalizesObject) {
    auto normalized = normalize_json_object("{ \"model\" : \"v1\",  \"runs\": [1, 2] }", "params");
    ASSERT_TRUE(normalized.ok()) << normalized.error();
    EXPECT_EQ(normalized.value(), "{\"model\":\"v1\",\"runs\":[1,2]}");
}

TEST(JsonTest, RejectsNonObjects) {
    auto array = normalize_json_object("[1, 2]", "params");
    EXPECT_FALSE(array.ok());
    EXPECT_EQ(array.code(), Error::Code::INVALID_ARGUMENT);

    auto broken = normalize_json_object("{\"a\":", "metadata");
    EXPECT_FALSE(broken.ok());
    EXPECT_NE(broken.error().find("metadata"), std::string::npos);
}

TEST(JsonTest, LabelsSerializeSorted) {
    Labels labels;
    labels.add("b", "2");
    labels.add("a", "1");
    EXPECT_EQ(labels_to_json(labels), "{\"a\":\"1\",\"b\":\"2\"}");
}

} // namespace
} // namespace core
} // namespace bitsdb
