#include <gtest/gtest.h>
#include "bitsdb/store/canonical.h"
#include <cmath>
#include <limits>

namespace bitsdb {
namespace store {
namespace {

TEST(CanonicalTest, TagsNormalizedDedupedSorted) {
    auto tags = canonical_tags(Tags{"B", " a ", "a"});
    ASSERT_TRUE(tags.has_value());
    EXPECT_EQ(*tags, (Tags{"a", "b"}));
}

TEST(CanonicalTest, EmptyTagsBecomeNull) {
    EXPECT_FALSE(canonical_tags(Tags{}).has_value());
    EXPECT_FALSE(canonical_tags(Tags{"  ", ""}).has_value());
    EXPECT_FALSE(canonical_tags(std::nullopt).has_value());
}

TEST(CanonicalTest, TagPermutationsAreEqual) {
    EXPECT_EQ(canonical_tags(Tags{"Peak", "manual"}), canonical_tags(Tags{"MANUAL ", "peak"}));
}

TEST(CanonicalTest, NormalizeTag) {
    EXPECT_EQ(normalize_tag("  Storm "), std::optional<std::string>("storm"));
    EXPECT_FALSE(normalize_tag("   ").has_value());
}

TEST(CanonicalTest, AnnotationTrimmedBlankIsNull) {
    EXPECT_EQ(canonical_annotation(std::string("  spike  ")), std::optional<std::string>("spike"));
    EXPECT_FALSE(canonical_annotation(std::string(" \t\n")).has_value());
    EXPECT_FALSE(canonical_annotation(std::nullopt).has_value());
}

TEST(CanonicalTest, ValueComparisonIsExact) {
    EXPECT_TRUE(same_value(1.5, 1.5));
    EXPECT_FALSE(same_value(0.1 + 0.2, 0.3));
    EXPECT_TRUE(same_value(std::nullopt, std::nullopt));
    EXPECT_FALSE(same_value(0.0, std::nullopt));
    EXPECT_FALSE(same_value(std::nullopt, 0.0));
}

TEST(CanonicalTest, NanEqualsNan) {
    const double nan = std::numeric_limits<double>::quiet_NaN();
    EXPECT_TRUE(same_value(nan, nan));
    EXPECT_FALSE(same_value(nan, 1.0));
}

TEST(CanonicalTest, TripleComparesCanonicalForms) {
    auto stored = CanonicalTriple::of(10.0, std::string("x"), Tags{"a", "b"});
    auto incoming = CanonicalTriple::of(10.0, std::string(" x "), Tags{"B", "A", "a"});
    EXPECT_EQ(stored, incoming);

    auto cleared = CanonicalTriple::of(10.0, std::string("x"), Tags{});
    EXPECT_NE(stored, cleared);
    EXPECT_FALSE(cleared.tags.has_value());
}

} // namespace
} // namespace store
} // namespace bitsdb
