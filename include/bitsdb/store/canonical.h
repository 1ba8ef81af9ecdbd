#ifndef BITSDB_STORE_CANONICAL_H_
#define BITSDB_STORE_CANONICAL_H_

#include <optional>
#include <string>
#include <vector>

#include "bitsdb/core/types.h"

namespace bitsdb {
namespace store {

using Tags = std::vector<std::string>;

/**
 * @brief Trims and lowercases one tag; empty result is nullopt
 */
std::optional<std::string> normalize_tag(const std::string& tag);

/**
 * @brief Normalized, deduplicated, sorted tags; an empty result is null
 */
std::optional<Tags> canonical_tags(const std::optional<Tags>& tags);

/**
 * @brief Trimmed annotation; blank is null
 */
std::optional<std::string> canonical_annotation(const std::optional<std::string>& annotation);

/**
 * @brief Exact comparison of nullable values. Two NaNs compare equal so that
 * resubmitting a NaN is a no-op.
 */
bool same_value(const std::optional<core::Value>& a, const std::optional<core::Value>& b);

/**
 * @brief The fields of a version that the update protocol compares
 */
struct CanonicalTriple {
    std::optional<core::Value> value;
    std::optional<std::string> annotation;
    std::optional<Tags> tags;

    static CanonicalTriple of(const std::optional<core::Value>& value,
                              const std::optional<std::string>& annotation,
                              const std::optional<Tags>& tags) {
        return CanonicalTriple{value, canonical_annotation(annotation), canonical_tags(tags)};
    }

    bool operator==(const CanonicalTriple& other) const {
        return same_value(value, other.value) && annotation == other.annotation &&
               tags == other.tags;
    }
    bool operator!=(const CanonicalTriple& other) const { return !(*this == other); }
};

} // namespace store
} // namespace bitsdb

#endif // BITSDB_STORE_CANONICAL_H_
