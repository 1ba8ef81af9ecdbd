#include "bitsdb/store/canonical.h"

#include <algorithm>
#include <cmath>
#include <set>

#include <absl/strings/ascii.h>
#include <absl/strings/string_view.h>

namespace bitsdb {
namespace store {

std::optional<std::string> normalize_tag(const std::string& tag) {
    auto out = absl::AsciiStrToLower(absl::StripAsciiWhitespace(tag));
    if (out.empty()) {
        return std::nullopt;
    }
    return out;
}

std::optional<Tags> canonical_tags(const std::optional<Tags>& tags) {
    if (!tags) {
        return std::nullopt;
    }
    std::set<std::string> unique;
    for (const auto& tag : *tags) {
        if (auto normalized = normalize_tag(tag)) {
            unique.insert(std::move(*normalized));
        }
    }
    if (unique.empty()) {
        return std::nullopt;
    }
    return Tags(unique.begin(), unique.end());
}

std::optional<std::string> canonical_annotation(const std::optional<std::string>& annotation) {
    if (!annotation) {
        return std::nullopt;
    }
    auto trimmed = absl::StripAsciiWhitespace(*annotation);
    if (trimmed.empty()) {
        return std::nullopt;
    }
    return std::string(trimmed);
}

bool same_value(const std::optional<core::Value>& a, const std::optional<core::Value>& b) {
    if (!a || !b) {
        return !a && !b;
    }
    if (std::isnan(*a) || std::isnan(*b)) {
        return std::isnan(*a) && std::isnan(*b);
    }
    return *a == *b;
}

} // namespace store
} // namespace bitsdb
