#include "bitsdb/core/types.h"
#include "bitsdb/core/error.h"
#include <sstream>
#include <algorithm>

#include <absl/time/clock.h>
#include <absl/time/time.h>

namespace bitsdb {
namespace core {

Labels::Labels(const Map& labels) : labels_(labels) {}

void Labels::add(const std::string& name, const std::string& value) {
    if (name.empty()) {
        throw InvalidArgumentError("Label name cannot be empty");
    }
    labels_[name] = value;
}

void Labels::remove(const std::string& name) {
    labels_.erase(name);
}

void Labels::clear() {
    labels_.clear();
}

bool Labels::has(const std::string& name) const {
    return labels_.find(name) != labels_.end();
}

std::optional<std::string> Labels::get(const std::string& name) const {
    auto it = labels_.find(name);
    if (it != labels_.end()) {
        return it->second;
    }
    return std::nullopt;
}

bool Labels::contains(const Labels& subset) const {
    return std::all_of(subset.labels_.begin(), subset.labels_.end(),
                       [this](const auto& kv) {
                           auto it = labels_.find(kv.first);
                           return it != labels_.end() && it->second == kv.second;
                       });
}

bool Labels::operator==(const Labels& other) const {
    return labels_ == other.labels_;
}

bool Labels::operator!=(const Labels& other) const {
    return !(*this == other);
}

bool Labels::operator<(const Labels& other) const {
    return labels_ < other.labels_;
}

std::string Labels::to_string() const {
    std::ostringstream oss;
    oss << "{";
    bool first = true;
    for (const auto& [name, value] : labels_) {
        if (!first) {
            oss << ", ";
        }
        oss << name << "=\"" << value << "\"";
        first = false;
    }
    oss << "}";
    return oss.str();
}

ZonedTime ZonedTime::Now() {
    return FromUnixMicros(absl::ToUnixMicros(absl::Now()));
}

Result<ZonedTime> ZonedTime::Parse(const std::string& text) {
    absl::Time t;
    std::string err;
    if (absl::ParseTime(absl::RFC3339_full, text, &t, &err)) {
        return Result<ZonedTime>(FromUnixMicros(absl::ToUnixMicros(t)));
    }
    // Same layout without an offset: accepted syntactically, but naive
    std::string naive_err;
    if (absl::ParseTime("%Y-%m-%d%ET%H:%M:%E*S", text, absl::UTCTimeZone(), &t, &naive_err) ||
        absl::ParseTime("%Y-%m-%d %H:%M:%E*S", text, absl::UTCTimeZone(), &t, &naive_err)) {
        return Result<ZonedTime>(Naive(absl::ToUnixMicros(t)));
    }
    return Result<ZonedTime>::error(
        "Cannot parse time '" + text + "': " + err, Error::Code::INVALID_ARGUMENT);
}

std::string ZonedTime::to_string() const {
    auto out = format_timestamp(micros_);
    if (!zoned_) {
        out += " (naive)";
    }
    return out;
}

std::string format_timestamp(Timestamp micros) {
    return absl::FormatTime(absl::RFC3339_full, absl::FromUnixMicros(micros),
                            absl::UTCTimeZone());
}

} // namespace core
} // namespace bitsdb
