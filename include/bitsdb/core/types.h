#ifndef BITSDB_CORE_TYPES_H_
#define BITSDB_CORE_TYPES_H_

#include <cstdint>
#include <string>
#include <vector>
#include <map>
#include <optional>

#include "bitsdb/core/result.h"

namespace bitsdb {
namespace core {

/**
 * @brief Stable identifier of a series, assigned on first creation
 */
using SeriesID = uint64_t;

/**
 * @brief Identifier of one value-version; monotonic, never reused
 */
using ValueID = uint64_t;

/**
 * @brief Identifier of an ingestion batch (caller supplied, usually a UUID)
 */
using BatchID = std::string;

/**
 * @brief Identifier of a tenant (usually a UUID)
 */
using TenantID = std::string;

/**
 * @brief Represents an instant in microseconds since Unix epoch (UTC)
 */
using Timestamp = int64_t;

/**
 * @brief Represents a measured or forecast value
 */
using Value = double;

/**
 * @brief Tenant used when a caller does not name one
 */
constexpr const char* kDefaultTenant = "00000000-0000-0000-0000-000000000000";

/**
 * @brief Represents a set of labels that, together with a name, identify a series
 */
class Labels {
public:
    using Map = std::map<std::string, std::string>;

    Labels() = default;
    explicit Labels(const Map& labels);

    void add(const std::string& name, const std::string& value);
    void remove(const std::string& name);
    void clear();
    bool has(const std::string& name) const;
    std::optional<std::string> get(const std::string& name) const;

    /**
     * @brief True if every label of @p subset is present here with the same value
     */
    bool contains(const Labels& subset) const;

    const Map& map() const { return labels_; }
    bool empty() const { return labels_.empty(); }
    size_t size() const { return labels_.size(); }

    bool operator==(const Labels& other) const;
    bool operator!=(const Labels& other) const;
    bool operator<(const Labels& other) const;

    std::string to_string() const;

private:
    Map labels_;
};

/**
 * @brief An instant together with whether it was supplied timezone-qualified.
 *
 * Every time that crosses the engine boundary must be qualified; a naive
 * time is representable only so that validation can reject it.
 */
class ZonedTime {
public:
    ZonedTime() = default;

    static ZonedTime FromUnixMicros(Timestamp micros) { return ZonedTime(micros, true); }
    static ZonedTime Naive(Timestamp micros) { return ZonedTime(micros, false); }
    static ZonedTime Now();

    /**
     * @brief Parses RFC 3339. "2025-01-01T00:00:00+01:00" and "...Z" are
     * qualified; "2025-01-01T00:00:00" parses as naive.
     */
    static Result<ZonedTime> Parse(const std::string& text);

    Timestamp micros() const { return micros_; }
    bool zoned() const { return zoned_; }

    ZonedTime plus_micros(int64_t delta) const { return ZonedTime(micros_ + delta, zoned_); }

    /**
     * @brief RFC 3339 in UTC; naive times are suffixed with " (naive)"
     */
    std::string to_string() const;

    bool operator==(const ZonedTime& other) const {
        return micros_ == other.micros_ && zoned_ == other.zoned_;
    }
    bool operator!=(const ZonedTime& other) const { return !(*this == other); }

private:
    ZonedTime(Timestamp micros, bool zoned) : micros_(micros), zoned_(zoned) {}

    Timestamp micros_ = 0;
    bool zoned_ = false;
};

/**
 * @brief Formats a timestamp as RFC 3339 UTC
 */
std::string format_timestamp(Timestamp micros);

/**
 * @brief Half-open time range [start, end); either bound may be absent
 */
struct TimeRange {
    std::optional<Timestamp> start;
    std::optional<Timestamp> end;

    bool contains(Timestamp ts) const {
        return (!start || ts >= *start) && (!end || ts < *end);
    }
};

} // namespace core
} // namespace bitsdb

#endif // BITSDB_CORE_TYPES_H_
