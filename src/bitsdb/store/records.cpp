#include "bitsdb/store/records.h"

#include <sstream>

namespace bitsdb {
namespace store {

const char* retention_tier_name(RetentionTier tier) {
    switch (tier) {
        case RetentionTier::SHORT: return "short";
        case RetentionTier::MEDIUM: return "medium";
        case RetentionTier::LONG: return "long";
    }
    return "medium";
}

std::string CellKey::to_string() const {
    std::ostringstream oss;
    oss << "(batch=" << batch_id
        << ", tenant=" << tenant_id
        << ", valid_time=" << core::format_timestamp(valid_time)
        << ", series=" << series_id << ")";
    return oss.str();
}

} // namespace store
} // namespace bitsdb
