#ifndef BITSDB_CORE_JSON_H_
#define BITSDB_CORE_JSON_H_

#include <string>

#include "bitsdb/core/result.h"
#include "bitsdb/core/types.h"

namespace bitsdb {
namespace core {

/**
 * @brief Parses @p text, requires a JSON object and returns its compact form.
 * @param what Field name used in the error message ("params", "metadata")
 */
Result<std::string> normalize_json_object(const std::string& text, const std::string& what);

/**
 * @brief Serializes labels as a JSON object with sorted keys
 */
std::string labels_to_json(const Labels& labels);

} // namespace core
} // namespace bitsdb

#endif // BITSDB_CORE_JSON_H_
