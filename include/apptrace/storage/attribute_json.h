#ifndef APPTRACE_STORAGE_ATTRIBUTE_JSON_H_
#define APPTRACE_STORAGE_ATTRIBUTE_JSON_H_

#include <string>

#include <rapidjson/document.h>

#include "apptrace/core/types.h"

namespace apptrace {
namespace storage {

/**
 * @brief Serialize an attribute set as a compact JSON object
 *
 * Byte values are written as lowercase hex strings and non-finite doubles
 * as their text rendering, so the output is always valid JSON.
 */
std::string SerializeAttributes(const core::Attributes& attributes);

/**
 * @brief Parse a JSON object back into an attribute set
 *
 * Nested objects and arrays are kept as their JSON text.
 * @throws core::InvalidArgumentError if @p json is not a JSON object
 */
core::Attributes ParseAttributes(const std::string& json);

/**
 * @brief Build a JSON object value for embedding in a larger document
 */
rapidjson::Value AttributesToJson(const core::Attributes& attributes,
                                  rapidjson::Document::AllocatorType& allocator);

} // namespace storage
} // namespace apptrace

#endif // APPTRACE_STORAGE_ATTRIBUTE_JSON_H_
