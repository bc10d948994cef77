/**
 * @file Value.hpp
 * @brief Value type for element content and settings data
 *
 * Uses nlohmann::json as the underlying value model. Element payloads are
 * opaque to the merge engine; it only needs structural equality, which
 * nlohmann::json provides through operator==.
 */

#ifndef TIDYMERGE_VALUE_HPP
#define TIDYMERGE_VALUE_HPP

#include <nlohmann/json.hpp>
#include <string>

namespace tidymerge {

/**
 * @brief JSON-like value type
 *
 * Alias for nlohmann::json. Used for element content, the JSON storage
 * form of documents and the settings tree.
 */
using Value = nlohmann::json;

/**
 * @brief Get human-readable type name for a Value
 * @param val The value to inspect
 * @return Type name string (e.g., "null", "boolean", "integer", "float",
 *         "string", "array", "object")
 */
inline std::string type_name(const Value& val) {
    if (val.is_null()) return "null";
    if (val.is_boolean()) return "boolean";
    if (val.is_number_integer()) return "integer";
    if (val.is_number_float()) return "float";
    if (val.is_string()) return "string";
    if (val.is_array()) return "array";
    if (val.is_object()) return "object";
    return "unknown";
}

} // namespace tidymerge

#endif // TIDYMERGE_VALUE_HPP
