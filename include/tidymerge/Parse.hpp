/**
 * @file Parse.hpp
 * @brief String-to-Value parsing for environment variables and overrides
 *
 * Parsing order (first match wins):
 * - Boolean ("true", "false", case insensitive)
 * - Null ("null", case insensitive)
 * - Integer (-?[0-9]+, fitting in int64)
 * - Float (-?[0-9]+.[0-9]+ with optional exponent)
 * - JSON compound ({...} or [...])
 * - Quoted string ("...", JSON escapes honoured)
 * - Raw string (fallback)
 */

#ifndef TIDYMERGE_PARSE_HPP
#define TIDYMERGE_PARSE_HPP

#include "tidymerge/Value.hpp"

#include <map>
#include <string>

namespace tidymerge {

/**
 * @brief Parse string value to the most specific type
 *
 * Examples:
 * ```cpp
 * parse_value("TRUE")          // → true
 * parse_value("4")             // → 4
 * parse_value("field:id")      // → "field:id"
 * parse_value("\"2\"")         // → "2" (string)
 * parse_value("{\"a\":1}")     // → {"a": 1}
 * ```
 */
Value parse_value(const std::string& str);

/**
 * @brief Parse an overrides string "k1:v1, k2:v2"
 *
 * Keys are dot-paths, values go through parse_value(). Commas inside
 * quotes, braces or brackets do not split. Only the first ':' of a pair
 * separates key from value, so "merge.key:field:id" sets merge.key to
 * "field:id".
 */
std::map<std::string, Value> parse_overrides(const std::string& str);

} // namespace tidymerge

#endif // TIDYMERGE_PARSE_HPP
