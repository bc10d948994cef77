/**
 * @file DotPath.hpp
 * @brief Dot-notation path utilities for nested values
 *
 * Paths like "merge.key" or "attributes.items.0.id" address values inside
 * settings and element content. Object members are addressed by name,
 * array entries by decimal index.
 */

#ifndef TIDYMERGE_DOTPATH_HPP
#define TIDYMERGE_DOTPATH_HPP

#include "tidymerge/Value.hpp"
#include "tidymerge/Errors.hpp"

#include <string>
#include <vector>

namespace tidymerge {

/**
 * @brief Split a dot-path into segments
 *
 * Empty segments are dropped:
 * - "merge.key" → ["merge", "key"]
 * - "a..b" → ["a", "b"]
 * - "" → []
 */
std::vector<std::string> split_dot_path(const std::string& path);

/// Join segments with dots; inverse of split_dot_path for non-empty segments
std::string join_dot_path(const std::vector<std::string>& segments);

/**
 * @brief Get value at a dot-path (strict)
 *
 * @return Pointer to the value; the root itself for an empty path
 * @throws KeyError if a segment does not exist
 * @throws TypeError if traversal hits a scalar before the final segment
 */
const Value* get_by_dot(const Value& data, const std::string& path);

/**
 * @brief Get value at a dot-path without throwing
 *
 * Missing segments and traversal into scalars both yield nullptr. Used
 * where a lookup must be total, such as key selectors.
 */
const Value* find_by_dot(const Value& data, const std::string& path) noexcept;

/**
 * @brief Set value at a dot-path, creating intermediate objects
 *
 * Intermediates that are missing or are not objects are replaced by empty
 * objects. An empty path replaces the root.
 */
void set_by_dot(Value& data, const std::string& path, const Value& value);

/**
 * @brief Check whether a dot-path resolves
 *
 * @return false for missing segments
 * @throws TypeError if traversal hits a scalar before the final segment
 */
bool contains_dot(const Value& data, const std::string& path);

} // namespace tidymerge

#endif // TIDYMERGE_DOTPATH_HPP
