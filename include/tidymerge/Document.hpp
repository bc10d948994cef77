/**
 * @file Document.hpp
 * @brief Storage form of containers and element lists
 *
 * A container is stored as a JSON node list, either a bare array or
 * {"nodes": [...]}:
 * ```json
 * {"nodes": [
 *     {"whitespace": "\n  "},
 *     {"comment": "<!-- editor settings -->"},
 *     {"whitespace": "\n  "},
 *     {"element": {"name": "TabSize", "content": 4}},
 *     {"whitespace": "\n"}
 * ]}
 * ```
 * New elements are a JSON/TOML list of {"name", "content"} objects, either
 * bare or under an "elements" key (TOML: [[elements]]).
 */

#ifndef TIDYMERGE_DOCUMENT_HPP
#define TIDYMERGE_DOCUMENT_HPP

#include "tidymerge/Node.hpp"
#include "tidymerge/Value.hpp"

#include <string>
#include <vector>

namespace tidymerge {

/**
 * @brief Convert a JSON node list to a Container
 *
 * @throws DocumentError for entries that are not exactly one of the three
 *         node forms, for non-string trivia text, and for whitespace nodes
 *         containing non-blank characters
 */
Container container_from_json(const Value& data);

/// Inverse of container_from_json(); always produces {"nodes": [...]}
Value container_to_json(const Container& container);

/**
 * @brief Convert a JSON/TOML element list
 *
 * `content` is optional and defaults to null.
 *
 * @throws DocumentError for entries without a string "name"
 */
std::vector<Element> elements_from_value(const Value& data);

/// Load a container from a JSON file
Container load_document(const std::string& path);

/// Write a container as JSON, replacing the file
void write_document(const std::string& path, const Container& container, int indent = 2);

/// Load new elements from a .json or .toml file
std::vector<Element> load_elements(const std::string& path);

/**
 * @brief Flat text rendering for inspection
 *
 * Trivia text is emitted verbatim and each element as
 * `name = <compact json content>`.
 */
std::string render(const Container& container);

} // namespace tidymerge

#endif // TIDYMERGE_DOCUMENT_HPP
