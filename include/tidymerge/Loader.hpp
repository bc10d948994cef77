/**
 * @file Loader.hpp
 * @brief File loading utilities
 *
 * Loads structured input from:
 * - JSON files (using nlohmann::json)
 * - TOML files (using toml++)
 *
 * Both end up as a Value so that documents, element lists and settings
 * share one representation.
 */

#ifndef TIDYMERGE_LOADER_HPP
#define TIDYMERGE_LOADER_HPP

#include "tidymerge/Value.hpp"

#include <string>

namespace tidymerge {

/**
 * @brief Load a JSON file
 *
 * @throws FileNotFoundError if the file doesn't exist
 * @throws ParseError if the JSON syntax is invalid
 */
Value load_json_file(const std::string& path);

/**
 * @brief Load a TOML file
 *
 * Tables become objects, arrays become arrays. Dates and times are kept
 * as their TOML text.
 *
 * @throws FileNotFoundError if the file doesn't exist
 * @throws ParseError if the TOML syntax is invalid
 */
Value load_toml_file(const std::string& path);

/**
 * @brief Load a file, picking the format by extension
 *
 * - Empty path → empty object (nothing loaded)
 * - ".json" → load_json_file()
 * - ".toml" → load_toml_file()
 *
 * @throws FileNotFoundError if path is non-empty and the file doesn't exist
 * @throws ParseError on syntax errors
 * @throws TidyMergeError if the extension is not .json or .toml
 */
Value load_config_file(const std::string& path);

/**
 * @brief Write a Value as JSON, replacing the file
 *
 * @param indent Indentation width; negative for compact output
 * @throws TidyMergeError if the file cannot be opened for writing
 */
void write_json_file(const std::string& path, const Value& data, int indent = 2);

/**
 * @brief Get file extension (lowercase, including the dot)
 */
std::string get_file_extension(const std::string& path);

} // namespace tidymerge

#endif // TIDYMERGE_LOADER_HPP
