/**
 * @file KeySelector.hpp
 * @brief Functions deriving the merge key of an element
 *
 * Keys are compared byte-wise, so selectors must produce the exact text to
 * sort on. Every selector here is pure and total: it returns a key for any
 * element and never throws.
 */

#ifndef TIDYMERGE_KEYSELECTOR_HPP
#define TIDYMERGE_KEYSELECTOR_HPP

#include "tidymerge/Node.hpp"

#include <functional>
#include <string>

namespace tidymerge {

using KeySelector = std::function<std::string(const Element&)>;

/// Key is the element name
KeySelector key_by_name();

/**
 * @brief Key is a value inside the element content
 *
 * Strings are used as-is, other values by their compact JSON dump.
 * A path that does not resolve gives the empty key.
 *
 * @param path Dot-path into Element::content (e.g. "attributes.name")
 */
KeySelector key_by_field(std::string path);

/**
 * @brief Build a selector from its textual description
 *
 * Accepted forms:
 * - "name"          → key_by_name()
 * - "field:<path>"  → key_by_field(path)
 *
 * @throws SettingsError for anything else
 */
KeySelector make_key_selector(const std::string& description);

} // namespace tidymerge

#endif // TIDYMERGE_KEYSELECTOR_HPP
