/**
 * @file Trivia.hpp
 * @brief Locating trivia around elements
 *
 * Two helpers used by the merge engine to position new elements:
 * - leading_trivia(): the comment/whitespace run that belongs to an element
 *   and must stay visually attached to it
 * - sample_separator(): a whitespace node next to an element, copied as the
 *   separator for inserted elements so the document's indentation style
 *   carries over
 */

#ifndef TIDYMERGE_TRIVIA_HPP
#define TIDYMERGE_TRIVIA_HPP

#include "tidymerge/Node.hpp"

#include <cstddef>
#include <optional>
#include <vector>

namespace tidymerge {

/**
 * @brief Half-open range [begin, end) of child indices
 */
struct TriviaRange {
    std::size_t begin = 0;
    std::size_t end = 0;

    std::size_t size() const noexcept { return end - begin; }
    bool empty() const noexcept { return begin == end; }
};

/**
 * @brief Find the trivia run immediately preceding an element
 *
 * The run is bounded by the previous element (exclusive) or, for the first
 * element, by the start of the container. `end` is always @p element_index.
 *
 * @param container Container holding the element
 * @param element_index Child index of the element
 * @return Range of preceding non-element nodes (possibly empty)
 * @throws std::out_of_range if element_index >= container.size()
 *
 * Example:
 * ```cpp
 * // [ws, A, ws, <!-- c -->, ws, B]
 * leading_trivia(c, 5);  // {2, 5}
 * leading_trivia(c, 1);  // {0, 1}
 * ```
 */
TriviaRange leading_trivia(const Container& container, std::size_t element_index);

/// Copies of the nodes in leading_trivia(), in document order
std::vector<Node> leading_trivia_nodes(const Container& container, std::size_t element_index);

/**
 * @brief Sample the whitespace used to separate elements
 *
 * Looks at the previous sibling first, then the next one, and returns a
 * copy of the first that is a whitespace-only trivia node. The original
 * node is not touched.
 *
 * @return The copied node, or std::nullopt if neither neighbour is
 *         whitespace or the index is out of range
 */
std::optional<Node> sample_separator(const Container& container, std::size_t element_index);

} // namespace tidymerge

#endif // TIDYMERGE_TRIVIA_HPP
