/**
 * @file Merge.hpp
 * @brief Sorted, formatting-preserving merge of elements into a container
 *
 * Merging rules:
 * - New elements are placed in ascending byte-wise key order
 * - An existing element with the same key as a new one is replaced in place
 * - Existing elements without a counterpart stay where they are, together
 *   with their comments and whitespace
 * - A new element is inserted before the comment/whitespace run of the
 *   element that follows it, so comments stay with the element they describe
 * - Separator whitespace is copied from the document, never invented
 * - A container that turns out to be unsorted is sorted once, then the
 *   merge is redone on the sorted container
 */

#ifndef TIDYMERGE_MERGE_HPP
#define TIDYMERGE_MERGE_HPP

#include "tidymerge/KeySelector.hpp"
#include "tidymerge/Node.hpp"

#include <cstddef>
#include <vector>

namespace tidymerge {

/**
 * @brief Outcome of a merge
 */
struct MergeReport {
    /// Element set, order or content differs from before the call
    bool changed = false;

    /// The existing elements were out of order and had to be sorted first
    bool resorted = false;

    /// New elements that had no existing counterpart
    std::size_t inserted = 0;

    /// Existing elements replaced by a new element with the same key,
    /// including replacements with identical content
    std::size_t replaced = 0;
};

/**
 * @brief Merge new elements into a container, keeping it sorted by key
 *
 * @param container Container to modify in place
 * @param new_elements Elements to merge in; moved into the container
 * @param key_of Pure, deterministic key selector
 * @return true if the container changed; false if every new element was
 *         already present with equal content and the container was sorted
 *
 * Keys must be unique on each side. With duplicate keys the placement is
 * unspecified, but nothing is lost: every new element ends up in the
 * container.
 *
 * Examples:
 * ```cpp
 * // [ws, A, ws, C, ws]  +  [B]
 * merge_elements(c, {Element("B")}, key_by_name());
 * // [ws, A, ws', B, ws, C, ws]    ws' copied from the whitespace before C
 *
 * // [ws, B, ws, A]  +  []
 * merge_elements(c, {}, key_by_name());   // returns true
 * // [ws, A, ws, B]                each element keeps its own leading trivia
 * ```
 */
bool merge_elements(Container& container, std::vector<Element> new_elements,
                    const KeySelector& key_of);

/**
 * @brief Same as merge_elements(), with insertion/replacement counts
 */
MergeReport merge_elements_report(Container& container, std::vector<Element> new_elements,
                                  const KeySelector& key_of);

/**
 * @brief Check that element keys are in ascending byte-wise order
 *
 * Equal adjacent keys count as sorted.
 */
bool is_sorted_by_key(const Container& container, const KeySelector& key_of);

/**
 * @brief Stable-sort the elements of a container by key
 *
 * Each element moves together with its leading trivia. Nodes after the
 * last element (trailing comments, final newline) stay at the end.
 *
 * @return true if the order changed; false (and no modification) if the
 *         container was already sorted
 */
bool sort_elements(Container& container, const KeySelector& key_of);

} // namespace tidymerge

#endif // TIDYMERGE_MERGE_HPP
