/**
 * @file Trivia.cpp
 * @brief Implementation of trivia location and whitespace sampling
 */

#include "tidymerge/Trivia.hpp"

#include <stdexcept>
#include <string>

namespace tidymerge {

TriviaRange leading_trivia(const Container& container, std::size_t element_index) {
    if (element_index >= container.size()) {
        throw std::out_of_range("leading_trivia: index " + std::to_string(element_index) +
                                " out of range");
    }

    TriviaRange range{element_index, element_index};
    while (range.begin > 0 && !is_element(container[range.begin - 1])) {
        --range.begin;
    }
    return range;
}

std::vector<Node> leading_trivia_nodes(const Container& container, std::size_t element_index) {
    const auto range = leading_trivia(container, element_index);
    std::vector<Node> out;
    out.reserve(range.size());
    for (std::size_t i = range.begin; i < range.end; ++i) {
        out.push_back(container[i]);
    }
    return out;
}

std::optional<Node> sample_separator(const Container& container, std::size_t element_index) {
    if (element_index >= container.size()) {
        return std::nullopt;
    }

    if (element_index > 0 && is_whitespace(container[element_index - 1])) {
        return container[element_index - 1];
    }
    if (element_index + 1 < container.size() && is_whitespace(container[element_index + 1])) {
        return container[element_index + 1];
    }
    return std::nullopt;
}

} // namespace tidymerge
