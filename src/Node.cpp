/**
 * @file Node.cpp
 * @brief Implementation of the node model
 */

#include "tidymerge/Node.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>
#include <stdexcept>

namespace tidymerge {

bool Trivia::is_whitespace_only() const {
    if (kind != TriviaKind::Whitespace) {
        return false;
    }
    return std::all_of(text.begin(), text.end(),
                       [](unsigned char c) { return std::isspace(c) != 0; });
}

bool is_element(const Node& node) noexcept {
    return std::holds_alternative<Element>(node);
}

bool is_whitespace(const Node& node) {
    const auto* trivia = std::get_if<Trivia>(&node);
    return trivia != nullptr && trivia->is_whitespace_only();
}

const Element* as_element(const Node& node) noexcept {
    return std::get_if<Element>(&node);
}

Element* as_element(Node& node) noexcept {
    return std::get_if<Element>(&node);
}

// ============================================================================
// Container
// ============================================================================

Container& Container::append(Node node) {
    children_.push_back(std::move(node));
    return *this;
}

Container& Container::append_element(std::string name, Value content) {
    return append(Element(std::move(name), std::move(content)));
}

Container& Container::append_whitespace(std::string text) {
    return append(Trivia::whitespace(std::move(text)));
}

Container& Container::append_comment(std::string text) {
    return append(Trivia::comment(std::move(text)));
}

void Container::insert(std::size_t index, std::vector<Node> nodes) {
    if (index > children_.size()) {
        throw std::out_of_range("Container::insert: index " + std::to_string(index) +
                                " past end (size " + std::to_string(children_.size()) + ")");
    }
    children_.insert(children_.begin() + static_cast<std::ptrdiff_t>(index),
                     std::make_move_iterator(nodes.begin()),
                     std::make_move_iterator(nodes.end()));
}

void Container::replace(std::size_t index, Node node) {
    children_.at(index) = std::move(node);
}

std::vector<Node> Container::release() {
    std::vector<Node> out;
    out.swap(children_);
    return out;
}

std::vector<std::size_t> Container::element_indices() const {
    std::vector<std::size_t> out;
    for (std::size_t i = 0; i < children_.size(); ++i) {
        if (is_element(children_[i])) out.push_back(i);
    }
    return out;
}

std::vector<const Element*> Container::elements() const {
    std::vector<const Element*> out;
    for (const auto& child : children_) {
        if (const auto* e = as_element(child)) out.push_back(e);
    }
    return out;
}

std::size_t Container::element_count() const {
    return static_cast<std::size_t>(
        std::count_if(children_.begin(), children_.end(),
                      [](const Node& n) { return is_element(n); }));
}

} // namespace tidymerge
