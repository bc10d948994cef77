/**
 * @file Node.hpp
 * @brief Node model for ordered, formatting-preserving containers
 *
 * A Container is an explicit ordered list of tagged nodes. Two kinds
 * participate:
 * - Element: the entities being merged (a name plus opaque JSON content)
 * - Trivia: whitespace-only text or comments, preserved for readability
 *   and never compared semantically
 *
 * All editing is done through child indices so that "insert before this
 * trivia block" and "replace in place" are plain list operations.
 */

#ifndef TIDYMERGE_NODE_HPP
#define TIDYMERGE_NODE_HPP

#include "tidymerge/Value.hpp"

#include <cstddef>
#include <string>
#include <variant>
#include <vector>

namespace tidymerge {

/**
 * @brief A mergeable entity
 *
 * Two elements are deeply equal when both the name and the content are
 * equal. The merge key is not stored; it is derived by a KeySelector.
 */
struct Element {
    std::string name;
    Value content;

    Element() = default;
    explicit Element(std::string n, Value c = Value())
        : name(std::move(n)), content(std::move(c)) {}

    bool operator==(const Element& other) const {
        return name == other.name && content == other.content;
    }
    bool operator!=(const Element& other) const {
        return !(*this == other);
    }
};

enum class TriviaKind {
    Whitespace,
    Comment
};

/**
 * @brief Non-semantic formatting node
 *
 * Text is kept verbatim, including comment delimiters.
 */
struct Trivia {
    TriviaKind kind = TriviaKind::Whitespace;
    std::string text;

    static Trivia whitespace(std::string text) {
        return Trivia{TriviaKind::Whitespace, std::move(text)};
    }
    static Trivia comment(std::string text) {
        return Trivia{TriviaKind::Comment, std::move(text)};
    }

    /**
     * @brief True for a whitespace node whose text has only blank characters
     *
     * The empty string counts as whitespace-only.
     */
    bool is_whitespace_only() const;

    bool operator==(const Trivia& other) const {
        return kind == other.kind && text == other.text;
    }
    bool operator!=(const Trivia& other) const {
        return !(*this == other);
    }
};

/// Tagged child of a container
using Node = std::variant<Element, Trivia>;

bool is_element(const Node& node) noexcept;
bool is_whitespace(const Node& node);

/// @return Pointer to the element, or nullptr for trivia
const Element* as_element(const Node& node) noexcept;
Element* as_element(Node& node) noexcept;

/**
 * @brief Ordered sequence of child nodes
 *
 * The container owns its children. Element nodes handed to it are moved
 * in; it never copies them behind the caller's back.
 */
class Container {
public:
    Container() = default;
    explicit Container(std::vector<Node> children) : children_(std::move(children)) {}

    const std::vector<Node>& children() const noexcept { return children_; }
    std::size_t size() const noexcept { return children_.size(); }
    bool empty() const noexcept { return children_.empty(); }

    const Node& operator[](std::size_t index) const { return children_.at(index); }
    Node& operator[](std::size_t index) { return children_.at(index); }

    // Builders
    Container& append(Node node);
    Container& append_element(std::string name, Value content = Value());
    Container& append_whitespace(std::string text);
    Container& append_comment(std::string text);

    /**
     * @brief Insert nodes so that the first one ends up at @p index
     * @throws std::out_of_range if index > size()
     */
    void insert(std::size_t index, std::vector<Node> nodes);

    /**
     * @brief Replace the node at @p index, keeping its neighbours in place
     * @throws std::out_of_range if index >= size()
     */
    void replace(std::size_t index, Node node);

    /// Swap in a complete new child list
    void assign(std::vector<Node> children) { children_ = std::move(children); }

    /// Move the child list out, leaving the container empty
    std::vector<Node> release();

    /// Child indices of all element nodes, in document order
    std::vector<std::size_t> element_indices() const;

    /// Pointers to all elements, in document order
    std::vector<const Element*> elements() const;

    std::size_t element_count() const;

    bool operator==(const Container& other) const {
        return children_ == other.children_;
    }
    bool operator!=(const Container& other) const {
        return !(*this == other);
    }

private:
    std::vector<Node> children_;
};

} // namespace tidymerge

#endif // TIDYMERGE_NODE_HPP
