/**
 * @file Document.cpp
 * @brief Implementation of the container storage form
 */

#include "tidymerge/Document.hpp"
#include "tidymerge/Errors.hpp"
#include "tidymerge/Loader.hpp"

#include <sstream>

namespace tidymerge {

namespace {

    const Value& node_list(const Value& data) {
        if (data.is_array()) {
            return data;
        }
        if (data.is_object()) {
            auto it = data.find("nodes");
            if (it != data.end() && it->is_array()) {
                return *it;
            }
        }
        throw DocumentError("expected an array of nodes or an object with a \"nodes\" array, got " +
                            type_name(data));
    }

    Element element_from_json(std::size_t index, const Value& entry) {
        if (!entry.is_object()) {
            throw DocumentError(index, "element must be an object, got " + type_name(entry));
        }
        auto name = entry.find("name");
        if (name == entry.end() || !name->is_string()) {
            throw DocumentError(index, "element needs a string \"name\"");
        }
        auto content = entry.find("content");
        return Element(name->get<std::string>(),
                       content == entry.end() ? Value() : *content);
    }

    std::string trivia_text(std::size_t index, const Value& text, const char* kind) {
        if (!text.is_string()) {
            throw DocumentError(index, std::string(kind) + " text must be a string, got " +
                                       type_name(text));
        }
        return text.get<std::string>();
    }

    Node node_from_json(std::size_t index, const Value& entry) {
        if (!entry.is_object() || entry.size() != 1) {
            throw DocumentError(index, "node must be an object with exactly one of "
                                       "\"element\", \"whitespace\", \"comment\"");
        }

        const auto it = entry.begin();
        if (it.key() == "element") {
            return element_from_json(index, it.value());
        }
        if (it.key() == "whitespace") {
            auto trivia = Trivia::whitespace(trivia_text(index, it.value(), "whitespace"));
            if (!trivia.is_whitespace_only()) {
                throw DocumentError(index, "whitespace node contains non-blank characters");
            }
            return trivia;
        }
        if (it.key() == "comment") {
            return Trivia::comment(trivia_text(index, it.value(), "comment"));
        }
        throw DocumentError(index, "unknown node kind \"" + it.key() + "\"");
    }

    struct NodeToJson {
        Value operator()(const Element& e) const {
            return Value{{"element", {{"name", e.name}, {"content", e.content}}}};
        }
        Value operator()(const Trivia& t) const {
            return Value{{t.kind == TriviaKind::Whitespace ? "whitespace" : "comment", t.text}};
        }
    };

} // anonymous namespace

Container container_from_json(const Value& data) {
    const Value& nodes = node_list(data);

    Container container;
    for (std::size_t i = 0; i < nodes.size(); ++i) {
        container.append(node_from_json(i, nodes[i]));
    }
    return container;
}

Value container_to_json(const Container& container) {
    Value nodes = Value::array();
    for (const auto& child : container.children()) {
        nodes.push_back(std::visit(NodeToJson{}, child));
    }
    return Value{{"nodes", std::move(nodes)}};
}

std::vector<Element> elements_from_value(const Value& data) {
    const Value* list = &data;
    if (data.is_object()) {
        auto it = data.find("elements");
        if (it == data.end()) {
            throw DocumentError("expected an \"elements\" list");
        }
        list = &*it;
    }
    if (!list->is_array()) {
        throw DocumentError("element list must be an array, got " + type_name(*list));
    }

    std::vector<Element> out;
    out.reserve(list->size());
    for (std::size_t i = 0; i < list->size(); ++i) {
        out.push_back(element_from_json(i, (*list)[i]));
    }
    return out;
}

Container load_document(const std::string& path) {
    return container_from_json(load_json_file(path));
}

void write_document(const std::string& path, const Container& container, int indent) {
    write_json_file(path, container_to_json(container), indent);
}

std::vector<Element> load_elements(const std::string& path) {
    return elements_from_value(load_config_file(path));
}

std::string render(const Container& container) {
    std::ostringstream oss;
    for (const auto& child : container.children()) {
        if (const auto* e = as_element(child)) {
            oss << e->name << " = "
                << e->content.dump(-1, ' ', false, Value::error_handler_t::replace);
        } else {
            oss << std::get<Trivia>(child).text;
        }
    }
    return oss.str();
}

} // namespace tidymerge
