/**
 * @file DotPath.cpp
 * @brief Implementation of dot-path utilities
 */

#include "tidymerge/DotPath.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace tidymerge {

std::vector<std::string> split_dot_path(const std::string& path) {
    std::vector<std::string> segments;
    std::string current;

    for (char c : path) {
        if (c != '.') {
            current += c;
        } else if (!current.empty()) {
            segments.push_back(current);
            current.clear();
        }
    }
    if (!current.empty()) {
        segments.push_back(current);
    }

    return segments;
}

std::string join_dot_path(const std::vector<std::string>& segments) {
    std::ostringstream oss;
    for (size_t i = 0; i < segments.size(); ++i) {
        if (i > 0) oss << '.';
        oss << segments[i];
    }
    return oss.str();
}

namespace {

    enum class Step {
        Found,
        Missing,
        NotContainer
    };

    /**
     * @brief Check if segment is a canonical non-negative integer
     *
     * "0" is accepted, leading zeros ("01") are not.
     */
    bool is_array_index(const std::string& segment) {
        if (segment.empty()) return false;
        if (segment[0] == '0' && segment.size() > 1) return false;
        return std::all_of(segment.begin(), segment.end(),
                           [](unsigned char c) { return std::isdigit(c) != 0; });
    }

    /**
     * @brief Descend one segment from @p current
     *
     * On Found, @p current is updated to the child.
     */
    Step step_into(const Value*& current, const std::string& seg) {
        if (current->is_object()) {
            auto it = current->find(seg);
            if (it == current->end()) return Step::Missing;
            current = &*it;
            return Step::Found;
        }
        if (current->is_array()) {
            if (!is_array_index(seg)) return Step::Missing;
            const auto idx = std::stoull(seg);
            if (idx >= current->size()) return Step::Missing;
            current = &(*current)[static_cast<size_t>(idx)];
            return Step::Found;
        }
        return Step::NotContainer;
    }

} // anonymous namespace

const Value* get_by_dot(const Value& data, const std::string& path) {
    const Value* current = &data;
    for (const auto& seg : split_dot_path(path)) {
        const Value* parent = current;
        switch (step_into(current, seg)) {
            case Step::Found:
                break;
            case Step::Missing:
                throw KeyError(path, seg);
            case Step::NotContainer:
                throw TypeError(path, "object or array", type_name(*parent));
        }
    }
    return current;
}

const Value* find_by_dot(const Value& data, const std::string& path) noexcept {
    const Value* current = &data;
    try {
        for (const auto& seg : split_dot_path(path)) {
            if (step_into(current, seg) != Step::Found) {
                return nullptr;
            }
        }
    } catch (const std::exception&) {
        // std::bad_alloc from splitting, or an index too large for stoull
        return nullptr;
    }
    return current;
}

void set_by_dot(Value& data, const std::string& path, const Value& value) {
    const auto segments = split_dot_path(path);
    if (segments.empty()) {
        data = value;
        return;
    }

    Value* current = &data;
    for (const auto& seg : segments) {
        if (!current->is_object()) {
            *current = Value::object();
        }
        current = &(*current)[seg];
    }
    *current = value;
}

bool contains_dot(const Value& data, const std::string& path) {
    const Value* current = &data;
    for (const auto& seg : split_dot_path(path)) {
        const Value* parent = current;
        switch (step_into(current, seg)) {
            case Step::Found:
                break;
            case Step::Missing:
                return false;
            case Step::NotContainer:
                throw TypeError(path, "object or array", type_name(*parent));
        }
    }
    return true;
}

} // namespace tidymerge
