/**
 * @file KeySelector.cpp
 * @brief Implementation of key selectors
 */

#include "tidymerge/KeySelector.hpp"
#include "tidymerge/DotPath.hpp"
#include "tidymerge/Errors.hpp"

namespace tidymerge {

KeySelector key_by_name() {
    return [](const Element& e) { return e.name; };
}

KeySelector key_by_field(std::string path) {
    return [path = std::move(path)](const Element& e) -> std::string {
        const Value* v = find_by_dot(e.content, path);
        if (v == nullptr) {
            return {};
        }
        if (v->is_string()) {
            return v->get<std::string>();
        }
        return v->dump(-1, ' ', false, Value::error_handler_t::replace);
    };
}

KeySelector make_key_selector(const std::string& description) {
    static const std::string field_prefix = "field:";

    if (description == "name") {
        return key_by_name();
    }
    if (description.compare(0, field_prefix.size(), field_prefix) == 0) {
        std::string path = description.substr(field_prefix.size());
        if (split_dot_path(path).empty()) {
            throw SettingsError("merge.key", "field selector needs a path");
        }
        return key_by_field(std::move(path));
    }
    throw SettingsError("merge.key",
                        "unknown key selector '" + description +
                        "' (expected 'name' or 'field:<path>')");
}

} // namespace tidymerge
