/**
 * @file Settings.cpp
 * @brief Implementation of layered settings
 */

#include "tidymerge/Settings.hpp"
#include "tidymerge/DotPath.hpp"
#include "tidymerge/Errors.hpp"
#include "tidymerge/Loader.hpp"
#include "tidymerge/Parse.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <cstring>

#if defined(_WIN32)
  #include <windows.h>
#else
  #include <unistd.h>
  extern char **environ;
#endif

namespace tidymerge {

namespace {

    // Merge b into a (recursively). Values in b take precedence.
    void deep_merge(Value& a, const Value& b) {
        if (!a.is_object() || !b.is_object()) {
            a = b;
            return;
        }
        for (auto it = b.begin(); it != b.end(); ++it) {
            auto existing = a.find(it.key());
            if (existing != a.end() && existing->is_object() && it->is_object()) {
                deep_merge(*existing, *it);
            } else {
                a[it.key()] = *it;
            }
        }
    }

    std::vector<std::pair<std::string, std::string>> enumerate_environment() {
        std::vector<std::pair<std::string, std::string>> envs;
#if defined(_WIN32)
        LPCH env = GetEnvironmentStringsA();
        if (!env) return envs;
        for (LPSTR var = env; *var != '\0'; var += strlen(var) + 1) {
            std::string entry(var);
            auto pos = entry.find('=');
            if (pos == std::string::npos || pos == 0) continue;
            envs.emplace_back(entry.substr(0, pos), entry.substr(pos + 1));
        }
        FreeEnvironmentStringsA(env);
#else
        if (environ) {
            for (char** env = environ; *env; ++env) {
                std::string entry(*env);
                auto pos = entry.find('=');
                if (pos == std::string::npos) continue;
                envs.emplace_back(entry.substr(0, pos), entry.substr(pos + 1));
            }
        }
#endif
        return envs;
    }

} // anonymous namespace

Value default_settings() {
    return Value{
        {"merge", {{"key", "name"}}},
        {"output", {{"indent", 2}}},
        {"log", {{"verbose", false}}}
    };
}

Settings Settings::load(const LoadOptions& opts) {
    Value merged = Value::object();

    // 1) defaults
    deep_merge(merged, opts.defaults);

    // 2) file
    if (opts.file_path.has_value()) {
        deep_merge(merged, load_config_file(*opts.file_path));
    }

    Settings settings(std::move(merged));

    // 3) env
    if (opts.prefix.has_value() && !opts.prefix->empty()) {
        settings.apply_env_prefix(*opts.prefix);
    }

    // 4) overrides
    settings.apply_overrides(opts.overrides);

    // 5) mandatory
    settings.enforce_mandatory(opts.mandatory);

    return settings;
}

const Value& Settings::at(const std::string& path) const {
    return *get_by_dot(data_, path);
}

bool Settings::contains(const std::string& path) const {
    return find_by_dot(data_, path) != nullptr;
}

void Settings::set(const std::string& path, const Value& v) {
    set_by_dot(data_, path, v);
}

void Settings::apply_env_prefix(const std::string& prefix) {
    std::string normalized = prefix;
    while (!normalized.empty() && normalized.back() == '_') normalized.pop_back();
    normalized += "_";

    for (const auto& [name, value] : enumerate_environment()) {
        if (name.rfind(normalized, 0) != 0) continue;

        // remainder -> lower, underscores become dots
        std::string key = name.substr(normalized.size());
        std::transform(key.begin(), key.end(), key.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        std::replace(key.begin(), key.end(), '_', '.');
        if (split_dot_path(key).empty()) continue;

        set_by_dot(data_, key, parse_value(value));
    }
}

void Settings::apply_overrides(const std::map<std::string, Value>& kv) {
    for (const auto& [k, v] : kv) {
        set_by_dot(data_, k, v);
    }
}

void Settings::enforce_mandatory(const std::vector<std::string>& keys) const {
    std::vector<std::string> missing;
    for (const auto& k : keys) {
        if (!contains(k)) missing.push_back(k);
    }
    if (!missing.empty()) throw MissingMandatoryConfig(missing);
}

KeySelector Settings::key_selector() const {
    const Value* key = find_by_dot(data_, "merge.key");
    if (key == nullptr || !key->is_string()) {
        throw SettingsError("merge.key", "expected a string");
    }
    return make_key_selector(key->get<std::string>());
}

int Settings::output_indent() const {
    return get<int>("output.indent", 2);
}

bool Settings::verbose() const {
    return get<bool>("log.verbose", false);
}

} // namespace tidymerge
