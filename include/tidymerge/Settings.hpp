/**
 * @file Settings.hpp
 * @brief Layered settings for the tidymerge tool
 *
 * Precedence, lowest first:
 * 1. defaults (built-in, see default_settings())
 * 2. settings file (.json or .toml)
 * 3. environment variables with a prefix: PREFIX_MERGE_KEY → merge.key
 * 4. explicit overrides ("merge.key:field:id")
 * Mandatory keys are checked last.
 */

#ifndef TIDYMERGE_SETTINGS_HPP
#define TIDYMERGE_SETTINGS_HPP

#include "tidymerge/KeySelector.hpp"
#include "tidymerge/Value.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace tidymerge {

/**
 * @brief Built-in defaults
 *
 * ```json
 * {"merge": {"key": "name"}, "output": {"indent": 2}, "log": {"verbose": false}}
 * ```
 */
Value default_settings();

/**
 * @brief Options for loading settings from multiple sources
 */
struct LoadOptions {
    std::optional<std::string> file_path;
    std::optional<std::string> prefix; // e.g. "TIDYMERGE"
    std::map<std::string, Value> overrides;
    Value defaults = default_settings();
    std::vector<std::string> mandatory;
};

/**
 * @brief Settings tree with dot-path access
 */
class Settings {
public:
    Settings() = default;
    explicit Settings(Value data) : data_(std::move(data)) {}

    static Settings load(const LoadOptions& opts);

    const Value& data() const noexcept { return data_; }

    /// @throws KeyError / TypeError as get_by_dot()
    const Value& at(const std::string& path) const;
    bool contains(const std::string& path) const;
    void set(const std::string& path, const Value& v);

    /**
     * @brief Typed lookup with fallback
     *
     * Returns @p fallback when the path is missing or holds a value of
     * another type.
     */
    template <typename T>
    T get(const std::string& path, const T& fallback) const {
        if (!contains(path)) return fallback;
        try {
            return at(path).get<T>();
        } catch (const nlohmann::json::type_error&) {
            return fallback;
        }
    }

    void apply_env_prefix(const std::string& prefix);
    void apply_overrides(const std::map<std::string, Value>& kv);

    /// @throws MissingMandatoryConfig listing every absent key
    void enforce_mandatory(const std::vector<std::string>& keys) const;

    /// Selector described by merge.key
    /// @throws SettingsError if merge.key is not a valid description
    KeySelector key_selector() const;

    int output_indent() const;
    bool verbose() const;

private:
    Value data_ = Value::object();
};

} // namespace tidymerge

#endif // TIDYMERGE_SETTINGS_HPP
