/**
 * @file Parse.cpp
 * @brief Implementation of type parsing
 */

#include "tidymerge/Parse.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <stdexcept>

namespace tidymerge {

namespace {

    std::string to_lower(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return s;
    }

    std::string trim(const std::string& s) {
        auto start = s.find_first_not_of(" \t\r\n");
        if (start == std::string::npos) return "";
        auto end = s.find_last_not_of(" \t\r\n");
        return s.substr(start, end - start + 1);
    }

    /// Count of leading digits starting at @p pos
    size_t digits_at(const std::string& s, size_t pos) {
        size_t n = 0;
        while (pos + n < s.size() && std::isdigit(static_cast<unsigned char>(s[pos + n]))) {
            ++n;
        }
        return n;
    }

    bool looks_integer(const std::string& s) {
        size_t pos = (s[0] == '-') ? 1 : 0;
        size_t n = digits_at(s, pos);
        return n > 0 && pos + n == s.size();
    }

    bool looks_float(const std::string& s) {
        size_t pos = (s[0] == '-') ? 1 : 0;
        size_t n = digits_at(s, pos);
        if (n == 0) return false;
        pos += n;
        if (pos >= s.size() || s[pos] != '.') return false;
        ++pos;
        n = digits_at(s, pos);
        if (n == 0) return false;
        pos += n;
        if (pos == s.size()) return true;
        if (s[pos] != 'e' && s[pos] != 'E') return false;
        ++pos;
        if (pos < s.size() && (s[pos] == '+' || s[pos] == '-')) ++pos;
        n = digits_at(s, pos);
        return n > 0 && pos + n == s.size();
    }

} // anonymous namespace

Value parse_value(const std::string& str) {
    if (str.empty()) {
        return "";
    }

    const std::string lower = to_lower(str);
    if (lower == "true") return true;
    if (lower == "false") return false;
    if (lower == "null") return nullptr;

    if (looks_integer(str)) {
        try {
            return static_cast<int64_t>(std::stoll(str));
        } catch (const std::out_of_range&) {
            // Too large for int64: falls through to raw string
        }
    } else if (looks_float(str)) {
        try {
            return std::stod(str);
        } catch (const std::out_of_range&) {
            // Overflows double: raw string
        }
    }

    const char first = str.front();
    const char last = str.back();
    const bool compound = (first == '{' && last == '}') || (first == '[' && last == ']');
    const bool quoted = str.size() >= 2 && first == '"' && last == '"';
    if (compound || quoted) {
        Value parsed = Value::parse(str, nullptr, /*allow_exceptions=*/false);
        if (!parsed.is_discarded() && (compound || parsed.is_string())) {
            return parsed;
        }
    }

    return str;
}

std::map<std::string, Value> parse_overrides(const std::string& str) {
    std::map<std::string, Value> out;

    auto flush = [&out](const std::string& pair) {
        auto colon = pair.find(':');
        if (colon == std::string::npos) return;
        std::string key = trim(pair.substr(0, colon));
        if (key.empty()) return;
        out[key] = parse_value(trim(pair.substr(colon + 1)));
    };

    int depth = 0;
    char quote = '\0';
    std::string buf;
    for (size_t i = 0; i < str.size(); ++i) {
        const char c = str[i];
        if (quote != '\0') {
            if (c == quote && str[i - 1] != '\\') quote = '\0';
        } else if (c == '"' || c == '\'') {
            quote = c;
        } else if (c == '{' || c == '[') {
            ++depth;
        } else if (c == '}' || c == ']') {
            --depth;
        } else if (c == ',' && depth == 0) {
            flush(buf);
            buf.clear();
            continue;
        }
        buf += c;
    }
    if (!buf.empty()) flush(buf);

    return out;
}

} // namespace tidymerge
