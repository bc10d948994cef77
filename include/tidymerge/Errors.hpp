/**
 * @file Errors.hpp
 * @brief Exception types for tidymerge
 *
 * The merge engine itself never throws. These types are raised by the
 * layers around it:
 * - TidyMergeError: Base class
 * - FileNotFoundError: Input file not found
 * - ParseError: JSON/TOML syntax errors
 * - DocumentError: Well-formed JSON that is not a valid node list
 * - KeyError: Dot-path segment not found
 * - TypeError: Traversal into non-container
 * - SettingsError: Invalid setting value (e.g. unknown key selector)
 * - MissingMandatoryConfig: Mandatory settings absent
 */

#ifndef TIDYMERGE_ERRORS_HPP
#define TIDYMERGE_ERRORS_HPP

#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>
#include <sstream>

namespace tidymerge {

/**
 * @brief Base class for all tidymerge exceptions
 */
class TidyMergeError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Input file not found
 */
class FileNotFoundError : public TidyMergeError {
public:
    /**
     * @brief Construct with file path
     * @param path Path to the missing file
     */
    explicit FileNotFoundError(std::string path)
        : TidyMergeError("File not found: " + path)
        , path_(std::move(path))
    {}

    const std::string& path() const noexcept {
        return path_;
    }

private:
    std::string path_;
};

/**
 * @brief JSON/TOML syntax error in an input file
 *
 * Line and column are 0 when the underlying parser does not report them.
 */
class ParseError : public TidyMergeError {
public:
    ParseError(std::string file, int line, int column, std::string details)
        : TidyMergeError(format_message(file, line, column, details))
        , file_(std::move(file))
        , line_(line)
        , column_(column)
        , details_(std::move(details))
    {}

    const std::string& file() const noexcept { return file_; }
    int line() const noexcept { return line_; }
    int column() const noexcept { return column_; }
    const std::string& details() const noexcept { return details_; }

private:
    std::string file_;
    int line_;
    int column_;
    std::string details_;

    static std::string format_message(const std::string& file, int line,
                                      int column, const std::string& details) {
        std::ostringstream oss;
        oss << "Parse error in '" << file << "'";
        if (line > 0) {
            oss << " at line " << line << ", column " << column;
        }
        oss << ": " << details;
        return oss.str();
    }
};

/**
 * @brief A node list that does not describe a valid container
 *
 * Raised while converting the JSON storage form into a Container or an
 * element list. The index is the position of the offending entry.
 */
class DocumentError : public TidyMergeError {
public:
    DocumentError(std::size_t index, std::string details)
        : TidyMergeError("Invalid node at index " + std::to_string(index) +
                         ": " + details)
        , index_(index)
        , details_(std::move(details))
    {}

    explicit DocumentError(std::string details)
        : TidyMergeError("Invalid document: " + details)
        , index_(0)
        , details_(std::move(details))
    {}

    std::size_t index() const noexcept { return index_; }
    const std::string& details() const noexcept { return details_; }

private:
    std::size_t index_;
    std::string details_;
};

/**
 * @brief Key not found during dot-path traversal
 */
class KeyError : public TidyMergeError {
public:
    /**
     * @param path Full dot-path being accessed (e.g., "merge.key")
     * @param segment The specific segment that doesn't exist (e.g., "key")
     */
    KeyError(std::string path, std::string segment)
        : TidyMergeError("Key not found: '" + segment + "' in path '" + path + "'")
        , path_(std::move(path))
        , segment_(std::move(segment))
    {}

    const std::string& path() const noexcept { return path_; }
    const std::string& segment() const noexcept { return segment_; }

private:
    std::string path_;
    std::string segment_;
};

/**
 * @brief Type mismatch during dot-path traversal
 *
 * Raised when attempting to traverse into a scalar
 * (e.g., "output.indent.width" when indent is an integer).
 */
class TypeError : public TidyMergeError {
public:
    TypeError(std::string path, std::string expected, std::string actual)
        : TidyMergeError("Cannot traverse into " + actual +
                         " (expected " + expected + ") at path '" + path + "'")
        , path_(std::move(path))
        , expected_(std::move(expected))
        , actual_(std::move(actual))
    {}

    const std::string& path() const noexcept { return path_; }
    const std::string& expected() const noexcept { return expected_; }
    const std::string& actual() const noexcept { return actual_; }

private:
    std::string path_;
    std::string expected_;
    std::string actual_;
};

/**
 * @brief A setting has a value the tool cannot use
 */
class SettingsError : public TidyMergeError {
public:
    SettingsError(std::string key, std::string details)
        : TidyMergeError("Invalid setting '" + key + "': " + details)
        , key_(std::move(key))
    {}

    const std::string& key() const noexcept { return key_; }

private:
    std::string key_;
};

/**
 * @brief Mandatory settings are missing after all layers were applied
 */
class MissingMandatoryConfig : public TidyMergeError {
public:
    explicit MissingMandatoryConfig(std::vector<std::string> keys)
        : TidyMergeError(format_message(keys))
        , missing_keys_(std::move(keys))
    {}

    const std::vector<std::string>& missing_keys() const noexcept {
        return missing_keys_;
    }

private:
    std::vector<std::string> missing_keys_;

    static std::string format_message(const std::vector<std::string>& keys) {
        std::ostringstream oss;
        oss << "Missing mandatory configuration keys: [";
        for (size_t i = 0; i < keys.size(); ++i) {
            if (i > 0) oss << ", ";
            oss << "'" << keys[i] << "'";
        }
        oss << "]";
        return oss.str();
    }
};

} // namespace tidymerge

#endif // TIDYMERGE_ERRORS_HPP
