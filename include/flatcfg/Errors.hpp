/**
 * @file Errors.hpp
 * @brief Exception types for flatcfg configuration errors
 *
 * Error taxonomy:
 * - ConfigError: Base class
 * - MissingRequiredError: Required key absent or blank
 * - CoercionTypeError: Stored type cannot become the requested type
 * - NumericOverflowError: Wider integer does not fit the narrower target
 * - NumericParseError: Text is not a valid numeric literal
 * - RangeError: Port/byte outside its domain
 * - PatternCompileError: Invalid regex syntax
 * - UriParseError / UuidParseError: Malformed URI/UUID text
 * - PathKindError / PathNotFoundError: Filesystem validation failures
 * - DuplicateListIndexError: Two list entries share an index
 * - InvalidArgumentError / InvalidKeyPrefixError: Bad call arguments
 * - UnconsumedKeysError: Keys left over after consumption
 * - FileNotFoundError / ConfigParseError: Loader failures
 */

#ifndef FLATCFG_ERRORS_HPP
#define FLATCFG_ERRORS_HPP

#include <cstddef>
#include <cstdint>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace flatcfg {

/**
 * @brief Base class for all flatcfg exceptions
 */
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief A caller passed an argument that violates a precondition
 *
 * Blank keys, blank or dotted delimiters, invalid ConfigEntry parts.
 */
class InvalidArgumentError : public ConfigError {
public:
    using ConfigError::ConfigError;
};

/**
 * @brief A key prefix is blank, untrimmed or ends with a bracket
 */
class InvalidKeyPrefixError : public InvalidArgumentError {
public:
    InvalidKeyPrefixError(std::string prefix, const std::string& reason)
        : InvalidArgumentError("Invalid key prefix '" + prefix + "': " + reason)
        , prefix_(std::move(prefix))
    {}

    const std::string& prefix() const noexcept {
        return prefix_;
    }

private:
    std::string prefix_;
};

/**
 * @brief A required property is absent or blank
 */
class MissingRequiredError : public ConfigError {
public:
    explicit MissingRequiredError(std::string key)
        : ConfigError("property required: '" + key + "'")
        , key_(std::move(key))
    {}

    const std::string& key() const noexcept {
        return key_;
    }

private:
    std::string key_;
};

/**
 * @brief Stored value's runtime type cannot be converted
 */
class CoercionTypeError : public ConfigError {
public:
    /**
     * @param key Property key
     * @param target Requested type (e.g., "int")
     * @param actual Stored type name (see type_name())
     */
    CoercionTypeError(std::string key, std::string target, std::string actual)
        : ConfigError("Failed to coerce type to " + target + ": key=" + key +
                      ", type=" + actual)
        , key_(std::move(key))
        , target_(std::move(target))
        , actual_(std::move(actual))
    {}

    const std::string& key() const noexcept {
        return key_;
    }

    const std::string& target() const noexcept {
        return target_;
    }

    const std::string& actual() const noexcept {
        return actual_;
    }

private:
    std::string key_;
    std::string target_;
    std::string actual_;
};

/**
 * @brief A wider integer value does not fit the requested type
 */
class NumericOverflowError : public ConfigError {
public:
    NumericOverflowError(std::string key, const std::string& value,
                         const std::string& target)
        : ConfigError("value overflow for key=" + key + ", value=" + value +
                      ", target=" + target)
        , key_(std::move(key))
    {}

    const std::string& key() const noexcept {
        return key_;
    }

private:
    std::string key_;
};

/**
 * @brief Text is not a valid literal of the requested numeric type
 */
class NumericParseError : public ConfigError {
public:
    NumericParseError(std::string key, std::string text, const std::string& target)
        : ConfigError("Failed to parse " + target + " for key=" + key +
                      ": \"" + text + "\"")
        , key_(std::move(key))
        , text_(std::move(text))
    {}

    const std::string& key() const noexcept {
        return key_;
    }

    const std::string& text() const noexcept {
        return text_;
    }

private:
    std::string key_;
    std::string text_;
};

/**
 * @brief Numeric value outside its domain (ports, bytes)
 *
 * The message carries the offending value, the bound, and either
 * "too low" or "too high".
 */
class RangeError : public ConfigError {
public:
    /**
     * @param key Property key
     * @param what Domain name (e.g., "port", "byte")
     * @param value Offending value
     * @param bound The violated bound
     * @param too_high true when value > bound, false when value < bound
     */
    RangeError(std::string key, const std::string& what, std::int64_t value,
               std::int64_t bound, bool too_high)
        : ConfigError(format_message(key, what, value, bound, too_high))
        , key_(std::move(key))
        , value_(value)
        , bound_(bound)
    {}

    const std::string& key() const noexcept {
        return key_;
    }

    std::int64_t value() const noexcept {
        return value_;
    }

    std::int64_t bound() const noexcept {
        return bound_;
    }

private:
    std::string key_;
    std::int64_t value_;
    std::int64_t bound_;

    static std::string format_message(const std::string& key, const std::string& what,
                                      std::int64_t value, std::int64_t bound,
                                      bool too_high) {
        std::ostringstream oss;
        oss << what << (too_high ? " too high" : " too low")
            << ": key=" << key << ", " << what << "=" << value
            << (too_high ? ", max=" : ", min=") << bound;
        return oss.str();
    }
};

/**
 * @brief Regex pattern failed to compile
 */
class PatternCompileError : public ConfigError {
public:
    PatternCompileError(std::string key, const std::string& cause)
        : ConfigError("failed to compile regex pattern for key=" + key + ": " + cause)
        , key_(std::move(key))
        , cause_(cause)
    {}

    const std::string& key() const noexcept {
        return key_;
    }

    /**
     * @brief Message of the underlying std::regex_error
     */
    const std::string& cause() const noexcept {
        return cause_;
    }

private:
    std::string key_;
    std::string cause_;
};

/**
 * @brief Malformed URI text
 */
class UriParseError : public ConfigError {
public:
    UriParseError(std::string key, std::string text, const std::string& reason)
        : ConfigError("Invalid URI for key=" + key + ": \"" + text + "\" (" + reason + ")")
        , key_(std::move(key))
        , text_(std::move(text))
    {}

    const std::string& key() const noexcept {
        return key_;
    }

    const std::string& text() const noexcept {
        return text_;
    }

private:
    std::string key_;
    std::string text_;
};

/**
 * @brief Malformed UUID text
 */
class UuidParseError : public ConfigError {
public:
    UuidParseError(std::string key, std::string text)
        : ConfigError("Invalid UUID for key=" + key + ": \"" + text + "\"")
        , key_(std::move(key))
        , text_(std::move(text))
    {}

    const std::string& key() const noexcept {
        return key_;
    }

    const std::string& text() const noexcept {
        return text_;
    }

private:
    std::string key_;
    std::string text_;
};

/**
 * @brief Path exists but is the wrong kind (file vs directory)
 */
class PathKindError : public ConfigError {
public:
    /**
     * @param key Property key
     * @param path Resolved absolute path
     * @param expected "directory" or "regular file"
     */
    PathKindError(std::string key, const std::string& path, std::string expected)
        : ConfigError("property '" + key + "' must be a " + expected + ": " + path)
        , key_(std::move(key))
        , expected_(std::move(expected))
    {}

    const std::string& key() const noexcept {
        return key_;
    }

    const std::string& expected() const noexcept {
        return expected_;
    }

private:
    std::string key_;
    std::string expected_;
};

/**
 * @brief Path was required to exist but does not
 */
class PathNotFoundError : public ConfigError {
public:
    PathNotFoundError(std::string key, const std::string& path, std::string expected)
        : ConfigError(capitalize(expected) + " must exist for property '" + key +
                      "': " + path)
        , key_(std::move(key))
        , expected_(std::move(expected))
    {}

    const std::string& key() const noexcept {
        return key_;
    }

    const std::string& expected() const noexcept {
        return expected_;
    }

private:
    std::string key_;
    std::string expected_;

    static std::string capitalize(std::string s) {
        if (!s.empty() && s[0] >= 'a' && s[0] <= 'z') {
            s[0] = static_cast<char>(s[0] - 'a' + 'A');
        }
        return s;
    }
};

/**
 * @brief Two list keys resolve to the same numeric index
 *
 * e.g. "b[15].c" and "b[15].c.d" under prefix "b".
 */
class DuplicateListIndexError : public ConfigError {
public:
    DuplicateListIndexError(std::string prefix, std::size_t index)
        : ConfigError("duplicate index for list property: index=" +
                      std::to_string(index) + ", keyPrefix='" + prefix + "'")
        , prefix_(std::move(prefix))
        , index_(index)
    {}

    const std::string& prefix() const noexcept {
        return prefix_;
    }

    std::size_t index() const noexcept {
        return index_;
    }

private:
    std::string prefix_;
    std::size_t index_;
};

/**
 * @brief Keys remain in a store that should have been fully consumed
 */
class UnconsumedKeysError : public ConfigError {
public:
    /**
     * @param type_name Name of the type being configured
     * @param keys Leftover keys, sorted
     */
    UnconsumedKeysError(std::string type_name, std::vector<std::string> keys)
        : ConfigError(format_message(type_name, keys))
        , type_name_(std::move(type_name))
        , keys_(std::move(keys))
    {}

    const std::string& type_name() const noexcept {
        return type_name_;
    }

    const std::vector<std::string>& keys() const noexcept {
        return keys_;
    }

private:
    std::string type_name_;
    std::vector<std::string> keys_;

    static std::string format_message(const std::string& type_name,
                                      const std::vector<std::string>& keys) {
        std::ostringstream oss;
        oss << "Unrecognized/Extra properties for type: " << type_name << " -> [";
        for (std::size_t i = 0; i < keys.size(); ++i) {
            if (i > 0) oss << ", ";
            oss << keys[i];
        }
        oss << "]";
        return oss.str();
    }
};

/**
 * @brief Configuration file not found
 */
class FileNotFoundError : public ConfigError {
public:
    explicit FileNotFoundError(std::string path)
        : ConfigError("Configuration file not found: " + path)
        , path_(std::move(path))
    {}

    const std::string& path() const noexcept {
        return path_;
    }

private:
    std::string path_;
};

/**
 * @brief Configuration file parse error (properties/JSON/TOML syntax)
 */
class ConfigParseError : public ConfigError {
public:
    /**
     * @param file Path to the file with parse error
     * @param line 1-based line, or 0 when unknown
     * @param details Detailed error message from parser
     */
    ConfigParseError(std::string file, int line, std::string details)
        : ConfigError("Parse error in '" + file + "'" +
                      (line > 0 ? " at line " + std::to_string(line) : std::string()) +
                      ": " + details)
        , file_(std::move(file))
        , line_(line)
        , details_(std::move(details))
    {}

    const std::string& file() const noexcept {
        return file_;
    }

    int line() const noexcept {
        return line_;
    }

    const std::string& details() const noexcept {
        return details_;
    }

private:
    std::string file_;
    int line_;
    std::string details_;
};

} // namespace flatcfg

#endif // FLATCFG_ERRORS_HPP
