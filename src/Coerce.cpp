/**
 * @file Coerce.cpp
 * @brief Implementation of value coercion
 */

#include "flatcfg/Coerce.hpp"
#include "flatcfg/Errors.hpp"
#include "flatcfg/Parse.hpp"
#include "flatcfg/Util.hpp"

#include <boost/uuid/string_generator.hpp>

#include <cmath>
#include <exception>
#include <limits>
#include <stdexcept>

namespace flatcfg {

namespace {

/**
 * @brief Trimmed string content, or nullopt when absent
 *
 * Non-string, non-null values are a CoercionTypeError for target.
 */
std::optional<std::string> require_text(const Value& value, const std::string& key,
                                        const char* target) {
    if (std::holds_alternative<std::monostate>(value)) return std::nullopt;

    if (auto s = std::get_if<std::string>(&value)) {
        std::string trimmed = trim(*s);
        if (trimmed.empty()) return std::nullopt;
        return trimmed;
    }

    throw CoercionTypeError(key, target, type_name(value));
}

/**
 * @brief Java-style (int) narrowing of a double, then compare to 1
 */
bool double_is_one(double d) {
    if (std::isnan(d)) return false;
    return std::trunc(d) == 1.0;
}

const std::regex& uuid_pattern() {
    static const std::regex re(
        "^[0-9a-fA-F]{8}-[0-9a-fA-F]{4}-[0-9a-fA-F]{4}-[0-9a-fA-F]{4}-[0-9a-fA-F]{12}$");
    return re;
}

} // anonymous namespace

const std::set<std::string>& truthy_values() {
    static const std::set<std::string> values = {"1", "on", "t", "true", "y", "yes"};
    return values;
}

std::optional<bool> coerce_bool(const Value& value, const std::string& key) {
    if (std::holds_alternative<std::monostate>(value)) return std::nullopt;

    if (auto b = std::get_if<bool>(&value)) return *b;

    // Numbers: only a value whose int truncation is exactly 1 is true
    if (auto v = std::get_if<std::int8_t>(&value)) return *v == 1;
    if (auto v = std::get_if<std::int16_t>(&value)) return *v == 1;
    if (auto v = std::get_if<std::int32_t>(&value)) return *v == 1;
    if (auto v = std::get_if<std::int64_t>(&value)) return static_cast<std::int32_t>(*v) == 1;
    if (auto v = std::get_if<double>(&value)) return double_is_one(*v);

    if (auto s = std::get_if<std::string>(&value)) {
        std::string normalized = to_lower(trim(*s));
        if (normalized.empty()) return std::nullopt;
        return truthy_values().count(normalized) > 0;
    }

    throw CoercionTypeError(key, "boolean", type_name(value));
}

std::optional<std::int32_t> coerce_int(const Value& value, const std::string& key) {
    if (std::holds_alternative<std::monostate>(value)) return std::nullopt;

    if (auto v = std::get_if<std::int8_t>(&value)) return *v;
    if (auto v = std::get_if<std::int16_t>(&value)) return *v;
    if (auto v = std::get_if<std::int32_t>(&value)) return *v;

    if (auto v = std::get_if<std::int64_t>(&value)) {
        if (*v > std::numeric_limits<std::int32_t>::max() ||
            *v < std::numeric_limits<std::int32_t>::min()) {
            throw NumericOverflowError(key, std::to_string(*v), "int");
        }
        return static_cast<std::int32_t>(*v);
    }

    if (auto s = std::get_if<std::string>(&value)) {
        std::string trimmed = trim(*s);
        if (trimmed.empty()) return std::nullopt;
        return parse_int32(trimmed, key);
    }

    throw CoercionTypeError(key, "int", type_name(value));
}

std::optional<std::int64_t> coerce_long(const Value& value, const std::string& key) {
    if (std::holds_alternative<std::monostate>(value)) return std::nullopt;

    if (auto v = std::get_if<std::int8_t>(&value)) return *v;
    if (auto v = std::get_if<std::int16_t>(&value)) return *v;
    if (auto v = std::get_if<std::int32_t>(&value)) return *v;
    if (auto v = std::get_if<std::int64_t>(&value)) return *v;

    if (auto s = std::get_if<std::string>(&value)) {
        std::string trimmed = trim(*s);
        if (trimmed.empty()) return std::nullopt;
        return parse_int64(trimmed, key);
    }

    throw CoercionTypeError(key, "long", type_name(value));
}

std::optional<std::string> coerce_string(const Value& value, const std::string& /*key*/) {
    if (std::holds_alternative<std::monostate>(value)) return std::nullopt;

    if (auto s = std::get_if<std::string>(&value)) {
        std::string trimmed = trim(*s);
        if (trimmed.empty()) return std::nullopt;
        return trimmed;
    }

    // Never rejected: non-string values use their default representation
    return to_display_string(value);
}

std::optional<Uri> coerce_uri(const Value& value, const std::string& key) {
    auto text = require_text(value, key, "uri");
    if (!text) return std::nullopt;
    return Uri::parse(*text, key);
}

std::optional<std::filesystem::path> coerce_path(const Value& value, const std::string& key) {
    auto text = require_text(value, key, "path");
    if (!text) return std::nullopt;

    std::filesystem::path p = std::filesystem::absolute(*text).lexically_normal();
    // "/a/b/" normalizes to "/a/b/"; drop the empty trailing element
    if (!p.has_filename() && p.has_relative_path()) p = p.parent_path();
    return p;
}

std::optional<std::regex> coerce_regex(const Value& value, const std::string& key) {
    auto text = coerce_string(value, key);
    if (!text) return std::nullopt;

    try {
        return std::regex(*text);
    } catch (const std::regex_error& e) {
        std::throw_with_nested(PatternCompileError(key, e.what()));
    }
}

std::optional<boost::uuids::uuid> coerce_uuid(const Value& value, const std::string& key) {
    auto text = coerce_string(value, key);
    if (!text) return std::nullopt;

    if (!std::regex_match(*text, uuid_pattern())) {
        throw UuidParseError(key, *text);
    }

    try {
        return boost::uuids::string_generator()(*text);
    } catch (const std::runtime_error&) {
        throw UuidParseError(key, *text);
    }
}

std::int64_t check_port(const std::string& key, std::int64_t port) {
    if (port < MIN_PORT) throw RangeError(key, "port", port, MIN_PORT, false);
    if (port > MAX_PORT) throw RangeError(key, "port", port, MAX_PORT, true);
    return port;
}

} // namespace flatcfg
