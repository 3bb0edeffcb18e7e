/**
 * @file Coerce.hpp
 * @brief Lenient conversion of stored values to requested types
 *
 * Every coerce_* function returns std::nullopt when the value is absent
 * (null, or a string that is blank after trimming) and otherwise either a
 * converted value or an exception. Required/optional/default policy is
 * applied by the accessors in Accessors.hpp, not here.
 *
 * Conversion rules:
 * - bool:   bool as-is; any number is true iff it truncates to the int 1;
 *           strings are trimmed, lower-cased and looked up in
 *           truthy_values() (anything else is false, never an error);
 *           objects are a CoercionTypeError.
 * - int:    byte/short/int widen; long must fit int (NumericOverflowError);
 *           strings parse as base-10 literals (NumericParseError);
 *           double/bool/object are a CoercionTypeError.
 * - long:   byte/short/int/long widen; strings parse; others rejected.
 * - string: strings are trimmed; any other value falls back to
 *           to_display_string() and is never rejected.
 * - uri, path, regex, uuid: trimmed strings only, everything else is a
 *           CoercionTypeError.
 */

#ifndef FLATCFG_COERCE_HPP
#define FLATCFG_COERCE_HPP

#include "flatcfg/Uri.hpp"
#include "flatcfg/Value.hpp"

#include <boost/uuid/uuid.hpp>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <regex>
#include <set>
#include <string>

namespace flatcfg {

/// Lowest valid IP port; 0 asks the operating system to pick one
constexpr int MIN_PORT = 0;

/// Highest valid IP port (RFC 1340)
constexpr int MAX_PORT = 0xffff;

/**
 * @brief Lower-case strings treated as boolean true
 *
 * {"1", "on", "t", "true", "y", "yes"}. Built once, never modified.
 */
const std::set<std::string>& truthy_values();

std::optional<bool> coerce_bool(const Value& value, const std::string& key);

std::optional<std::int32_t> coerce_int(const Value& value, const std::string& key);

std::optional<std::int64_t> coerce_long(const Value& value, const std::string& key);

std::optional<std::string> coerce_string(const Value& value, const std::string& key);

/**
 * @throws UriParseError on malformed URI text
 */
std::optional<Uri> coerce_uri(const Value& value, const std::string& key);

/**
 * @brief Absolute, lexically normalized path; existence is not checked
 */
std::optional<std::filesystem::path> coerce_path(const Value& value, const std::string& key);

/**
 * @brief Compile the string form of the value (see coerce_string())
 * @throws PatternCompileError with the std::regex_error nested inside
 */
std::optional<std::regex> coerce_regex(const Value& value, const std::string& key);

/**
 * @brief Parse the string form of the value (see coerce_string())
 *
 * Canonical 8-4-4-4-12 hex form only.
 *
 * @throws UuidParseError on any other text
 */
std::optional<boost::uuids::uuid> coerce_uuid(const Value& value, const std::string& key);

/**
 * @brief Validate an IP port
 * @return port, unchanged
 * @throws RangeError ("port too low"/"port too high") naming value and bound
 */
std::int64_t check_port(const std::string& key, std::int64_t port);

} // namespace flatcfg

#endif // FLATCFG_COERCE_HPP
