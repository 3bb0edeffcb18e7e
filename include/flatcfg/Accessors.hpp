/**
 * @file Accessors.hpp
 * @brief Typed getters over a flat Properties store
 *
 * Three families, one per presence policy:
 * - get_optional_X(props, key, default): the default is returned when the
 *   key is missing, null, or a blank string. Defaults may be nullopt.
 * - get_required_X(props, key): MissingRequiredError when absent.
 * - consume_X(props, key, ...): same as the matching get, then the key is
 *   erased from props. A failed get leaves props untouched.
 *
 * Syntax and range errors are raised by both optional and required
 * variants (see Coerce.hpp for the conversion rules). Every function
 * throws InvalidArgumentError for a blank key.
 *
 * Example:
 * ```cpp
 * Properties props = load_properties_file("app.properties");
 * int port = consume_required_port(props, "server.port");
 * auto debug = consume_optional_bool(props, "server.debug", false);
 * require_fully_consumed(props, "ServerConfig");
 * ```
 */

#ifndef FLATCFG_ACCESSORS_HPP
#define FLATCFG_ACCESSORS_HPP

#include "flatcfg/Coerce.hpp"
#include "flatcfg/Uri.hpp"
#include "flatcfg/Value.hpp"

#include <boost/uuid/uuid.hpp>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <regex>
#include <string>

namespace flatcfg {

/**
 * @brief Pointer to the stored value, or nullptr when the key is missing
 */
const Value* find_value(const Properties& props, const std::string& key);

// ============================================================================
// Boolean
// ============================================================================

std::optional<bool> get_optional_bool(const Properties& props, const std::string& key,
                                      std::optional<bool> default_value);
bool get_required_bool(const Properties& props, const std::string& key);
std::optional<bool> consume_optional_bool(Properties& props, const std::string& key,
                                          std::optional<bool> default_value);
bool consume_required_bool(Properties& props, const std::string& key);

// ============================================================================
// Int (32-bit)
// ============================================================================

std::optional<std::int32_t> get_optional_int(const Properties& props, const std::string& key,
                                             std::optional<std::int32_t> default_value);
std::int32_t get_required_int(const Properties& props, const std::string& key);
std::optional<std::int32_t> consume_optional_int(Properties& props, const std::string& key,
                                                 std::optional<std::int32_t> default_value);
std::int32_t consume_required_int(Properties& props, const std::string& key);

// ============================================================================
// Long (64-bit)
// ============================================================================

std::optional<std::int64_t> get_optional_long(const Properties& props, const std::string& key,
                                              std::optional<std::int64_t> default_value);
std::int64_t get_required_long(const Properties& props, const std::string& key);
std::optional<std::int64_t> consume_optional_long(Properties& props, const std::string& key,
                                                  std::optional<std::int64_t> default_value);
std::int64_t consume_required_long(Properties& props, const std::string& key);

// ============================================================================
// String
// ============================================================================

/**
 * @brief Trimmed string value
 *
 * Non-string values (numbers, booleans, objects) are returned in their
 * default textual form instead of being rejected.
 */
std::optional<std::string> get_optional_string(const Properties& props, const std::string& key,
                                               std::optional<std::string> default_value);

/**
 * @return non-blank, trimmed string
 */
std::string get_required_string(const Properties& props, const std::string& key);
std::optional<std::string> consume_optional_string(Properties& props, const std::string& key,
                                                   std::optional<std::string> default_value);
std::string consume_required_string(Properties& props, const std::string& key);

// ============================================================================
// Port [MIN_PORT, MAX_PORT]
// ============================================================================

/**
 * @brief Port value, or default_value when absent
 *
 * The default is range-checked too.
 */
int get_optional_port(const Properties& props, const std::string& key, int default_value);
int get_required_port(const Properties& props, const std::string& key);
int consume_optional_port(Properties& props, const std::string& key, int default_value);
int consume_required_port(Properties& props, const std::string& key);

// ============================================================================
// URI
// ============================================================================

/**
 * @brief URI value, or the parsed default when absent
 *
 * The default is only parsed when it is needed. Returns nullopt when both
 * the stored value and the default are absent or blank.
 */
std::optional<Uri> get_optional_uri(const Properties& props, const std::string& key,
                                    const std::optional<std::string>& default_value);

/**
 * @brief URI value, or default_value when absent (never empty)
 */
Uri get_optional_uri(const Properties& props, const std::string& key,
                     const Uri& default_value);
Uri get_required_uri(const Properties& props, const std::string& key);

std::optional<Uri> consume_optional_uri(Properties& props, const std::string& key,
                                        const std::optional<std::string>& default_value);
Uri consume_optional_uri(Properties& props, const std::string& key,
                         const Uri& default_value);
Uri consume_required_uri(Properties& props, const std::string& key);

// ============================================================================
// Path
// ============================================================================

/**
 * @brief Absolute, normalized path; need not exist
 *
 * See Paths.hpp for variants that check the filesystem.
 */
std::filesystem::path get_required_path(const Properties& props, const std::string& key);
std::optional<std::filesystem::path> get_optional_path(
    const Properties& props, const std::string& key,
    std::optional<std::filesystem::path> default_value);
std::filesystem::path consume_required_path(Properties& props, const std::string& key);

// ============================================================================
// Regex
// ============================================================================

std::optional<std::regex> get_optional_regex(const Properties& props, const std::string& key,
                                             std::optional<std::regex> default_value);
std::regex get_required_regex(const Properties& props, const std::string& key);
std::optional<std::regex> consume_optional_regex(Properties& props, const std::string& key,
                                                 std::optional<std::regex> default_value);
std::regex consume_required_regex(Properties& props, const std::string& key);

// ============================================================================
// UUID
// ============================================================================

std::optional<boost::uuids::uuid> get_optional_uuid(
    const Properties& props, const std::string& key,
    std::optional<boost::uuids::uuid> default_value);
boost::uuids::uuid get_required_uuid(const Properties& props, const std::string& key);
std::optional<boost::uuids::uuid> consume_optional_uuid(
    Properties& props, const std::string& key,
    std::optional<boost::uuids::uuid> default_value);
boost::uuids::uuid consume_required_uuid(Properties& props, const std::string& key);

} // namespace flatcfg

#endif // FLATCFG_ACCESSORS_HPP
