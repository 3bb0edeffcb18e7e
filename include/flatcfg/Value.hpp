/**
 * @file Value.hpp
 * @brief Value type for flat property stores
 *
 * A stored value is one of:
 * - Null (std::monostate)
 * - Bool
 * - Byte / Short / Int / Long (int8_t, int16_t, int32_t, int64_t)
 * - Double
 * - String (std::string, UTF-8)
 * - Object (nlohmann::json, any structured value with no scalar form)
 */

#ifndef FLATCFG_VALUE_HPP
#define FLATCFG_VALUE_HPP

#include <nlohmann/json.hpp>

#include <cstdint>
#include <map>
#include <string>
#include <variant>

namespace flatcfg {

/**
 * @brief Loosely-typed value held under one property key
 *
 * The alternatives are the match-arms of every coercion in Coerce.hpp.
 * Alternative order matters: index() is used by type_name().
 */
using Value = std::variant<
    std::monostate,
    bool,
    std::int8_t,
    std::int16_t,
    std::int32_t,
    std::int64_t,
    double,
    std::string,
    nlohmann::json
>;

/**
 * @brief Flat key -> value store
 *
 * Keys use the dotted/bracketed convention, e.g. "queue.workers[0].host".
 * Owned by the caller; consume_* functions erase keys from it.
 */
using Properties = std::map<std::string, Value>;

/**
 * @brief Get human-readable type name for a Value
 * @param val The value to inspect
 * @return One of "null", "boolean", "byte", "short", "int", "long",
 *         "double", "string", "object"
 */
std::string type_name(const Value& val);

/**
 * @brief Default textual representation of a value
 *
 * Booleans print as true/false, numbers in decimal, strings verbatim,
 * null as "null" and objects as compact JSON.
 */
std::string to_display_string(const Value& val);

/**
 * @brief Check whether a value counts as absent
 * @return true for null, or for a string that is blank after trimming
 */
bool is_absent(const Value& val);

} // namespace flatcfg

#endif // FLATCFG_VALUE_HPP
