/**
 * @file Delimited.hpp
 * @brief Delimited collection properties ("80,443,8080")
 *
 * Values are read with get_optional_string() and split on a literal
 * delimiter. Trailing empty pieces are always dropped, so "a,b," splits
 * to ["a", "b"]; every piece is then trimmed. Numeric variants also drop
 * blank pieces anywhere in the list.
 *
 * The delimiter must be non-blank and must not contain '.' (it would be
 * ambiguous with decimal literals); violations throw InvalidArgumentError
 * before the value is read. An absent or blank value yields an empty list.
 */

#ifndef FLATCFG_DELIMITED_HPP
#define FLATCFG_DELIMITED_HPP

#include "flatcfg/Value.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace flatcfg {

/**
 * @brief Split on a literal delimiter, dropping trailing empty pieces
 *
 * Pieces are not trimmed.
 *
 * Examples:
 * ```cpp
 * split_delimited("a,b,", ",")   // → {"a", "b"}
 * split_delimited(",a", ",")     // → {"", "a"}
 * split_delimited("a,,,", ",")   // → {"a"}
 * split_delimited("", ",")       // → {}
 * split_delimited("a::b", "::")  // → {"a", "b"}
 * ```
 */
std::vector<std::string> split_delimited(const std::string& text, const std::string& delim);

/**
 * @brief Bytes in [0, 255]
 * @param radix Radix for every piece (2..36)
 * @throws RangeError naming the first out-of-range value
 */
std::vector<std::uint8_t> get_delimited_bytes(const Properties& props, const std::string& key,
                                              const std::string& delim, int radix = 10);

std::vector<double> get_delimited_doubles(const Properties& props, const std::string& key,
                                          const std::string& delim);

std::vector<std::int32_t> get_delimited_ints(const Properties& props, const std::string& key,
                                             const std::string& delim);

std::vector<std::int64_t> get_delimited_longs(const Properties& props, const std::string& key,
                                              const std::string& delim);

/**
 * @brief Ports, de-duplicated in first-seen order
 * @throws RangeError ("port too low"/"port too high") on the first bad port
 */
std::vector<int> get_delimited_ports(const Properties& props, const std::string& key,
                                     const std::string& delim);

/**
 * @param remove_blanks drop blank pieces; when false they are kept as ""
 *        (except trailing ones, which are always dropped)
 */
std::vector<std::string> get_delimited_strings(const Properties& props, const std::string& key,
                                               const std::string& delim, bool remove_blanks);

/**
 * @brief Comma-delimited, blanks removed
 */
std::vector<std::string> get_delimited_strings(const Properties& props, const std::string& key);

std::vector<std::uint8_t> consume_delimited_bytes(Properties& props, const std::string& key,
                                                  const std::string& delim, int radix = 10);
std::vector<double> consume_delimited_doubles(Properties& props, const std::string& key,
                                              const std::string& delim);
std::vector<std::int32_t> consume_delimited_ints(Properties& props, const std::string& key,
                                                 const std::string& delim);
std::vector<std::int64_t> consume_delimited_longs(Properties& props, const std::string& key,
                                                  const std::string& delim);
std::vector<int> consume_delimited_ports(Properties& props, const std::string& key,
                                         const std::string& delim);
std::vector<std::string> consume_delimited_strings(Properties& props, const std::string& key,
                                                   const std::string& delim, bool remove_blanks);
std::vector<std::string> consume_delimited_strings(Properties& props, const std::string& key);

} // namespace flatcfg

#endif // FLATCFG_DELIMITED_HPP
