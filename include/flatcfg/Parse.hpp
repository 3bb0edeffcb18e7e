/**
 * @file Parse.hpp
 * @brief Numeric literal parsing for property text
 *
 * All functions expect text that is already trimmed. Every failure is a
 * NumericParseError naming the key, the text and the target type:
 * - Integers: optional sign then decimal digits (^[+-]?[0-9]+$)
 * - Radix integers: optional sign then digits valid in the radix
 * - Doubles: decimal or exponent notation, NaN, Infinity
 *
 * A literal outside the target type's range is not a valid literal of
 * that type and is reported as a NumericParseError as well.
 */

#ifndef FLATCFG_PARSE_HPP
#define FLATCFG_PARSE_HPP

#include <cstdint>
#include <string>

namespace flatcfg {

/**
 * @brief Parse a base-10 32-bit integer
 *
 * Examples:
 * ```cpp
 * parse_int32("42", "k")          // → 42
 * parse_int32("+7", "k")          // → 7
 * parse_int32("-2147483648", "k") // → INT32_MIN
 * parse_int32("2147483648", "k")  // throws NumericParseError
 * parse_int32("4x", "k")          // throws NumericParseError
 * ```
 */
std::int32_t parse_int32(const std::string& text, const std::string& key);

/**
 * @brief Parse a base-10 64-bit integer
 */
std::int64_t parse_int64(const std::string& text, const std::string& key);

/**
 * @brief Parse an integer in the given radix (2..36)
 *
 * No "0x"-style prefixes are accepted; digits above 9 are letters in
 * either case.
 *
 * @param target Type name used in error messages (e.g., "byte")
 * @throws InvalidArgumentError if radix is outside [2, 36]
 */
std::int64_t parse_integer_radix(const std::string& text, int radix,
                                 const std::string& key, const std::string& target);

/**
 * @brief Parse a double
 *
 * Accepts "1", "1.5", ".5", "1.", "-2.5e10", "NaN", "Infinity".
 * Literals beyond the double range become +/-infinity.
 */
double parse_double(const std::string& text, const std::string& key);

} // namespace flatcfg

#endif // FLATCFG_PARSE_HPP
