/**
 * @file Parse.cpp
 * @brief Implementation of numeric literal parsing
 */

#include "flatcfg/Parse.hpp"
#include "flatcfg/Errors.hpp"

#include <cctype>
#include <cstdlib>
#include <limits>
#include <regex>
#include <stdexcept>

namespace flatcfg {

namespace {
    /**
     * @brief Check if string matches regex pattern
     */
    bool matches_regex(const std::string& str, const std::regex& re) {
        return std::regex_match(str, re);
    }

    const std::regex& double_pattern() {
        static const std::regex re(
            "^[+-]?(([0-9]+\\.?[0-9]*|\\.[0-9]+)([eE][+-]?[0-9]+)?|NaN|Infinity)$");
        return re;
    }

    /**
     * @brief Value of one digit character, or -1
     */
    int digit_value(char c) {
        if (c >= '0' && c <= '9') return c - '0';
        unsigned char u = static_cast<unsigned char>(c);
        if (std::isalpha(u)) return std::tolower(u) - 'a' + 10;
        return -1;
    }

    bool is_radix_literal(const std::string& text, int radix) {
        std::size_t i = 0;
        if (!text.empty() && (text[0] == '+' || text[0] == '-')) i = 1;
        if (i == text.size()) return false;
        for (; i < text.size(); ++i) {
            int d = digit_value(text[i]);
            if (d < 0 || d >= radix) return false;
        }
        return true;
    }
}

std::int64_t parse_int64(const std::string& text, const std::string& key) {
    return parse_integer_radix(text, 10, key, "long");
}

std::int32_t parse_int32(const std::string& text, const std::string& key) {
    std::int64_t val = parse_integer_radix(text, 10, key, "int");
    if (val < std::numeric_limits<std::int32_t>::min() ||
        val > std::numeric_limits<std::int32_t>::max()) {
        throw NumericParseError(key, text, "int");
    }
    return static_cast<std::int32_t>(val);
}

std::int64_t parse_integer_radix(const std::string& text, int radix,
                                 const std::string& key, const std::string& target) {
    if (radix < 2 || radix > 36) {
        throw InvalidArgumentError("radix must be in [2, 36]: " + std::to_string(radix));
    }

    if (!is_radix_literal(text, radix)) {
        throw NumericParseError(key, text, target);
    }

    try {
        size_t pos = 0;
        long long val = std::stoll(text, &pos, radix);
        if (pos != text.size()) throw NumericParseError(key, text, target);
        return static_cast<std::int64_t>(val);
    } catch (const std::out_of_range&) {
        throw NumericParseError(key, text, target);
    } catch (const std::invalid_argument&) {
        throw NumericParseError(key, text, target);
    }
}

double parse_double(const std::string& text, const std::string& key) {
    if (!matches_regex(text, double_pattern())) {
        throw NumericParseError(key, text, "double");
    }

    // strtod saturates to +/-HUGE_VAL instead of throwing
    char* end = nullptr;
    double val = std::strtod(text.c_str(), &end);
    if (end != text.c_str() + text.size()) {
        throw NumericParseError(key, text, "double");
    }
    return val;
}

} // namespace flatcfg
