/**
 * @file Delimited.cpp
 * @brief Implementation of delimited collection properties
 */

#include "flatcfg/Delimited.hpp"
#include "flatcfg/Accessors.hpp"
#include "flatcfg/Coerce.hpp"
#include "flatcfg/Errors.hpp"
#include "flatcfg/Parse.hpp"
#include "flatcfg/Util.hpp"

#include <algorithm>
#include <set>

namespace flatcfg {

namespace {

void check_delimiter(const std::string& delim) {
    if (is_blank(delim)) {
        throw InvalidArgumentError("delim is required");
    }
    if (delim.find('.') != std::string::npos) {
        throw InvalidArgumentError("delim must not contain a decimal point");
    }
}

/**
 * @brief Trimmed, non-blank pieces of the property value
 */
std::vector<std::string> non_blank_pieces(const Properties& props, const std::string& key,
                                          const std::string& delim) {
    require_key(key);
    check_delimiter(delim);

    std::vector<std::string> out;
    auto value = get_optional_string(props, key, std::string());
    if (!value || value->empty()) return out;

    for (const auto& piece : split_delimited(*value, delim)) {
        std::string trimmed = trim(piece);
        if (!trimmed.empty()) out.push_back(std::move(trimmed));
    }
    return out;
}

template <typename Get>
auto consume(Properties& props, const std::string& key, Get get) {
    auto out = get();
    props.erase(key);
    return out;
}

} // anonymous namespace

std::vector<std::string> split_delimited(const std::string& text, const std::string& delim) {
    std::vector<std::string> parts;
    if (delim.empty()) {
        throw InvalidArgumentError("delim is required");
    }

    std::string::size_type start = 0;
    while (true) {
        auto pos = text.find(delim, start);
        if (pos == std::string::npos) {
            parts.push_back(text.substr(start));
            break;
        }
        parts.push_back(text.substr(start, pos - start));
        start = pos + delim.size();
    }

    while (!parts.empty() && parts.back().empty()) parts.pop_back();
    return parts;
}

std::vector<std::uint8_t> get_delimited_bytes(const Properties& props, const std::string& key,
                                              const std::string& delim, int radix) {
    std::vector<std::uint8_t> out;
    for (const auto& piece : non_blank_pieces(props, key, delim)) {
        std::int64_t b = parse_integer_radix(piece, radix, key, "byte");
        if (b < 0) throw RangeError(key, "byte", b, 0, false);
        if (b > 255) throw RangeError(key, "byte", b, 255, true);
        out.push_back(static_cast<std::uint8_t>(b));
    }
    return out;
}

std::vector<double> get_delimited_doubles(const Properties& props, const std::string& key,
                                          const std::string& delim) {
    std::vector<double> out;
    for (const auto& piece : non_blank_pieces(props, key, delim)) {
        out.push_back(parse_double(piece, key));
    }
    return out;
}

std::vector<std::int32_t> get_delimited_ints(const Properties& props, const std::string& key,
                                             const std::string& delim) {
    std::vector<std::int32_t> out;
    for (const auto& piece : non_blank_pieces(props, key, delim)) {
        out.push_back(parse_int32(piece, key));
    }
    return out;
}

std::vector<std::int64_t> get_delimited_longs(const Properties& props, const std::string& key,
                                              const std::string& delim) {
    std::vector<std::int64_t> out;
    for (const auto& piece : non_blank_pieces(props, key, delim)) {
        out.push_back(parse_int64(piece, key));
    }
    return out;
}

std::vector<int> get_delimited_ports(const Properties& props, const std::string& key,
                                     const std::string& delim) {
    std::vector<int> out;
    std::set<std::int32_t> seen;
    for (const auto& piece : non_blank_pieces(props, key, delim)) {
        std::int32_t port = parse_int32(piece, key);
        if (!seen.insert(port).second) continue;
        check_port(key, port);
        out.push_back(port);
    }
    return out;
}

std::vector<std::string> get_delimited_strings(const Properties& props, const std::string& key,
                                               const std::string& delim, bool remove_blanks) {
    require_key(key);
    check_delimiter(delim);

    std::vector<std::string> out;
    auto value = get_optional_string(props, key, std::string());
    if (!value || value->empty()) return out;

    for (const auto& piece : split_delimited(*value, delim)) {
        std::string trimmed = trim(piece);
        if (remove_blanks && trimmed.empty()) continue;
        out.push_back(std::move(trimmed));
    }
    return out;
}

std::vector<std::string> get_delimited_strings(const Properties& props, const std::string& key) {
    return get_delimited_strings(props, key, ",", true);
}

std::vector<std::uint8_t> consume_delimited_bytes(Properties& props, const std::string& key,
                                                  const std::string& delim, int radix) {
    return consume(props, key, [&] { return get_delimited_bytes(props, key, delim, radix); });
}

std::vector<double> consume_delimited_doubles(Properties& props, const std::string& key,
                                              const std::string& delim) {
    return consume(props, key, [&] { return get_delimited_doubles(props, key, delim); });
}

std::vector<std::int32_t> consume_delimited_ints(Properties& props, const std::string& key,
                                                 const std::string& delim) {
    return consume(props, key, [&] { return get_delimited_ints(props, key, delim); });
}

std::vector<std::int64_t> consume_delimited_longs(Properties& props, const std::string& key,
                                                  const std::string& delim) {
    return consume(props, key, [&] { return get_delimited_longs(props, key, delim); });
}

std::vector<int> consume_delimited_ports(Properties& props, const std::string& key,
                                         const std::string& delim) {
    return consume(props, key, [&] { return get_delimited_ports(props, key, delim); });
}

std::vector<std::string> consume_delimited_strings(Properties& props, const std::string& key,
                                                   const std::string& delim, bool remove_blanks) {
    return consume(props, key, [&] {
        return get_delimited_strings(props, key, delim, remove_blanks);
    });
}

std::vector<std::string> consume_delimited_strings(Properties& props, const std::string& key) {
    return consume_delimited_strings(props, key, ",", true);
}

} // namespace flatcfg
