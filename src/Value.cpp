/**
 * @file Value.cpp
 * @brief Value inspection helpers
 */

#include "flatcfg/Value.hpp"
#include "flatcfg/Util.hpp"

#include <cstdlib>
#include <sstream>

namespace flatcfg {

namespace {
    // Indexed by Value::index()
    const char* const TYPE_NAMES[] = {
        "null", "boolean", "byte", "short", "int", "long", "double", "string", "object"
    };

    static_assert(sizeof(TYPE_NAMES) / sizeof(TYPE_NAMES[0]) == std::variant_size_v<Value>,
                  "TYPE_NAMES must cover every Value alternative");

    /**
     * @brief Shortest round-trip text for a double (e.g., 1.5, 1e+20)
     */
    std::string double_to_string(double d) {
        std::ostringstream oss;
        oss.precision(17);
        oss << d;
        std::string longest = oss.str();

        // Prefer the shortest representation that parses back exactly
        for (int precision = 1; precision < 17; ++precision) {
            std::ostringstream shorter;
            shorter.precision(precision);
            shorter << d;
            if (std::strtod(shorter.str().c_str(), nullptr) == d) return shorter.str();
        }
        return longest;
    }
}

std::string type_name(const Value& val) {
    return TYPE_NAMES[val.index()];
}

std::string to_display_string(const Value& val) {
    if (std::holds_alternative<std::monostate>(val)) return "null";
    if (auto b = std::get_if<bool>(&val)) return *b ? "true" : "false";
    if (auto v = std::get_if<std::int8_t>(&val)) return std::to_string(static_cast<int>(*v));
    if (auto v = std::get_if<std::int16_t>(&val)) return std::to_string(*v);
    if (auto v = std::get_if<std::int32_t>(&val)) return std::to_string(*v);
    if (auto v = std::get_if<std::int64_t>(&val)) return std::to_string(*v);
    if (auto v = std::get_if<double>(&val)) return double_to_string(*v);
    if (auto s = std::get_if<std::string>(&val)) return *s;
    return std::get<nlohmann::json>(val).dump();
}

bool is_absent(const Value& val) {
    if (std::holds_alternative<std::monostate>(val)) return true;
    if (auto s = std::get_if<std::string>(&val)) return is_blank(*s);
    return false;
}

} // namespace flatcfg
