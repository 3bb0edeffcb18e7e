/**
 * @file Env.cpp
 * @brief Environment variable helpers
 */

#include "flatcfg/Env.hpp"
#include "flatcfg/Errors.hpp"
#include "flatcfg/Util.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

#ifdef _WIN32
    #include <windows.h>
#else
    extern char** environ;
#endif

namespace flatcfg {

namespace {

bool starts_with_icase(const std::string& str, const std::string& prefix) {
    if (prefix.size() > str.size()) return false;
    return std::equal(prefix.begin(), prefix.end(), str.begin(),
                      [](char a, char b) {
                          return std::toupper(static_cast<unsigned char>(a)) ==
                                 std::toupper(static_cast<unsigned char>(b));
                      });
}

std::string abbreviate(const std::string& value, int max_length) {
    if (value.empty()) {
        return "<null>";
    }
    auto limit = static_cast<std::size_t>(max_length);
    if (value.size() <= limit) {
        return value;
    }
    // max_length < 3 leaves only the ellipsis
    return value.substr(0, limit >= 3 ? limit - 3 : 0) + "...";
}

} // anonymous namespace

std::vector<std::pair<std::string, std::string>> enumerate_environment() {
    std::vector<std::pair<std::string, std::string>> result;

#ifdef _WIN32
    LPCH env_block = GetEnvironmentStrings();
    if (env_block == nullptr) return result;

    LPCH current = env_block;
    while (*current != '\0') {
        std::string entry(current);
        size_t eq_pos = entry.find('=');
        if (eq_pos != std::string::npos && eq_pos > 0) {
            result.emplace_back(entry.substr(0, eq_pos), entry.substr(eq_pos + 1));
        }
        current += entry.length() + 1;
    }
    FreeEnvironmentStrings(env_block);
#else
    if (environ == nullptr) return result;

    for (char** env = environ; *env != nullptr; ++env) {
        std::string entry(*env);
        size_t eq_pos = entry.find('=');
        if (eq_pos != std::string::npos) {
            result.emplace_back(entry.substr(0, eq_pos), entry.substr(eq_pos + 1));
        }
    }
#endif

    return result;
}

std::string pretty_print_env_vars(const std::string& delim, int max_length) {
    return pretty_print_env_vars(enumerate_environment(), delim, max_length);
}

std::string pretty_print_env_vars(std::vector<std::pair<std::string, std::string>> vars,
                                  const std::string& delim, int max_length) {
    if (max_length < 1) {
        throw InvalidArgumentError("maxLength must be greater than 0");
    }

    std::sort(vars.begin(), vars.end(),
              [](const auto& a, const auto& b) { return a.first < b.first; });

    std::ostringstream oss;
    for (const auto& [name, value] : vars) {
        if (to_lower(name).find("pass") != std::string::npos) {
            continue;
        }
        oss << name << " = " << abbreviate(value, max_length) << delim;
    }
    return oss.str();
}

std::string transform_env_name(const std::string& name) {
    std::string lowered = to_lower(name);
    std::string result;
    result.reserve(lowered.size());

    for (std::size_t i = 0; i < lowered.size(); ++i) {
        if (lowered[i] != '_') {
            result += lowered[i];
        } else if (i + 1 < lowered.size() && lowered[i + 1] == '_') {
            result += '_';
            ++i;
        } else {
            result += '.';
        }
    }
    return result;
}

Properties env_overlay(const std::string& prefix) {
    if (is_blank(prefix)) {
        throw InvalidArgumentError("env prefix is required");
    }

    std::string prefix_match = trim(prefix);
    while (!prefix_match.empty() && prefix_match.back() == '_') {
        prefix_match.pop_back();
    }
    prefix_match += "_";

    Properties out;
    for (const auto& [name, value] : enumerate_environment()) {
        if (!starts_with_icase(name, prefix_match)) continue;

        std::string key = transform_env_name(name.substr(prefix_match.size()));
        if (key.empty()) continue;
        out.insert_or_assign(std::move(key), value);
    }
    return out;
}

} // namespace flatcfg
