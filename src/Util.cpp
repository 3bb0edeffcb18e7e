#include "flatcfg/Util.hpp"
#include "flatcfg/Errors.hpp"

#include <algorithm>
#include <cctype>

namespace flatcfg {

namespace {
    const char* const WHITESPACE = " \t\n\v\f\r";
}

std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(WHITESPACE);
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(WHITESPACE);
    return s.substr(start, end - start + 1);
}

bool is_blank(const std::string& s) {
    return s.find_first_not_of(WHITESPACE) == std::string::npos;
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return std::tolower(c); });
    return s;
}

bool starts_with(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

void require_key(const std::string& key) {
    if (is_blank(key)) throw InvalidArgumentError("key is required");
}

void require_trimmed_prefix(const std::string& prefix) {
    if (is_blank(prefix)) throw InvalidKeyPrefixError(prefix, "keyPrefix is required");
    if (prefix != trim(prefix)) throw InvalidKeyPrefixError(prefix, "keyPrefix must be trimmed");
}

} // namespace flatcfg
