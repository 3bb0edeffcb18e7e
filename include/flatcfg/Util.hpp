#ifndef FLATCFG_UTIL_HPP
#define FLATCFG_UTIL_HPP

#include <string>

namespace flatcfg {

// Whitespace is ASCII space, \t, \n, \v, \f, \r.
std::string trim(const std::string& s);

// True when s is empty or whitespace only.
bool is_blank(const std::string& s);

std::string to_lower(std::string s);

bool starts_with(const std::string& s, const std::string& prefix);
bool ends_with(const std::string& s, const std::string& suffix);

// Throws InvalidArgumentError when key is blank.
void require_key(const std::string& key);

// Throws InvalidKeyPrefixError when prefix is blank or not trimmed.
void require_trimmed_prefix(const std::string& prefix);

} // namespace flatcfg

#endif // FLATCFG_UTIL_HPP
