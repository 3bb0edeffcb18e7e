/**
 * @file ListDecoder.cpp
 * @brief Implementation of indexed list decoding
 */

#include "flatcfg/ListDecoder.hpp"
#include "flatcfg/Errors.hpp"
#include "flatcfg/Log.hpp"
#include "flatcfg/Util.hpp"

#include <cctype>
#include <limits>
#include <map>

namespace flatcfg {

// ============================================================================
// ConfigEntry
// ============================================================================

ConfigEntry::ConfigEntry(std::string full_key, const std::string& short_key, Value value)
    : full_key_(std::move(full_key))
    , short_key_(trim(short_key))
    , value_(std::move(value))
{
    if (is_blank(full_key_)) {
        throw InvalidArgumentError("fullKey is required");
    }
    if (!ends_with(full_key_, short_key_)) {
        throw InvalidArgumentError("fullKey ('" + full_key_ +
                                   "') must end with shortKey ('" + short_key_ + "')");
    }
}

bool ConfigEntry::operator==(const ConfigEntry& other) const {
    return full_key_ == other.full_key_
        && short_key_ == other.short_key_
        && value_ == other.value_;
}

std::ostream& operator<<(std::ostream& os, const ConfigEntry& entry) {
    return os << "ConfigEntry{fullKey='" << entry.full_key()
              << "', shortKey='" << entry.short_key()
              << "', value=" << to_display_string(entry.value()) << "}";
}

// ============================================================================
// Decoding
// ============================================================================

namespace {

/**
 * @brief Scan "[digits]" then optional "." starting at pos
 * @param[out] rest_pos Start of the short key
 */
std::optional<std::size_t> scan_index(const std::string& key, std::size_t pos,
                                      std::size_t& rest_pos) {
    if (pos >= key.size() || key[pos] != '[') return std::nullopt;
    ++pos;

    std::size_t digits_begin = pos;
    while (pos < key.size() && std::isdigit(static_cast<unsigned char>(key[pos]))) {
        ++pos;
    }
    if (pos == digits_begin || pos >= key.size() || key[pos] != ']') {
        return std::nullopt;
    }

    std::size_t index = 0;
    constexpr std::size_t max = std::numeric_limits<std::size_t>::max();
    for (std::size_t i = digits_begin; i < pos; ++i) {
        std::size_t digit = static_cast<std::size_t>(key[i] - '0');
        if (index > (max - digit) / 10) {
            throw NumericParseError(key, key.substr(digits_begin, pos - digits_begin),
                                    "list index");
        }
        index = index * 10 + digit;
    }

    ++pos; // ']'
    if (pos < key.size() && key[pos] == '.') ++pos;
    rest_pos = pos;
    return index;
}

void require_list_prefix(const std::string& prefix) {
    require_trimmed_prefix(prefix);
    if (ends_with(prefix, "]")) {
        throw InvalidKeyPrefixError(prefix, "keyPrefix must not end with ']'");
    }
    if (ends_with(prefix, "[")) {
        throw InvalidKeyPrefixError(prefix, "keyPrefix must not end with '['");
    }
}

} // anonymous namespace

std::optional<std::size_t> list_index_of(const std::string& key, const std::string& prefix) {
    if (!starts_with(key, prefix)) return std::nullopt;
    std::size_t rest_pos = 0;
    return scan_index(key, prefix.size(), rest_pos);
}

std::vector<ConfigEntry> decode_list(const Properties& props, const std::string& prefix) {
    require_list_prefix(prefix);

    std::map<std::size_t, ConfigEntry> by_index;
    for (const auto& [key, value] : props) {
        if (!starts_with(key, prefix)) continue;

        std::size_t rest_pos = 0;
        auto index = scan_index(key, prefix.size(), rest_pos);
        if (!index) continue;

        if (by_index.count(*index) > 0) {
            throw DuplicateListIndexError(prefix, *index);
        }
        by_index.emplace(*index, ConfigEntry(key, key.substr(rest_pos), value));
    }

    std::vector<ConfigEntry> out;
    if (by_index.empty()) return out;

    std::size_t min_index = by_index.begin()->first;
    std::size_t max_index = by_index.rbegin()->first;
    if (min_index != 0) {
        logger()->warn("list index should start at zero: minIndex={}, keyPrefix={}",
                       min_index, prefix);
    }
    if (max_index != by_index.size() - 1) {
        logger()->warn("max list index doesn't match list length: size={}, maxIndex={}, "
                       "keyPrefix={}", by_index.size(), max_index, prefix);
    }

    out.reserve(by_index.size());
    for (auto& kv : by_index) {
        out.push_back(std::move(kv.second));
    }
    return out;
}

std::vector<ConfigEntry> consume_list(Properties& props, const std::string& prefix) {
    auto out = decode_list(props, prefix);

    for (auto it = props.begin(); it != props.end();) {
        if (starts_with(it->first, prefix)) {
            it = props.erase(it);
        } else {
            ++it;
        }
    }
    return out;
}

} // namespace flatcfg
