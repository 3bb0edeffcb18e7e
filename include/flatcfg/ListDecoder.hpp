/**
 * @file ListDecoder.hpp
 * @brief Indexed list properties ("workers[0].host", "workers[1].host")
 *
 * Keys shaped PREFIX[N] or PREFIX[N].rest or PREFIX[N]rest are list
 * entries under PREFIX. N is decimal digits. The part after the index
 * (and after the optional dot) becomes the entry's short key.
 *
 * Example:
 * ```
 * a.b[1].c.d = bar
 * a.b[0].c.d = foo
 * ```
 * decode_list(props, "a.b") returns two entries, in index order:
 * {"a.b[0].c.d", "c.d", "foo"} and {"a.b[1].c.d", "c.d", "bar"}.
 *
 * Gaps in the indexes and lists that do not start at zero are accepted
 * but logged as warnings on the "flatcfg" logger.
 */

#ifndef FLATCFG_LIST_DECODER_HPP
#define FLATCFG_LIST_DECODER_HPP

#include "flatcfg/Value.hpp"

#include <cstddef>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace flatcfg {

/**
 * @brief One decoded key/value pair
 *
 * full_key is the key as stored; short_key is the trimmed remainder
 * after a prefix or list index, and is always a suffix of full_key.
 */
class ConfigEntry {
public:
    /**
     * @throws InvalidArgumentError if full_key is blank or does not end
     *         with the trimmed short_key
     */
    ConfigEntry(std::string full_key, const std::string& short_key, Value value);

    const std::string& full_key() const noexcept {
        return full_key_;
    }

    const std::string& short_key() const noexcept {
        return short_key_;
    }

    const Value& value() const noexcept {
        return value_;
    }

    bool operator==(const ConfigEntry& other) const;
    bool operator!=(const ConfigEntry& other) const {
        return !(*this == other);
    }

private:
    std::string full_key_;
    std::string short_key_;
    Value value_;
};

std::ostream& operator<<(std::ostream& os, const ConfigEntry& entry);

/**
 * @brief Index of a list key under prefix
 *
 * @return the index when key is prefix + "[digits]" + optional "." + rest,
 *         nullopt for any other key
 * @throws NumericParseError if the digits overflow std::size_t
 */
std::optional<std::size_t> list_index_of(const std::string& key, const std::string& prefix);

/**
 * @brief Decode list entries for prefix, in ascending index order
 *
 * @param prefix Non-blank, trimmed, not ending with '[' or ']'
 * @return Possibly empty list of entries
 * @throws InvalidKeyPrefixError for a bad prefix
 * @throws DuplicateListIndexError if two keys share an index
 */
std::vector<ConfigEntry> decode_list(const Properties& props, const std::string& prefix);

/**
 * @brief decode_list(), then erase every key that starts with prefix
 *
 * Erasure covers all keys with the prefix, list-shaped or not. Nothing
 * is erased when decoding throws.
 */
std::vector<ConfigEntry> consume_list(Properties& props, const std::string& prefix);

} // namespace flatcfg

#endif // FLATCFG_LIST_DECODER_HPP
