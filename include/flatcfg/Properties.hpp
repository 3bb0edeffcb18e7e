/**
 * @file Properties.hpp
 * @brief Prefix views and the exhaustiveness check over a Properties store
 *
 * Typical use, after every known key has been consumed:
 * ```cpp
 * auto host = consume_required_string(props, "db.host");
 * auto port = consume_required_port(props, "db.port");
 * require_fully_consumed(props, "DatabaseConfig");  // rejects typos
 * ```
 */

#ifndef FLATCFG_PROPERTIES_HPP
#define FLATCFG_PROPERTIES_HPP

#include "flatcfg/ListDecoder.hpp"
#include "flatcfg/Value.hpp"

#include <map>
#include <string>

namespace flatcfg {

/**
 * @brief Copy of every entry whose key starts with prefix
 * @throws InvalidKeyPrefixError if prefix is blank or untrimmed
 */
Properties filter_by_prefix(const Properties& props, const std::string& prefix);

/**
 * @brief Entries under prefix, keyed by the trimmed remainder of the key
 *
 * With prefix "db." the key "db.host" maps to entry {"db.host", "host", v}.
 * Two keys whose remainders trim to the same text: the later key in
 * sorted order wins.
 *
 * @throws InvalidKeyPrefixError if prefix is blank or untrimmed
 */
std::map<std::string, ConfigEntry> build_entries_for_prefix(const Properties& props,
                                                            const std::string& prefix);

/**
 * @brief Throw unless props is empty
 * @param type_name Named in the error message
 * @throws UnconsumedKeysError listing the leftover keys, sorted
 * @throws InvalidArgumentError if type_name is blank
 */
void require_fully_consumed(const Properties& props, const std::string& type_name);

} // namespace flatcfg

#endif // FLATCFG_PROPERTIES_HPP
