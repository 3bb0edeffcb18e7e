/**
 * @file Env.hpp
 * @brief Environment variable helpers
 *
 * - enumerate_environment(): the raw process environment
 * - pretty_print_env_vars(): a sorted, abbreviated dump for diagnostics
 * - env_overlay(): PREFIX_* variables as flat property keys
 */

#ifndef FLATCFG_ENV_HPP
#define FLATCFG_ENV_HPP

#include "flatcfg/Value.hpp"

#include <string>
#include <utility>
#include <vector>

namespace flatcfg {

/**
 * @brief All (name, value) pairs of the process environment, unsorted
 */
std::vector<std::pair<std::string, std::string>> enumerate_environment();

/**
 * @brief Format the environment for logging
 *
 * Each variable is printed as "NAME = value" followed by delim, sorted
 * by name. Variables whose lower-cased name contains "pass" are left
 * out. Values longer than max_length are cut to max_length - 3
 * characters plus "..."; empty values print as "<null>".
 *
 * @throws InvalidArgumentError if max_length < 1
 */
std::string pretty_print_env_vars(const std::string& delim = "\n", int max_length = 80);

/**
 * @brief Same formatting over an explicit variable list
 */
std::string pretty_print_env_vars(std::vector<std::pair<std::string, std::string>> vars,
                                  const std::string& delim, int max_length);

/**
 * @brief Map an environment variable name (prefix removed) to a key
 *
 * Lower-cased; "__" becomes a literal '_' and a single '_' becomes '.'.
 *
 * Examples:
 *   - DATABASE_HOST -> database.host
 *   - FEATURE__FLAGS_BETA -> feature_flags.beta
 */
std::string transform_env_name(const std::string& name);

/**
 * @brief Properties from variables named PREFIX_REST
 *
 * The prefix matches case-insensitively; a trailing '_' in prefix is
 * optional. Values are stored as strings under transform_env_name(REST).
 *
 * @throws InvalidArgumentError if prefix is blank
 */
Properties env_overlay(const std::string& prefix);

} // namespace flatcfg

#endif // FLATCFG_ENV_HPP
