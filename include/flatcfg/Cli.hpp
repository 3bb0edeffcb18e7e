/**
 * @file Cli.hpp
 * @brief flatcfg-cli command dispatcher
 *
 * Usage:
 *   flatcfg-cli [-c FILE] [--env-prefix P] [-v] COMMAND [ARGS]
 *
 * Commands:
 *   get KEY [--type string|bool|int|long|port|uri|path|uuid]
 *   list PREFIX      one line per entry: index<TAB>short_key<TAB>value
 *   keys             every key, sorted
 *   dump             "key = value" lines, sorted by key
 *   env              the environment, via pretty_print_env_vars()
 *
 * Without -c the typical candidate files are searched.
 */

#ifndef FLATCFG_CLI_HPP
#define FLATCFG_CLI_HPP

#include <ostream>

namespace flatcfg {

/**
 * @brief Run the CLI
 * @return Process exit status: 0 on success, 1 on any error
 */
int run_cli(int argc, const char* const* argv, std::ostream& out, std::ostream& err);

} // namespace flatcfg

#endif // FLATCFG_CLI_HPP
