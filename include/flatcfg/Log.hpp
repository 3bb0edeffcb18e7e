/**
 * @file Log.hpp
 * @brief Library logger
 *
 * flatcfg logs through one named spdlog logger, "flatcfg", writing to
 * stderr. Its initial level is read from FLATCFG_LOG_LEVEL (trace, debug,
 * info, warn, error, critical, off) and defaults to info. Applications
 * may change the level or sinks on the returned logger at any time.
 */

#ifndef FLATCFG_LOG_HPP
#define FLATCFG_LOG_HPP

#include <spdlog/spdlog.h>

#include <memory>

namespace flatcfg {

/// Name the logger is registered under in the spdlog registry.
inline constexpr const char* LOGGER_NAME = "flatcfg";

/// Environment variable holding the initial log level.
inline constexpr const char* LOG_LEVEL_ENV = "FLATCFG_LOG_LEVEL";

/**
 * @brief The process-wide flatcfg logger, created on first use
 */
std::shared_ptr<spdlog::logger> logger();

} // namespace flatcfg

#endif // FLATCFG_LOG_HPP
