/**
 * @file Log.cpp
 * @brief The library logger
 */

#include "flatcfg/Log.hpp"
#include "flatcfg/Util.hpp"

#include <spdlog/sinks/stdout_sinks.h>

#include <cstdlib>

namespace flatcfg {

namespace {

spdlog::level::level_enum initial_level() {
    const char* raw = std::getenv(LOG_LEVEL_ENV);
    if (raw == nullptr || is_blank(raw)) return spdlog::level::info;

    // from_str() maps unknown names to "off"
    std::string name = to_lower(trim(raw));
    auto level = spdlog::level::from_str(name);
    if (level == spdlog::level::off && name != "off") return spdlog::level::info;
    return level;
}

std::shared_ptr<spdlog::logger> create_logger() {
    if (auto existing = spdlog::get(LOGGER_NAME)) {
        return existing;
    }
    auto sink = std::make_shared<spdlog::sinks::stderr_sink_mt>();
    auto log = std::make_shared<spdlog::logger>(LOGGER_NAME, sink);
    log->set_level(initial_level());
    spdlog::register_logger(log);
    return log;
}

} // anonymous namespace

std::shared_ptr<spdlog::logger> logger() {
    static const std::shared_ptr<spdlog::logger> instance = create_logger();
    return instance;
}

} // namespace flatcfg
