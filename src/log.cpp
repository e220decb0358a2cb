#include "log.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>

namespace logging {

spdlog::level::level_enum level_from(const std::string& name) {
    if (name == "trace") return spdlog::level::trace;
    if (name == "debug") return spdlog::level::debug;
    if (name == "info" ) return spdlog::level::info;
    if (name == "warn" ) return spdlog::level::warn;
    if (name == "error") return spdlog::level::err;
    if (name == "off"  ) return spdlog::level::off;
    return spdlog::level::info;
}

void init(const std::string& level, bool quiet) {
    auto logger = spdlog::get("ormigrate");
    if (!logger) logger = spdlog::stderr_color_mt("ormigrate");
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    auto lvl = level_from(level);
    if (quiet && lvl < spdlog::level::warn) lvl = spdlog::level::warn;
    logger->set_level(lvl);
    spdlog::set_default_logger(logger);
    spdlog::set_level(lvl); // SPDLOG_* macros go through the default logger
}

} // namespace logging
