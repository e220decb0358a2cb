#pragma once
#include <string>
#include <spdlog/spdlog.h>

namespace logging {

// Configure the default spdlog logger for the process.
// level: trace|debug|info|warn|error|off. quiet drops everything below warn.
void init(const std::string& level = "info", bool quiet = false);

// Parse a level name, unknown names map to info.
spdlog::level::level_enum level_from(const std::string& name);

} // namespace logging
