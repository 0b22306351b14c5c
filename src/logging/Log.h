#pragma once
#include <memory>
#include <string>
#include <spdlog/spdlog.h>

namespace orbis::logsys {

struct LogOptions {
    spdlog::level::level_enum level = spdlog::level::info;
    std::string file;               // empty => console only
};

// Installs the "orbis" logger as spdlog's default: color console sink plus an
// optional rotating file sink (1MB * 4). Safe to call more than once.
void init(const LogOptions& options);

// Parses "trace", "debug", "info", "warn", "error", "critical", "off".
// Throws worldgen::ConfigError on anything else.
spdlog::level::level_enum parse_level(const std::string& name);

std::shared_ptr<spdlog::logger> get();  // "orbis"

} // namespace orbis::logsys
