#include "Log.h"
#include "worldgen/Errors.hpp"
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <filesystem>
#include <vector>

namespace fs = std::filesystem;
static std::shared_ptr<spdlog::logger> g_logger;

void orbis::logsys::init(const LogOptions& options) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    if (!options.file.empty()) {
        const fs::path file(options.file);
        if (file.has_parent_path()) {
            std::error_code ec; fs::create_directories(file.parent_path(), ec);
        }
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(options.file, 1 << 20, 4)); // 1MB * 4
    }
    g_logger = std::make_shared<spdlog::logger>("orbis", sinks.begin(), sinks.end());
    g_logger->set_level(options.level);
    spdlog::set_default_logger(g_logger);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e][%l] %v");
    spdlog::flush_on(spdlog::level::warn);
    spdlog::debug("Logging started");
}

spdlog::level::level_enum orbis::logsys::parse_level(const std::string& name) {
    if (name == "trace")    return spdlog::level::trace;
    if (name == "debug")    return spdlog::level::debug;
    if (name == "info")     return spdlog::level::info;
    if (name == "warn")     return spdlog::level::warn;
    if (name == "error")    return spdlog::level::err;
    if (name == "critical") return spdlog::level::critical;
    if (name == "off")      return spdlog::level::off;
    throw worldgen::ConfigError("log.level: unknown level '" + name + "'");
}

std::shared_ptr<spdlog::logger> orbis::logsys::get() { return g_logger; }
