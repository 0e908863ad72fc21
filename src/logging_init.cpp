// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "logging_init.h"

#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <memory>
#include <vector>

namespace mdresgen {
namespace logging {

void init(const LogConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;

    if (config.enable_console) {
        sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    } else {
        sinks.push_back(std::make_shared<spdlog::sinks::null_sink_mt>());
    }

    auto logger = std::make_shared<spdlog::logger>("mdresgen", sinks.begin(), sinks.end());
    logger->set_level(config.level);
    logger->set_pattern("[%^%l%$] %v");

    spdlog::set_default_logger(logger);

    spdlog::debug("[Logging] Initialized: level={}, console={}",
                  spdlog::level::to_string_view(config.level),
                  config.enable_console ? "yes" : "no");
}

spdlog::level::level_enum parse_level(const std::string& str,
                                      spdlog::level::level_enum default_level) {
    if (str == "trace")
        return spdlog::level::trace;
    if (str == "debug")
        return spdlog::level::debug;
    if (str == "info")
        return spdlog::level::info;
    if (str == "warn" || str == "warning")
        return spdlog::level::warn;
    if (str == "error")
        return spdlog::level::err;
    if (str == "critical")
        return spdlog::level::critical;
    if (str == "off")
        return spdlog::level::off;
    return default_level;
}

spdlog::level::level_enum verbosity_to_level(int verbosity) {
    switch (verbosity) {
    case 0:
        return spdlog::level::warn;
    case 1:
        return spdlog::level::info;
    case 2:
        return spdlog::level::debug;
    default:
        return verbosity >= 3 ? spdlog::level::trace : spdlog::level::warn;
    }
}

spdlog::level::level_enum resolve_log_level(int verbosity, const std::string& level_name) {
    auto from_verbosity = verbosity_to_level(verbosity);
    if (level_name.empty()) {
        return from_verbosity;
    }
    return parse_level(level_name, from_verbosity);
}

} // namespace logging
} // namespace mdresgen
