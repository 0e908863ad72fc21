// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <spdlog/spdlog.h>

#include <string>

namespace mdresgen {
namespace logging {

struct LogConfig {
    spdlog::level::level_enum level = spdlog::level::warn;
    bool enable_console = true;
};

/**
 * @brief Install the default "mdresgen" logger
 *
 * Console output goes to stderr so generator output and logs never mix.
 */
void init(const LogConfig& config);

/**
 * @brief Parse a level name (trace, debug, info, warn/warning, error, critical, off)
 * @return parsed level, or @p default_level if unrecognized (case sensitive)
 */
spdlog::level::level_enum parse_level(const std::string& str,
                                      spdlog::level::level_enum default_level = spdlog::level::warn);

/// -v count to level: 0 = warn, 1 = info, 2 = debug, 3+ = trace
spdlog::level::level_enum verbosity_to_level(int verbosity);

/**
 * @brief Pick the effective level
 *
 * An explicit --log-level name wins; otherwise -v count decides.
 * An unrecognized name falls back to the verbosity level.
 */
spdlog::level::level_enum resolve_log_level(int verbosity, const std::string& level_name);

} // namespace logging
} // namespace mdresgen
