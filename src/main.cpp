// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file main.cpp
 * @brief mdresgen - regenerates MaterialDesign brush resources from ThemeColors.json
 *
 * Usage: mdresgen [options]   (see --help)
 *
 * Exit codes:
 *   0 - All outputs written
 *   1 - Usage error or generation failure
 */

#include "cli_args.h"
#include "generator.h"
#include "logging_init.h"

#include <spdlog/spdlog.h>

int main(int argc, char* argv[]) {
    mdresgen::CliArgs args;
    if (!mdresgen::parse_cli_args(argc, argv, args)) {
        return 1;
    }
    if (args.show_help) {
        mdresgen::print_usage(argv[0]);
        return 0;
    }

    mdresgen::logging::LogConfig log_config;
    log_config.level = mdresgen::logging::resolve_log_level(args.verbosity, args.log_level);
    mdresgen::logging::init(log_config);

    mdresgen::Generator generator(args.config);
    if (!generator.run()) {
        spdlog::critical("[mdresgen] Generation failed");
        return 1;
    }
    return 0;
}
