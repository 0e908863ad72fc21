// SPDX-License-Identifier: GPL-3.0-or-later
#pragma once

/**
 * @file cli_args.h
 * @brief Command-line argument parsing for mdresgen
 *
 * Every option is an override; running with no arguments regenerates all
 * outputs from the defaults in GeneratorConfig.
 */

#include "generator_config.h"

#include <string>

namespace mdresgen {

/**
 * @brief Parsed command-line arguments
 */
struct CliArgs {
    GeneratorConfig config;

    // Logging
    int verbosity = 0;     // -v count
    std::string log_level; // --log-level, wins over -v when set

    bool show_help = false;
};

/**
 * @brief Parse command-line arguments
 *
 * @param argc Argument count
 * @param argv Argument values
 * @param args Output: parsed arguments
 * @return true on success (including -h), false on a usage error
 */
bool parse_cli_args(int argc, const char* const* argv, CliArgs& args);

/// Print usage to stdout
void print_usage(const char* program);

} // namespace mdresgen
