// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "cli_args.h"

#include <cstdio>
#include <cstring>

namespace mdresgen {

// Accepts "--opt value", "-o value" and "--opt=value". Advances i past a separate value.
static bool take_value(int argc, const char* const* argv, int& i, const char* short_name,
                       const char* long_name, std::string& out, bool& matched) {
    const char* arg = argv[i];
    size_t long_len = strlen(long_name);

    if (strncmp(arg, long_name, long_len) == 0 && arg[long_len] == '=') {
        matched = true;
        out = arg + long_len + 1;
        return true;
    }

    matched = strcmp(arg, long_name) == 0 || (short_name && strcmp(arg, short_name) == 0);
    if (!matched) {
        return true;
    }
    if (i + 1 >= argc) {
        if (short_name) {
            printf("Error: %s/%s requires an argument\n", short_name, long_name);
        } else {
            printf("Error: %s requires an argument\n", long_name);
        }
        return false;
    }
    out = argv[++i];
    return true;
}

void print_usage(const char* program) {
    printf("Usage: %s [options]\n", program);
    printf("Regenerates the theme dictionaries, obsolete brush aliases and Theme.g.cs\n");
    printf("from the brush catalog.\n");
    printf("Options:\n");
    printf("  -i, --input <file>      Brush catalog (default: ThemeColors.json)\n");
    printf("  -t, --template <file>   Obsolete brush template\n");
    printf("                          (default: MaterialDesignTheme.ObsoleteBrushes.xaml)\n");
    printf("  -r, --repo-root <dir>   Repository root (default: nearest parent with .git)\n");
    printf("  -v, --verbose           Increase verbosity (-v=info, -vv=debug, -vvv=trace)\n");
    printf("  --log-level <level>     trace, debug, info, warn, error, critical, off\n");
    printf("  -h, --help              Show this help message\n");
}

bool parse_cli_args(int argc, const char* const* argv, CliArgs& args) {
    for (int i = 1; i < argc; i++) {
        bool matched = false;

        if (!take_value(argc, argv, i, "-i", "--input", args.config.input_path, matched))
            return false;
        if (matched)
            continue;

        if (!take_value(argc, argv, i, "-t", "--template", args.config.template_path, matched))
            return false;
        if (matched)
            continue;

        if (!take_value(argc, argv, i, "-r", "--repo-root", args.config.repo_root, matched))
            return false;
        if (matched)
            continue;

        if (!take_value(argc, argv, i, nullptr, "--log-level", args.log_level, matched))
            return false;
        if (matched)
            continue;

        // Verbosity
        if (strcmp(argv[i], "-v") == 0 || strcmp(argv[i], "-vv") == 0 ||
            strcmp(argv[i], "-vvv") == 0) {
            const char* p = argv[i];
            while (*p == '-')
                p++;
            while (*p == 'v') {
                args.verbosity++;
                p++;
            }
        } else if (strcmp(argv[i], "--verbose") == 0) {
            args.verbosity++;
        }
        // Help
        else if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            args.show_help = true;
        }
        // Unknown argument
        else {
            printf("Unknown argument: %s\n", argv[i]);
            printf("Use --help for usage information\n");
            return false;
        }
    }

    if (args.config.input_path.empty() || args.config.template_path.empty()) {
        printf("Error: --input and --template cannot be empty\n");
        return false;
    }

    return true;
}

} // namespace mdresgen
