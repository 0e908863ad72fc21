// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "brush.h"

#include <filesystem>
#include <string>

namespace mdresgen {

/**
 * @brief Paths and names for one generation run
 *
 * Defaults reproduce the no-argument invocation: inputs come from the working
 * directory, outputs go under the discovered repository root.
 */
struct GeneratorConfig {
    std::string input_path = "ThemeColors.json";
    std::string template_path = "MaterialDesignTheme.ObsoleteBrushes.xaml";

    std::string repo_root; // empty = search upward for a .git directory

    std::string project_dir = "MaterialDesignThemes.Wpf";
    std::string theme_prefix = "MaterialDesignTheme";

    /// <root>/<project>/Themes/<prefix>.<Light|Dark>.xaml
    std::filesystem::path theme_dictionary_path(const std::filesystem::path& root,
                                                ThemeVariant variant) const {
        return root / project_dir / "Themes" /
               (theme_prefix + "." + theme_variant_name(variant) + ".xaml");
    }

    /// <root>/<project>/Themes/<prefix>.ObsoleteBrushes.xaml
    std::filesystem::path obsolete_dictionary_path(const std::filesystem::path& root) const {
        return root / project_dir / "Themes" / (theme_prefix + ".ObsoleteBrushes.xaml");
    }

    /// <root>/<project>/Theme.g.cs
    std::filesystem::path theme_class_path(const std::filesystem::path& root) const {
        return root / project_dir / "Theme.g.cs";
    }
};

} // namespace mdresgen
