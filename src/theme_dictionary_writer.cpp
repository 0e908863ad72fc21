// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "theme_dictionary_writer.h"

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

namespace mdresgen {

static const char* const DICTIONARY_HEADER =
    "<ResourceDictionary xmlns=\"http://schemas.microsoft.com/winfx/2006/xaml/presentation\"\n"
    "                    xmlns:x=\"http://schemas.microsoft.com/winfx/2006/xaml\"\n"
    "                    "
    "xmlns:po=\"http://schemas.microsoft.com/winfx/2006/xaml/presentation/options\"\n"
    "                    "
    "xmlns:colors=\"clr-namespace:MaterialDesignColors;assembly=MaterialDesignColors\">\n"
    "  <ResourceDictionary.MergedDictionaries>\n"
    "    <ResourceDictionary Source=\"./Internal/MaterialDesignTheme.BaseThemeColors.xaml\" />\n"
    "  </ResourceDictionary.MergedDictionaries>\n";

static const char* const DICTIONARY_FOOTER = "\n</ResourceDictionary>\n";

std::string render_brush_binding(const std::string& key, const std::string& value) {
    if (is_literal_color(value)) {
        return fmt::format("  <SolidColorBrush x:Key=\"{}\" Color=\"{}\" po:Freeze=\"True\" />\n",
                           key, value);
    }
    return fmt::format("  <colors:StaticResource x:Key=\"{}\" ResourceKey=\"{}\" />\n", key,
                       value);
}

std::string render_theme_dictionary(ThemeVariant variant, const std::vector<BrushRecord>& brushes) {
    std::string out = DICTIONARY_HEADER;
    size_t bindings = 0;

    for (const auto& brush : brushes) {
        const std::string& value = brush.theme_values.at(variant);
        out += render_brush_binding(brush.name, value);
        ++bindings;

        for (const auto& alternate : brush.alternate_keys) {
            out += render_brush_binding(alternate, value);
            ++bindings;
        }
    }

    out += DICTIONARY_FOOTER;

    spdlog::debug("[ThemeDictionary] {}: {} bindings for {} brushes", theme_variant_name(variant),
                  bindings, brushes.size());
    return out;
}

} // namespace mdresgen
