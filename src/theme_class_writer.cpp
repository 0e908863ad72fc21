// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "theme_class_writer.h"

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

namespace mdresgen {

namespace {

constexpr int INDENT_WIDTH = 4;

const char* const CLASS_PREAMBLE = "/// <summary>\n"
                                   "/// This file is auto-generated by mdresgen.\n"
                                   "/// </summary>\n"
                                   "using System.Windows.Media;\n"
                                   "\n"
                                   "namespace MaterialDesignThemes.Wpf;\n"
                                   "\n"
                                   "partial class Theme\n"
                                   "{\n";

void write_tree_item(const BrushTree& item, int indent_level, std::string& out) {
    const std::string indent(static_cast<size_t>(indent_level * INDENT_WIDTH), ' ');

    if (!item.is_root()) {
        out += fmt::format("{}public class {}\n", indent, item.name());
        out += fmt::format("{}{{\n", indent);
    }

    for (const auto& brush : item.values()) {
        out += fmt::format("{}    public Color {} {{ get; set; }}\n\n", indent,
                           brush_property_name(brush.name));
    }

    for (const auto& child : item.children()) {
        out += fmt::format("{}    public {} {}s {{ get; set; }} = new();\n\n", indent,
                           child.name(), child.name());
    }

    for (const auto& child : item.children()) {
        write_tree_item(child, indent_level + 1, out);
    }

    if (!item.is_root()) {
        out += fmt::format("{}}}\n\n", indent);
    }
}

} // namespace

std::string render_theme_class(const BrushTree& tree) {
    std::string out = CLASS_PREAMBLE;
    write_tree_item(tree, 0, out);
    out += "}\n";

    spdlog::debug("[ThemeClass] Rendered {} nodes ({} bytes)", tree.node_count(), out.size());
    return out;
}

} // namespace mdresgen
