// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <cstddef>
#include <string>
#include <vector>

/**
 * @file brush.h
 * @brief Brush record model and dotted-name derivations
 *
 * A brush is one named color entry from ThemeColors.json. Its name is a
 * dotted path such as "MaterialDesign.Brush.Button.Background": the first
 * two segments are namespace and category, the last is the leaf property,
 * and everything in between is the container hierarchy.
 */

namespace mdresgen {

/// Leading prefix stripped by brush_name_without_prefix()
inline constexpr const char* BRUSH_PREFIX = "MaterialDesign.Brush.";

/// Brush excluded from the accessor class and obsolete aliases (but not theme dictionaries)
inline constexpr const char* IGNORED_BRUSH_NAME = "MaterialDesign.Brush.Ignored";

/// Minimum number of dot-separated segments in a brush name
inline constexpr size_t MIN_BRUSH_NAME_SEGMENTS = 3;

enum class ThemeVariant { Light, Dark };

/// "Light" / "Dark", as used in output file names
const char* theme_variant_name(ThemeVariant variant);

/// Per-theme values: a literal color ("#AARRGGBB") or the key of another resource
struct ThemeValues {
    std::string light;
    std::string dark;

    const std::string& at(ThemeVariant variant) const;

    /**
     * @brief Look up a value by theme key ("light" / "dark", case-insensitive)
     * @throws std::invalid_argument for any other key
     */
    const std::string& at(const std::string& theme) const;
};

struct BrushRecord {
    std::string name;
    ThemeValues theme_values;
    std::vector<std::string> alternate_keys; ///< Extra keys sharing this brush's value
    std::vector<std::string> obsolete_keys;  ///< Deprecated keys aliased to this brush's name
};

/// True if a theme value is a literal color rather than a resource reference
bool is_literal_color(const std::string& value);

/// Split a dotted name into its segments (empty segments preserved)
std::vector<std::string> split_brush_name(const std::string& name);

/// True if the name has at least MIN_BRUSH_NAME_SEGMENTS segments
bool is_valid_brush_name(const std::string& name);

// Derived facts. Each throws std::invalid_argument when the name has fewer
// than MIN_BRUSH_NAME_SEGMENTS segments.

/// Final segment: "MaterialDesign.Brush.Button.Background" -> "Background"
std::string brush_property_name(const std::string& name);

/// Name with BRUSH_PREFIX stripped: -> "Button.Background"
std::string brush_name_without_prefix(const std::string& name);

/// Segments between category and leaf: -> {"Button"}
std::vector<std::string> brush_container_parts(const std::string& name);

/// Container parts rejoined with dots: -> "Button"
std::string brush_container_type_name(const std::string& name);

/// Stable sort by name (ordinal byte order)
void sort_brushes_by_name(std::vector<BrushRecord>& brushes);

/// Copy of the list without the IGNORED_BRUSH_NAME entry
std::vector<BrushRecord> without_ignored_brush(const std::vector<BrushRecord>& brushes);

} // namespace mdresgen
