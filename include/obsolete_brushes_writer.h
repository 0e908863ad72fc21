// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "brush.h"

#include <string>
#include <vector>

namespace mdresgen {

/// Pattern for the template line replaced by the generated aliases. The whole
/// line must be the marker; surrounding whitespace (and a CR) is allowed.
inline constexpr const char* INSERT_MARKER_PATTERN = R"(^\s*<!-- INSERT HERE -->\s*$)";

/**
 * @brief Render one alias binding per obsolete key
 *
 * Each obsolete key references the owning brush's name, never its raw value,
 * so the alias follows whatever the brush resolves to in the active theme.
 */
std::string render_obsolete_bindings(const std::vector<BrushRecord>& brushes);

/**
 * @brief Replace the first marker line of @p template_text with @p block
 *
 * The marker line and its line terminator are replaced; every other byte of
 * the template is kept. An empty block, or a template without a marker line,
 * leaves the template unchanged.
 */
std::string splice_into_template(const std::string& template_text, const std::string& block);

/**
 * @brief Render the obsolete-brush dictionary from a template
 *
 * Callers pass the catalog with IGNORED_BRUSH_NAME already removed.
 */
std::string render_obsolete_dictionary(const std::vector<BrushRecord>& brushes,
                                       const std::string& template_text);

} // namespace mdresgen
