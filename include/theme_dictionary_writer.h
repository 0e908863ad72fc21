// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "brush.h"

#include <string>
#include <vector>

namespace mdresgen {

/**
 * @brief Render the Light or Dark resource dictionary
 *
 * One binding per brush name and one per alternate key, all resolving to the
 * brush's value for @p variant. Literal colors ("#...") become frozen
 * SolidColorBrush entries; anything else becomes a StaticResource reference.
 *
 * Callers pass the full catalog, including IGNORED_BRUSH_NAME.
 */
std::string render_theme_dictionary(ThemeVariant variant, const std::vector<BrushRecord>& brushes);

/// Single binding line (with trailing newline) for @p key resolving to @p value
std::string render_brush_binding(const std::string& key, const std::string& value);

} // namespace mdresgen
