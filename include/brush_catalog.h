// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "brush.h"

#include <optional>
#include <string>
#include <vector>

namespace mdresgen {

/**
 * @brief JSON parser for the brush catalog (ThemeColors.json)
 *
 * The catalog is a JSON array of brush objects:
 * ```json
 * [
 *   {
 *     "name": "MaterialDesign.Brush.Button.Background",
 *     "themeValues": { "light": "#FF2196F3", "dark": "MaterialDesign.Brush.Primary" },
 *     "alternateKeys": [ "PrimaryHueMidBrush" ],
 *     "obsoleteKeys": [ "MaterialDesignButtonBackground" ]
 *   }
 * ]
 * ```
 * alternateKeys and obsoleteKeys may be absent or null. Any other shape
 * mismatch (or an empty array) rejects the whole catalog.
 */
class BrushCatalogParser {
  public:
    /// Load catalog from JSON file on disk
    /// @return brushes in file order, or nullopt on error
    static std::optional<std::vector<BrushRecord>> load_from_file(const std::string& path);

    /// Load catalog from JSON string (useful for testing)
    /// @return brushes in file order, or nullopt on error
    static std::optional<std::vector<BrushRecord>> load_from_string(const std::string& json_str);
};

} // namespace mdresgen
