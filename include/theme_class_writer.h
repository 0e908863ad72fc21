// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "brush_tree.h"

#include <string>

namespace mdresgen {

/**
 * @brief Render Theme.g.cs, the typed accessor class for the brush tree
 *
 * Each non-root node becomes a nested class holding one Color property per
 * value, then one "<Child>s" property per child, then the child classes.
 * The root contributes members directly to "partial class Theme".
 */
std::string render_theme_class(const BrushTree& tree);

} // namespace mdresgen
