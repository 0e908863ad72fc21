// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "brush.h"
#include "tree_item.h"

#include <vector>

namespace mdresgen {

using BrushTree = TreeItem<BrushRecord>;

/**
 * @brief Group brushes into a tree keyed by their container parts
 *
 * "NS.Brush.A.B.Leaf" lands in root -> A -> B. Children and values keep the
 * order they are first seen in, so name-sorted input yields a name-sorted tree.
 * Duplicate names produce duplicate values.
 *
 * @throws std::invalid_argument if a brush name has too few segments
 */
BrushTree build_brush_tree(const std::vector<BrushRecord>& brushes);

} // namespace mdresgen
