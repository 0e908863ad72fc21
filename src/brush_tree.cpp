// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "brush_tree.h"

#include <spdlog/spdlog.h>

namespace mdresgen {

BrushTree build_brush_tree(const std::vector<BrushRecord>& brushes) {
    BrushTree root;

    for (const auto& brush : brushes) {
        BrushTree* current = &root;
        for (const auto& part : brush_container_parts(brush.name)) {
            current = &current->find_or_add_child(part);
        }
        current->add_value(brush);
    }

    spdlog::debug("[BrushTree] Built {} nodes from {} brushes", root.node_count(), brushes.size());
    return root;
}

} // namespace mdresgen
