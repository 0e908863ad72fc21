// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <algorithm>
#include <string>
#include <utility>
#include <vector>

namespace mdresgen {

/**
 * @brief Labelled tree node holding child nodes and leaf values
 *
 * Children and values keep insertion order. Sibling names are unique when
 * children are only added through find_or_add_child(). The root uses an
 * empty name. Nodes own their children by value; there are no parent links.
 */
template <typename T> class TreeItem {
  public:
    TreeItem() = default;
    explicit TreeItem(std::string name) : name_(std::move(name)) {}

    const std::string& name() const {
        return name_;
    }

    bool is_root() const {
        return name_.empty();
    }

    const std::vector<TreeItem>& children() const {
        return children_;
    }

    const std::vector<T>& values() const {
        return values_;
    }

    /// Child with the given name, or nullptr
    const TreeItem* find_child(const std::string& name) const {
        auto it = std::find_if(children_.begin(), children_.end(),
                               [&name](const TreeItem& child) { return child.name_ == name; });
        return it != children_.end() ? &*it : nullptr;
    }

    /**
     * @brief Return the child with the given name, appending it if missing
     *
     * The returned reference is invalidated by the next call that appends
     * to this node's children.
     */
    TreeItem& find_or_add_child(const std::string& name) {
        auto it = std::find_if(children_.begin(), children_.end(),
                               [&name](const TreeItem& child) { return child.name_ == name; });
        if (it != children_.end()) {
            return *it;
        }
        children_.emplace_back(name);
        return children_.back();
    }

    void add_value(T value) {
        values_.push_back(std::move(value));
    }

    /// Nodes in this subtree, including this one
    size_t node_count() const {
        size_t count = 1;
        for (const auto& child : children_) {
            count += child.node_count();
        }
        return count;
    }

  private:
    std::string name_;
    std::vector<TreeItem> children_;
    std::vector<T> values_;
};

} // namespace mdresgen
