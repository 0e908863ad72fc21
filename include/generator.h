// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "generator_config.h"

#include <filesystem>
#include <optional>
#include <string>

namespace mdresgen {

/**
 * @brief Walk up from @p start to the first directory containing a .git directory
 * @return repository root, or nullopt if the filesystem root is reached
 */
std::optional<std::filesystem::path> find_repo_root(const std::filesystem::path& start);

/// Read a whole file; nullopt if it cannot be opened
std::optional<std::string> read_text_file(const std::filesystem::path& path);

/// Create parent directories, then write and close @p path
bool write_text_file(const std::filesystem::path& path, const std::string& content);

/**
 * @brief Full regeneration of all resource outputs
 *
 * load -> sort -> filter -> tree -> Light, Dark, ObsoleteBrushes, Theme.g.cs.
 * Stops at the first failure; outputs written before it are left in place.
 */
class Generator {
  public:
    explicit Generator(GeneratorConfig config);

    /// @return true if every output was written
    bool run();

  private:
    bool resolve_repo_root(std::filesystem::path& root) const;

    GeneratorConfig config_;
};

} // namespace mdresgen
