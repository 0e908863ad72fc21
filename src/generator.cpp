// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "generator.h"

#include "brush_catalog.h"
#include "brush_tree.h"
#include "obsolete_brushes_writer.h"
#include "theme_class_writer.h"
#include "theme_dictionary_writer.h"

#include <spdlog/spdlog.h>

#include <fstream>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace fs = std::filesystem;

namespace mdresgen {

std::optional<fs::path> find_repo_root(const fs::path& start) {
    std::error_code ec;
    fs::path current = fs::absolute(start, ec);
    if (ec) {
        spdlog::error("[Generator] Cannot resolve '{}': {}", start.string(), ec.message());
        return std::nullopt;
    }

    while (true) {
        if (fs::is_directory(current / ".git", ec)) {
            return current;
        }
        fs::path parent = current.parent_path();
        if (parent.empty() || parent == current) {
            return std::nullopt;
        }
        current = parent;
    }
}

std::optional<std::string> read_text_file(const fs::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return std::nullopt;
    }
    std::stringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

bool write_text_file(const fs::path& path, const std::string& content) {
    std::error_code ec;
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path(), ec);
        if (ec) {
            spdlog::error("[Generator] Cannot create directory '{}': {}",
                          path.parent_path().string(), ec.message());
            return false;
        }
    }

    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        spdlog::error("[Generator] Cannot open '{}' for writing", path.string());
        return false;
    }
    file << content;
    file.close();
    if (!file) {
        spdlog::error("[Generator] Failed writing '{}'", path.string());
        return false;
    }

    spdlog::info("[Generator] Wrote {} ({} bytes)", path.string(), content.size());
    return true;
}

Generator::Generator(GeneratorConfig config) : config_(std::move(config)) {}

bool Generator::resolve_repo_root(fs::path& root) const {
    if (!config_.repo_root.empty()) {
        root = config_.repo_root;
        return true;
    }

    std::error_code ec;
    fs::path cwd = fs::current_path(ec);
    if (ec) {
        spdlog::error("[Generator] Cannot determine working directory: {}", ec.message());
        return false;
    }

    auto found = find_repo_root(cwd);
    if (!found) {
        spdlog::error("[Generator] Failed to find the repo root above '{}'", cwd.string());
        return false;
    }
    root = *found;
    return true;
}

bool Generator::run() {
    auto loaded = BrushCatalogParser::load_from_file(config_.input_path);
    if (!loaded) {
        spdlog::error("[Generator] Did not find brushes in '{}'", config_.input_path);
        return false;
    }

    std::vector<BrushRecord> brushes = std::move(*loaded);
    sort_brushes_by_name(brushes);

    // IGNORED_BRUSH_NAME still gets theme values, but no accessor or aliases
    std::vector<BrushRecord> visible = without_ignored_brush(brushes);

    try {
        BrushTree tree = build_brush_tree(visible);

        fs::path root;
        if (!resolve_repo_root(root)) {
            return false;
        }
        spdlog::debug("[Generator] Repo root: {}", root.string());

        for (ThemeVariant variant : {ThemeVariant::Light, ThemeVariant::Dark}) {
            if (!write_text_file(config_.theme_dictionary_path(root, variant),
                                 render_theme_dictionary(variant, brushes))) {
                return false;
            }
        }

        auto template_text = read_text_file(config_.template_path);
        if (!template_text) {
            spdlog::error("[Generator] Could not read template '{}'", config_.template_path);
            return false;
        }
        if (!write_text_file(config_.obsolete_dictionary_path(root),
                             render_obsolete_dictionary(visible, *template_text))) {
            return false;
        }

        if (!write_text_file(config_.theme_class_path(root), render_theme_class(tree))) {
            return false;
        }
    } catch (const std::exception& e) {
        spdlog::error("[Generator] Generation failed: {}", e.what());
        return false;
    }

    spdlog::info("[Generator] Generated resources for {} brushes", brushes.size());
    return true;
}

} // namespace mdresgen
