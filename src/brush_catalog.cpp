// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "brush_catalog.h"

#include <spdlog/spdlog.h>

#include <fstream>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace mdresgen {

// ============================================================================
// Field helpers
// ============================================================================

// Absent or null -> empty list. Anything other than an array of strings fails.
static bool parse_key_list(const json& j, const char* key, size_t index,
                           std::vector<std::string>& out) {
    if (!j.contains(key) || j[key].is_null()) {
        return true;
    }
    const auto& list = j[key];
    if (!list.is_array()) {
        spdlog::error("[BrushCatalog] Brush #{}: '{}' must be an array of strings", index, key);
        return false;
    }
    for (const auto& item : list) {
        if (!item.is_string()) {
            spdlog::error("[BrushCatalog] Brush #{}: '{}' contains a non-string entry", index,
                          key);
            return false;
        }
        out.push_back(item.get<std::string>());
    }
    return true;
}

static bool parse_theme_values(const json& j, size_t index, ThemeValues& out) {
    if (!j.contains("themeValues") || !j["themeValues"].is_object()) {
        spdlog::error("[BrushCatalog] Brush #{}: missing or invalid 'themeValues'", index);
        return false;
    }
    const auto& values = j["themeValues"];
    for (const char* theme : {"light", "dark"}) {
        if (!values.contains(theme) || !values[theme].is_string()) {
            spdlog::error("[BrushCatalog] Brush #{}: themeValues.{} must be a string", index,
                          theme);
            return false;
        }
    }
    out.light = values["light"].get<std::string>();
    out.dark = values["dark"].get<std::string>();
    return true;
}

// ============================================================================
// Brush parsing
// ============================================================================

static std::optional<BrushRecord> parse_brush(const json& j, size_t index) {
    if (!j.is_object()) {
        spdlog::error("[BrushCatalog] Brush #{} is not a JSON object", index);
        return std::nullopt;
    }

    if (!j.contains("name") || !j["name"].is_string()) {
        spdlog::error("[BrushCatalog] Brush #{}: missing or non-string 'name'", index);
        return std::nullopt;
    }

    BrushRecord brush;
    brush.name = j["name"].get<std::string>();

    if (!is_valid_brush_name(brush.name)) {
        spdlog::error("[BrushCatalog] Brush '{}' needs at least {} dot-separated segments",
                      brush.name, MIN_BRUSH_NAME_SEGMENTS);
        return std::nullopt;
    }

    if (!parse_theme_values(j, index, brush.theme_values) ||
        !parse_key_list(j, "alternateKeys", index, brush.alternate_keys) ||
        !parse_key_list(j, "obsoleteKeys", index, brush.obsolete_keys)) {
        return std::nullopt;
    }

    return brush;
}

static std::optional<std::vector<BrushRecord>> parse_catalog(const json& j) {
    if (!j.is_array()) {
        spdlog::error("[BrushCatalog] Root is not a JSON array");
        return std::nullopt;
    }

    if (j.empty()) {
        spdlog::error("[BrushCatalog] Did not find any brushes in the catalog");
        return std::nullopt;
    }

    std::vector<BrushRecord> brushes;
    brushes.reserve(j.size());
    for (size_t i = 0; i < j.size(); i++) {
        auto brush = parse_brush(j[i], i);
        if (!brush) {
            return std::nullopt;
        }
        brushes.push_back(std::move(*brush));
    }

    spdlog::debug("[BrushCatalog] Loaded {} brushes", brushes.size());
    return brushes;
}

// ============================================================================
// Public API
// ============================================================================

std::optional<std::vector<BrushRecord>> BrushCatalogParser::load_from_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        spdlog::error("[BrushCatalog] Could not open '{}'", path);
        return std::nullopt;
    }

    json j;
    try {
        j = json::parse(file);
    } catch (const json::parse_error& e) {
        spdlog::error("[BrushCatalog] JSON parse error in '{}': {}", path, e.what());
        return std::nullopt;
    }

    return parse_catalog(j);
}

std::optional<std::vector<BrushRecord>>
BrushCatalogParser::load_from_string(const std::string& json_str) {
    if (json_str.empty()) {
        spdlog::error("[BrushCatalog] Empty catalog input");
        return std::nullopt;
    }

    json j;
    try {
        j = json::parse(json_str);
    } catch (const json::parse_error& e) {
        spdlog::error("[BrushCatalog] JSON parse error: {}", e.what());
        return std::nullopt;
    }

    return parse_catalog(j);
}

} // namespace mdresgen
