// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "brush.h"

#include <algorithm>
#include <cctype>
#include <iterator>
#include <stdexcept>

namespace mdresgen {

namespace {

std::string to_lower(const std::string& str) {
    std::string lower = str;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower;
}

std::vector<std::string> require_segments(const std::string& name) {
    auto parts = split_brush_name(name);
    if (parts.size() < MIN_BRUSH_NAME_SEGMENTS) {
        throw std::invalid_argument("Brush name '" + name + "' needs at least " +
                                    std::to_string(MIN_BRUSH_NAME_SEGMENTS) +
                                    " dot-separated segments");
    }
    return parts;
}

} // namespace

const char* theme_variant_name(ThemeVariant variant) {
    switch (variant) {
    case ThemeVariant::Light:
        return "Light";
    case ThemeVariant::Dark:
        return "Dark";
    }
    return "Unknown";
}

const std::string& ThemeValues::at(ThemeVariant variant) const {
    return variant == ThemeVariant::Dark ? dark : light;
}

const std::string& ThemeValues::at(const std::string& theme) const {
    std::string key = to_lower(theme);
    if (key == "light") {
        return light;
    }
    if (key == "dark") {
        return dark;
    }
    throw std::invalid_argument("Unknown theme: " + theme);
}

bool is_literal_color(const std::string& value) {
    return !value.empty() && value[0] == '#';
}

std::vector<std::string> split_brush_name(const std::string& name) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (true) {
        size_t dot = name.find('.', start);
        if (dot == std::string::npos) {
            parts.push_back(name.substr(start));
            break;
        }
        parts.push_back(name.substr(start, dot - start));
        start = dot + 1;
    }
    return parts;
}

bool is_valid_brush_name(const std::string& name) {
    return split_brush_name(name).size() >= MIN_BRUSH_NAME_SEGMENTS;
}

std::string brush_property_name(const std::string& name) {
    return require_segments(name).back();
}

std::string brush_name_without_prefix(const std::string& name) {
    require_segments(name);
    const std::string prefix = BRUSH_PREFIX;
    if (name.compare(0, prefix.size(), prefix) == 0) {
        return name.substr(prefix.size());
    }
    return name;
}

std::vector<std::string> brush_container_parts(const std::string& name) {
    auto parts = require_segments(name);
    // Drop namespace + category in front and the leaf at the back
    return std::vector<std::string>(parts.begin() + 2, parts.end() - 1);
}

std::string brush_container_type_name(const std::string& name) {
    std::string joined;
    for (const auto& part : brush_container_parts(name)) {
        if (!joined.empty()) {
            joined += '.';
        }
        joined += part;
    }
    return joined;
}

void sort_brushes_by_name(std::vector<BrushRecord>& brushes) {
    std::stable_sort(brushes.begin(), brushes.end(),
                     [](const BrushRecord& a, const BrushRecord& b) { return a.name < b.name; });
}

std::vector<BrushRecord> without_ignored_brush(const std::vector<BrushRecord>& brushes) {
    std::vector<BrushRecord> filtered;
    filtered.reserve(brushes.size());
    std::copy_if(brushes.begin(), brushes.end(), std::back_inserter(filtered),
                 [](const BrushRecord& brush) { return brush.name != IGNORED_BRUSH_NAME; });
    return filtered;
}

} // namespace mdresgen
