// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "obsolete_brushes_writer.h"

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <regex>

namespace mdresgen {

std::string render_obsolete_bindings(const std::vector<BrushRecord>& brushes) {
    std::string block;
    size_t aliases = 0;
    for (const auto& brush : brushes) {
        for (const auto& obsolete_key : brush.obsolete_keys) {
            // Never a literal: the alias resolves through the canonical brush key
            block += fmt::format("  <colors:StaticResource x:Key=\"{}\" ResourceKey=\"{}\" />\n",
                                 obsolete_key, brush.name);
            ++aliases;
        }
    }
    spdlog::debug("[ObsoleteBrushes] {} aliases from {} brushes", aliases, brushes.size());
    return block;
}

std::string splice_into_template(const std::string& template_text, const std::string& block) {
    if (block.empty()) {
        return template_text;
    }

    const std::regex marker_regex(INSERT_MARKER_PATTERN);

    size_t pos = 0;
    while (pos < template_text.size()) {
        size_t eol = template_text.find('\n', pos);
        size_t content_end = (eol == std::string::npos) ? template_text.size() : eol;
        size_t line_end = (eol == std::string::npos) ? template_text.size() : eol + 1;

        std::string line = template_text.substr(pos, content_end - pos);
        if (std::regex_match(line, marker_regex)) {
            spdlog::trace("[ObsoleteBrushes] Insert marker found at offset {}", pos);
            return template_text.substr(0, pos) + block + template_text.substr(line_end);
        }
        pos = line_end;
    }

    spdlog::warn("[ObsoleteBrushes] Template has no '<!-- INSERT HERE -->' line, left unchanged");
    return template_text;
}

std::string render_obsolete_dictionary(const std::vector<BrushRecord>& brushes,
                                       const std::string& template_text) {
    return splice_into_template(template_text, render_obsolete_bindings(brushes));
}

} // namespace mdresgen
