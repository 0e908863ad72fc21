// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

/**
 * @file test_fixtures.h
 * @brief Reusable test fixtures and brush builders for mdresgen unit tests
 *
 * Available Fixtures:
 * - TempRepoFixture: isolated temp directory laid out as a repository
 *   (with a .git directory) plus helpers to drop input files into it
 *
 * Usage:
 * @code
 * TEST_CASE_METHOD(TempRepoFixture, "Test name", "[tags]") {
 *     write_file("ThemeColors.json", "[...]");
 *     auto config = make_config();
 *     REQUIRE(mdresgen::Generator(config).run());
 * }
 * @endcode
 */

#include "brush.h"
#include "generator.h"
#include "generator_config.h"

#include <spdlog/sinks/null_sink.h>
#include <spdlog/spdlog.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

/// Brush with the same light and dark value
inline mdresgen::BrushRecord make_brush(const std::string& name, const std::string& value = "#FF000000",
                                        std::vector<std::string> alternates = {},
                                        std::vector<std::string> obsoletes = {}) {
    mdresgen::BrushRecord brush;
    brush.name = name;
    brush.theme_values.light = value;
    brush.theme_values.dark = value;
    brush.alternate_keys = std::move(alternates);
    brush.obsolete_keys = std::move(obsoletes);
    return brush;
}

// ============================================================================
// TempRepoFixture - isolated repository on disk
// ============================================================================

class TempRepoFixture {
  public:
    TempRepoFixture() {
        // Keep generator logs out of the test output
        spdlog::set_default_logger(std::make_shared<spdlog::logger>(
            "mdresgen_test", std::make_shared<spdlog::sinks::null_sink_mt>()));

        root_ = fs::temp_directory_path() /
                ("mdresgen_test_" +
                 std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));
        fs::create_directories(root_ / ".git");
        fs::create_directories(root_ / "mdresgen");
    }

    ~TempRepoFixture() {
        std::error_code ec;
        fs::remove_all(root_, ec);
    }

    /// Write a file relative to the generator's working directory (root/mdresgen)
    fs::path write_file(const std::string& relative, const std::string& content) {
        fs::path path = tool_dir() / relative;
        std::ofstream out(path, std::ios::binary);
        out << content;
        return path;
    }

    std::string read_output(const fs::path& path) const {
        std::ifstream in(path, std::ios::binary);
        std::stringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }

    /// Config pointing at files under tool_dir() and writing under root()
    mdresgen::GeneratorConfig make_config() const {
        mdresgen::GeneratorConfig config;
        config.input_path = (tool_dir() / "ThemeColors.json").string();
        config.template_path = (tool_dir() / "MaterialDesignTheme.ObsoleteBrushes.xaml").string();
        config.repo_root = root_.string();
        return config;
    }

    const fs::path& root() const {
        return root_;
    }

    fs::path tool_dir() const {
        return root_ / "mdresgen";
    }

  private:
    fs::path root_;
};

/// Minimal obsolete-brush template with a single marker line
inline const char* const OBSOLETE_TEMPLATE =
    "<ResourceDictionary xmlns=\"http://schemas.microsoft.com/winfx/2006/xaml/presentation\"\n"
    "                    xmlns:x=\"http://schemas.microsoft.com/winfx/2006/xaml\"\n"
    "                    xmlns:colors=\"clr-namespace:MaterialDesignColors;assembly=MaterialDesignColors\">\n"
    "  <!-- INSERT HERE -->\n"
    "</ResourceDictionary>\n";
