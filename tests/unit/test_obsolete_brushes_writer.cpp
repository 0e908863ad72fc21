// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file test_obsolete_brushes_writer.cpp
 * @brief Unit tests for obsolete brush aliases and the template splice
 */

#include "obsolete_brushes_writer.h"

#include "../test_fixtures.h"

#include <catch2/catch_test_macros.hpp>

using namespace mdresgen;

// ============================================================================
// Alias bindings
// ============================================================================

TEST_CASE("render_obsolete_bindings: aliases reference the canonical name", "[obsolete]") {
    std::vector<BrushRecord> brushes = {
        make_brush("NS.Brush.A", "#FF112233", {"AltA"}, {"OldA1", "OldA2"}),
        make_brush("NS.Brush.B", "NS.Brush.A"),
        make_brush("NS.Brush.C", "#FFFFFFFF", {}, {"OldC"}),
    };

    REQUIRE(render_obsolete_bindings(brushes) ==
            "  <colors:StaticResource x:Key=\"OldA1\" ResourceKey=\"NS.Brush.A\" />\n"
            "  <colors:StaticResource x:Key=\"OldA2\" ResourceKey=\"NS.Brush.A\" />\n"
            "  <colors:StaticResource x:Key=\"OldC\" ResourceKey=\"NS.Brush.C\" />\n");
}

TEST_CASE("render_obsolete_bindings: never uses raw values", "[obsolete]") {
    std::vector<BrushRecord> brushes = {make_brush("NS.Brush.A", "#FF112233", {}, {"OldA"})};

    std::string block = render_obsolete_bindings(brushes);
    REQUIRE(block.find("#FF112233") == std::string::npos);
    REQUIRE(block.find("SolidColorBrush") == std::string::npos);
}

TEST_CASE("render_obsolete_bindings: nothing to alias", "[obsolete]") {
    REQUIRE(render_obsolete_bindings({make_brush("NS.Brush.A")}).empty());
    REQUIRE(render_obsolete_bindings({}).empty());
}

// ============================================================================
// Template splice
// ============================================================================

TEST_CASE("splice_into_template: replaces only the marker line", "[obsolete][template]") {
    const std::string tmpl = "<ResourceDictionary>\n"
                             "  <!-- Hand-written entries -->\n"
                             "  <!-- INSERT HERE -->\n"
                             "  <SolidColorBrush x:Key=\"Manual\" Color=\"#FF000000\" />\n"
                             "</ResourceDictionary>\n";
    const std::string block = "  <colors:StaticResource x:Key=\"Old1\" ResourceKey=\"NS.Brush.A\" />\n"
                              "  <colors:StaticResource x:Key=\"Old2\" ResourceKey=\"NS.Brush.B\" />\n";

    REQUIRE(splice_into_template(tmpl, block) ==
            "<ResourceDictionary>\n"
            "  <!-- Hand-written entries -->\n"
            "  <colors:StaticResource x:Key=\"Old1\" ResourceKey=\"NS.Brush.A\" />\n"
            "  <colors:StaticResource x:Key=\"Old2\" ResourceKey=\"NS.Brush.B\" />\n"
            "  <SolidColorBrush x:Key=\"Manual\" Color=\"#FF000000\" />\n"
            "</ResourceDictionary>\n");
}

TEST_CASE("splice_into_template: first marker wins", "[obsolete][template]") {
    const std::string tmpl = "<!-- INSERT HERE -->\n"
                             "\t<!-- INSERT HERE -->\n";

    REQUIRE(splice_into_template(tmpl, "X\n") == "X\n\t<!-- INSERT HERE -->\n");
}

TEST_CASE("splice_into_template: marker edge cases", "[obsolete][template]") {
    SECTION("marker on last line without newline") {
        REQUIRE(splice_into_template("a\n    <!-- INSERT HERE -->", "X\n") == "a\nX\n");
    }

    SECTION("CRLF template keeps other line endings") {
        REQUIRE(splice_into_template("a\r\n  <!-- INSERT HERE -->\r\nb\r\n", "X\n") ==
                "a\r\nX\nb\r\n");
    }

    SECTION("marker must start the line content") {
        const std::string tmpl = "<a/> <!-- INSERT HERE -->\n";
        REQUIRE(splice_into_template(tmpl, "X\n") == tmpl);
    }

    SECTION("markup after the marker is not a marker line") {
        const std::string tmpl = "<R>\n  <!-- INSERT HERE --> <Keep x=\"1\"/>\n</R>\n";
        REQUIRE(splice_into_template(tmpl, "  <A/>\n") == tmpl);
    }

    SECTION("trailing whitespace after the marker still matches") {
        REQUIRE(splice_into_template("<R>\n  <!-- INSERT HERE -->  \t\n</R>\n", "  <A/>\n") ==
                "<R>\n  <A/>\n</R>\n");
    }

    SECTION("later exact marker wins over an earlier decorated one") {
        const std::string tmpl = "  <!-- INSERT HERE --> <Keep/>\n  <!-- INSERT HERE -->\n</R>\n";
        REQUIRE(splice_into_template(tmpl, "X\n") == "  <!-- INSERT HERE --> <Keep/>\nX\n</R>\n");
    }

    SECTION("no marker leaves template unchanged") {
        const std::string tmpl = "<ResourceDictionary>\n</ResourceDictionary>\n";
        REQUIRE(splice_into_template(tmpl, "X\n") == tmpl);
    }

    SECTION("empty block leaves template unchanged") {
        REQUIRE(splice_into_template(OBSOLETE_TEMPLATE, "") == OBSOLETE_TEMPLATE);
    }
}

TEST_CASE("render_obsolete_dictionary: aliases spliced into template", "[obsolete][template]") {
    std::vector<BrushRecord> brushes = {
        make_brush("NS.Brush.A", "#1", {}, {"OldA"}),
        make_brush("NS.Brush.B", "#2", {}, {"OldB"}),
    };

    std::string doc = render_obsolete_dictionary(brushes, OBSOLETE_TEMPLATE);

    REQUIRE(doc.find("<!-- INSERT HERE -->") == std::string::npos);
    REQUIRE(doc.find("  <colors:StaticResource x:Key=\"OldA\" ResourceKey=\"NS.Brush.A\" />\n"
                     "  <colors:StaticResource x:Key=\"OldB\" ResourceKey=\"NS.Brush.B\" />\n"
                     "</ResourceDictionary>\n") != std::string::npos);
}
