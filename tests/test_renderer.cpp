#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include "renderer.h"
#include "test_helpers.h"

using Catch::Matchers::ContainsSubstring;
using Catch::Matchers::StartsWith;

static FormSection numbered(size_t count) {
    FormSection section = FormSection::selection("Host", true);
    for (size_t i = 0; i < count; ++i) {
        section.choice("host" + std::to_string(i), "h" + std::to_string(i));
    }
    return section;
}

static bool has_line(const std::vector<std::string>& lines, const std::string& needle) {
    for (const auto& line : lines) {
        if (line.find(needle) != std::string::npos) {
            return true;
        }
    }
    return false;
}

// ============================================================================
// Viewport
// ============================================================================

TEST_CASE("visible range") {
    SECTION("short list is shown whole") {
        std::pair<size_t, size_t> range = FormRenderer::visible_range(5, 4, 10);
        CHECK(range.first == 0);
        CHECK(range.second == 5);
    }
    SECTION("window is centered on the cursor") {
        std::pair<size_t, size_t> range = FormRenderer::visible_range(50, 25, 12);
        CHECK(range.second - range.first == 10);
        CHECK(range.first == 20);
    }
    SECTION("clamped at the top") {
        std::pair<size_t, size_t> range = FormRenderer::visible_range(50, 1, 12);
        CHECK(range.first == 0);
        CHECK(range.second == 10);
    }
    SECTION("clamped at the bottom") {
        std::pair<size_t, size_t> range = FormRenderer::visible_range(50, 49, 12);
        CHECK(range.first == 40);
        CHECK(range.second == 50);
    }
    SECTION("no room at all") {
        std::pair<size_t, size_t> range = FormRenderer::visible_range(50, 10, 2);
        CHECK(range.first == range.second);
    }
}

TEST_CASE("visible width and truncation") {
    CHECK(FormRenderer::visible_width("abc") == 3);
    CHECK(FormRenderer::visible_width("\033[1;32mabc\033[0m") == 3);
    CHECK(FormRenderer::visible_width("\xE2\x9C\x93 ok") == 4);

    CHECK(FormRenderer::truncate_visible("abcdef", 3) == "abc");
    CHECK(FormRenderer::truncate_visible("abc", 10) == "abc");
    CHECK(FormRenderer::truncate_visible("abc", 0).empty());

    std::string styled = FormRenderer::truncate_visible("\033[2mabcdef\033[0m", 2);
    CHECK(styled == "\033[2mab\033[0m");
    CHECK(FormRenderer::truncate_visible("\xE2\x9C\x93\xE2\x9C\x93\xE2\x9C\x93", 2) == "\xE2\x9C\x93\xE2\x9C\x93");
}

// ============================================================================
// Frame content
// ============================================================================

TEST_CASE("frame layout") {
    std::vector<FormSection> sections;
    sections.push_back(FormSection::text("Name", true, one_field("Tunnel name")));
    FormSection color = FormSection::selection("Color", false);
    color.choice("Red", "red").with_default(0);
    sections.push_back(color);
    sections.push_back(numbered(3));
    FormState state(sections, std::vector<std::string>(), std::vector<uint16_t>());
    state.handle_char('d');
    state.handle_char('b');

    FormRenderer renderer("New tunnel", false);
    std::vector<std::string> lines = renderer.build_lines(state, 24, 80);

    REQUIRE(lines.size() >= 12);
    CHECK(lines[0] == "  New tunnel");
    CHECK(lines[1].empty());
    CHECK_THAT(lines[2], ContainsSubstring("[ Name ]"));
    CHECK_THAT(lines[2], ContainsSubstring("\xE2\x9C\x93 Color"));
    CHECK_THAT(lines[2], ContainsSubstring("\xC2\xB7 Host"));
    CHECK(FormRenderer::visible_width(lines[3]) == 78);
    CHECK(lines.back() == "  \xE2\x86\x90\xE2\x86\x92 tab  \xE2\x86\x91\xE2\x86\x93 choose  \xE2\x8F\x8E select  esc cancel");

    CHECK(has_line(lines, "Tunnel name: db_"));
    CHECK(has_line(lines, "[ Confirm ]"));
    // Summary: every value, ??? for required tabs that are still empty
    CHECK(has_line(lines, "db \xC2\xB7 red \xC2\xB7 ???"));
}

TEST_CASE("text labels are right-aligned") {
    std::vector<TextField> fields;
    fields.push_back(TextField("Local port", true));
    fields.push_back(TextField("Remote bind port", true));
    FormState state(std::vector<FormSection>(1, FormSection::text("Ports", true, fields)),
                    std::vector<std::string>(), std::vector<uint16_t>());

    FormRenderer renderer("t", false);
    std::vector<std::string> lines = renderer.build_lines(state, 24, 80);

    CHECK(has_line(lines, "\xE2\x80\xBA       Local port: _"));
    CHECK(has_line(lines, "      Remote bind port: "));
    CHECK(!has_line(lines, "Remote bind port: _"));
}

TEST_CASE("error line") {
    FormState state(std::vector<FormSection>(1, FormSection::text("Name", true, one_field("Tunnel name"))),
                    std::vector<std::string>(), std::vector<uint16_t>());
    FormRenderer renderer("t", false);
    size_t without = renderer.build_lines(state, 24, 80).size();

    state.set_error("Name cannot be empty");
    std::vector<std::string> lines = renderer.build_lines(state, 24, 80);
    CHECK(lines.size() == without + 2);
    CHECK(has_line(lines, "    Name cannot be empty"));
}

TEST_CASE("confirm affordance") {
    FormState state(std::vector<FormSection>(1, FormSection::text("Name", true, one_field("Tunnel name"))),
                    std::vector<std::string>(), std::vector<uint16_t>());
    FormRenderer renderer("t", false);

    state.down();
    REQUIRE(state.on_confirm());
    CHECK(has_line(renderer.build_lines(state, 24, 80), "[ Fill required tabs: Name ]"));

    state.up();
    state.handle_char('x');
    state.down();
    CHECK(has_line(renderer.build_lines(state, 24, 80), "\xE2\x80\xBA [ Confirm ]"));
}

TEST_CASE("long lists scroll with indicators") {
    FormState state(std::vector<FormSection>(1, numbered(40)), std::vector<std::string>(), std::vector<uint16_t>());
    for (int i = 0; i < 20; ++i) {
        state.down();
    }
    FormRenderer renderer("t", false);
    std::vector<std::string> lines = renderer.build_lines(state, 24, 80);

    // 24 rows leave 12 for content: 10 options plus the two indicators
    CHECK(lines.size() == 24);
    CHECK(has_line(lines, "\xE2\x86\x91 15 more"));
    CHECK(has_line(lines, "\xE2\x86\x93 15 more"));
    CHECK(has_line(lines, "\xE2\x80\xBA host20"));
    CHECK(!has_line(lines, "host14"));
    CHECK(!has_line(lines, "host25"));
}

TEST_CASE("lines never exceed the width") {
    FormState state(std::vector<FormSection>(1, numbered(3)), std::vector<std::string>(), std::vector<uint16_t>());
    FormRenderer renderer("A title that is much longer than the terminal is wide", true);
    std::string frame = renderer.render(state, 20, 30);

    CHECK_THAT(frame, StartsWith("\033[r\033[1;1H\033[2K"));
    CHECK_THAT(frame, ContainsSubstring("\033[20;1H\033[2K"));
    for (const auto& line : renderer.build_lines(state, 20, 30)) {
        CHECK(FormRenderer::visible_width(FormRenderer::truncate_visible(line, 30)) <= 30);
    }
}

TEST_CASE("small terminal shows only the resize message") {
    FormState state(std::vector<FormSection>(1, numbered(3)), std::vector<std::string>(), std::vector<uint16_t>());
    FormRenderer renderer("t", false);

    CHECK(FormRenderer::too_small(13, 80));
    CHECK(FormRenderer::too_small(24, 19));
    CHECK(!FormRenderer::too_small(14, 20));

    std::string frame = renderer.render(state, 10, 40);
    CHECK_THAT(frame, ContainsSubstring("resize to continue"));
    CHECK_THAT(frame, ContainsSubstring("\033[10;1H\033[2K"));
    CHECK_THAT(frame, !ContainsSubstring("host0"));
}

TEST_CASE("custom summary") {
    FormState state(std::vector<FormSection>(1, numbered(3)), std::vector<std::string>(), std::vector<uint16_t>());
    FormRenderer renderer("t", false);
    renderer.set_summary_builder([](const FormState& form, const Style&) {
        return "tabs=" + std::to_string(form.sections().size());
    });
    CHECK(has_line(renderer.build_lines(state, 24, 80), "  tabs=1"));
}

TEST_CASE("style collapses when disabled") {
    Style plain(false);
    Style color(true);
    CHECK(plain.bold("x") == "x");
    CHECK(color.red("x") == "\033[31mx\033[0m");
    CHECK(color.bold_cyan("x") == "\033[1;36mx\033[0m");
}
