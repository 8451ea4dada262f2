#include "renderer.h"
#include "terminal.h"
#include "utils.h"
#include <algorithm>
#include <sstream>

constexpr int FormRenderer::MIN_ROWS;
constexpr int FormRenderer::MIN_COLS;
constexpr int FormRenderer::CHROME_ROWS;

static const char* const HINTS = "\xE2\x86\x90\xE2\x86\x92 tab  \xE2\x86\x91\xE2\x86\x93 choose  \xE2\x8F\x8E select  esc cancel";
static const char* const RULE = "\xE2\x94\x80";        // ─
static const char* const DOTTED_RULE = "\xE2\x94\x84"; // ┄
static const char* const CHECK = "\xE2\x9C\x93";       // ✓
static const char* const POINTER = "\xE2\x80\xBA";     // ›
static const char* const DOT = "\xC2\xB7";             // ·
static const char* const UP_ARROW = "\xE2\x86\x91";
static const char* const DOWN_ARROW = "\xE2\x86\x93";

FormRenderer::FormRenderer(const std::string& title, bool use_color)
    : title_(title)
    , style_(use_color)
    , summary_builder_(&FormRenderer::default_summary) {
}

std::pair<size_t, size_t> FormRenderer::visible_range(size_t total, size_t cursor, size_t max_height) {
    if (total <= max_height) {
        return std::make_pair(static_cast<size_t>(0), total);
    }
    // Reserve 2 lines for scroll indicators
    size_t window = max_height > 2 ? max_height - 2 : 0;
    if (window == 0) {
        return std::make_pair(static_cast<size_t>(0), static_cast<size_t>(0));
    }
    size_t half = window / 2;
    size_t start = cursor > half ? cursor - half : 0;
    if (start + window > total) {
        start = total - window;
    }
    return std::make_pair(start, start + window);
}

size_t FormRenderer::visible_width(const std::string& line) {
    size_t width = 0;
    size_t i = 0;
    while (i < line.size()) {
        unsigned char c = static_cast<unsigned char>(line[i]);
        if (c == 0x1b) {
            // Skip CSI: ESC [ params final
            i++;
            if (i < line.size() && line[i] == '[') {
                i++;
                while (i < line.size() && (static_cast<unsigned char>(line[i]) < 0x40 ||
                                           static_cast<unsigned char>(line[i]) > 0x7e)) {
                    i++;
                }
            }
            i++;
            continue;
        }
        if ((c & 0xC0) != 0x80) {
            width++; // count lead bytes only
        }
        i++;
    }
    return width;
}

std::string FormRenderer::truncate_visible(const std::string& line, int cols) {
    if (cols <= 0) {
        return "";
    }
    std::string out;
    out.reserve(line.size());
    size_t width = 0;
    size_t i = 0;
    while (i < line.size()) {
        unsigned char c = static_cast<unsigned char>(line[i]);
        if (c == 0x1b) {
            size_t start = i;
            i++;
            if (i < line.size() && line[i] == '[') {
                i++;
                while (i < line.size() && (static_cast<unsigned char>(line[i]) < 0x40 ||
                                           static_cast<unsigned char>(line[i]) > 0x7e)) {
                    i++;
                }
            }
            if (i < line.size()) {
                i++;
            }
            out.append(line, start, i - start);
            continue;
        }

        size_t len = 1;
        if (c >= 0xF0) len = 4;
        else if (c >= 0xE0) len = 3;
        else if (c >= 0xC0) len = 2;

        if (width >= static_cast<size_t>(cols)) {
            // Past the edge: keep scanning only for escape sequences so attributes still reset
            i += len;
            continue;
        }
        out.append(line, i, std::min(len, line.size() - i));
        width++;
        i += len;
    }
    return out;
}

std::string FormRenderer::default_summary(const FormState& state, const Style& style) {
    std::vector<std::string> parts;
    for (const auto& section : state.sections()) {
        std::string val;
        if (section.value(val)) {
            parts.push_back(val);
        } else if (section.required()) {
            parts.push_back(style.yellow("???"));
        }
    }
    return utils::join(parts, " " + style.dim(DOT) + " ");
}

std::string FormRenderer::tab_bar(const FormState& state) const {
    std::string bar = "  ";
    const std::vector<FormSection>& sections = state.sections();
    for (size_t si = 0; si < sections.size(); ++si) {
        const FormSection& section = sections[si];
        if (si > 0) {
            bar += "  ";
        }
        bool is_active = !state.on_confirm() && state.tab() == si;
        if (is_active) {
            bar += style_.bold_cyan("[ " + section.label() + " ]");
        } else if (section.has_value()) {
            bar += style_.green(std::string(CHECK) + " " + section.label());
        } else if (section.required()) {
            bar += style_.yellow(std::string(DOT) + " " + section.label());
        } else {
            bar += style_.dim(section.label());
        }
    }
    return bar;
}

void FormRenderer::selection_lines(const FormState& state, const FormSection& section, size_t max_content,
                                   std::vector<std::string>& out) const {
    const std::vector<FormOption>& options = section.options();
    size_t total = options.size();
    size_t cursor = state.on_confirm() ? (total > 0 ? total - 1 : 0) : state.item();
    std::pair<size_t, size_t> range = visible_range(total, cursor, max_content);

    if (range.first > 0) {
        out.push_back("    " + style_.dim(std::string(UP_ARROW) + " " + std::to_string(range.first) + " more"));
    }

    for (size_t oi = range.first; oi < range.second; ++oi) {
        const FormOption& opt = options[oi];
        bool at_cursor = !state.on_confirm() && state.item() == oi;
        bool is_selected = section.has_selection() && section.selected() == oi;

        std::string prefix;
        if (is_selected) {
            prefix = "    " + style_.green(CHECK) + " ";
        } else if (at_cursor) {
            prefix = "    " + style_.cyan(POINTER) + " ";
        } else {
            prefix = "      ";
        }

        std::string label = opt.label;
        if (is_selected && opt.kind == FormOption::Kind::Manual && section.has_manual_value()) {
            label += ": " + section.manual_value();
        }

        std::string styled;
        if (at_cursor && is_selected) {
            styled = style_.bold_green(label);
        } else if (at_cursor) {
            styled = style_.bold(label);
        } else if (is_selected) {
            styled = style_.green(label);
        } else if (opt.kind != FormOption::Kind::Choice) {
            styled = style_.dim(label);
        } else {
            styled = label;
        }
        out.push_back(prefix + styled);
    }

    if (range.second < total) {
        out.push_back("    " + style_.dim(std::string(DOWN_ARROW) + " " + std::to_string(total - range.second) + " more"));
    }
}

void FormRenderer::text_lines(const FormState& state, const FormSection& section, std::vector<std::string>& out) const {
    const std::vector<TextField>& fields = section.fields();
    size_t max_label = 0;
    for (const auto& field : fields) {
        max_label = std::max(max_label, field.label.size());
    }

    for (size_t fi = 0; fi < fields.size(); ++fi) {
        const TextField& field = fields[fi];
        bool is_active = !state.on_confirm() && fi == section.active_field();
        std::string pad(max_label - field.label.size(), ' ');

        if (is_active) {
            out.push_back("    " + style_.cyan(POINTER) + " " + pad + style_.bold_cyan(field.label) + ": " +
                          field.buffer + style_.dim("_"));
        } else {
            out.push_back("      " + pad + style_.dim(field.label) + ": " + style_.dim(field.buffer));
        }
    }
}

std::string FormRenderer::confirm_line(const FormState& state) const {
    if (state.on_confirm()) {
        if (state.ready()) {
            return "    " + style_.cyan(POINTER) + " " + style_.bold_green("[ Confirm ]");
        }
        return "    " + style_.cyan(POINTER) + " " + style_.yellow("[ " + state.confirm_hint() + " ]");
    }
    if (state.ready()) {
        return "      " + style_.green("[ Confirm ]");
    }
    return "      " + style_.dim("[ Confirm ]");
}

std::vector<std::string> FormRenderer::build_lines(const FormState& state, int rows, int cols) const {
    std::vector<std::string> out;
    if (state.empty()) {
        return out;
    }

    // Title
    out.push_back("  " + style_.bold(title_));
    out.push_back("");

    out.push_back(tab_bar(state));

    size_t rule_width = cols > 4 ? static_cast<size_t>(cols - 4) : 0;
    out.push_back("  " + style_.dim(utils::repeat(RULE, rule_width)));
    out.push_back("");

    // Content area gets whatever the chrome leaves over
    int error_lines = state.has_error() ? 2 : 0;
    int available = rows - CHROME_ROWS - error_lines;
    size_t max_content = available > 0 ? static_cast<size_t>(available) : 0;

    const FormSection& section = state.current_section();
    switch (section.type()) {
        case FormSection::ContentType::Selection:
            selection_lines(state, section, max_content, out);
            break;
        case FormSection::ContentType::TextInput:
            text_lines(state, section, out);
            break;
    }

    if (state.has_error()) {
        out.push_back("");
        out.push_back("    " + style_.red(state.error()));
    }

    out.push_back("");
    out.push_back(confirm_line(state));

    out.push_back("");
    out.push_back("  " + style_.dim(utils::repeat(DOTTED_RULE, rule_width)));
    out.push_back("  " + (summary_builder_ ? summary_builder_(state, style_) : default_summary(state, style_)));

    out.push_back("");
    out.push_back("  " + style_.dim(HINTS));

    return out;
}

std::string FormRenderer::compose(const std::vector<std::string>& lines, int rows, int cols) const {
    // One absolute position + line clear per row: immune to whatever scroll
    // region or cursor state a resize left behind
    std::string frame = terminal::RESET_SCROLL_REGION;
    for (int row = 1; row <= rows; ++row) {
        frame += terminal::move_to(row, 1);
        frame += terminal::CLEAR_LINE;
        size_t index = static_cast<size_t>(row - 1);
        if (index < lines.size()) {
            frame += truncate_visible(lines[index], cols);
            frame += terminal::RESET_ATTRIBUTES;
        }
    }
    return frame;
}

std::string FormRenderer::small_terminal_frame(int rows, int cols) const {
    std::string frame = terminal::RESET_SCROLL_REGION;
    for (int row = 1; row <= rows; ++row) {
        frame += terminal::move_to(row, 1);
        frame += terminal::CLEAR_LINE;
    }
    frame += terminal::move_to(1, 1);
    frame += truncate_visible("  " + style_.dim("Terminal too small, resize to continue"), cols);
    frame += terminal::RESET_ATTRIBUTES;
    return frame;
}

std::string FormRenderer::render(const FormState& state, int rows, int cols) const {
    if (too_small(rows, cols)) {
        return small_terminal_frame(rows, cols);
    }
    return compose(build_lines(state, rows, cols), rows, cols);
}
