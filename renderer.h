#ifndef RENDERER_H
#define RENDERER_H

#include <string>
#include <vector>
#include <functional>
#include <utility>
#include "form.h"

// Full-screen frame rendering for the form (ANSI escape codes, no curses)
// Layout, top to bottom: title, tab bar, rule, active tab content, error,
// confirm affordance, rule, summary, key hints.

// SGR styling that collapses to plain text when color is off
class Style {
public:
    explicit Style(bool enabled) : enabled_(enabled) {}

    std::string bold(const std::string& text) const { return wrap("1", text); }
    std::string dim(const std::string& text) const { return wrap("2", text); }
    std::string red(const std::string& text) const { return wrap("31", text); }
    std::string green(const std::string& text) const { return wrap("32", text); }
    std::string yellow(const std::string& text) const { return wrap("33", text); }
    std::string cyan(const std::string& text) const { return wrap("36", text); }
    std::string bold_green(const std::string& text) const { return wrap("1;32", text); }
    std::string bold_cyan(const std::string& text) const { return wrap("1;36", text); }

    bool enabled() const { return enabled_; }

private:
    bool enabled_;

    std::string wrap(const char* code, const std::string& text) const {
        if (!enabled_) {
            return text;
        }
        return std::string("\033[") + code + "m" + text + "\033[0m";
    }
};

// Builds the one-line cross-tab summary
typedef std::function<std::string(const FormState&, const Style&)> SummaryBuilder;

class FormRenderer {
public:
    FormRenderer(const std::string& title, bool use_color);

    void set_summary_builder(const SummaryBuilder& builder) { summary_builder_ = builder; }

    // Complete frame for the given size, ready to write to the terminal
    std::string render(const FormState& state, int rows, int cols) const;

    // Frame content before truncation and row addressing
    std::vector<std::string> build_lines(const FormState& state, int rows, int cols) const;

    const Style& style() const { return style_; }

    // Below this the frame is replaced by a resize message
    static constexpr int MIN_ROWS = 14;
    static constexpr int MIN_COLS = 20;

    // Rows used by everything except the tab content and the error block
    static constexpr int CHROME_ROWS = 12;

    static bool too_small(int rows, int cols) { return rows < MIN_ROWS || cols < MIN_COLS; }

    // Window [start, end) of a list of `total` items that keeps `cursor`
    // centered; two rows of `max_height` go to the "more" indicators once it scrolls.
    static std::pair<size_t, size_t> visible_range(size_t total, size_t cursor, size_t max_height);

    // Cut to `cols` visible columns; escape sequences are kept and cost nothing
    static std::string truncate_visible(const std::string& line, int cols);

    // Number of visible columns (UTF-8 code points outside escape sequences)
    static size_t visible_width(const std::string& line);

    // Default summary: every tab's value, "???" for required tabs still empty
    static std::string default_summary(const FormState& state, const Style& style);

private:
    std::string title_;
    Style style_;
    SummaryBuilder summary_builder_;

    std::string tab_bar(const FormState& state) const;
    void selection_lines(const FormState& state, const FormSection& section, size_t max_content,
                         std::vector<std::string>& out) const;
    void text_lines(const FormState& state, const FormSection& section, std::vector<std::string>& out) const;
    std::string confirm_line(const FormState& state) const;
    std::string small_terminal_frame(int rows, int cols) const;
    std::string compose(const std::vector<std::string>& lines, int rows, int cols) const;
};

#endif // RENDERER_H
