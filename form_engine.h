#ifndef FORM_ENGINE_H
#define FORM_ENGINE_H

#include <string>
#include <chrono>
#include "config.h"
#include "form.h"
#include "keys.h"
#include "renderer.h"
#include "validator.h"

class TerminalSession;

// What the loop has to do after a key was applied to the form
enum class FormAction {
    Continue,
    Confirm,
    Cancel,
    ManualEntry // focused option is "enter manually": run the line prompt
};

enum class FormOutcome {
    Confirmed,
    Cancelled,
    Interrupted, // SIGINT/SIGTERM/SIGHUP while the form was up
    Failed       // terminal unavailable or lost; see last_error()
};

const char* outcome_name(FormOutcome outcome);

// Single-threaded form loop on the controlling terminal.
// Terminal mode, screen buffer and signal handlers are owned by guards inside
// run(), so every exit path leaves the terminal as it was found.
class FormEngine {
public:
    FormEngine(const std::string& title, const Config& config);

    void set_summary_builder(const SummaryBuilder& builder) { renderer_.set_summary_builder(builder); }

    // Run until confirm, cancel, a termination signal or a terminal failure.
    // values is filled only for FormOutcome::Confirmed.
    FormOutcome run(FormState& state, FormValues& values);

    // Apply one key to the form. Validation runs when leaving a text tab.
    FormAction handle_key(FormState& state, const Key& key) const;

    // Result of the manual prompt: blank input keeps the tab's previous value,
    // focus moves on either way
    static void apply_manual_entry(FormState& state, const std::string& input);

    const FormRenderer& renderer() const { return renderer_; }
    const std::string& last_error() const { return last_error_; }

private:
    FormRenderer renderer_;
    FormValidator validator_;
    std::string tty_device_;
    int poll_timeout_ms_;
    int redraw_interval_ms_;
    int escape_timeout_ms_;
    std::string last_error_;

    std::chrono::steady_clock::time_point last_draw_;
    int rows_;
    int cols_;

    bool draw(TerminalSession& session, const FormState& state);
    // Draws only when redraw_interval has passed since the last frame
    bool redraw_if_due(TerminalSession& session, const FormState& state);
    bool prompt_manual(TerminalSession& session, FormState& state);
    bool advance_text_tab(FormState& state) const;

    void log_event(const std::string& event, const FormState& state, const std::string& detail) const;
};

#endif // FORM_ENGINE_H
