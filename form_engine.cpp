#include "form_engine.h"
#include "terminal.h"
#include "signals.h"
#include "logger.h"
#include "utils.h"
#include <cerrno>
#include <cstring>
#include <ctime>

const char* outcome_name(FormOutcome outcome) {
    switch (outcome) {
        case FormOutcome::Confirmed: return "confirmed";
        case FormOutcome::Cancelled: return "cancelled";
        case FormOutcome::Interrupted: return "interrupted";
        case FormOutcome::Failed: return "failed";
    }
    return "failed";
}

FormEngine::FormEngine(const std::string& title, const Config& config)
    : renderer_(title, config.color)
    , validator_()
    , tty_device_(config.tty_device)
    , poll_timeout_ms_(static_cast<int>(config.poll_timeout_ms))
    , redraw_interval_ms_(static_cast<int>(config.redraw_interval_ms))
    , escape_timeout_ms_(static_cast<int>(config.escape_timeout_ms))
    , last_draw_()
    , rows_(0)
    , cols_(0) {
}

FormOutcome FormEngine::run(FormState& state, FormValues& values) {
    last_error_.clear();
    if (state.empty()) {
        last_error_ = "form has no tabs";
        return FormOutcome::Failed;
    }

    TerminalSession session;
    if (!session.open(tty_device_)) {
        last_error_ = session.last_error();
        log_event("terminal_error", state, last_error_);
        return FormOutcome::Failed;
    }

    signals::clear_flags();
    SignalBridge signal_bridge;
    if (!signal_bridge.installed()) {
        Logger::instance().log(LogLevel::WARN, "Signal handlers not installed, resize is picked up on periodic redraw only");
    }

    // Guards unwind in reverse order: screen first, then raw mode, then the descriptor
    RawModeGuard raw_mode(session);
    if (!raw_mode.active()) {
        last_error_ = "failed to enter raw mode: " + session.last_error();
        log_event("terminal_error", state, last_error_);
        return FormOutcome::Failed;
    }
    ScreenGuard screen(session);

    FdByteSource source(session.fd());
    KeyDecoder decoder(source, escape_timeout_ms_);

    log_event("start", state, "");
    if (!draw(session, state)) {
        return FormOutcome::Failed;
    }

    while (true) {
        if (signals::termination_requested()) {
            log_event("interrupted", state, "");
            return FormOutcome::Interrupted;
        }

        int ready = session.wait_readable(poll_timeout_ms_);
        if (ready < 0) {
            if (errno != EINTR) {
                last_error_ = std::string("poll failed: ") + std::strerror(errno);
                log_event("terminal_error", state, last_error_);
                return FormOutcome::Failed;
            }
            ready = 0;
        }

        bool resized = signals::consume_resize();
        if (ready == 0 || resized) {
            // Timeout, signal wakeup or resize: periodic redraw keeps the frame
            // in step with the window even if SIGWINCH was missed
            if (!redraw_if_due(session, state)) {
                return FormOutcome::Failed;
            }
            if (ready == 0) {
                continue;
            }
        }

        Key key;
        ReadStatus status = decoder.read_key(key);
        switch (status) {
            case ReadStatus::Ok:
                break;
            case ReadStatus::WouldBlock:
                // Spurious wakeup
                if (!redraw_if_due(session, state)) {
                    return FormOutcome::Failed;
                }
                continue;
            case ReadStatus::Eof:
                last_error_ = "terminal closed";
                log_event("terminal_error", state, last_error_);
                return FormOutcome::Failed;
            case ReadStatus::Error:
                last_error_ = std::string("failed to read from terminal: ") + std::strerror(errno);
                log_event("terminal_error", state, last_error_);
                return FormOutcome::Failed;
        }

        Logger::instance().log(LogLevel::DEBUG, "Key " + key_name(key));

        FormAction action = handle_key(state, key);
        switch (action) {
            case FormAction::Continue:
                break;
            case FormAction::Confirm:
                values = state.values();
                log_event("confirm", state, std::to_string(values.size()) + " values");
                return FormOutcome::Confirmed;
            case FormAction::Cancel:
                log_event("cancel", state, "");
                return FormOutcome::Cancelled;
            case FormAction::ManualEntry:
                if (!prompt_manual(session, state)) {
                    log_event("interrupted", state, "during manual entry");
                    return FormOutcome::Interrupted;
                }
                break;
        }

        if (!draw(session, state)) {
            return FormOutcome::Failed;
        }
    }
}

bool FormEngine::draw(TerminalSession& session, const FormState& state) {
    int rows = 0;
    int cols = 0;
    session.get_size(rows, cols);
    if (rows != rows_ || cols != cols_) {
        if (rows_ != 0) {
            log_event("resize", state, "");
        }
        rows_ = rows;
        cols_ = cols;
    }

    last_draw_ = std::chrono::steady_clock::now();
    if (!session.write_all(renderer_.render(state, rows, cols))) {
        last_error_ = session.last_error();
        log_event("terminal_error", state, last_error_);
        return false;
    }
    return true;
}

bool FormEngine::redraw_if_due(TerminalSession& session, const FormState& state) {
    std::chrono::steady_clock::duration since = std::chrono::steady_clock::now() - last_draw_;
    if (since < std::chrono::milliseconds(redraw_interval_ms_)) {
        return true;
    }
    return draw(session, state);
}

bool FormEngine::prompt_manual(TerminalSession& session, FormState& state) {
    const std::string label = state.current_section().label();
    std::string input;
    bool ok = false;
    {
        CookedModeScope cooked(session);
        ok = session.read_line("\n  " + label + ": ", input);
    }

    if (!ok) {
        if (signals::termination_requested()) {
            return false;
        }
        Logger::instance().log(LogLevel::DEBUG, "Manual entry for " + label + " ended without input");
        input.clear();
    }

    std::string value = utils::trim(input);
    log_event("manual", state, value.empty() ? "empty" : value);
    apply_manual_entry(state, value);
    return true;
}

void FormEngine::apply_manual_entry(FormState& state, const std::string& input) {
    std::string value = utils::trim(input);
    if (!value.empty()) {
        state.set_manual(value);
    }
    state.advance_tab();
}

void FormEngine::log_event(const std::string& event, const FormState& state, const std::string& detail) const {
    FormEventLog entry;
    entry.timestamp = static_cast<uint64_t>(std::time(nullptr));
    entry.event = event;
    if (!state.empty()) {
        entry.tab = state.on_confirm() ? "confirm" : state.current_section().label();
    }
    entry.detail = detail;
    entry.rows = rows_;
    entry.cols = cols_;
    Logger::instance().log_event(entry);
}
