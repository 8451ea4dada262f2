#include "form_engine.h"
#include "logger.h"

// Key dispatch for the form (no terminal access, so it runs the same under tests)

FormAction FormEngine::handle_key(FormState& state, const Key& key) const {
    if (state.empty()) {
        return key.type == Key::Type::Escape ? FormAction::Cancel : FormAction::Continue;
    }

    // Text tabs take printable characters (space included) and backspace before navigation
    if (state.is_text_input() && !state.on_confirm()) {
        if (key.type == Key::Type::Char) {
            state.handle_char(key.ch);
            return FormAction::Continue;
        }
        if (key.type == Key::Type::Backspace) {
            state.handle_backspace();
            return FormAction::Continue;
        }
    }

    switch (key.type) {
        case Key::Type::Escape:
            return FormAction::Cancel;

        case Key::Type::ArrowLeft:
            state.tab_left();
            return FormAction::Continue;

        case Key::Type::ArrowRight:
            state.tab_right();
            return FormAction::Continue;

        case Key::Type::ArrowUp:
        case Key::Type::BackTab:
            state.up();
            return FormAction::Continue;

        case Key::Type::ArrowDown:
            state.down();
            return FormAction::Continue;

        case Key::Type::Tab:
            if (state.is_text_input() && !state.on_confirm()) {
                advance_text_tab(state);
            } else {
                state.down();
            }
            return FormAction::Continue;

        case Key::Type::Char:
            if (key.ch != ' ') {
                return FormAction::Continue;
            }
            // Space activates like Enter outside text tabs
            /* fallthrough */
        case Key::Type::Enter: {
            if (state.on_confirm()) {
                // Not ready: stay put, the confirm line shows what is missing
                return state.ready() ? FormAction::Confirm : FormAction::Continue;
            }
            if (state.is_text_input()) {
                const FormSection& section = state.current_section();
                if (section.fields().size() > 1 && section.active_field() + 1 < section.fields().size()) {
                    state.down();
                } else {
                    advance_text_tab(state);
                }
                return FormAction::Continue;
            }
            if (state.is_manual()) {
                return FormAction::ManualEntry;
            }
            state.select_current();
            state.advance_tab();
            return FormAction::Continue;
        }

        case Key::Type::Backspace:
        case Key::Type::Unknown:
            return FormAction::Continue;
    }
    return FormAction::Continue;
}

bool FormEngine::advance_text_tab(FormState& state) const {
    if (!validator_.validate_current_tab(state)) {
        log_event("validation", state, state.error());
        return false;
    }
    state.advance_tab();
    return true;
}
