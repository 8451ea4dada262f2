#ifndef FORM_H
#define FORM_H

#include <string>
#include <vector>
#include <map>
#include <cstdint>

// Tabbed form model: each tab ("section") is either a selectable option list
// or one or more text fields. Focus is (tab, item) plus the confirm sentinel
// that sits after the last item of every tab.

struct TextField {
    std::string label;
    std::string buffer;
    bool digits_only;

    TextField() : digits_only(false) {}
    TextField(const std::string& field_label, bool digits)
        : label(field_label)
        , digits_only(digits) {}

    bool accepts(char c) const;
};

struct FormOption {
    enum class Kind {
        Choice, // carries a fixed value
        Manual, // opens the line prompt
        Skip    // clears the tab's value
    };

    std::string label;
    Kind kind;
    std::string value; // Choice only

    FormOption() : kind(Kind::Skip) {}
    FormOption(const std::string& option_label, Kind option_kind, const std::string& option_value = "")
        : label(option_label)
        , kind(option_kind)
        , value(option_value) {}
};

// Resolved answers keyed by tab label; tabs without a value are absent
typedef std::map<std::string, std::string> FormValues;

class FormSection {
public:
    enum class ContentType {
        Selection,
        TextInput
    };

    static FormSection selection(const std::string& label, bool required);
    static FormSection text(const std::string& label, bool required, const std::vector<TextField>& fields);

    // Builders (Selection only, ignored for TextInput)
    FormSection& choice(const std::string& label, const std::string& value);
    FormSection& choice_front(const std::string& label, const std::string& value);
    FormSection& manual(const std::string& label = "Enter manually...");
    FormSection& skip(const std::string& label = "None");
    FormSection& with_default(size_t index);

    const std::string& label() const { return label_; }
    bool required() const { return required_; }
    ContentType type() const { return type_; }
    bool is_selection() const { return type_ == ContentType::Selection; }
    bool is_text_input() const { return type_ == ContentType::TextInput; }

    // Options for a Selection, fields for a TextInput
    size_t item_count() const;

    // Computed on demand, never cached
    bool value(std::string& out) const;
    bool has_value() const;

    // Trimmed buffer of one field; false if empty or not a text tab
    bool text_field_value(size_t index, std::string& out) const;

    // Selection content
    const std::vector<FormOption>& options() const { return options_; }
    bool has_selection() const { return has_selected_; }
    size_t selected() const { return selected_; }
    bool has_manual_value() const { return has_manual_; }
    const std::string& manual_value() const { return manual_value_; }

    // TextInput content
    const std::vector<TextField>& fields() const { return fields_; }
    size_t active_field() const { return active_field_; }

private:
    friend class FormState;

    FormSection(const std::string& label, bool required, ContentType type);

    std::string label_;
    bool required_;
    ContentType type_;

    std::vector<FormOption> options_;
    bool has_selected_;
    size_t selected_;
    bool has_manual_;
    std::string manual_value_;

    std::vector<TextField> fields_;
    size_t active_field_;
};

class FormState {
public:
    FormState(const std::vector<FormSection>& sections,
              const std::vector<std::string>& existing_names,
              const std::vector<uint16_t>& reserved_ports);

    // Navigation
    void tab_left();
    void tab_right();
    void up();
    void down();
    void advance_tab();

    // Selection tabs
    void select_current();
    bool is_manual() const;
    void set_manual(const std::string& value);

    // Text tabs
    bool is_text_input() const;
    void handle_char(char c);
    void handle_backspace();

    // Every required tab has a value
    bool ready() const;
    std::vector<std::string> missing_required() const;

    // Shown on the confirm affordance while the form is not ready; empty when ready
    std::string confirm_hint() const;

    FormValues values() const;

    const std::vector<FormSection>& sections() const { return sections_; }
    const FormSection& current_section() const { return sections_[tab_]; }
    size_t tab() const { return tab_; }
    size_t item() const { return item_; }
    bool on_confirm() const { return on_confirm_; }
    bool empty() const { return sections_.empty(); }

    const std::vector<std::string>& existing_names() const { return existing_names_; }
    const std::vector<uint16_t>& reserved_ports() const { return reserved_ports_; }

    bool has_error() const { return !error_.empty(); }
    const std::string& error() const { return error_; }
    void set_error(const std::string& error) { error_ = error; }
    void clear_error() { error_.clear(); }

private:
    std::vector<FormSection> sections_;
    size_t tab_;
    size_t item_;
    bool on_confirm_;
    const std::vector<std::string> existing_names_;
    const std::vector<uint16_t> reserved_ports_;
    std::string error_;

    size_t restore_cursor() const;
    void sync_active_field();
};

#endif // FORM_H
