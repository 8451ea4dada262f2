#include "form.h"
#include "utils.h"
#include <cctype>

bool TextField::accepts(char c) const {
    if (digits_only) {
        return std::isdigit(static_cast<unsigned char>(c)) != 0;
    }
    return c >= ' ' && c <= '~';
}

FormSection::FormSection(const std::string& label, bool required, ContentType type)
    : label_(label)
    , required_(required)
    , type_(type)
    , has_selected_(false)
    , selected_(0)
    , has_manual_(false)
    , active_field_(0) {
}

FormSection FormSection::selection(const std::string& label, bool required) {
    return FormSection(label, required, ContentType::Selection);
}

FormSection FormSection::text(const std::string& label, bool required, const std::vector<TextField>& fields) {
    FormSection section(label, required, ContentType::TextInput);
    section.fields_ = fields;
    return section;
}

FormSection& FormSection::choice(const std::string& label, const std::string& value) {
    if (type_ == ContentType::Selection) {
        options_.push_back(FormOption(label, FormOption::Kind::Choice, value));
    }
    return *this;
}

FormSection& FormSection::choice_front(const std::string& label, const std::string& value) {
    if (type_ == ContentType::Selection) {
        options_.insert(options_.begin(), FormOption(label, FormOption::Kind::Choice, value));
        if (has_selected_) {
            selected_++;
        }
    }
    return *this;
}

FormSection& FormSection::manual(const std::string& label) {
    if (type_ == ContentType::Selection) {
        options_.push_back(FormOption(label, FormOption::Kind::Manual));
    }
    return *this;
}

FormSection& FormSection::skip(const std::string& label) {
    if (type_ == ContentType::Selection) {
        options_.push_back(FormOption(label, FormOption::Kind::Skip));
    }
    return *this;
}

FormSection& FormSection::with_default(size_t index) {
    if (type_ == ContentType::Selection && index < options_.size() &&
        options_[index].kind == FormOption::Kind::Choice) {
        has_selected_ = true;
        selected_ = index;
    }
    return *this;
}

size_t FormSection::item_count() const {
    switch (type_) {
        case ContentType::Selection: return options_.size();
        case ContentType::TextInput: return fields_.size();
    }
    return 0;
}

bool FormSection::value(std::string& out) const {
    switch (type_) {
        case ContentType::Selection: {
            if (has_manual_) {
                out = manual_value_;
                return true;
            }
            if (!has_selected_ || selected_ >= options_.size()) {
                return false;
            }
            const FormOption& option = options_[selected_];
            if (option.kind == FormOption::Kind::Choice) {
                out = option.value;
                return true;
            }
            return false;
        }
        case ContentType::TextInput: {
            if (fields_.empty()) {
                return false;
            }
            if (fields_.size() == 1) {
                std::string val = utils::trim(fields_[0].buffer);
                if (val.empty()) {
                    return false;
                }
                out = val;
                return true;
            }
            // Composite values are all-or-nothing
            std::vector<std::string> parts;
            for (const auto& field : fields_) {
                std::string val = utils::trim(field.buffer);
                if (val.empty()) {
                    return false;
                }
                parts.push_back(val);
            }
            out = utils::join(parts, ":");
            return true;
        }
    }
    return false;
}

bool FormSection::has_value() const {
    std::string ignored;
    return value(ignored);
}

bool FormSection::text_field_value(size_t index, std::string& out) const {
    if (type_ != ContentType::TextInput || index >= fields_.size()) {
        return false;
    }
    std::string val = utils::trim(fields_[index].buffer);
    if (val.empty()) {
        return false;
    }
    out = val;
    return true;
}

FormState::FormState(const std::vector<FormSection>& sections,
                     const std::vector<std::string>& existing_names,
                     const std::vector<uint16_t>& reserved_ports)
    : sections_(sections)
    , tab_(0)
    , item_(0)
    , on_confirm_(false)
    , existing_names_(existing_names)
    , reserved_ports_(reserved_ports) {
    if (!sections_.empty()) {
        item_ = restore_cursor();
    }
}

size_t FormState::restore_cursor() const {
    const FormSection& section = sections_[tab_];
    switch (section.type_) {
        case FormSection::ContentType::Selection:
            return section.has_selected_ ? section.selected_ : 0;
        case FormSection::ContentType::TextInput:
            return section.active_field_;
    }
    return 0;
}

void FormState::sync_active_field() {
    FormSection& section = sections_[tab_];
    if (section.type_ == FormSection::ContentType::TextInput) {
        section.active_field_ = item_;
    }
}

void FormState::tab_left() {
    if (sections_.empty() || on_confirm_ || tab_ == 0) {
        return;
    }
    error_.clear();
    tab_--;
    item_ = restore_cursor();
}

void FormState::tab_right() {
    if (sections_.empty() || on_confirm_ || tab_ + 1 >= sections_.size()) {
        return;
    }
    error_.clear();
    tab_++;
    item_ = restore_cursor();
}

void FormState::up() {
    if (sections_.empty()) {
        return;
    }
    if (on_confirm_) {
        on_confirm_ = false;
        size_t count = sections_[tab_].item_count();
        item_ = count > 0 ? count - 1 : 0;
        sync_active_field();
    } else if (item_ > 0) {
        item_--;
        sync_active_field();
    }
}

void FormState::down() {
    if (sections_.empty() || on_confirm_) {
        return;
    }
    size_t count = sections_[tab_].item_count();
    if (item_ + 1 < count) {
        item_++;
        sync_active_field();
    } else {
        on_confirm_ = true;
    }
}

void FormState::advance_tab() {
    if (sections_.empty()) {
        return;
    }
    on_confirm_ = false;
    error_.clear();
    if (tab_ + 1 < sections_.size()) {
        tab_++;
        item_ = restore_cursor();
    } else {
        on_confirm_ = true;
    }
}

void FormState::select_current() {
    if (sections_.empty() || on_confirm_) {
        return;
    }
    FormSection& section = sections_[tab_];
    if (section.type_ != FormSection::ContentType::Selection || item_ >= section.options_.size()) {
        return;
    }

    switch (section.options_[item_].kind) {
        case FormOption::Kind::Choice:
            section.has_selected_ = true;
            section.selected_ = item_;
            section.has_manual_ = false;
            section.manual_value_.clear();
            break;
        case FormOption::Kind::Skip:
            section.has_selected_ = false;
            section.selected_ = 0;
            section.has_manual_ = false;
            section.manual_value_.clear();
            break;
        case FormOption::Kind::Manual:
            // Handled by the manual entry prompt
            break;
    }
}

bool FormState::is_manual() const {
    if (sections_.empty() || on_confirm_) {
        return false;
    }
    const FormSection& section = sections_[tab_];
    return section.type_ == FormSection::ContentType::Selection &&
           item_ < section.options_.size() &&
           section.options_[item_].kind == FormOption::Kind::Manual;
}

void FormState::set_manual(const std::string& value) {
    if (sections_.empty()) {
        return;
    }
    FormSection& section = sections_[tab_];
    if (section.type_ != FormSection::ContentType::Selection) {
        return;
    }
    section.has_manual_ = true;
    section.manual_value_ = value;
    section.has_selected_ = true;
    section.selected_ = item_;
}

bool FormState::is_text_input() const {
    return !sections_.empty() && sections_[tab_].type_ == FormSection::ContentType::TextInput;
}

void FormState::handle_char(char c) {
    if (!is_text_input() || on_confirm_) {
        return;
    }
    FormSection& section = sections_[tab_];
    if (section.active_field_ >= section.fields_.size()) {
        return;
    }
    TextField& field = section.fields_[section.active_field_];
    if (field.accepts(c)) {
        field.buffer.push_back(c);
        error_.clear();
    }
}

void FormState::handle_backspace() {
    if (!is_text_input() || on_confirm_) {
        return;
    }
    FormSection& section = sections_[tab_];
    if (section.active_field_ >= section.fields_.size()) {
        return;
    }
    TextField& field = section.fields_[section.active_field_];
    if (!field.buffer.empty()) {
        field.buffer.pop_back();
    }
    error_.clear();
}

bool FormState::ready() const {
    for (const auto& section : sections_) {
        if (section.required() && !section.has_value()) {
            return false;
        }
    }
    return true;
}

std::vector<std::string> FormState::missing_required() const {
    std::vector<std::string> missing;
    for (const auto& section : sections_) {
        if (section.required() && !section.has_value()) {
            missing.push_back(section.label());
        }
    }
    return missing;
}

std::string FormState::confirm_hint() const {
    std::vector<std::string> missing = missing_required();
    if (missing.empty()) {
        return "";
    }
    return "Fill required tabs: " + utils::join(missing, ", ");
}

FormValues FormState::values() const {
    FormValues result;
    for (const auto& section : sections_) {
        std::string val;
        if (section.value(val)) {
            result[section.label()] = val;
        }
    }
    return result;
}
