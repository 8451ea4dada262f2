#include "validator.h"
#include "utils.h"
#include <algorithm>

FormValidator::FormValidator() {
}

bool FormValidator::contains_wildcard(const std::string& value) const {
    return value.find_first_of("*?") != std::string::npos;
}

bool FormValidator::validate_name(const std::string& label, const std::string& value,
                                  const std::vector<std::string>& existing_names, std::string& error) const {
    std::string name = utils::trim(value);
    if (name.empty()) {
        error = label + " cannot be empty";
        return false;
    }
    if (utils::contains_whitespace(name)) {
        error = label + " cannot contain spaces";
        return false;
    }
    if (contains_control(name)) {
        error = label + " cannot contain control characters";
        return false;
    }
    if (contains_wildcard(name)) {
        error = label + " cannot contain wildcards (* or ?)";
        return false;
    }
    if (std::find(existing_names.begin(), existing_names.end(), name) != existing_names.end()) {
        error = "'" + name + "' already exists";
        return false;
    }
    return true;
}

bool FormValidator::contains_control(const std::string& value) const {
    for (char c : value) {
        unsigned char b = static_cast<unsigned char>(c);
        if (b < 0x20 || b == 0x7f) {
            return true;
        }
    }
    return false;
}

bool FormValidator::validate_token(const std::string& label, const std::string& value, std::string& error) const {
    if (contains_control(value)) {
        error = label + " cannot contain control characters";
        return false;
    }
    if (utils::contains_whitespace(value)) {
        error = label + " cannot contain spaces";
        return false;
    }
    return true;
}

bool FormValidator::validate_line(const std::string& label, const std::string& value, std::string& error) const {
    if (contains_control(value)) {
        error = label + " cannot contain control characters";
        return false;
    }
    return true;
}

bool FormValidator::validate_ports(const std::vector<TextField>& fields,
                                   const std::vector<uint16_t>& reserved_ports, std::string& error) const {
    for (const auto& field : fields) {
        std::string val = utils::trim(field.buffer);
        if (val.empty()) {
            error = field.label + " cannot be empty";
            return false;
        }
        uint16_t port = 0;
        if (!utils::safe_str_to_uint16(val, port)) {
            error = field.label + " must be a number between 1 and 65535";
            return false;
        }
        if (port == 0) {
            error = field.label + " must be between 1 and 65535";
            return false;
        }
    }

    if (!fields.empty()) {
        uint16_t first = 0;
        if (utils::safe_str_to_uint16(utils::trim(fields[0].buffer), first) &&
            std::find(reserved_ports.begin(), reserved_ports.end(), first) != reserved_ports.end()) {
            error = "port " + std::to_string(first) + " is already used by another tunnel";
            return false;
        }
    }
    return true;
}

bool FormValidator::validate_current_tab(FormState& state) const {
    if (state.empty() || !state.is_text_input()) {
        return true;
    }

    const FormSection& section = state.current_section();
    std::string error;
    bool ok = true;

    if (state.tab() == 0) {
        std::string name = section.fields().empty() ? "" : section.fields()[0].buffer;
        ok = validate_name(section.label(), name, state.existing_names(), error);
    } else if (state.tab() == state.sections().size() - 1) {
        ok = validate_ports(section.fields(), state.reserved_ports(), error);
    }

    if (ok) {
        state.clear_error();
    } else {
        state.set_error(error);
    }
    return ok;
}
