#ifndef VALIDATOR_H
#define VALIDATOR_H

#include <string>
#include <vector>
#include <cstdint>
#include "form.h"

// Validation run when focus leaves a text tab.
// The first tab holds the new entry's name, the last tab its port(s).

class FormValidator {
public:
    FormValidator();

    // Non-empty, no whitespace, no glob wildcards, not already taken
    bool validate_name(const std::string& label, const std::string& value,
                       const std::vector<std::string>& existing_names, std::string& error) const;

    // Every field an integer in [1, 65535]; the first one not reserved
    bool validate_ports(const std::vector<TextField>& fields,
                        const std::vector<uint16_t>& reserved_ports, std::string& error) const;

    // Single config token (host, user, jump host): no whitespace, no control bytes
    bool validate_token(const std::string& label, const std::string& value, std::string& error) const;

    // Rest-of-line value (identity path, group tag): no control bytes
    bool validate_line(const std::string& label, const std::string& value, std::string& error) const;

    // Runs the rule for the focused tab and sets or clears the state's error.
    // Returns false if advancing must be blocked.
    bool validate_current_tab(FormState& state) const;

private:
    bool contains_wildcard(const std::string& value) const;
    bool contains_control(const std::string& value) const;
};

#endif // VALIDATOR_H
