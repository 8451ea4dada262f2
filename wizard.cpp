#include "wizard.h"
#include "logger.h"
#include "utils.h"
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fstream>

static const char* const TYPE_LABEL = "Type";

static bool contains(const std::vector<std::string>& values, const std::string& value) {
    return std::find(values.begin(), values.end(), value) != values.end();
}

TunnelWizard::TunnelWizard(ForwardType type, const SshChoices& choices,
                           const std::vector<std::string>& existing_names, const std::string& current_user)
    : type_(type)
    , choices_(choices)
    , existing_names_(existing_names)
    , current_user_(current_user)
    , validator_() {
}

bool TunnelWizard::parse_type(const std::string& name, ForwardType& type) {
    std::string lower = utils::to_lower(utils::trim(name));
    if (lower == "local" || lower == "l") {
        type = ForwardType::Local;
    } else if (lower == "remote" || lower == "r") {
        type = ForwardType::Remote;
    } else if (lower == "dynamic" || lower == "d" || lower == "socks") {
        type = ForwardType::Dynamic;
    } else {
        return false;
    }
    return true;
}

const char* TunnelWizard::type_name(ForwardType type) {
    switch (type) {
        case ForwardType::Local: return "local";
        case ForwardType::Remote: return "remote";
        case ForwardType::Dynamic: return "dynamic";
    }
    return "local";
}

std::vector<FormSection> TunnelWizard::type_sections() {
    FormSection section = FormSection::selection(TYPE_LABEL, true);
    section.choice("Local Forward", "local")
        .choice("Remote Forward", "remote")
        .choice("Dynamic (SOCKS)", "dynamic")
        .with_default(0);
    return std::vector<FormSection>(1, section);
}

bool TunnelWizard::type_from_values(const FormValues& values, ForwardType& type) {
    FormValues::const_iterator it = values.find(TYPE_LABEL);
    if (it == values.end()) {
        return false;
    }
    return parse_type(it->second, type);
}

FormSection TunnelWizard::forward_section(const std::string& label) const {
    FormSection section = FormSection::selection(label, true);
    section.choice("localhost", "localhost");
    for (const auto& host : choices_.remote_hosts) {
        section.choice(host, host);
    }
    section.manual().with_default(0);
    return section;
}

FormSection TunnelWizard::ports_section() const {
    std::vector<TextField> fields;
    switch (type_) {
        case ForwardType::Local:
            fields.push_back(TextField("Local port", true));
            fields.push_back(TextField("Remote port", true));
            return FormSection::text("Ports", true, fields);
        case ForwardType::Remote:
            fields.push_back(TextField("Remote bind port", true));
            fields.push_back(TextField("Local target port", true));
            return FormSection::text("Ports", true, fields);
        case ForwardType::Dynamic:
            fields.push_back(TextField("Listen port", true));
            return FormSection::text("Port", true, fields);
    }
    return FormSection::text("Ports", true, fields);
}

std::vector<FormSection> TunnelWizard::build_sections() const {
    std::vector<FormSection> sections;

    sections.push_back(FormSection::text("Name", true, std::vector<TextField>(1, TextField("Tunnel name", false))));
    sections.push_back(FormSection::text("Group", false, std::vector<TextField>(1, TextField("Group tag", false))));

    // Existing tunnels and jump hosts are not offered as tunnel endpoints
    FormSection host = FormSection::selection("Host", true);
    for (const auto& entry : choices_.hosts) {
        if (contains(existing_names_, entry.alias) || contains(choices_.proxy_jumps, entry.alias)) {
            continue;
        }
        host.choice(entry.alias + " (" + entry.hostname + ")", entry.hostname);
    }
    host.manual();
    sections.push_back(host);

    FormSection user = FormSection::selection("User", true);
    for (const auto& name : choices_.users) {
        user.choice(name, name);
    }
    if (!current_user_.empty() && !contains(choices_.users, current_user_)) {
        user.choice_front(current_user_, current_user_);
    }
    user.manual();
    sections.push_back(user);

    FormSection identity = FormSection::selection("Identity", false);
    for (const auto& file : choices_.identity_files) {
        identity.choice(file, file);
    }
    identity.manual().skip();
    sections.push_back(identity);

    FormSection jump = FormSection::selection("ProxyJump", false);
    for (const auto& entry : choices_.hosts) {
        if (contains(existing_names_, entry.alias)) {
            continue;
        }
        jump.choice(entry.alias + " (" + entry.hostname + ")", entry.alias);
    }
    jump.manual().skip();
    sections.push_back(jump);

    switch (type_) {
        case ForwardType::Local:
            sections.push_back(forward_section("Forward"));
            break;
        case ForwardType::Remote:
            sections.push_back(forward_section("Target"));
            break;
        case ForwardType::Dynamic:
            break;
    }
    sections.push_back(ports_section());

    return sections;
}

std::string TunnelWizard::build_summary(const FormState& state, const Style& style) const {
    const std::vector<FormSection>& sections = state.sections();
    if (sections.size() <= static_cast<size_t>(PROXY_JUMP)) {
        return FormRenderer::default_summary(state, style);
    }

    const std::string missing = style.yellow("???");
    const std::string arrow = style.dim("\xE2\x86\x92");
    const std::string dot = style.dim("\xC2\xB7");

    std::string name;
    std::string group;
    std::string host;
    std::string user;
    std::string identity;
    std::string jump;

    std::vector<std::string> parts;
    parts.push_back(sections[NAME].value(name) ? name : missing);
    if (sections[GROUP].value(group)) {
        parts.push_back(style.dim("[" + group + "]"));
    }
    parts.push_back(arrow);
    parts.push_back(sections[HOST].value(host) ? host : missing);
    parts.push_back(dot);
    parts.push_back(sections[USER].value(user) ? user : missing);
    if (sections[IDENTITY].value(identity)) {
        parts.push_back(dot);
        parts.push_back(identity);
    }
    if (sections[PROXY_JUMP].value(jump)) {
        parts.push_back(dot);
        parts.push_back(jump);
    }
    parts.push_back(dot);

    const FormSection& ports = sections.back();
    std::string first;
    std::string second;
    if (!ports.text_field_value(0, first)) {
        first = missing;
    }

    switch (type_) {
        case ForwardType::Dynamic:
            parts.push_back("D:" + first);
            break;
        case ForwardType::Local:
        case ForwardType::Remote: {
            std::string forward;
            if (sections.size() <= static_cast<size_t>(FORWARD) || !sections[FORWARD].value(forward)) {
                forward = "localhost";
            }
            if (!ports.text_field_value(1, second)) {
                second = missing;
            }
            parts.push_back(forward + ":" + first);
            parts.push_back(arrow);
            parts.push_back(second);
            break;
        }
    }

    return utils::join(parts, " ");
}

bool TunnelWizard::extract(const FormState& state, TunnelAnswers& answers, std::string& error) const {
    const std::vector<FormSection>& sections = state.sections();
    size_t expected = static_cast<size_t>(type_ == ForwardType::Dynamic ? FORWARD + 1 : FORWARD + 2);
    if (sections.size() != expected) {
        error = "unexpected form layout";
        return false;
    }

    TunnelAnswers result;
    result.type = type_;

    if (!sections[NAME].value(result.name)) {
        error = "name is required";
        return false;
    }
    // Arrow keys can leave a tab without passing validation, so check again
    if (!validator_.validate_name("Name", result.name, state.existing_names(), error)) {
        return false;
    }
    sections[GROUP].value(result.group);

    if (!sections[HOST].value(result.hostname)) {
        error = "host is required";
        return false;
    }
    if (!sections[USER].value(result.user)) {
        error = "user is required";
        return false;
    }
    sections[IDENTITY].value(result.identity_file);
    sections[PROXY_JUMP].value(result.proxy_jump);

    // Manual entries go into the config verbatim
    if (!validator_.validate_line("Group", result.group, error) ||
        !validator_.validate_token("Host", result.hostname, error) ||
        !validator_.validate_token("User", result.user, error) ||
        !validator_.validate_line("Identity", result.identity_file, error) ||
        !validator_.validate_token("ProxyJump", result.proxy_jump, error)) {
        return false;
    }

    const FormSection& ports = sections.back();
    if (!validator_.validate_ports(ports.fields(), state.reserved_ports(), error)) {
        return false;
    }

    std::string first;
    if (!ports.text_field_value(0, first) || !utils::safe_str_to_uint16(first, result.first_port)) {
        error = "invalid " + ports.fields()[0].label;
        return false;
    }

    if (type_ != ForwardType::Dynamic) {
        if (!sections[FORWARD].value(result.forward_host)) {
            result.forward_host = "localhost";
        }
        if (!validator_.validate_token(sections[FORWARD].label(), result.forward_host, error)) {
            return false;
        }
        std::string second;
        if (!ports.text_field_value(1, second) || !utils::safe_str_to_uint16(second, result.second_port)) {
            error = "invalid " + ports.fields()[1].label;
            return false;
        }
    }

    answers = result;
    return true;
}

std::string TunnelWizard::serialize(const TunnelAnswers& answers) {
    std::string block;
    block += "# Tunnel: " + answers.name + "\n";
    block += "Host " + answers.name + "\n";
    if (!answers.group.empty()) {
        block += std::string("  ") + GROUP_TAG + answers.group + "\n";
    }
    block += "  HostName " + answers.hostname + "\n";
    block += "  User " + answers.user + "\n";
    if (!answers.identity_file.empty()) {
        block += "  IdentityFile " + answers.identity_file + "\n";
    }
    if (!answers.proxy_jump.empty()) {
        block += "  ProxyJump " + answers.proxy_jump + "\n";
    }

    switch (answers.type) {
        case ForwardType::Local:
            block += "  LocalForward " + std::to_string(answers.first_port) + " " +
                     answers.forward_host + ":" + std::to_string(answers.second_port) + "\n";
            break;
        case ForwardType::Remote:
            block += "  RemoteForward " + std::to_string(answers.first_port) + " " +
                     answers.forward_host + ":" + std::to_string(answers.second_port) + "\n";
            break;
        case ForwardType::Dynamic:
            block += "  DynamicForward " + std::to_string(answers.first_port) + "\n";
            break;
    }

    block += "  RequestTTY no\n";
    block += "  ExitOnForwardFailure yes\n";
    return block;
}

bool TunnelWizard::append_block(const std::string& path, const std::string& block, std::string& error) {
    std::string existing;
    std::string separator;
    if (utils::file_exists(path)) {
        if (!utils::read_file(path, existing)) {
            error = "failed to read " + path;
            return false;
        }
        if (!existing.empty()) {
            separator = utils::ends_with(existing, "\n") ? "\n" : "\n\n";
        }
    }

    std::ofstream file(path, std::ios::app | std::ios::out);
    if (!file.is_open()) {
        error = "failed to open " + path + ": " + std::strerror(errno);
        return false;
    }

    file << separator << block;
    file.flush();
    if (!file) {
        error = "failed to write to " + path;
        return false;
    }

    Logger::instance().log(LogLevel::INFO, "Appended " + std::to_string(block.size()) + " bytes to " + path);
    return true;
}
