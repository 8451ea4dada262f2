#ifndef WIZARD_H
#define WIZARD_H

#include <string>
#include <vector>
#include <cstdint>
#include "form.h"
#include "renderer.h"
#include "ssh_config.h"
#include "tunnel.h"
#include "validator.h"

// Answers of a confirmed tunnel form; optional fields are empty when unset
struct TunnelAnswers {
    ForwardType type;
    std::string name;
    std::string group;
    std::string hostname;
    std::string user;
    std::string identity_file;
    std::string proxy_jump;
    std::string forward_host; // Local: remote end, Remote: local target
    uint16_t first_port;      // Local: local port, Remote: bind port, Dynamic: listen port
    uint16_t second_port;     // Local: remote port, Remote: target port, Dynamic: unused

    TunnelAnswers()
        : type(ForwardType::Local)
        , first_port(0)
        , second_port(0) {}
};

// Builds the "add tunnel" form and turns its answers into a Host block
class TunnelWizard {
public:
    // Tab order: Name, Group, Host, User, Identity, ProxyJump, then per type
    // Forward/Target + Ports (Local, Remote) or Port (Dynamic)
    enum SectionIndex {
        NAME = 0,
        GROUP = 1,
        HOST = 2,
        USER = 3,
        IDENTITY = 4,
        PROXY_JUMP = 5,
        FORWARD = 6
    };

    TunnelWizard(ForwardType type, const SshChoices& choices,
                 const std::vector<std::string>& existing_names, const std::string& current_user);

    ForwardType type() const { return type_; }

    std::vector<FormSection> build_sections() const;

    // Single-tab form asking for the forward type
    static std::vector<FormSection> type_sections();
    static bool type_from_values(const FormValues& values, ForwardType& type);

    static bool parse_type(const std::string& name, ForwardType& type);
    static const char* type_name(ForwardType type);

    // "name [group] → host · user · identity · jump · fwd:port → port"
    std::string build_summary(const FormState& state, const Style& style) const;

    // Reads and re-checks the confirmed form; false with error if anything is off
    bool extract(const FormState& state, TunnelAnswers& answers, std::string& error) const;

    static std::string serialize(const TunnelAnswers& answers);

    // Append the block to the config file, separated from existing content by a blank line
    static bool append_block(const std::string& path, const std::string& block, std::string& error);

private:
    ForwardType type_;
    SshChoices choices_;
    std::vector<std::string> existing_names_;
    std::string current_user_;
    FormValidator validator_;

    FormSection forward_section(const std::string& label) const;
    FormSection ports_section() const;
};

#endif // WIZARD_H
