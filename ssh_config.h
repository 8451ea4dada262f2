#ifndef SSH_CONFIG_H
#define SSH_CONFIG_H

#include <string>
#include <vector>
#include <cstdint>
#include "tunnel.h"

// OpenSSH client config reader (subset)
// Reference: ssh_config(5) - Host blocks, Include, LocalForward/RemoteForward/DynamicForward

// Tag comment inside a Host block that assigns the tunnel to a group
static const char* const GROUP_TAG = "# tunnelform:group=";

struct HostEntry {
    std::string alias;
    std::string hostname;

    HostEntry() {}
    HostEntry(const std::string& host_alias, const std::string& host_name)
        : alias(host_alias), hostname(host_name) {}
};

// Values already present in the config, offered as choices by the wizard
struct SshChoices {
    std::vector<HostEntry> hosts;            // non-wildcard aliases with a HostName
    std::vector<std::string> users;          // sorted, unique
    std::vector<std::string> identity_files; // sorted, unique
    std::vector<std::string> proxy_jumps;    // sorted, unique
    std::vector<std::string> remote_hosts;   // LocalForward targets other than localhost
};

class SshConfigReader {
public:
    // config_path may start with "~/"; relative Include patterns resolve against ssh_dir
    explicit SshConfigReader(const std::string& config_path, const std::string& ssh_dir = "");

    const std::string& config_path() const { return config_path_; }
    const std::string& ssh_dir() const { return ssh_dir_; }

    // All tunnels in the config and its includes, in file order
    bool discover_tunnels(std::vector<TunnelHost>& tunnels);

    // Tunnels from a config file's text; includes are followed from disk
    bool parse_content(const std::string& content, std::vector<TunnelHost>& tunnels);

    // Choices from the config and its includes plus key pairs found in ssh_dir
    SshChoices gather_choices() const;

    // Main config followed by every file its Include lines match
    std::vector<std::string> config_files() const;

    // Lines of the named Host block (with its "# Tunnel:" comment) and the file holding it
    bool read_host_block(const std::string& name, std::string& path, std::vector<std::string>& block);

    // Drop the block from whichever config file holds it; path receives that file
    bool remove_host_block(const std::string& name, std::string& path);

    // Rewrite the block's Host line (and its "# Tunnel:" comment) to new_name
    bool rename_host_block(const std::string& old_name, const std::string& new_name, std::string& path);

    const std::string& last_error() const { return last_error_; }

    // "Key value" or "Key=value"; false for blank lines and keys without a value
    static bool split_directive(const std::string& line, std::string& key, std::string& value);

    static bool parse_local_forward(const std::string& value, PortForward& forward);
    static bool parse_remote_forward(const std::string& value, RemotePortForward& forward);
    static bool parse_dynamic_forward(const std::string& value, DynamicForward& forward);

    static std::vector<std::string> existing_names(const std::vector<TunnelHost>& tunnels);

    // Local forward ports and dynamic listen ports; these bind on this machine
    static std::vector<uint16_t> reserved_ports(const std::vector<TunnelHost>& tunnels);

private:
    std::string config_path_;
    std::string ssh_dir_;
    std::string last_error_;

    static const int MAX_INCLUDE_DEPTH = 16;

    bool parse_file(const std::string& path, std::vector<TunnelHost>& tunnels, int depth);
    bool parse_lines(const std::string& content, std::vector<TunnelHost>& tunnels, int depth);
    bool process_include(const std::string& pattern, std::vector<TunnelHost>& tunnels, int depth);

    // [start, end) of the block in lines; start covers a preceding "# Tunnel: name" line
    static bool find_host_range(const std::vector<std::string>& lines, const std::string& name,
                                size_t& start, size_t& host_line, size_t& end);

    bool locate_host_block(const std::string& name, std::string& path, std::vector<std::string>& lines,
                           size_t& start, size_t& host_line, size_t& end);
    bool write_lines(const std::string& path, const std::vector<std::string>& lines);

    std::string expand_include_path(const std::string& pattern) const;
    std::vector<std::string> glob_files(const std::string& pattern) const;
    void collect_choices(const std::string& content, SshChoices& choices) const;
};

#endif // SSH_CONFIG_H
