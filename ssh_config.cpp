#include "ssh_config.h"
#include "utils.h"
#include "logger.h"
#include <algorithm>
#include <fstream>
#include <sstream>
#include <glob.h>

SshConfigReader::SshConfigReader(const std::string& config_path, const std::string& ssh_dir)
    : config_path_(utils::expand_home(config_path))
    , ssh_dir_(ssh_dir.empty() ? utils::expand_home("~/.ssh") : utils::expand_home(ssh_dir)) {
}

bool SshConfigReader::split_directive(const std::string& line, std::string& key, std::string& value) {
    std::string trimmed = utils::trim(line);
    if (trimmed.empty()) {
        return false;
    }

    // Directives may use '=' or whitespace between key and value
    size_t eq_pos = trimmed.find('=');
    if (eq_pos != std::string::npos) {
        std::string k = utils::trim(trimmed.substr(0, eq_pos));
        std::string v = utils::trim(trimmed.substr(eq_pos + 1));
        if (!k.empty() && !v.empty() && !utils::contains_whitespace(k)) {
            key = k;
            value = v;
            return true;
        }
    }

    size_t ws_pos = trimmed.find_first_of(" \t");
    if (ws_pos == std::string::npos) {
        return false;
    }
    std::string v = utils::trim(trimmed.substr(ws_pos + 1));
    if (v.empty()) {
        return false;
    }
    key = trimmed.substr(0, ws_pos);
    value = v;
    return true;
}

// Splits "host:port" at the last colon so IPv6-ish hosts keep their colons
static bool split_host_port(const std::string& target, std::string& host, uint16_t& port) {
    size_t colon = target.rfind(':');
    if (colon == std::string::npos) {
        return false;
    }
    if (!utils::safe_str_to_uint16(target.substr(colon + 1), port)) {
        return false;
    }
    host = target.substr(0, colon);
    return true;
}

bool SshConfigReader::parse_local_forward(const std::string& value, PortForward& forward) {
    std::vector<std::string> parts = utils::split_whitespace(value);
    if (parts.size() != 2) {
        return false;
    }

    uint16_t local_port = 0;
    std::string remote_host;
    uint16_t remote_port = 0;
    if (!utils::safe_str_to_uint16(parts[0], local_port) ||
        !split_host_port(parts[1], remote_host, remote_port)) {
        return false;
    }

    forward = PortForward(local_port, remote_host, remote_port);
    return true;
}

bool SshConfigReader::parse_remote_forward(const std::string& value, RemotePortForward& forward) {
    std::vector<std::string> parts = utils::split_whitespace(value);
    if (parts.size() != 2) {
        return false;
    }

    uint16_t bind_port = 0;
    std::string remote_host;
    uint16_t remote_port = 0;
    if (!utils::safe_str_to_uint16(parts[0], bind_port) ||
        !split_host_port(parts[1], remote_host, remote_port)) {
        return false;
    }

    forward = RemotePortForward(bind_port, remote_host, remote_port);
    return true;
}

bool SshConfigReader::parse_dynamic_forward(const std::string& value, DynamicForward& forward) {
    std::string trimmed = utils::trim(value);
    size_t colon = trimmed.rfind(':');
    std::string port_str = colon == std::string::npos ? trimmed : trimmed.substr(colon + 1);

    uint16_t port = 0;
    if (!utils::safe_str_to_uint16(port_str, port)) {
        return false;
    }
    forward = DynamicForward(port);
    return true;
}

std::string SshConfigReader::expand_include_path(const std::string& pattern) const {
    if (utils::starts_with(pattern, "~")) {
        return utils::expand_home(pattern);
    }
    if (utils::starts_with(pattern, "/")) {
        return pattern;
    }
    return ssh_dir_ + "/" + pattern;
}

std::vector<std::string> SshConfigReader::glob_files(const std::string& pattern) const {
    std::vector<std::string> files;
    glob_t results;
    int ret = glob(pattern.c_str(), 0, nullptr, &results);
    if (ret == 0) {
        for (size_t i = 0; i < results.gl_pathc; ++i) {
            std::string path = results.gl_pathv[i];
            if (utils::is_regular_file(path)) {
                files.push_back(path);
            }
        }
    } else if (ret != GLOB_NOMATCH) {
        Logger::instance().log(LogLevel::WARN, "Include pattern failed to expand: " + pattern);
    }
    globfree(&results);
    return files;
}

std::vector<std::string> SshConfigReader::config_files() const {
    std::vector<std::string> files;
    if (!utils::is_regular_file(config_path_)) {
        return files;
    }
    files.push_back(config_path_);

    std::string content;
    if (!utils::read_file(config_path_, content)) {
        return files;
    }

    std::istringstream stream(content);
    std::string line;
    while (std::getline(stream, line)) {
        std::string key;
        std::string value;
        if (split_directive(line, key, value) && utils::to_lower(key) == "include") {
            for (const auto& pattern : utils::split_whitespace(value)) {
                std::vector<std::string> matched = glob_files(expand_include_path(pattern));
                files.insert(files.end(), matched.begin(), matched.end());
            }
        }
    }
    return files;
}

bool SshConfigReader::discover_tunnels(std::vector<TunnelHost>& tunnels) {
    last_error_.clear();
    if (!utils::file_exists(config_path_)) {
        last_error_ = config_path_ + " not found";
        return false;
    }
    return parse_file(config_path_, tunnels, 0);
}

bool SshConfigReader::parse_content(const std::string& content, std::vector<TunnelHost>& tunnels) {
    last_error_.clear();
    return parse_lines(content, tunnels, 0);
}

bool SshConfigReader::parse_file(const std::string& path, std::vector<TunnelHost>& tunnels, int depth) {
    std::string content;
    if (!utils::read_file(path, content)) {
        last_error_ = "failed to read " + path;
        return false;
    }
    return parse_lines(content, tunnels, depth);
}

bool SshConfigReader::process_include(const std::string& value, std::vector<TunnelHost>& tunnels, int depth) {
    if (depth >= MAX_INCLUDE_DEPTH) {
        Logger::instance().log(LogLevel::WARN, "Include nesting too deep, ignoring: " + value);
        return true;
    }
    for (const auto& pattern : utils::split_whitespace(value)) {
        for (const auto& path : glob_files(expand_include_path(pattern))) {
            if (!parse_file(path, tunnels, depth + 1)) {
                return false;
            }
        }
    }
    return true;
}

// Host block being accumulated while scanning a file
struct PendingHost {
    bool active;
    TunnelHost tunnel;

    PendingHost() : active(false) {}

    void flush(std::vector<TunnelHost>& tunnels) {
        if (active && tunnel.has_forwards()) {
            tunnels.push_back(tunnel);
        }
        active = false;
        tunnel = TunnelHost();
    }
};

bool SshConfigReader::parse_lines(const std::string& content, std::vector<TunnelHost>& tunnels, int depth) {
    PendingHost current;
    const std::string group_tag = GROUP_TAG;

    std::istringstream stream(content);
    std::string raw_line;
    while (std::getline(stream, raw_line)) {
        std::string line = utils::trim(raw_line);
        if (line.empty()) {
            continue;
        }

        // Group tag is a comment, so look for it before comments are skipped
        if (line[0] == '#') {
            if (current.active && utils::starts_with(line, group_tag)) {
                std::string group = utils::trim(line.substr(group_tag.size()));
                if (!group.empty()) {
                    current.tunnel.group = group;
                }
            }
            continue;
        }

        std::string key;
        std::string value;
        if (!split_directive(line, key, value)) {
            continue;
        }
        key = utils::to_lower(key);

        if (key == "include") {
            current.flush(tunnels);
            if (!process_include(value, tunnels, depth)) {
                return false;
            }
        } else if (key == "host" || key == "match") {
            current.flush(tunnels);
            if (key == "host") {
                std::string name = utils::split_whitespace(value)[0];
                if (name.find_first_of("*?") == std::string::npos) {
                    current.active = true;
                    current.tunnel.name = name;
                }
            }
        } else if (!current.active) {
            continue;
        } else if (key == "hostname") {
            current.tunnel.hostname = value;
        } else if (key == "localforward") {
            PortForward forward;
            if (parse_local_forward(value, forward)) {
                current.tunnel.forwards.push_back(forward);
            } else {
                Logger::instance().log(LogLevel::DEBUG, "Ignoring LocalForward in " + current.tunnel.name + ": " + value);
            }
        } else if (key == "remoteforward") {
            RemotePortForward forward;
            if (parse_remote_forward(value, forward)) {
                current.tunnel.remote_forwards.push_back(forward);
            } else {
                Logger::instance().log(LogLevel::DEBUG, "Ignoring RemoteForward in " + current.tunnel.name + ": " + value);
            }
        } else if (key == "dynamicforward") {
            DynamicForward forward;
            if (parse_dynamic_forward(value, forward)) {
                current.tunnel.dynamic_forwards.push_back(forward);
            } else {
                Logger::instance().log(LogLevel::DEBUG, "Ignoring DynamicForward in " + current.tunnel.name + ": " + value);
            }
        }
    }

    current.flush(tunnels);
    return true;
}

void SshConfigReader::collect_choices(const std::string& content, SshChoices& choices) const {
    std::string alias;
    std::string hostname;

    std::istringstream stream(content);
    std::string raw_line;
    while (std::getline(stream, raw_line)) {
        std::string line = utils::trim(raw_line);
        if (line.empty() || line[0] == '#') {
            continue;
        }

        std::string key;
        std::string value;
        if (!split_directive(line, key, value)) {
            continue;
        }
        key = utils::to_lower(key);

        if (key == "host" || key == "match") {
            if (!alias.empty() && !hostname.empty()) {
                choices.hosts.push_back(HostEntry(alias, hostname));
            }
            alias.clear();
            hostname.clear();
            if (key == "host") {
                std::string name = utils::split_whitespace(value)[0];
                if (name.find_first_of("*?") == std::string::npos) {
                    alias = name;
                }
            }
        } else if (key == "hostname") {
            if (!alias.empty()) {
                hostname = value;
            }
        } else if (key == "user") {
            choices.users.push_back(value);
        } else if (key == "identityfile") {
            choices.identity_files.push_back(value);
        } else if (key == "proxyjump") {
            choices.proxy_jumps.push_back(value);
        } else if (key == "localforward") {
            PortForward forward;
            if (parse_local_forward(value, forward) && forward.remote_host != "localhost") {
                choices.remote_hosts.push_back(forward.remote_host);
            }
        }
    }

    if (!alias.empty() && !hostname.empty()) {
        choices.hosts.push_back(HostEntry(alias, hostname));
    }
}

static void sort_unique(std::vector<std::string>& values) {
    std::sort(values.begin(), values.end());
    values.erase(std::unique(values.begin(), values.end()), values.end());
}

SshChoices SshConfigReader::gather_choices() const {
    SshChoices choices;

    for (const auto& path : config_files()) {
        std::string content;
        if (utils::read_file(path, content)) {
            collect_choices(content, choices);
        } else {
            Logger::instance().log(LogLevel::WARN, "Failed to read " + path);
        }
    }

    // A key pair in ssh_dir is offered even if no host uses it yet
    const bool home_ssh_dir = ssh_dir_ == utils::expand_home("~/.ssh");
    for (const auto& pub : glob_files(ssh_dir_ + "/*.pub")) {
        std::string private_key = pub.substr(0, pub.size() - 4);
        if (!utils::is_regular_file(private_key)) {
            continue;
        }
        if (home_ssh_dir) {
            size_t slash = private_key.rfind('/');
            choices.identity_files.push_back("~/.ssh/" + private_key.substr(slash + 1));
        } else {
            choices.identity_files.push_back(private_key);
        }
    }

    sort_unique(choices.users);
    sort_unique(choices.identity_files);
    sort_unique(choices.proxy_jumps);
    sort_unique(choices.remote_hosts);
    return choices;
}

static const char* const TUNNEL_COMMENT = "# Tunnel: ";

static std::vector<std::string> split_lines(const std::string& content) {
    std::vector<std::string> lines;
    std::istringstream stream(content);
    std::string line;
    while (std::getline(stream, line)) {
        lines.push_back(line);
    }
    return lines;
}

static bool is_blank(const std::string& line) {
    return utils::trim(line).empty();
}

static bool is_tunnel_comment(const std::string& line) {
    return utils::starts_with(utils::trim(line), TUNNEL_COMMENT);
}

bool SshConfigReader::find_host_range(const std::vector<std::string>& lines, const std::string& name,
                                      size_t& start, size_t& host_line, size_t& end) {
    bool found = false;
    for (size_t i = 0; i < lines.size(); ++i) {
        std::string key;
        std::string value;
        if (!split_directive(lines[i], key, value)) {
            continue;
        }
        std::string lower = utils::to_lower(key);
        if (lower != "host" && lower != "match") {
            continue;
        }
        if (found) {
            end = i;
            break;
        }
        std::vector<std::string> patterns = utils::split_whitespace(value);
        if (lower == "host" && !patterns.empty() && patterns[0] == name) {
            found = true;
            host_line = i;
            end = lines.size();
        }
    }
    if (!found) {
        return false;
    }

    // Blank lines and the next block's comment stay with the next block
    while (end > host_line + 1 && (is_blank(lines[end - 1]) || is_tunnel_comment(lines[end - 1]))) {
        --end;
    }

    start = host_line;
    if (host_line > 0 && utils::trim(lines[host_line - 1]) == TUNNEL_COMMENT + name) {
        start = host_line - 1;
    }
    return true;
}

bool SshConfigReader::locate_host_block(const std::string& name, std::string& path, std::vector<std::string>& lines,
                                        size_t& start, size_t& host_line, size_t& end) {
    last_error_.clear();
    for (const auto& file : config_files()) {
        std::string content;
        if (!utils::read_file(file, content)) {
            Logger::instance().log(LogLevel::WARN, "Failed to read " + file);
            continue;
        }
        std::vector<std::string> file_lines = split_lines(content);
        if (find_host_range(file_lines, name, start, host_line, end)) {
            path = file;
            lines.swap(file_lines);
            return true;
        }
    }
    last_error_ = "Host block '" + name + "' not found in SSH config files";
    return false;
}

bool SshConfigReader::write_lines(const std::string& path, const std::vector<std::string>& lines) {
    std::ofstream file(path, std::ios::out | std::ios::trunc);
    if (!file.is_open()) {
        last_error_ = "failed to open " + path;
        return false;
    }
    for (const auto& line : lines) {
        file << line << "\n";
    }
    file.flush();
    if (!file) {
        last_error_ = "failed to write to " + path;
        return false;
    }
    return true;
}

bool SshConfigReader::read_host_block(const std::string& name, std::string& path, std::vector<std::string>& block) {
    std::vector<std::string> lines;
    size_t start = 0;
    size_t host_line = 0;
    size_t end = 0;
    if (!locate_host_block(name, path, lines, start, host_line, end)) {
        return false;
    }
    block.assign(lines.begin() + start, lines.begin() + end);
    return true;
}

bool SshConfigReader::remove_host_block(const std::string& name, std::string& path) {
    std::vector<std::string> lines;
    size_t start = 0;
    size_t host_line = 0;
    size_t end = 0;
    if (!locate_host_block(name, path, lines, start, host_line, end)) {
        return false;
    }

    lines.erase(lines.begin() + start, lines.begin() + end);

    // Keep at most one blank line where the block was, none at either end of the file
    while (start < lines.size() && is_blank(lines[start]) && (start == 0 || is_blank(lines[start - 1]))) {
        lines.erase(lines.begin() + start);
    }
    while (!lines.empty() && is_blank(lines.back())) {
        lines.pop_back();
    }

    if (!write_lines(path, lines)) {
        return false;
    }
    Logger::instance().log(LogLevel::INFO, "Removed Host " + name + " from " + path);
    return true;
}

static std::string leading_whitespace(const std::string& line) {
    size_t pos = line.find_first_not_of(" \t");
    return pos == std::string::npos ? line : line.substr(0, pos);
}

bool SshConfigReader::rename_host_block(const std::string& old_name, const std::string& new_name, std::string& path) {
    std::vector<std::string> lines;
    size_t start = 0;
    size_t host_line = 0;
    size_t end = 0;
    if (!locate_host_block(old_name, path, lines, start, host_line, end)) {
        return false;
    }

    std::string key;
    std::string value;
    split_directive(lines[host_line], key, value);
    std::vector<std::string> patterns = utils::split_whitespace(value);
    patterns[0] = new_name;
    lines[host_line] = leading_whitespace(lines[host_line]) + key + " " + utils::join(patterns, " ");

    if (start < host_line) {
        lines[start] = leading_whitespace(lines[start]) + TUNNEL_COMMENT + new_name;
    }

    if (!write_lines(path, lines)) {
        return false;
    }
    Logger::instance().log(LogLevel::INFO, "Renamed Host " + old_name + " to " + new_name + " in " + path);
    return true;
}

std::vector<std::string> SshConfigReader::existing_names(const std::vector<TunnelHost>& tunnels) {
    std::vector<std::string> names;
    for (const auto& tunnel : tunnels) {
        names.push_back(tunnel.name);
    }
    return names;
}

std::vector<uint16_t> SshConfigReader::reserved_ports(const std::vector<TunnelHost>& tunnels) {
    std::vector<uint16_t> ports;
    for (const auto& tunnel : tunnels) {
        for (const auto& forward : tunnel.forwards) {
            ports.push_back(forward.local_port);
        }
        for (const auto& forward : tunnel.dynamic_forwards) {
            ports.push_back(forward.listen_port);
        }
    }
    return ports;
}
