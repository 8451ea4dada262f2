#include "config.h"
#include "utils.h"
#include <fstream>
#include <sstream>
#include <cctype>
#include <algorithm>
#include <map>

// RFC 7159 - JSON Data Interchange Format
// This is a simplified parser for the flat config object we need

constexpr uint64_t Config::MIN_TIMEOUT_MS;
constexpr uint64_t Config::MAX_TIMEOUT_MS;

Config::Config()
    : ssh_config("~/.ssh/config")
    , log_file("~/.tunnelform/tunnelform.log")
    , log_level("INFO")
    , tty_device("/dev/tty")
    , poll_timeout_ms(100)
    , redraw_interval_ms(50)
    , escape_timeout_ms(50)
    , color(true)
{
}

Config Config::load(const std::string& path) {
    std::string content;
    if (!utils::read_file(path, content)) {
        return Config(); // Return default config
    }
    return parse_json(content);
}

std::string Config::default_path() {
    return utils::home_dir() + "/.tunnelform/config.json";
}

void Config::skip_whitespace(const std::string& str, size_t& pos) {
    while (pos < str.length() && std::isspace(static_cast<unsigned char>(str[pos]))) {
        pos++;
    }
}

bool Config::parse_string(const std::string& str, size_t& pos, std::string& result) {
    if (pos >= str.length() || str[pos] != '"') return false;
    pos++; // Skip opening quote

    result.clear();
    while (pos < str.length()) {
        if (str[pos] == '"') {
            pos++; // Skip closing quote
            return true;
        }
        if (str[pos] == '\\' && pos + 1 < str.length()) {
            // Handle escape sequences (RFC 7159 Section 7)
            pos++;
            switch (str[pos]) {
                case '"': result += '"'; break;
                case '\\': result += '\\'; break;
                case '/': result += '/'; break;
                case 'b': result += '\b'; break;
                case 'f': result += '\f'; break;
                case 'n': result += '\n'; break;
                case 'r': result += '\r'; break;
                case 't': result += '\t'; break;
                case 'u': // Unicode escape (simplified - just skip)
                    if (pos + 4 < str.length()) pos += 4;
                    break;
                default: result += str[pos]; break;
            }
            pos++;
        } else {
            result += str[pos++];
        }
    }
    return false; // Unterminated string
}

bool Config::parse_boolean(const std::string& str, size_t& pos, bool& result) {
    if (str.compare(pos, 4, "true") == 0) {
        result = true;
        pos += 4;
        return true;
    }
    if (str.compare(pos, 5, "false") == 0) {
        result = false;
        pos += 5;
        return true;
    }
    return false;
}

bool Config::parse_object(const std::string& str, size_t& pos, std::map<std::string, std::string>& obj) {
    skip_whitespace(str, pos);
    if (pos >= str.length() || str[pos] != '{') return false;
    pos++; // Skip '{'

    obj.clear();
    skip_whitespace(str, pos);

    if (pos < str.length() && str[pos] == '}') {
        pos++; // Empty object
        return true;
    }

    while (pos < str.length()) {
        skip_whitespace(str, pos);

        std::string key;
        if (!parse_string(str, pos, key)) return false;

        skip_whitespace(str, pos);
        if (pos >= str.length() || str[pos] != ':') return false;
        pos++; // Skip ':'

        skip_whitespace(str, pos);

        // Keep the raw value text; nested values are skipped as a whole
        size_t value_start = pos;
        int depth = 0;
        bool in_string = false;
        bool escaped = false;

        while (pos < str.length()) {
            char c = str[pos];
            if (escaped) {
                escaped = false;
                pos++;
                continue;
            }
            if (c == '\\') {
                escaped = true;
                pos++;
                continue;
            }
            if (c == '"') {
                in_string = !in_string;
                pos++;
                continue;
            }
            if (!in_string) {
                if (c == '{' || c == '[') depth++;
                else if (c == '}' || c == ']') {
                    if (depth == 0) break;
                    depth--;
                } else if (depth == 0 && c == ',') {
                    break;
                }
            }
            pos++;
        }

        std::string value = str.substr(value_start, pos - value_start);
        obj[key] = utils::trim(value);

        skip_whitespace(str, pos);
        if (pos < str.length() && str[pos] == ',') {
            pos++;
            continue;
        }
        if (pos < str.length() && str[pos] == '}') {
            pos++;
            return true;
        }
    }

    return false;
}

bool Config::unquote(const std::string& raw, std::string& result) {
    size_t pos = 0;
    std::string value;
    if (!parse_string(raw, pos, value) || pos != raw.length()) {
        return false;
    }
    result = value;
    return true;
}

Config Config::parse_json(const std::string& json_str) {
    Config config;
    size_t pos = 0;
    std::map<std::string, std::string> root;

    if (!parse_object(json_str, pos, root)) {
        return config; // Return default on parse error
    }

    // String fields
    const std::pair<const char*, std::string*> string_fields[] = {
        {"ssh_config", &config.ssh_config},
        {"log_file", &config.log_file},
        {"log_level", &config.log_level},
        {"tty_device", &config.tty_device},
    };
    for (const auto& field : string_fields) {
        auto it = root.find(field.first);
        if (it != root.end()) {
            std::string value;
            if (unquote(it->second, value) && !value.empty()) {
                *field.second = value;
            }
        }
    }

    // Numeric fields
    const std::pair<const char*, uint64_t*> numeric_fields[] = {
        {"poll_timeout_ms", &config.poll_timeout_ms},
        {"redraw_interval_ms", &config.redraw_interval_ms},
        {"escape_timeout_ms", &config.escape_timeout_ms},
    };
    for (const auto& field : numeric_fields) {
        auto it = root.find(field.first);
        if (it != root.end()) {
            uint64_t val;
            if (utils::safe_str_to_uint64(it->second, val) && val >= MIN_TIMEOUT_MS && val <= MAX_TIMEOUT_MS) {
                *field.second = val;
            }
        }
    }

    if (root.find("color") != root.end()) {
        size_t bool_pos = 0;
        bool val = true;
        if (parse_boolean(root["color"], bool_pos, val)) {
            config.color = val;
        }
    }

    return config;
}

std::string Config::escape_string(const std::string& str) {
    std::string escaped;
    for (char c : str) {
        switch (c) {
            case '"': escaped += "\\\""; break;
            case '\\': escaped += "\\\\"; break;
            case '\n': escaped += "\\n"; break;
            case '\r': escaped += "\\r"; break;
            case '\t': escaped += "\\t"; break;
            default: escaped += c; break;
        }
    }
    return escaped;
}

std::string Config::to_json() const {
    std::ostringstream out;
    out << "{\n";
    out << "  \"ssh_config\": \"" << escape_string(ssh_config) << "\",\n";
    out << "  \"log_file\": \"" << escape_string(log_file) << "\",\n";
    out << "  \"log_level\": \"" << escape_string(log_level) << "\",\n";
    out << "  \"tty_device\": \"" << escape_string(tty_device) << "\",\n";
    out << "  \"poll_timeout_ms\": " << poll_timeout_ms << ",\n";
    out << "  \"redraw_interval_ms\": " << redraw_interval_ms << ",\n";
    out << "  \"escape_timeout_ms\": " << escape_timeout_ms << ",\n";
    out << "  \"color\": " << (color ? "true" : "false") << "\n";
    out << "}\n";
    return out.str();
}

bool Config::save(const std::string& path) const {
    size_t last_slash = path.find_last_of('/');
    if (last_slash != std::string::npos && last_slash > 0) {
        if (!utils::create_directory(path.substr(0, last_slash))) {
            return false;
        }
    }

    std::ofstream file(path, std::ios::out | std::ios::trunc);
    if (!file.is_open()) {
        return false;
    }
    file << to_json();
    return file.good();
}
