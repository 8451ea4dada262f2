#ifndef CONFIG_H
#define CONFIG_H

#include <string>
#include <vector>
#include <map>
#include <cstdint>

// JSON config parser (manual, RFC 7159 subset)
// Reference: RFC 7159 - The JavaScript Object Notation (JSON) Data Interchange Format

struct Config {
    std::string ssh_config;   // SSH config the wizard reads and appends to
    std::string log_file;
    std::string log_level;
    std::string tty_device;
    uint64_t poll_timeout_ms;     // readability wait per loop iteration
    uint64_t redraw_interval_ms;  // minimum gap between forced redraws
    uint64_t escape_timeout_ms;   // wait for the byte after ESC
    bool color;

    // Timeouts outside this range keep their defaults; they end up as int poll() timeouts
    static constexpr uint64_t MIN_TIMEOUT_MS = 1;
    static constexpr uint64_t MAX_TIMEOUT_MS = 10000;

    Config();

    // Missing or unreadable file yields defaults
    static Config load(const std::string& path);
    static Config parse_json(const std::string& json_str);

    // Default location: ~/.tunnelform/config.json
    static std::string default_path();

    bool save(const std::string& path) const;
    std::string to_json() const;

private:
    // Simple JSON parser helpers
    static void skip_whitespace(const std::string& str, size_t& pos);
    static bool parse_string(const std::string& str, size_t& pos, std::string& result);
    static bool parse_boolean(const std::string& str, size_t& pos, bool& result);
    static bool parse_object(const std::string& str, size_t& pos, std::map<std::string, std::string>& obj);
    static bool unquote(const std::string& raw, std::string& result);
    static std::string escape_string(const std::string& str);
};

#endif // CONFIG_H
