#include "utils.h"
#include <cctype>
#include <algorithm>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <fstream>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>
#include <pwd.h>

namespace utils {

std::string trim(const std::string& str) {
    size_t start = str.find_first_not_of(" \t\n\r");
    if (start == std::string::npos) return "";
    size_t end = str.find_last_not_of(" \t\n\r");
    return str.substr(start, end - start + 1);
}

std::vector<std::string> split(const std::string& str, char delimiter) {
    std::vector<std::string> result;
    std::stringstream ss(str);
    std::string item;
    while (std::getline(ss, item, delimiter)) {
        result.push_back(item);
    }
    return result;
}

std::vector<std::string> split_whitespace(const std::string& str) {
    std::vector<std::string> result;
    std::istringstream ss(str);
    std::string item;
    while (ss >> item) {
        result.push_back(item);
    }
    return result;
}

std::string to_lower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

bool contains_whitespace(const std::string& str) {
    for (char c : str) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            return true;
        }
    }
    return false;
}

bool starts_with(const std::string& str, const std::string& prefix) {
    return str.size() >= prefix.size() && str.compare(0, prefix.size(), prefix) == 0;
}

bool ends_with(const std::string& str, const std::string& suffix) {
    return str.size() >= suffix.size() &&
           str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string join(const std::vector<std::string>& parts, const std::string& separator) {
    std::string result;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) {
            result += separator;
        }
        result += parts[i];
    }
    return result;
}

std::string repeat(const std::string& piece, size_t count) {
    std::string result;
    result.reserve(piece.size() * count);
    for (size_t i = 0; i < count; ++i) {
        result += piece;
    }
    return result;
}

bool safe_str_to_uint16(const std::string& str, uint16_t& result) {
    if (str.empty()) return false;
    if (!std::isdigit(static_cast<unsigned char>(str[0]))) return false; // strtoul accepts "-1"
    char* end;
    unsigned long val = std::strtoul(str.c_str(), &end, 10);
    if (*end != '\0' || val > UINT16_MAX) return false;
    result = static_cast<uint16_t>(val);
    return true;
}

bool safe_str_to_uint64(const std::string& str, uint64_t& result) {
    if (str.empty()) return false;
    if (!std::isdigit(static_cast<unsigned char>(str[0]))) return false;
    char* end;
    unsigned long long val = std::strtoull(str.c_str(), &end, 10);
    if (*end != '\0') return false;
    result = static_cast<uint64_t>(val);
    return true;
}

bool is_terminal() {
    return isatty(fileno(stdout)) != 0;
}

void safe_print(const std::string& message) {
    // Escape sequences only go to a real terminal
    if (is_terminal() || message.find_first_of("\x1B\x07\x08") == std::string::npos) {
        std::cout << message;
        safe_flush();
    }
}

void safe_flush() {
    std::cout.flush();
}

std::string home_dir() {
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return home;
    }
    struct passwd* pw = getpwuid(getuid());
    if (pw && pw->pw_dir) {
        return pw->pw_dir;
    }
    return "";
}

std::string expand_home(const std::string& path) {
    if (path == "~") {
        return home_dir();
    }
    if (starts_with(path, "~/")) {
        return home_dir() + path.substr(1);
    }
    return path;
}

std::string current_user() {
    const char* user = std::getenv("USER");
    if (user && *user) {
        return user;
    }
    struct passwd* pw = getpwuid(getuid());
    if (pw && pw->pw_name) {
        return pw->pw_name;
    }
    return "root";
}

bool create_directory(const std::string& path) {
    if (path.empty()) {
        return false;
    }

    // Check if directory already exists
    struct stat info;
    if (stat(path.c_str(), &info) == 0) {
        return S_ISDIR(info.st_mode);
    }

    if (mkdir(path.c_str(), 0755) == 0) {
        return true;
    }

    // Try to create parent directories if needed
    size_t pos = path.find_last_of('/');
    if (pos != std::string::npos && pos > 0) {
        std::string parent = path.substr(0, pos);
        if (create_directory(parent)) {
            return mkdir(path.c_str(), 0755) == 0;
        }
    }

    return false;
}

bool ensure_log_file(const std::string& log_file_path) {
    if (log_file_path.empty()) {
        return false;
    }

    // Extract directory from file path
    size_t last_slash = log_file_path.find_last_of('/');
    if (last_slash != std::string::npos && last_slash > 0) {
        std::string log_dir = log_file_path.substr(0, last_slash);
        if (!create_directory(log_dir)) {
            return false;
        }
    }

    // Create or touch the log file
    std::ofstream file(log_file_path, std::ios::app);
    return file.is_open();
}

bool file_exists(const std::string& path) {
    if (path.empty()) {
        return false;
    }

    struct stat info;
    return stat(path.c_str(), &info) == 0;
}

bool is_regular_file(const std::string& path) {
    struct stat info;
    return !path.empty() && stat(path.c_str(), &info) == 0 && S_ISREG(info.st_mode);
}

bool read_file(const std::string& path, std::string& content) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return false;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    content = buffer.str();
    return true;
}

} // namespace utils
