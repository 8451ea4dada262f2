#ifndef UTILS_H
#define UTILS_H

#include <string>
#include <vector>
#include <cstdint>
#include <sstream>
#include <iomanip>

// Utility functions for string manipulation, paths and terminal checks

namespace utils {

// Trim whitespace from string
std::string trim(const std::string& str);

// Split string by delimiter
std::vector<std::string> split(const std::string& str, char delimiter);

// Split on runs of whitespace, dropping empty pieces
std::vector<std::string> split_whitespace(const std::string& str);

// Convert string to lowercase
std::string to_lower(const std::string& str);

bool contains_whitespace(const std::string& str);
bool starts_with(const std::string& str, const std::string& prefix);
bool ends_with(const std::string& str, const std::string& suffix);
std::string join(const std::vector<std::string>& parts, const std::string& separator);
std::string repeat(const std::string& piece, size_t count);

// Safe string to number conversion
bool safe_str_to_uint16(const std::string& str, uint16_t& result);
bool safe_str_to_uint64(const std::string& str, uint64_t& result);

// True when stdout is a terminal
bool is_terminal();

// Safe output function (checks terminal state before writing)
void safe_print(const std::string& message);

// Flush output safely
void safe_flush();

// Home directory from $HOME, falling back to the password database
std::string home_dir();

// Expand a leading "~/" against the home directory
std::string expand_home(const std::string& path);

// Current login name ($USER, then the password database)
std::string current_user();

// Create directory if it doesn't exist
bool create_directory(const std::string& path);

// Ensure log directory and file exist
bool ensure_log_file(const std::string& log_file_path);

bool file_exists(const std::string& path);
bool is_regular_file(const std::string& path);

// Read a whole file; false if it cannot be opened
bool read_file(const std::string& path, std::string& content);

} // namespace utils

#endif // UTILS_H
