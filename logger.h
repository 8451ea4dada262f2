#ifndef LOGGER_H
#define LOGGER_H

#include <string>
#include <fstream>
#include <mutex>
#include <ctime>
#include <cstdint>
#include <sstream>
#include <iomanip>

// File logging for the wizard
// The terminal belongs to the form while it runs, so nothing is ever logged to stdout/stderr.
// Event records are formatted for easy parsing by log readers (JSON-like structure)

enum class LogLevel {
    DEBUG,
    INFO,
    WARN,
    ERROR_LEVEL
};

struct FormEventLog {
    uint64_t timestamp;
    std::string event; // "start", "validation", "manual", "confirm", "cancel", "terminal_error"
    std::string tab;
    std::string detail;
    int rows;
    int cols;

    FormEventLog()
        : timestamp(0)
        , rows(0)
        , cols(0) {}
};

class Logger {
public:
    static Logger& instance();

    void init(const std::string& log_file);
    void set_level(LogLevel level);
    void log(LogLevel level, const std::string& message);
    void log_event(const FormEventLog& event_log);
    void close();

    // Parses "DEBUG", "INFO", "WARN", "ERROR" (case-insensitive); false if unknown
    static bool parse_level(const std::string& name, LogLevel& level);

private:
    Logger() : log_file_(), file_stream_(), mutex_(), initialized_(false), min_level_(LogLevel::INFO) {}
    ~Logger() { close(); }
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::string log_file_;
    std::ofstream file_stream_;
    std::mutex mutex_;
    bool initialized_;
    LogLevel min_level_;

    std::string format_timestamp(uint64_t timestamp);
    std::string escape_json_string(const std::string& str);
    std::string level_to_string(LogLevel level);
};

#endif // LOGGER_H
