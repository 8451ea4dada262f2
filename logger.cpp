#include "logger.h"
#include "utils.h"
#include <ctime>
#include <sstream>
#include <iomanip>
#include <cstring>

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

void Logger::init(const std::string& log_file) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (initialized_) {
        return;
    }

    log_file_ = log_file;

    if (!log_file_.empty()) {
        utils::ensure_log_file(log_file_);
        file_stream_.open(log_file_, std::ios::app | std::ios::out);
        if (file_stream_.is_open()) {
            // Flush after each output operation so a crash keeps the tail of the log
            file_stream_.setf(std::ios::unitbuf);
            initialized_ = true;
        } else {
            initialized_ = false;
        }
    }
}

void Logger::set_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    min_level_ = level;
}

void Logger::log(LogLevel level, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!initialized_ || !file_stream_.is_open()) {
        return;
    }
    if (static_cast<int>(level) < static_cast<int>(min_level_)) {
        return;
    }

    uint64_t timestamp = std::time(nullptr);

    // Format: timestamp level message
    file_stream_ << format_timestamp(timestamp) << " [" << level_to_string(level) << "] " << message << "\n";
    file_stream_.flush();
}

void Logger::log_event(const FormEventLog& event_log) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!initialized_ || !file_stream_.is_open()) {
        return;
    }

    uint64_t timestamp = event_log.timestamp > 0 ? event_log.timestamp : static_cast<uint64_t>(std::time(nullptr));

    std::stringstream json;
    json << format_timestamp(timestamp) << " [FORM] {";
    json << "\"event\":\"" << escape_json_string(event_log.event) << "\"";

    if (!event_log.tab.empty()) {
        json << ",\"tab\":\"" << escape_json_string(event_log.tab) << "\"";
    }

    if (!event_log.detail.empty()) {
        json << ",\"detail\":\"" << escape_json_string(event_log.detail) << "\"";
    }

    if (event_log.rows > 0 || event_log.cols > 0) {
        json << ",\"rows\":" << event_log.rows;
        json << ",\"cols\":" << event_log.cols;
    }

    json << "}\n";

    file_stream_ << json.str();
    file_stream_.flush();
}

void Logger::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_stream_.is_open()) {
        file_stream_.close();
    }
    initialized_ = false;
}

bool Logger::parse_level(const std::string& name, LogLevel& level) {
    std::string lower = utils::to_lower(utils::trim(name));
    if (lower == "debug") {
        level = LogLevel::DEBUG;
    } else if (lower == "info") {
        level = LogLevel::INFO;
    } else if (lower == "warn" || lower == "warning") {
        level = LogLevel::WARN;
    } else if (lower == "error") {
        level = LogLevel::ERROR_LEVEL;
    } else {
        return false;
    }
    return true;
}

std::string Logger::format_timestamp(uint64_t timestamp) {
    std::time_t time_val = static_cast<std::time_t>(timestamp);
    std::tm tm_info;
    if (!localtime_r(&time_val, &tm_info)) {
        return "0000-00-00 00:00:00";
    }

    std::stringstream ss;
    ss << std::put_time(&tm_info, "%Y-%m-%d %H:%M:%S");
    return ss.str();
}

std::string Logger::escape_json_string(const std::string& str) {
    std::stringstream escaped;
    for (char c : str) {
        if (c == '"') {
            escaped << "\\\"";
        } else if (c == '\\') {
            escaped << "\\\\";
        } else if (c == '\n') {
            escaped << "\\n";
        } else if (c == '\r') {
            escaped << "\\r";
        } else if (c == '\t') {
            escaped << "\\t";
        } else if (static_cast<unsigned char>(c) < 0x20) {
            // Control characters
            escaped << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                    << static_cast<int>(static_cast<unsigned char>(c)) << std::dec;
        } else {
            escaped << c;
        }
    }
    return escaped.str();
}

std::string Logger::level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARN: return "WARN";
        case LogLevel::ERROR_LEVEL: return "ERROR";
        default: return "INFO";
    }
}
