/**
 * @file logger.cpp
 * @brief Implementation of structured logger
 */

#include "logger.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace premium {

namespace {

std::string to_upper(const std::string& text) {
    std::string upper = text;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return upper;
}

std::string format_ms(double ms) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(3) << ms;
    return oss.str();
}

} // anonymous namespace

LogLevel string_to_level(const std::string& level_str) {
    std::string upper = to_upper(level_str);
    if (upper == "DEBUG") return LogLevel::DEBUG;
    if (upper == "INFO") return LogLevel::INFO;
    if (upper == "WARN" || upper == "WARNING") return LogLevel::WARN;
    if (upper == "ERROR") return LogLevel::ERROR;
    return LogLevel::INFO;  // default
}

bool is_log_level(const std::string& level_str) {
    std::string upper = to_upper(level_str);
    return upper == "DEBUG" || upper == "INFO" || upper == "WARN" ||
           upper == "WARNING" || upper == "ERROR";
}

Logger& Logger::get_instance() {
    static Logger instance;
    return instance;
}

Logger::Logger() {
    // Default configuration
    config_ = LoggerConfig();
}

Logger::~Logger() {
    flush();
    if (file_stream_ && file_stream_->is_open()) {
        file_stream_->close();
    }
}

void Logger::configure(const LoggerConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_ = config;
    file_stream_.reset();

    // Open log file if enabled
    if (config_.enable_file) {
        file_stream_ = std::make_unique<std::ofstream>(config_.log_file_path, std::ios::app);
        if (!file_stream_->is_open()) {
            std::cerr << "Warning: Failed to open log file: " << config_.log_file_path << std::endl;
        }
    }
}

void Logger::log_server_started(
    const std::string& address,
    unsigned short port,
    size_t threads,
    const std::string& store_backend
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "server_started";
    fields["address"] = address;
    fields["port"] = std::to_string(port);
    fields["threads"] = std::to_string(threads);
    fields["store"] = store_backend;

    log(LogLevel::INFO, "Listening on " + address + ":" + std::to_string(port), fields);
}

void Logger::log_server_stopped(const std::string& reason) {
    std::map<std::string, std::string> fields;
    fields["event"] = "server_stopped";
    fields["reason"] = reason;

    log(LogLevel::INFO, "Server stopped", fields);
}

void Logger::log_store_connected(
    const std::string& backend,
    const std::string& endpoint,
    const std::string& password
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "store_connected";
    fields["backend"] = backend;
    if (!endpoint.empty()) {
        fields["endpoint"] = endpoint;
    }
    if (!password.empty()) {
        fields["password"] = mask_secret(password);
    }

    log(LogLevel::INFO, "Rate store ready", fields);
}

void Logger::log_request_completed(const RequestRecord& record) {
    std::map<std::string, std::string> fields;
    fields["event"] = "request_completed";
    fields["method"] = record.method;
    fields["target"] = record.target;
    fields["status"] = std::to_string(record.status);
    fields["response_bytes"] = std::to_string(record.response_bytes);
    fields["duration_ms"] = format_ms(record.duration_ms);
    if (!record.remote.empty()) {
        fields["remote"] = record.remote;
    }

    LogLevel level = LogLevel::INFO;
    if (record.status >= 500) {
        level = LogLevel::ERROR;
    } else if (record.status >= 400) {
        level = LogLevel::WARN;
    }

    log(level, record.method + " " + record.target, fields);
}

void Logger::log_tables_loaded(
    const std::string& path,
    const std::string& sheet,
    size_t rows,
    size_t keys,
    double duration_ms
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "tables_loaded";
    fields["path"] = path;
    fields["sheet"] = sheet;
    fields["rows"] = std::to_string(rows);
    fields["keys"] = std::to_string(keys);
    fields["duration_ms"] = format_ms(duration_ms);

    log(LogLevel::INFO, "Premium tables loaded", fields);
}

void Logger::log_tables_unloaded(size_t removed) {
    std::map<std::string, std::string> fields;
    fields["event"] = "tables_unloaded";
    fields["removed"] = std::to_string(removed);

    log(LogLevel::INFO, "Premium tables unloaded", fields);
}

void Logger::log_premium_quoted(
    const std::string& rate_key,
    int age,
    int score,
    const std::string& premium
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "premium_quoted";
    fields["key"] = rate_key;
    fields["age"] = std::to_string(age);
    fields["score"] = std::to_string(score);
    fields["premium"] = premium;

    log(LogLevel::DEBUG, "Premium quoted", fields);
}

void Logger::log_error(
    const std::string& component,
    const std::string& error_message,
    const std::string& cause
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "error";
    fields["component"] = component;
    fields["error_message"] = error_message;

    if (!cause.empty()) {
        fields["cause"] = cause;
    }

    log(LogLevel::ERROR, error_message, fields);
}

void Logger::log_warning(
    const std::string& component,
    const std::string& warning_message
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "warning";
    fields["component"] = component;
    fields["warning"] = warning_message;

    log(LogLevel::WARN, warning_message, fields);
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (config_.enable_console) {
        std::cerr.flush();
    }
    if (file_stream_ && file_stream_->is_open()) {
        file_stream_->flush();
    }
}

void Logger::set_min_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_.min_level = level;
}

LogLevel Logger::get_min_level() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_.min_level;
}

std::string Logger::mask_secret(const std::string& secret) {
    if (secret.empty()) {
        return secret;
    }
    if (secret.size() <= 8) {
        return "***";
    }
    // Show first 4 and last 4 characters
    return secret.substr(0, 4) + "..." + secret.substr(secret.size() - 4);
}

void Logger::log(
    LogLevel level,
    const std::string& message,
    const std::map<std::string, std::string>& fields
) {
    std::lock_guard<std::mutex> lock(mutex_);

    // Skip if below minimum level
    if (level < config_.min_level) {
        return;
    }

    std::string output;

    if (config_.enable_json) {
        std::map<std::string, std::string> json_fields = fields;
        json_fields["timestamp"] = get_timestamp();
        json_fields["level"] = level_to_string(level);
        json_fields["message"] = message;
        output = format_json(json_fields);
    } else {
        std::ostringstream oss;
        oss << get_timestamp() << " [" << level_to_string(level) << "] " << message;

        if (!fields.empty()) {
            oss << " {";
            bool first = true;
            for (const auto& [key, value] : fields) {
                if (!first) oss << ", ";
                oss << key << "=" << value;
                first = false;
            }
            oss << "}";
        }

        output = oss.str();
    }

    write_output(output);
}

std::string Logger::get_timestamp() const {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()
    ) % 1000;

    std::tm tm_buf;
    localtime_r(&time_t_now, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    oss << "." << std::setfill('0') << std::setw(3) << ms.count();

    return oss.str();
}

std::string Logger::format_json(const std::map<std::string, std::string>& fields) const {
    std::ostringstream oss;
    oss << "{";

    bool first = true;
    for (const auto& [key, value] : fields) {
        if (!first) oss << ",";
        oss << "\"" << escape_json_string(key) << "\":\"" << escape_json_string(value) << "\"";
        first = false;
    }

    oss << "}";
    return oss.str();
}

std::string Logger::escape_json_string(const std::string& str) const {
    std::ostringstream oss;
    for (char c : str) {
        switch (c) {
            case '"':  oss << "\\\""; break;
            case '\\': oss << "\\\\"; break;
            case '\n': oss << "\\n"; break;
            case '\r': oss << "\\r"; break;
            case '\t': oss << "\\t"; break;
            default:
                if (c >= 0 && c < 32) {
                    // Escape control characters
                    oss << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                        << static_cast<int>(c) << std::dec;
                } else {
                    oss << c;
                }
        }
    }
    return oss.str();
}

void Logger::write_output(const std::string& output) {
    if (config_.enable_console) {
        std::cerr << output << std::endl;
    }

    if (config_.enable_file && file_stream_ && file_stream_->is_open()) {
        *file_stream_ << output << std::endl;
    }
}

} // namespace premium
