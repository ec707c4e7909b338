/**
 * @file logger.hpp
 * @brief Structured logging for the premium service with JSON output
 *
 * The Logger provides structured logging capabilities with:
 * - Multiple log levels (DEBUG, INFO, WARN, ERROR)
 * - JSON-formatted output for easy parsing
 * - Event helpers for requests, table loads and quotes
 * - Masking of secrets such as the Redis password
 *
 * Design Pattern: Singleton logger with structured event emission.
 * Writes are serialised, so any server worker thread may log.
 */

#ifndef PREMIUM_LOGGER_HPP
#define PREMIUM_LOGGER_HPP

#include <cstddef>
#include <fstream>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace premium {

/**
 * @brief Log severity levels
 */
enum class LogLevel {
    DEBUG,   ///< Per-quote detail (rate key, score, premium)
    INFO,    ///< Server lifecycle, completed requests, table loads
    WARN,    ///< Non-fatal issues (rejected input, missing rates)
    ERROR    ///< Failures (unreadable tables, store errors)
};

/**
 * @brief Convert log level to string
 */
inline std::string level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARN: return "WARN";
        case LogLevel::ERROR: return "ERROR";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Parse log level from string (case-insensitive)
 *
 * Unknown names map to INFO; use is_log_level() to validate first.
 */
LogLevel string_to_level(const std::string& level_str);

/**
 * @brief Whether a string names a log level (case-insensitive)
 */
bool is_log_level(const std::string& level_str);

/**
 * @brief Logger configuration
 */
struct LoggerConfig {
    LogLevel min_level;              ///< Minimum log level to output
    bool enable_console;             ///< Log to console (stderr)
    bool enable_file;                ///< Log to file
    std::string log_file_path;       ///< File path for logs
    bool enable_json;                ///< Output as JSON (vs. plain text)

    LoggerConfig()
        : min_level(LogLevel::INFO),
          enable_console(true),
          enable_file(false),
          log_file_path("premium-server.log"),
          enable_json(true) {}
};

/**
 * @brief Outcome of one HTTP request, for the access log
 */
struct RequestRecord {
    std::string method;
    std::string target;
    std::string remote;
    int status;
    size_t response_bytes;
    double duration_ms;

    RequestRecord()
        : status(0), response_bytes(0), duration_ms(0.0) {}
};

/**
 * @brief Structured logger with JSON output
 *
 * Usage Example:
 *   @code
 *   LoggerConfig config;
 *   config.min_level = LogLevel::DEBUG;
 *   config.enable_file = true;
 *   config.log_file_path = "premium-server.log";
 *
 *   Logger& logger = Logger::get_instance();
 *   logger.configure(config);
 *
 *   logger.log_server_started("0.0.0.0", 8000, 4, "memory");
 *   logger.log_tables_loaded("premium_tables.xlsx", "matrix", 63, 9, 12.5);
 *   @endcode
 */
class Logger {
public:
    /**
     * @brief Get singleton logger instance
     */
    static Logger& get_instance();

    /**
     * @brief Configure logger with new settings
     *
     * Reopens the log file when file output is enabled.
     *
     * @param config Logger configuration
     */
    void configure(const LoggerConfig& config);

    /**
     * @brief Log that the HTTP listener is accepting connections
     */
    void log_server_started(
        const std::string& address,
        unsigned short port,
        size_t threads,
        const std::string& store_backend
    );

    /**
     * @brief Log that the server has stopped
     *
     * @param reason Signal name or "shutdown"
     */
    void log_server_stopped(const std::string& reason);

    /**
     * @brief Log connection to a rate store
     *
     * @param backend Store backend name
     * @param endpoint host:port of the backend, empty for in-process stores
     * @param password Backend password (masked in output)
     */
    void log_store_connected(
        const std::string& backend,
        const std::string& endpoint,
        const std::string& password = ""
    );

    /**
     * @brief Access log entry for a completed request
     *
     * 5xx responses are logged at ERROR, 4xx at WARN, the rest at INFO.
     */
    void log_request_completed(const RequestRecord& record);

    /**
     * @brief Log a premium table written to the store
     *
     * @param path Table file
     * @param sheet Worksheet name (ignored for CSV)
     * @param rows Rates written
     * @param keys Distinct rate keys written
     * @param duration_ms Read plus store time
     */
    void log_tables_loaded(
        const std::string& path,
        const std::string& sheet,
        size_t rows,
        size_t keys,
        double duration_ms
    );

    /**
     * @brief Log removal of all rates from the store
     *
     * @param removed Rate keys removed
     */
    void log_tables_unloaded(size_t removed);

    /**
     * @brief Log a computed premium (debug)
     */
    void log_premium_quoted(
        const std::string& rate_key,
        int age,
        int score,
        const std::string& premium
    );

    /**
     * @brief Log error with context
     *
     * @param component Subsystem reporting the error (e.g. "service", "store")
     * @param error_message Error message
     * @param cause Optional underlying exception text
     */
    void log_error(
        const std::string& component,
        const std::string& error_message,
        const std::string& cause = ""
    );

    /**
     * @brief Log warning message
     *
     * @param component Subsystem reporting the warning
     * @param warning_message Warning message
     */
    void log_warning(
        const std::string& component,
        const std::string& warning_message
    );

    /**
     * @brief Flush all log outputs
     */
    void flush();

    /**
     * @brief Set minimum log level
     *
     * @param level Minimum level to output
     */
    void set_min_level(LogLevel level);

    /**
     * @brief Get current log level
     *
     * @return Current minimum log level
     */
    LogLevel get_min_level() const;

    /**
     * @brief Mask a secret, keeping the first and last 4 characters
     *
     * Secrets of 8 characters or fewer become "***"; empty stays empty.
     */
    static std::string mask_secret(const std::string& secret);

private:
    Logger();
    ~Logger();

    // Disable copy and move
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(Logger&&) = delete;

    mutable std::mutex mutex_;
    LoggerConfig config_;
    std::unique_ptr<std::ofstream> file_stream_;

    // Helper methods
    void log(LogLevel level, const std::string& message, const std::map<std::string, std::string>& fields);
    std::string get_timestamp() const;
    std::string format_json(const std::map<std::string, std::string>& fields) const;
    std::string escape_json_string(const std::string& str) const;
    void write_output(const std::string& output);
};

} // namespace premium

#endif // PREMIUM_LOGGER_HPP
