#ifndef PREMIUM_SERVICE_CONFIG_HPP
#define PREMIUM_SERVICE_CONFIG_HPP

#include "logger.hpp"
#include <cstddef>
#include <map>
#include <stdexcept>
#include <string>

namespace premium {

/**
 * @brief Exception thrown when configuration cannot be read or is invalid
 */
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message)
        : std::runtime_error(message) {}
};

/// Upper bound on HTTP worker threads
constexpr size_t MAX_SERVER_THREADS = 1024;

/**
 * @brief Connection settings for the Redis rate store
 */
struct RedisConfig {
    std::string host;
    int port;
    std::string password;
    int db;
    size_t pool_size;
    std::string key_prefix;          ///< Prepended to every rate key
    int connect_timeout_ms;
    int socket_timeout_ms;

    RedisConfig()
        : host("127.0.0.1"), port(6379), db(0), pool_size(4),
          key_prefix("premium:"), connect_timeout_ms(1000), socket_timeout_ms(1000) {}
};

/**
 * @brief Complete premium-server configuration
 *
 * Layering: defaults < JSON file < environment < command line.
 */
struct ServiceConfig {
    // HTTP listener
    std::string address;
    int port;
    size_t threads;
    size_t body_limit;               ///< Maximum request body in bytes
    int idle_timeout_seconds;

    // Rate store: "memory" or "redis"
    std::string store;
    RedisConfig redis;

    // Premium tables
    std::string tables_path;
    std::string sheet;
    bool load_on_start;

    // Logging
    std::string log_level;
    bool log_json;
    std::string log_file;            ///< Empty logs to stderr only

    ServiceConfig();
};

/**
 * @brief Parses a service configuration from a JSON string
 *
 * Unknown keys are ignored, missing keys keep their defaults. String values
 * have ${VAR} references expanded.
 *
 * @param json_string JSON configuration
 * @param base Values the file overrides
 * @throws ConfigError if the JSON is invalid or a value has the wrong type
 */
ServiceConfig parse_service_config_from_string(const std::string& json_string,
                                               const ServiceConfig& base = ServiceConfig());

/**
 * @brief Parses a service configuration from a JSON file
 *
 * Relative table and log paths are resolved against the file's directory.
 *
 * @throws ConfigError if the file cannot be read or is invalid
 */
ServiceConfig parse_service_config_from_file(const std::string& file_path,
                                             const ServiceConfig& base = ServiceConfig());

/**
 * @brief Snapshot of the environment variables the service reads
 *
 * LISTEN_ADDRESS, LISTEN_PORT, redissvc, REDIS_PORT, REDIS_PASSWORD,
 * PREMIUM_STORE, PREMIUM_TABLES, PREMIUM_SHEET, LOG_LEVEL. Unset
 * variables are absent from the map.
 */
std::map<std::string, std::string> service_environment();

/**
 * @brief Applies environment overrides
 *
 * Empty values are ignored.
 *
 * @throws ConfigError if a numeric variable is malformed
 */
void apply_environment_overrides(ServiceConfig& config,
                                 const std::map<std::string, std::string>& env);

/**
 * @brief Validates a configuration
 *
 * @throws ConfigError naming the first invalid setting
 */
void validate_service_config(const ServiceConfig& config);

/**
 * @brief Logger settings derived from the configuration
 */
LoggerConfig make_logger_config(const ServiceConfig& config);

/**
 * @brief Parses a TCP port (1-65535)
 *
 * @param what Setting name used in the error message
 * @throws ConfigError
 */
int parse_port(const std::string& text, const std::string& what);

/**
 * @brief Parses a non-negative integer setting
 *
 * @throws ConfigError
 */
long parse_count(const std::string& text, const std::string& what);

/**
 * @brief Expands environment variable references in a string
 *
 * Supports syntax: ${VAR_NAME} or $VAR_NAME. Unset variables expand to
 * the empty string.
 */
std::string expand_environment_variables(const std::string& value);

/**
 * @brief Resolves file paths relative to config file directory
 *
 * Absolute paths are returned unchanged.
 */
std::string resolve_relative_path(const std::string& path, const std::string& config_file_path);

} // namespace premium

#endif // PREMIUM_SERVICE_CONFIG_HPP
