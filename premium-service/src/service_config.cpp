#include "service_config.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <limits>
#include <sstream>
#include <thread>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace premium {

namespace {

const char* const ENVIRONMENT_VARIABLES[] = {
    "LISTEN_ADDRESS", "LISTEN_PORT", "redissvc", "REDIS_PORT", "REDIS_PASSWORD",
    "PREMIUM_STORE", "PREMIUM_TABLES", "PREMIUM_SHEET", "LOG_LEVEL",
};

std::string read_string(const json& j, const char* key, const std::string& fallback) {
    if (!j.contains(key)) {
        return fallback;
    }
    return expand_environment_variables(j[key].get<std::string>());
}

template <typename T>
T read_number(const json& j, const char* key, T fallback) {
    if (!j.contains(key)) {
        return fallback;
    }
    if (!j[key].is_number_integer()) {
        throw ConfigError(std::string("Setting '") + key + "' must be an integer");
    }
    long long value = j[key].get<long long>();
    if (value < 0) {
        throw ConfigError(std::string("Setting '") + key + "' must not be negative");
    }
    if (static_cast<unsigned long long>(value) >
        static_cast<unsigned long long>(std::numeric_limits<T>::max())) {
        throw ConfigError(std::string("Setting '") + key + "' is out of range: " +
                          std::to_string(value));
    }
    return static_cast<T>(value);
}

bool read_bool(const json& j, const char* key, bool fallback) {
    if (!j.contains(key)) {
        return fallback;
    }
    return j[key].get<bool>();
}

} // anonymous namespace

ServiceConfig::ServiceConfig()
    : address("0.0.0.0"),
      port(8000),
      threads(std::max(1u, std::thread::hardware_concurrency())),
      body_limit(64 * 1024),
      idle_timeout_seconds(30),
      store("memory"),
      tables_path("premium_tables.xlsx"),
      sheet("matrix"),
      load_on_start(false),
      log_level("INFO"),
      log_json(true) {}

std::string expand_environment_variables(const std::string& value) {
    std::string result = value;
    size_t pos = 0;

    while ((pos = result.find('$', pos)) != std::string::npos) {
        size_t start = pos;
        pos++; // Skip '$'

        // Check for ${VAR} syntax
        bool braces = false;
        if (pos < result.size() && result[pos] == '{') {
            braces = true;
            pos++; // Skip '{'
        }

        // Extract variable name
        size_t name_start = pos;
        while (pos < result.size() &&
               (std::isalnum(static_cast<unsigned char>(result[pos])) || result[pos] == '_')) {
            pos++;
        }
        std::string var_name = result.substr(name_start, pos - name_start);

        if (braces) {
            if (pos >= result.size() || result[pos] != '}') {
                // Unterminated reference stays literal
                pos = start + 1;
                continue;
            }
            pos++; // Skip '}'
        }

        if (var_name.empty()) {
            pos = start + 1;
            continue;
        }

        const char* env_value = std::getenv(var_name.c_str());
        std::string replacement = env_value ? env_value : "";

        result.replace(start, pos - start, replacement);
        pos = start + replacement.size();
    }

    return result;
}

std::string resolve_relative_path(const std::string& path, const std::string& config_file_path) {
    fs::path p(path);

    if (path.empty() || p.is_absolute()) {
        return path;
    }

    fs::path config_dir = fs::path(config_file_path).parent_path();
    return (config_dir / p).string();
}

int parse_port(const std::string& text, const std::string& what) {
    long value = parse_count(text, what);
    if (value < 1 || value > 65535) {
        throw ConfigError(what + " must be between 1 and 65535, got '" + text + "'");
    }
    return static_cast<int>(value);
}

long parse_count(const std::string& text, const std::string& what) {
    if (text.empty() || text.size() > 9) {
        throw ConfigError(what + " must be a non-negative integer, got '" + text + "'");
    }
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            throw ConfigError(what + " must be a non-negative integer, got '" + text + "'");
        }
    }
    return std::stol(text);
}

ServiceConfig parse_service_config_from_string(const std::string& json_string,
                                               const ServiceConfig& base) {
    ServiceConfig config = base;

    try {
        json j = json::parse(json_string);
        if (!j.is_object()) {
            throw ConfigError("Configuration must be a JSON object");
        }

        if (j.contains("server")) {
            const json& server = j["server"];
            config.address = read_string(server, "address", config.address);
            config.port = read_number<int>(server, "port", config.port);
            config.threads = read_number<size_t>(server, "threads", config.threads);
            config.body_limit = read_number<size_t>(server, "body_limit", config.body_limit);
            config.idle_timeout_seconds =
                read_number<int>(server, "idle_timeout_seconds", config.idle_timeout_seconds);
        }

        if (j.contains("store")) {
            const json& store = j["store"];
            config.store = read_string(store, "backend", config.store);

            if (store.contains("redis")) {
                const json& redis = store["redis"];
                RedisConfig& rc = config.redis;
                rc.host = read_string(redis, "host", rc.host);
                rc.port = read_number<int>(redis, "port", rc.port);
                rc.password = read_string(redis, "password", rc.password);
                rc.db = read_number<int>(redis, "db", rc.db);
                rc.pool_size = read_number<size_t>(redis, "pool_size", rc.pool_size);
                rc.key_prefix = read_string(redis, "key_prefix", rc.key_prefix);
                rc.connect_timeout_ms =
                    read_number<int>(redis, "connect_timeout_ms", rc.connect_timeout_ms);
                rc.socket_timeout_ms =
                    read_number<int>(redis, "socket_timeout_ms", rc.socket_timeout_ms);
            }
        }

        if (j.contains("tables")) {
            const json& tables = j["tables"];
            config.tables_path = read_string(tables, "path", config.tables_path);
            config.sheet = read_string(tables, "sheet", config.sheet);
            config.load_on_start = read_bool(tables, "load_on_start", config.load_on_start);
        }

        if (j.contains("logging")) {
            const json& logging = j["logging"];
            config.log_level = read_string(logging, "level", config.log_level);
            config.log_json = read_bool(logging, "json", config.log_json);
            config.log_file = read_string(logging, "file", config.log_file);
        }

    } catch (const json::parse_error& e) {
        throw ConfigError(std::string("JSON parse error: ") + e.what());
    } catch (const json::type_error& e) {
        throw ConfigError(std::string("JSON type error: ") + e.what());
    }

    return config;
}

ServiceConfig parse_service_config_from_file(const std::string& file_path,
                                             const ServiceConfig& base) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        throw ConfigError("Failed to open config file: " + file_path);
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();

    ServiceConfig config;
    try {
        config = parse_service_config_from_string(buffer.str(), base);
    } catch (const ConfigError& e) {
        throw ConfigError(file_path + ": " + e.what());
    }

    // Paths set by the file are relative to the file
    if (config.tables_path != base.tables_path) {
        config.tables_path = resolve_relative_path(config.tables_path, file_path);
    }
    if (config.log_file != base.log_file) {
        config.log_file = resolve_relative_path(config.log_file, file_path);
    }

    return config;
}

std::map<std::string, std::string> service_environment() {
    std::map<std::string, std::string> env;
    for (const char* name : ENVIRONMENT_VARIABLES) {
        const char* value = std::getenv(name);
        if (value) {
            env[name] = value;
        }
    }
    return env;
}

void apply_environment_overrides(ServiceConfig& config,
                                 const std::map<std::string, std::string>& env) {
    auto lookup = [&env](const char* name) -> std::string {
        auto it = env.find(name);
        return it == env.end() ? std::string() : it->second;
    };

    std::string value;
    if (!(value = lookup("LISTEN_ADDRESS")).empty()) config.address = value;
    if (!(value = lookup("LISTEN_PORT")).empty()) config.port = parse_port(value, "LISTEN_PORT");
    if (!(value = lookup("redissvc")).empty()) config.redis.host = value;
    if (!(value = lookup("REDIS_PORT")).empty()) config.redis.port = parse_port(value, "REDIS_PORT");
    if (!(value = lookup("REDIS_PASSWORD")).empty()) config.redis.password = value;
    if (!(value = lookup("PREMIUM_STORE")).empty()) config.store = value;
    if (!(value = lookup("PREMIUM_TABLES")).empty()) config.tables_path = value;
    if (!(value = lookup("PREMIUM_SHEET")).empty()) config.sheet = value;
    if (!(value = lookup("LOG_LEVEL")).empty()) config.log_level = value;
}

void validate_service_config(const ServiceConfig& config) {
    if (config.address.empty()) {
        throw ConfigError("Listen address must not be empty");
    }
    if (config.port < 1 || config.port > 65535) {
        throw ConfigError("Listen port must be between 1 and 65535, got " +
                          std::to_string(config.port));
    }
    if (config.threads == 0 || config.threads > MAX_SERVER_THREADS) {
        throw ConfigError("Server threads must be between 1 and " +
                          std::to_string(MAX_SERVER_THREADS) + ", got " +
                          std::to_string(config.threads));
    }
    if (config.body_limit == 0) {
        throw ConfigError("Request body limit must be at least 1 byte");
    }
    if (config.idle_timeout_seconds <= 0) {
        throw ConfigError("Idle timeout must be at least 1 second");
    }

    if (config.store != "memory" && config.store != "redis") {
        throw ConfigError("Unknown store backend '" + config.store +
                          "' (expected 'memory' or 'redis')");
    }
    if (config.store == "redis") {
        if (config.redis.host.empty()) {
            throw ConfigError("Redis host must not be empty");
        }
        if (config.redis.port < 1 || config.redis.port > 65535) {
            throw ConfigError("Redis port must be between 1 and 65535, got " +
                              std::to_string(config.redis.port));
        }
        if (config.redis.pool_size == 0) {
            throw ConfigError("Redis pool size must be at least 1");
        }
    }

    if (config.tables_path.empty()) {
        throw ConfigError("Premium tables path must not be empty");
    }
    if (config.sheet.empty()) {
        throw ConfigError("Premium tables sheet name must not be empty");
    }
    if (!is_log_level(config.log_level)) {
        throw ConfigError("Unknown log level '" + config.log_level +
                          "' (expected DEBUG, INFO, WARN or ERROR)");
    }
}

LoggerConfig make_logger_config(const ServiceConfig& config) {
    LoggerConfig logger_config;
    logger_config.min_level = string_to_level(config.log_level);
    logger_config.enable_json = config.log_json;
    logger_config.enable_console = true;
    if (!config.log_file.empty()) {
        logger_config.enable_file = true;
        logger_config.log_file_path = config.log_file;
    }
    return logger_config;
}

} // namespace premium
