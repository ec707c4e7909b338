#include <catch2/catch_test_macros.hpp>
#include "../src/service_config.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>

using namespace premium;

TEST_CASE("ServiceConfig defaults", "[service_config]") {
    ServiceConfig config;

    REQUIRE(config.address == "0.0.0.0");
    REQUIRE(config.port == 8000);
    REQUIRE(config.threads >= 1);
    REQUIRE(config.store == "memory");
    REQUIRE(config.redis.host == "127.0.0.1");
    REQUIRE(config.redis.port == 6379);
    REQUIRE(config.redis.key_prefix == "premium:");
    REQUIRE(config.tables_path == "premium_tables.xlsx");
    REQUIRE(config.sheet == "matrix");
    REQUIRE_FALSE(config.load_on_start);
    REQUIRE(config.log_level == "INFO");

    REQUIRE_NOTHROW(validate_service_config(config));
}

TEST_CASE("ServiceConfig from JSON", "[service_config]") {
    SECTION("All sections") {
        std::string text = R"({
            "server": {"address": "127.0.0.1", "port": 8080, "threads": 2,
                       "body_limit": 4096, "idle_timeout_seconds": 5},
            "store": {"backend": "redis",
                      "redis": {"host": "cache", "port": 6380, "password": "pw",
                                "db": 2, "pool_size": 8, "key_prefix": "rates:"}},
            "tables": {"path": "/srv/tables.csv", "sheet": "rates", "load_on_start": true},
            "logging": {"level": "DEBUG", "json": false, "file": "/var/log/premium.log"}
        })";

        ServiceConfig config = parse_service_config_from_string(text);
        REQUIRE(config.address == "127.0.0.1");
        REQUIRE(config.port == 8080);
        REQUIRE(config.threads == 2);
        REQUIRE(config.body_limit == 4096);
        REQUIRE(config.idle_timeout_seconds == 5);
        REQUIRE(config.store == "redis");
        REQUIRE(config.redis.host == "cache");
        REQUIRE(config.redis.port == 6380);
        REQUIRE(config.redis.password == "pw");
        REQUIRE(config.redis.db == 2);
        REQUIRE(config.redis.pool_size == 8);
        REQUIRE(config.redis.key_prefix == "rates:");
        REQUIRE(config.tables_path == "/srv/tables.csv");
        REQUIRE(config.sheet == "rates");
        REQUIRE(config.load_on_start);
        REQUIRE(config.log_level == "DEBUG");
        REQUIRE_FALSE(config.log_json);
        REQUIRE(config.log_file == "/var/log/premium.log");
    }

    SECTION("Missing keys keep base values") {
        ServiceConfig base;
        base.port = 9000;
        ServiceConfig config = parse_service_config_from_string(R"({"tables": {"sheet": "m2"}})", base);
        REQUIRE(config.port == 9000);
        REQUIRE(config.sheet == "m2");
        REQUIRE(config.tables_path == "premium_tables.xlsx");
    }

    SECTION("Environment references are expanded") {
        setenv("PREMIUM_TEST_REDIS_SECRET", "s3cret", 1);
        ServiceConfig config = parse_service_config_from_string(
            R"({"store": {"redis": {"password": "${PREMIUM_TEST_REDIS_SECRET}"}}})");
        REQUIRE(config.redis.password == "s3cret");
        unsetenv("PREMIUM_TEST_REDIS_SECRET");
    }

    SECTION("Invalid documents") {
        REQUIRE_THROWS_AS(parse_service_config_from_string("{not json"), ConfigError);
        REQUIRE_THROWS_AS(parse_service_config_from_string("[1, 2]"), ConfigError);
        REQUIRE_THROWS_AS(parse_service_config_from_string(R"({"server": {"port": "8000"}})"),
                          ConfigError);
        REQUIRE_THROWS_AS(parse_service_config_from_string(R"({"server": {"threads": -1}})"),
                          ConfigError);
        REQUIRE_THROWS_AS(parse_service_config_from_string(R"({"tables": {"path": 3}})"),
                          ConfigError);
    }

    SECTION("Integers wider than the setting are rejected, not truncated") {
        // 2^32 + 1 would become port 1 after a narrowing cast
        REQUIRE_THROWS_AS(
            parse_service_config_from_string(R"({"server": {"port": 4294967297}})"),
            ConfigError);
        REQUIRE_THROWS_AS(
            parse_service_config_from_string(R"({"server": {"idle_timeout_seconds": 2147483648}})"),
            ConfigError);
        REQUIRE_THROWS_AS(
            parse_service_config_from_string(R"({"store": {"redis": {"db": 9999999999}}})"),
            ConfigError);

        ServiceConfig config = parse_service_config_from_string(
            R"({"server": {"idle_timeout_seconds": 2147483647}})");
        REQUIRE(config.idle_timeout_seconds == 2147483647);
    }
}

TEST_CASE("ServiceConfig from file resolves relative paths", "[service_config]") {
    std::filesystem::create_directories("config_test_dir");
    {
        std::ofstream file("config_test_dir/premium.json");
        file << R"({"tables": {"path": "tables/premium_tables.xlsx"},
                    "logging": {"file": "/tmp/premium.log"}})";
    }

    ServiceConfig config = parse_service_config_from_file("config_test_dir/premium.json");
    REQUIRE(config.tables_path == "config_test_dir/tables/premium_tables.xlsx");
    REQUIRE(config.log_file == "/tmp/premium.log");

    REQUIRE_THROWS_AS(parse_service_config_from_file("config_test_dir/missing.json"), ConfigError);

    std::filesystem::remove_all("config_test_dir");
}

TEST_CASE("Environment overrides", "[service_config]") {
    ServiceConfig config;

    SECTION("Recognised variables") {
        std::map<std::string, std::string> env = {
            {"LISTEN_ADDRESS", "127.0.0.1"},
            {"LISTEN_PORT", "8081"},
            {"redissvc", "redis.internal"},
            {"REDIS_PORT", "6390"},
            {"REDIS_PASSWORD", "hunter2"},
            {"PREMIUM_STORE", "redis"},
            {"PREMIUM_TABLES", "/app/premium_tables.xlsx"},
            {"PREMIUM_SHEET", "matrix2"},
            {"LOG_LEVEL", "warn"},
        };
        apply_environment_overrides(config, env);

        REQUIRE(config.address == "127.0.0.1");
        REQUIRE(config.port == 8081);
        REQUIRE(config.redis.host == "redis.internal");
        REQUIRE(config.redis.port == 6390);
        REQUIRE(config.redis.password == "hunter2");
        REQUIRE(config.store == "redis");
        REQUIRE(config.tables_path == "/app/premium_tables.xlsx");
        REQUIRE(config.sheet == "matrix2");
        REQUIRE(config.log_level == "warn");
        REQUIRE_NOTHROW(validate_service_config(config));
    }

    SECTION("Empty values are ignored") {
        std::map<std::string, std::string> env = {{"LISTEN_PORT", ""}, {"redissvc", ""}};
        apply_environment_overrides(config, env);
        REQUIRE(config.port == 8000);
        REQUIRE(config.redis.host == "127.0.0.1");
    }

    SECTION("Malformed ports") {
        std::map<std::string, std::string> env = {{"LISTEN_PORT", "eighty"}};
        REQUIRE_THROWS_AS(apply_environment_overrides(config, env), ConfigError);

        env = {{"REDIS_PORT", "70000"}};
        REQUIRE_THROWS_AS(apply_environment_overrides(config, env), ConfigError);

        env = {{"LISTEN_PORT", "0"}};
        REQUIRE_THROWS_AS(apply_environment_overrides(config, env), ConfigError);
    }

    SECTION("Process environment snapshot") {
        setenv("PREMIUM_SHEET", "from_env", 1);
        auto env = service_environment();
        REQUIRE(env["PREMIUM_SHEET"] == "from_env");
        unsetenv("PREMIUM_SHEET");
    }
}

TEST_CASE("ServiceConfig validation", "[service_config]") {
    ServiceConfig config;

    SECTION("Port") {
        config.port = 0;
        REQUIRE_THROWS_AS(validate_service_config(config), ConfigError);
        config.port = 65536;
        REQUIRE_THROWS_AS(validate_service_config(config), ConfigError);
    }

    SECTION("Threads") {
        config.threads = 0;
        REQUIRE_THROWS_AS(validate_service_config(config), ConfigError);
        config.threads = 100000;
        REQUIRE_THROWS_AS(validate_service_config(config), ConfigError);
        config.threads = MAX_SERVER_THREADS;
        REQUIRE_NOTHROW(validate_service_config(config));
    }

    SECTION("Store backend") {
        config.store = "sqlite";
        REQUIRE_THROWS_AS(validate_service_config(config), ConfigError);
    }

    SECTION("Redis settings only checked for the redis backend") {
        config.redis.pool_size = 0;
        REQUIRE_NOTHROW(validate_service_config(config));
        config.store = "redis";
        REQUIRE_THROWS_AS(validate_service_config(config), ConfigError);
    }

    SECTION("Sheet and tables path") {
        config.sheet = "";
        REQUIRE_THROWS_AS(validate_service_config(config), ConfigError);
        config.sheet = "matrix";
        config.tables_path = "";
        REQUIRE_THROWS_AS(validate_service_config(config), ConfigError);
    }

    SECTION("Log level") {
        config.log_level = "chatty";
        REQUIRE_THROWS_AS(validate_service_config(config), ConfigError);
        config.log_level = "debug";
        REQUIRE_NOTHROW(validate_service_config(config));
    }
}

TEST_CASE("Variable expansion and path helpers", "[service_config]") {
    setenv("PREMIUM_TEST_HOME", "/opt/premium", 1);

    REQUIRE(expand_environment_variables("${PREMIUM_TEST_HOME}/tables") == "/opt/premium/tables");
    REQUIRE(expand_environment_variables("$PREMIUM_TEST_HOME/tables") == "/opt/premium/tables");
    REQUIRE(expand_environment_variables("${PREMIUM_TEST_UNSET_VAR}x") == "x");
    REQUIRE(expand_environment_variables("cost $5") == "cost ");
    REQUIRE(expand_environment_variables("a $ b") == "a $ b");
    REQUIRE(expand_environment_variables("${unterminated") == "${unterminated");

    unsetenv("PREMIUM_TEST_HOME");

    REQUIRE(resolve_relative_path("tables.xlsx", "/etc/premium/premium.json") ==
            "/etc/premium/tables.xlsx");
    REQUIRE(resolve_relative_path("/data/tables.xlsx", "/etc/premium/premium.json") ==
            "/data/tables.xlsx");

    REQUIRE(parse_port("8000", "port") == 8000);
    REQUIRE_THROWS_AS(parse_port("-1", "port"), ConfigError);
    REQUIRE(parse_count("0", "threads") == 0);
    REQUIRE_THROWS_AS(parse_count("4x", "threads"), ConfigError);
}

TEST_CASE("Sample configuration file", "[service_config]") {
    std::string path = std::string(PREMIUM_DATA_DIR) + "/../config/premium.json";
    ServiceConfig config = parse_service_config_from_file(path);

    REQUIRE(config.store == "redis");
    REQUIRE(config.redis.host == "redis");
    REQUIRE(config.load_on_start);
    REQUIRE(config.tables_path.find("data/premium_tables.xlsx") != std::string::npos);
    REQUIRE_NOTHROW(validate_service_config(config));
}
