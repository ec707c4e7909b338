#include <catch2/catch_test_macros.hpp>
#include <nlohmann/json.hpp>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <string>
#include <sys/wait.h>

using json = nlohmann::json;

namespace {

const std::string SERVER = PREMIUM_SERVER_BIN;
const std::string DATA_DIR = PREMIUM_DATA_DIR;
const std::string ENGINE_DATA_DIR = PREMIUM_TEST_DATA_DIR;

// Helper to run CLI command and capture output
struct CommandResult {
    int exit_code;
    std::string stdout_output;
    std::string stderr_output;
};

std::string read_file(const std::string& path) {
    std::ifstream stream(path);
    std::ostringstream ss;
    if (stream) {
        ss << stream.rdbuf();
    }
    return ss.str();
}

CommandResult run_command(const std::string& cmd) {
    CommandResult result;

    std::string stdout_file = "/tmp/premium_cli_test_stdout.txt";
    std::string stderr_file = "/tmp/premium_cli_test_stderr.txt";

    std::string full_cmd = cmd + " >" + stdout_file + " 2>" + stderr_file;
    int status = std::system(full_cmd.c_str());
    result.exit_code = WEXITSTATUS(status);

    result.stdout_output = read_file(stdout_file);
    result.stderr_output = read_file(stderr_file);
    return result;
}

} // anonymous namespace

TEST_CASE("CLI help shows usage", "[cli]") {
    auto result = run_command(SERVER + " --help");
    REQUIRE(result.exit_code == 0);
    REQUIRE(result.stderr_output.find("Usage:") != std::string::npos);
    REQUIRE(result.stderr_output.find("--tables") != std::string::npos);
    REQUIRE(result.stderr_output.find("--store") != std::string::npos);
    REQUIRE(result.stderr_output.find("--validate-tables") != std::string::npos);
}

TEST_CASE("CLI unknown option fails", "[cli]") {
    auto result = run_command(SERVER + " --unknown-option");
    REQUIRE(result.exit_code == 1);
    REQUIRE(result.stderr_output.find("Unknown option") != std::string::npos);
}

TEST_CASE("CLI missing argument fails", "[cli]") {
    auto result = run_command(SERVER + " --port");
    REQUIRE(result.exit_code == 1);
    REQUIRE(result.stderr_output.find("missing argument: --port") != std::string::npos);
}

TEST_CASE("CLI validation errors", "[cli]") {
    SECTION("Invalid port") {
        auto result = run_command(SERVER + " --port eighty --validate-tables");
        REQUIRE(result.exit_code == 1);
        REQUIRE(result.stderr_output.find("--port") != std::string::npos);
    }

    SECTION("Zero threads") {
        auto result = run_command(SERVER + " --threads 0 --validate-tables");
        REQUIRE(result.exit_code == 1);
    }

    SECTION("Too many threads") {
        auto result = run_command(SERVER + " --threads 5000 --validate-tables");
        REQUIRE(result.exit_code == 1);
        REQUIRE(result.stderr_output.find("threads") != std::string::npos);
    }

    SECTION("Unknown store backend") {
        auto result = run_command(SERVER + " --store sqlite --validate-tables");
        REQUIRE(result.exit_code == 1);
        REQUIRE(result.stderr_output.find("sqlite") != std::string::npos);
    }

    SECTION("Unknown log level") {
        auto result = run_command(SERVER + " --log-level chatty --validate-tables");
        REQUIRE(result.exit_code == 1);
    }

    SECTION("Missing config file") {
        auto result = run_command(SERVER + " --config /nonexistent/premium.json --validate-tables");
        REQUIRE(result.exit_code == 1);
    }
}

TEST_CASE("CLI validates premium tables", "[cli][integration]") {
    SECTION("Workbook") {
        auto result = run_command(SERVER + " --tables " + DATA_DIR + "/premium_tables.xlsx" +
                                  " --validate-tables");
        REQUIRE(result.exit_code == 0);

        json summary = json::parse(result.stdout_output);
        REQUIRE(summary["rows"] == 63);
        REQUIRE(summary["keys"] == 9);
        REQUIRE(summary["sheet"] == "matrix");
        REQUIRE(summary["rate_keys"].size() == 9);
    }

    SECTION("CSV") {
        auto result = run_command(SERVER + " --tables " + DATA_DIR + "/premium_tables.csv" +
                                  " --validate-tables");
        REQUIRE(result.exit_code == 0);
        REQUIRE(json::parse(result.stdout_output)["rows"] == 63);
    }

    SECTION("Missing sheet") {
        auto result = run_command(SERVER + " --tables " + DATA_DIR + "/premium_tables.xlsx" +
                                  " --sheet nosuchsheet --validate-tables");
        REQUIRE(result.exit_code == 1);
        REQUIRE(result.stderr_output.find("Error:") != std::string::npos);
    }

    SECTION("Invalid premium") {
        auto result = run_command(SERVER + " --tables " + ENGINE_DATA_DIR + "/bad_premium.csv" +
                                  " --validate-tables");
        REQUIRE(result.exit_code == 1);
        REQUIRE(result.stdout_output.empty());
    }

    SECTION("Row number past the worksheet limit") {
        auto result = run_command(SERVER + " --tables " + ENGINE_DATA_DIR + "/out_of_range.xlsx" +
                                  " --sheet rows --validate-tables");
        REQUIRE(result.exit_code == 1);
        REQUIRE(result.stdout_output.empty());
        REQUIRE(result.stderr_output.find("Error:") != std::string::npos);
    }
}

TEST_CASE("CLI config file is layered under options", "[cli][integration]") {
    std::string config_path = "/tmp/premium_cli_test_config.json";
    {
        std::ofstream file(config_path);
        file << R"({"tables": {"path": ")" << DATA_DIR
             << R"(/premium_tables.csv", "sheet": "ignored_for_csv"}})";
    }

    SECTION("File settings are used") {
        auto result = run_command(SERVER + " --config " + config_path + " --validate-tables");
        REQUIRE(result.exit_code == 0);
        REQUIRE(json::parse(result.stdout_output)["sheet"] == "ignored_for_csv");
    }

    SECTION("Options override the file") {
        auto result = run_command(SERVER + " --config " + config_path +
                                  " --tables " + DATA_DIR + "/premium_tables.xlsx" +
                                  " --sheet matrix --validate-tables");
        REQUIRE(result.exit_code == 0);
        REQUIRE(json::parse(result.stdout_output)["sheet"] == "matrix");
    }

    std::remove(config_path.c_str());
}
