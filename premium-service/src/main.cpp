#include <iostream>
#include <string>
#include <memory>
#include "service_config.hpp"
#include "logger.hpp"
#include "premium_service.hpp"
#include "store/store_factory.hpp"
#include "http/router.hpp"
#include "http/http_server.hpp"
#include "../../premium-engine/src/io/table_loader.hpp"

#include <nlohmann/json.hpp>
using json = nlohmann::json;

namespace {

struct CLIArgs {
    std::string config_path;
    std::string address;
    std::string port;
    std::string threads;
    std::string tables_path;
    std::string sheet;
    std::string store;
    std::string redis_host;
    std::string redis_port;
    std::string log_level;
    bool load_on_start = false;
    bool validate_tables = false;
    bool help = false;
};

void print_usage(const char* program_name) {
    std::cerr << "premium-server v1.0.0\n\n";
    std::cerr << "Usage: " << program_name << " [options]\n\n";
    std::cerr << "Server options:\n";
    std::cerr << "  --config <path>             JSON configuration file\n";
    std::cerr << "  --address <addr>            Listen address (default: 0.0.0.0)\n";
    std::cerr << "  --port <port>               Listen port (default: 8000)\n";
    std::cerr << "  --threads <count>           Worker threads (default: hardware concurrency)\n\n";
    std::cerr << "Premium table options:\n";
    std::cerr << "  --tables <path>             Premium matrix, .xlsx or .csv\n";
    std::cerr << "                              (default: premium_tables.xlsx)\n";
    std::cerr << "  --sheet <name>              Worksheet holding the matrix (default: matrix)\n";
    std::cerr << "  --load-on-start             Load the tables into the store before listening\n";
    std::cerr << "  --validate-tables           Read and validate the tables, print a summary, exit\n\n";
    std::cerr << "Store options:\n";
    std::cerr << "  --store <backend>           memory or redis (default: memory)\n";
    std::cerr << "  --redis-host <host>         Redis host (default: 127.0.0.1)\n";
    std::cerr << "  --redis-port <port>         Redis port (default: 6379)\n\n";
    std::cerr << "Other options:\n";
    std::cerr << "  --log-level <level>         DEBUG, INFO, WARN or ERROR (default: INFO)\n";
    std::cerr << "  --help                      Show this help message\n\n";
    std::cerr << "Settings are layered: defaults, then --config, then environment\n";
    std::cerr << "(LISTEN_ADDRESS, LISTEN_PORT, redissvc, REDIS_PORT, REDIS_PASSWORD,\n";
    std::cerr << "PREMIUM_STORE, PREMIUM_TABLES, PREMIUM_SHEET, LOG_LEVEL), then options.\n\n";
    std::cerr << "Examples:\n\n";
    std::cerr << "  1. In-memory store, tables loaded at startup:\n";
    std::cerr << "     " << program_name << " --tables premium_tables.xlsx --load-on-start\n\n";
    std::cerr << "  2. Redis store:\n";
    std::cerr << "     " << program_name << " --store redis --redis-host redis --port 8000\n\n";
    std::cerr << "  3. Check a premium matrix before deploying it:\n";
    std::cerr << "     " << program_name << " --tables premium_tables.xlsx --validate-tables\n";
}

bool parse_args(int argc, char* argv[], CLIArgs& args) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            args.help = true;
            return true;
        } else if (arg == "--config" && i + 1 < argc) {
            args.config_path = argv[++i];
        } else if (arg == "--address" && i + 1 < argc) {
            args.address = argv[++i];
        } else if (arg == "--port" && i + 1 < argc) {
            args.port = argv[++i];
        } else if (arg == "--threads" && i + 1 < argc) {
            args.threads = argv[++i];
        } else if (arg == "--tables" && i + 1 < argc) {
            args.tables_path = argv[++i];
        } else if (arg == "--sheet" && i + 1 < argc) {
            args.sheet = argv[++i];
        } else if (arg == "--store" && i + 1 < argc) {
            args.store = argv[++i];
        } else if (arg == "--redis-host" && i + 1 < argc) {
            args.redis_host = argv[++i];
        } else if (arg == "--redis-port" && i + 1 < argc) {
            args.redis_port = argv[++i];
        } else if (arg == "--log-level" && i + 1 < argc) {
            args.log_level = argv[++i];
        } else if (arg == "--load-on-start") {
            args.load_on_start = true;
        } else if (arg == "--validate-tables") {
            args.validate_tables = true;
        } else {
            std::cerr << "Error: Unknown option or missing argument: " << arg << "\n\n";
            return false;
        }
    }
    return true;
}

// Command line values override file and environment settings
void apply_cli_overrides(premium::ServiceConfig& config, const CLIArgs& args) {
    if (!args.address.empty()) config.address = args.address;
    if (!args.port.empty()) config.port = premium::parse_port(args.port, "--port");
    if (!args.threads.empty()) {
        config.threads = static_cast<size_t>(premium::parse_count(args.threads, "--threads"));
    }
    if (!args.tables_path.empty()) config.tables_path = args.tables_path;
    if (!args.sheet.empty()) config.sheet = args.sheet;
    if (!args.store.empty()) config.store = args.store;
    if (!args.redis_host.empty()) config.redis.host = args.redis_host;
    if (!args.redis_port.empty()) {
        config.redis.port = premium::parse_port(args.redis_port, "--redis-port");
    }
    if (!args.log_level.empty()) config.log_level = args.log_level;
    if (args.load_on_start) config.load_on_start = true;
}

premium::ServiceConfig build_config(const CLIArgs& args) {
    premium::ServiceConfig config;
    if (!args.config_path.empty()) {
        config = premium::parse_service_config_from_file(args.config_path);
    }
    premium::apply_environment_overrides(config, premium::service_environment());
    apply_cli_overrides(config, args);
    premium::validate_service_config(config);
    return config;
}

// Summary printed by --validate-tables
int validate_tables(const premium::ServiceConfig& config) {
    std::cerr << "Loading premium tables from " << config.tables_path << "..." << std::flush;
    premium::PremiumTable table = premium::io::load_premium_table(config.tables_path, config.sheet);
    std::cerr << " loaded " << table.size() << " rates\n";

    json summary;
    summary["path"] = config.tables_path;
    summary["sheet"] = config.sheet;
    summary["rows"] = table.size();
    summary["keys"] = table.key_count();
    summary["rate_keys"] = table.keys();
    std::cout << summary.dump(2) << std::endl;
    return 0;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    CLIArgs args;

    // Parse arguments
    if (!parse_args(argc, argv, args)) {
        print_usage(argv[0]);
        return 1;
    }

    // Handle help
    if (args.help) {
        print_usage(argv[0]);
        return 0;
    }

    premium::ServiceConfig config;
    try {
        config = build_config(args);
    } catch (const premium::ConfigError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        std::cerr << "\nUse --help for usage information.\n";
        return 1;
    }

    if (args.validate_tables) {
        try {
            return validate_tables(config);
        } catch (const premium::TableLoadError& e) {
            std::cerr << "\nError: " << e.what() << "\n";
            return 1;
        } catch (const std::exception& e) {
            std::cerr << "\nError: Cannot read premium tables: " << e.what() << "\n";
            return 1;
        }
    }

    premium::Logger& logger = premium::Logger::get_instance();
    logger.configure(premium::make_logger_config(config));

    try {
        premium::PremiumService service(
            premium::create_premium_store(config),
            premium::TableSource(config.tables_path, config.sheet));

        if (config.load_on_start) {
            service.load_tables();
        }

        premium::http::Router router(service);
        premium::http::HttpServer server(router, premium::http::make_server_options(config));
        server.run();
    } catch (const premium::PremiumError& e) {
        // Cause already logged by the service
        std::cerr << "Error: " << e.what() << "\n";
        logger.flush();
        return 1;
    } catch (const std::exception& e) {
        logger.log_error("main", "Server failed", e.what());
        logger.flush();
        return 1;
    }

    logger.flush();
    return 0;
}
