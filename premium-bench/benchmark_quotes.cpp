/**
 * Premium Service - Quote Throughput Benchmark
 *
 * Drives a running premium-server with the standard quote payload:
 * - Optionally loads the premium tables first
 * - Issues N quote requests spread over C client threads
 * - Measures per-request latency and overall throughput
 * - Outputs JSON results (stdout, or a file with --output)
 */

#include <iostream>
#include <fstream>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <thread>
#include <mutex>
#include <vector>
#include <algorithm>
#include <numeric>
#include <ctime>
#include <nlohmann/json.hpp>

#include "../premium-client/src/premium_client.hpp"

using json = nlohmann::json;
using namespace premium::client;
using namespace std::chrono;

/**
 * Benchmark configuration
 */
struct BenchmarkConfig {
    std::string base_url = "http://127.0.0.1:8000";
    size_t requests = 10000;
    size_t concurrency = 8;
    int timeout_ms = 5000;
    bool load_tables = false;
    std::string output_path;

    // Quote payload
    std::string code = "1A";
    std::string sum_insured = "100000";
    std::string date_of_birth = "1990-06-07";
};

/**
 * Benchmark results
 */
struct BenchmarkResults {
    size_t requests = 0;
    size_t succeeded = 0;
    size_t failed = 0;
    size_t concurrency = 0;
    double total_time_ms = 0.0;
    double requests_per_second = 0.0;

    // Latency of successful requests (milliseconds)
    double mean_ms = 0.0;
    double p50_ms = 0.0;
    double p95_ms = 0.0;
    double p99_ms = 0.0;
    double max_ms = 0.0;

    std::string premium;
    std::string first_error;
    std::string base_url;
    std::string timestamp;

    json to_json() const {
        json j;

        j["benchmark"] = "quote-throughput";
        j["timestamp"] = timestamp;

        j["config"] = {
            {"base_url", base_url},
            {"requests", requests},
            {"concurrency", concurrency}
        };

        j["counts"] = {
            {"succeeded", succeeded},
            {"failed", failed}
        };

        j["performance"] = {
            {"total_ms", total_time_ms},
            {"requests_per_second", requests_per_second}
        };

        j["latency_ms"] = {
            {"mean", mean_ms},
            {"p50", p50_ms},
            {"p95", p95_ms},
            {"p99", p99_ms},
            {"max", max_ms}
        };

        j["premium"] = premium;
        if (!first_error.empty()) {
            j["first_error"] = first_error;
        }
        j["success"] = (failed == 0 && succeeded > 0);

        return j;
    }
};

/**
 * Nearest-rank percentile of sorted samples
 */
double percentile(const std::vector<double>& sorted, double p) {
    if (sorted.empty()) {
        return 0.0;
    }
    size_t rank = static_cast<size_t>(p / 100.0 * static_cast<double>(sorted.size()) + 0.5);
    rank = std::min(std::max<size_t>(rank, 1), sorted.size());
    return sorted[rank - 1];
}

/**
 * Run the quote benchmark
 */
BenchmarkResults run_benchmark(const BenchmarkConfig& config) {
    BenchmarkResults results;
    results.requests = config.requests;
    results.concurrency = config.concurrency;
    results.base_url = config.base_url;

    auto now_time_t = system_clock::to_time_t(system_clock::now());
    std::tm local_tm{};
    localtime_r(&now_time_t, &local_tm);
    std::stringstream ss;
    ss << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S");
    results.timestamp = ss.str();

    std::cerr << "=== Premium Quote Benchmark ===" << std::endl;
    std::cerr << "Server: " << config.base_url << std::endl;

    if (config.load_tables) {
        std::cerr << "Loading premium tables..." << std::flush;
        PremiumClient client(config.base_url, config.timeout_ms);
        LoadResult loaded = client.load();
        std::cerr << " " << loaded.rows << " rates, " << loaded.keys << " keys" << std::endl;
    }

    std::cerr << "Issuing " << config.requests << " quotes over "
              << config.concurrency << " threads..." << std::endl;

    std::vector<std::vector<double>> latencies(config.concurrency);
    std::vector<size_t> failures(config.concurrency, 0);
    std::mutex result_mutex;

    auto start = steady_clock::now();

    std::vector<std::thread> threads;
    for (size_t t = 0; t < config.concurrency; ++t) {
        // Spread the remainder over the first threads
        size_t count = config.requests / config.concurrency +
                       (t < config.requests % config.concurrency ? 1 : 0);

        threads.emplace_back([&, t, count]() {
            PremiumClient client(config.base_url, config.timeout_ms, RetryPolicy::none());
            latencies[t].reserve(count);
            bool recorded = false;

            for (size_t i = 0; i < count; ++i) {
                auto request_start = steady_clock::now();
                try {
                    std::string premium = client.quote(config.code, config.sum_insured,
                                                       config.date_of_birth);
                    latencies[t].push_back(duration<double, std::milli>(
                        steady_clock::now() - request_start).count());

                    if (!recorded) {
                        std::lock_guard<std::mutex> lock(result_mutex);
                        if (results.premium.empty()) {
                            results.premium = premium;
                        }
                        recorded = true;
                    }
                } catch (const PremiumApiError& e) {
                    failures[t]++;
                    std::lock_guard<std::mutex> lock(result_mutex);
                    if (results.first_error.empty()) {
                        results.first_error = e.what();
                    }
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    results.total_time_ms = duration<double, std::milli>(steady_clock::now() - start).count();

    std::vector<double> all;
    for (size_t t = 0; t < config.concurrency; ++t) {
        all.insert(all.end(), latencies[t].begin(), latencies[t].end());
        results.failed += failures[t];
    }
    std::sort(all.begin(), all.end());

    results.succeeded = all.size();
    if (!all.empty()) {
        results.mean_ms = std::accumulate(all.begin(), all.end(), 0.0) /
                          static_cast<double>(all.size());
        results.p50_ms = percentile(all, 50.0);
        results.p95_ms = percentile(all, 95.0);
        results.p99_ms = percentile(all, 99.0);
        results.max_ms = all.back();
    }
    if (results.total_time_ms > 0) {
        results.requests_per_second =
            static_cast<double>(results.succeeded) / (results.total_time_ms / 1000.0);
    }

    std::cerr << std::endl;
    std::cerr << "=== Benchmark Results ===" << std::endl;
    std::cerr << std::fixed << std::setprecision(2);
    std::cerr << "Succeeded:     " << results.succeeded << std::endl;
    std::cerr << "Failed:        " << results.failed << std::endl;
    std::cerr << "Total time:    " << results.total_time_ms / 1000.0 << " seconds" << std::endl;
    std::cerr << "Throughput:    " << results.requests_per_second << " requests/second" << std::endl;
    std::cerr << "Latency (ms):  mean " << results.mean_ms << ", p50 " << results.p50_ms
              << ", p95 " << results.p95_ms << ", p99 " << results.p99_ms << std::endl;
    if (!results.first_error.empty()) {
        std::cerr << "First error:   " << results.first_error << std::endl;
    }

    return results;
}

int main(int argc, char** argv) {
    BenchmarkConfig config;

    // Simple argument parsing
    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--url" && i + 1 < argc) {
                config.base_url = argv[++i];
            } else if (arg == "--requests" && i + 1 < argc) {
                config.requests = std::stoull(argv[++i]);
            } else if (arg == "--concurrency" && i + 1 < argc) {
                config.concurrency = std::stoull(argv[++i]);
            } else if (arg == "--timeout-ms" && i + 1 < argc) {
                config.timeout_ms = std::stoi(argv[++i]);
            } else if (arg == "--code" && i + 1 < argc) {
                config.code = argv[++i];
            } else if (arg == "--sum-insured" && i + 1 < argc) {
                config.sum_insured = argv[++i];
            } else if (arg == "--dob" && i + 1 < argc) {
                config.date_of_birth = argv[++i];
            } else if (arg == "--load") {
                config.load_tables = true;
            } else if (arg == "--output" && i + 1 < argc) {
                config.output_path = argv[++i];
            } else if (arg == "--help") {
                std::cout << "Usage: " << argv[0] << " [options]" << std::endl;
                std::cout << std::endl;
                std::cout << "Options:" << std::endl;
                std::cout << "  --url <url>          Server URL (default: http://127.0.0.1:8000)" << std::endl;
                std::cout << "  --requests <n>       Quote requests to issue (default: 10000)" << std::endl;
                std::cout << "  --concurrency <n>    Client threads (default: 8)" << std::endl;
                std::cout << "  --timeout-ms <n>     Per-request timeout (default: 5000)" << std::endl;
                std::cout << "  --code <code>        Product code (default: 1A)" << std::endl;
                std::cout << "  --sum-insured <sum>  Sum insured (default: 100000)" << std::endl;
                std::cout << "  --dob <date>         Date of birth (default: 1990-06-07)" << std::endl;
                std::cout << "  --load               Load the premium tables before the run" << std::endl;
                std::cout << "  --output <path>      Output JSON file (default: stdout)" << std::endl;
                std::cout << "  --help               Show this help message" << std::endl;
                return 0;
            } else {
                std::cerr << "Error: Unknown option or missing argument: " << arg << std::endl;
                return 1;
            }
        }
    } catch (const std::logic_error& e) {
        std::cerr << "Error: Invalid numeric argument: " << e.what() << std::endl;
        return 1;
    }

    if (config.requests == 0 || config.concurrency == 0) {
        std::cerr << "Error: --requests and --concurrency must be greater than 0" << std::endl;
        return 1;
    }

    BenchmarkResults results;
    try {
        results = run_benchmark(config);
    } catch (const PremiumApiError& e) {
        std::cerr << std::endl << "Error: " << e.what() << std::endl;
        return 1;
    }

    json j = results.to_json();
    if (config.output_path.empty()) {
        std::cout << std::setw(2) << j << std::endl;
    } else {
        std::ofstream out(config.output_path);
        if (!out) {
            std::cerr << "Error: Cannot write " << config.output_path << std::endl;
            return 1;
        }
        out << std::setw(2) << j << std::endl;
        std::cerr << "Results saved to " << config.output_path << std::endl;
    }

    return results.failed == 0 ? 0 : 1;
}
