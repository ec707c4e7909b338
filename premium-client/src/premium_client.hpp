#pragma once

#include "api/http_client.hpp"
#include <cstddef>
#include <memory>
#include <stdexcept>
#include <string>

namespace premium {
namespace client {

/**
 * Error reported by the premium API
 *
 * status is the HTTP status (0 when the server could not be reached),
 * code the API error code ("001".."006", empty if the body carried none).
 */
class PremiumApiError : public std::runtime_error {
public:
    PremiumApiError(int status, const std::string& code, const std::string& message)
        : std::runtime_error(message), status_(status), code_(code) {}

    int status() const { return status_; }
    const std::string& code() const { return code_; }

private:
    int status_;
    std::string code_;
};

/**
 * Rates written by a table load
 */
struct LoadResult {
    size_t rows;
    size_t keys;
};

/**
 * Typed client for the premium API
 *
 * Example usage:
 *   PremiumClient client("http://127.0.0.1:8000");
 *   client.load();
 *   std::string premium = client.quote("1A", "100000", "1978-03-14");
 */
class PremiumClient {
public:
    /**
     * Constructor
     * @param base_url Server URL, e.g. "http://127.0.0.1:8000"
     * @param timeout_ms Per-request timeout
     * @param retry Retry schedule for 408/429/5xx replies
     */
    explicit PremiumClient(const std::string& base_url, int timeout_ms = 30000,
                           RetryPolicy retry = RetryPolicy::none());

    /**
     * Quote a premium
     * @return Premium as formatted by the server (e.g. "750")
     * @throws PremiumApiError
     */
    std::string quote(const std::string& code,
                      const std::string& sum_insured,
                      const std::string& date_of_birth);

    /**
     * Load the server's premium tables into its store
     * @throws PremiumApiError
     */
    LoadResult load();

    /**
     * Remove all rates from the server's store
     * @return Rate keys removed
     * @throws PremiumApiError
     */
    size_t unload();

    /**
     * Whether the server has rates loaded
     * @throws PremiumApiError
     */
    bool check();

    /**
     * Whether the server answers its health endpoint
     */
    bool health();

    HttpClient& http() { return *http_; }

    /**
     * Build a PremiumApiError from a failed HTTP exchange
     */
    static PremiumApiError to_api_error(const HttpClientError& e);

private:
    std::unique_ptr<HttpClient> http_;
};

} // namespace client
} // namespace premium
