#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace premium {
namespace client {

/**
 * HTTP response structure
 */
struct HttpResponse {
    int status_code;
    std::string body;
    std::map<std::string, std::string> headers;  // lower-case names
    std::chrono::milliseconds duration;

    HttpResponse() : status_code(0), duration(0) {}

    std::string header(const std::string& name) const;
};

/**
 * HTTP client error
 *
 * status_code is 0 for transport failures (connection refused, timeout).
 * body holds the response body of a non-2xx reply.
 */
class HttpClientError : public std::runtime_error {
public:
    HttpClientError(const std::string& message, int status_code = 0, const std::string& body = "")
        : std::runtime_error(message), status_code_(status_code), body_(body) {}

    int status_code() const { return status_code_; }
    const std::string& body() const { return body_; }

private:
    int status_code_;
    std::string body_;
};

/**
 * Retry schedule: attempt n (0-based) waits delays_ms[n] before retrying
 */
struct RetryPolicy {
    std::vector<int> delays_ms;

    RetryPolicy() : delays_ms{1000, 2000, 4000} {}
    explicit RetryPolicy(std::vector<int> delays) : delays_ms(std::move(delays)) {}

    static RetryPolicy none() { return RetryPolicy(std::vector<int>{}); }

    int max_attempts() const { return static_cast<int>(delays_ms.size()) + 1; }
};

/**
 * HTTP client with retry logic and timeout support
 *
 * Features:
 * - Retry with backoff on 408, 429 and 5xx responses
 * - Configurable timeout (default 30s)
 * - Connection reuse through one libcurl easy handle
 * - Request/response logging in debug mode
 *
 * Not thread-safe: use one client per thread.
 */
class HttpClient {
public:
    /**
     * Constructor
     * @param base_url Base URL for all requests (e.g., "http://127.0.0.1:8000")
     * @param timeout_ms Timeout in milliseconds (default: 30000)
     * @param retry Retry schedule
     */
    explicit HttpClient(const std::string& base_url, int timeout_ms = 30000,
                        RetryPolicy retry = RetryPolicy());

    ~HttpClient();

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    /**
     * GET request with automatic retry
     * @param path Path relative to base_url (e.g., "/api/v1/healths/premiums/checks")
     * @param headers Additional headers
     * @return HttpResponse with a 2xx status
     * @throws HttpClientError on failure after retries
     */
    HttpResponse get(const std::string& path,
                     const std::map<std::string, std::string>& headers = {});

    /**
     * POST request with automatic retry
     * @param path Path relative to base_url
     * @param body Request body; sent as application/json unless headers
     *             name another Content-Type
     * @param headers Additional headers
     * @return HttpResponse with a 2xx status
     * @throws HttpClientError on failure after retries
     */
    HttpResponse post(const std::string& path,
                      const std::string& body,
                      const std::map<std::string, std::string>& headers = {});

    /**
     * Set debug mode (logs requests/responses to stderr, redacts secrets)
     */
    void set_debug(bool debug) { debug_ = debug; }

    const std::string& base_url() const { return base_url_; }

    static bool should_retry(int status_code);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;

    std::string base_url_;
    int timeout_ms_;
    RetryPolicy retry_;
    bool debug_;

    HttpResponse execute_once(
        const std::string& method,
        const std::string& path,
        const std::string& body,
        const std::map<std::string, std::string>& headers
    );
    HttpResponse execute_with_retry(
        const std::string& method,
        const std::string& path,
        const std::string& body,
        const std::map<std::string, std::string>& headers
    );
};

} // namespace client
} // namespace premium
