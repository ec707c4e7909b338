/**
 * @file router.hpp
 * @brief Transport-independent dispatch of premium API requests
 *
 * Routes:
 *   GET  /                                   health
 *   POST /api/v1/healths/premiums            quote
 *   POST /api/v1/healths/premiums/loads      load premium tables
 *   POST /api/v1/healths/premiums/unloads    unload premium tables
 *   GET  /api/v1/healths/premiums/checks     whether tables are loaded
 *
 * The HTTP server converts wire messages to HttpRequest and back, so the
 * routing rules are testable without sockets.
 */

#ifndef PREMIUM_HTTP_ROUTER_HPP
#define PREMIUM_HTTP_ROUTER_HPP

#include "../premium_service.hpp"
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace premium {
namespace http {

constexpr const char* HEALTH_PATH = "/";
constexpr const char* QUOTE_PATH = "/api/v1/healths/premiums";
constexpr const char* LOAD_PATH = "/api/v1/healths/premiums/loads";
constexpr const char* UNLOAD_PATH = "/api/v1/healths/premiums/unloads";
constexpr const char* CHECK_PATH = "/api/v1/healths/premiums/checks";

/**
 * @brief Request as seen by the router
 */
struct HttpRequest {
    std::string method;                          ///< Upper case, e.g. "POST"
    std::string target;                          ///< Path with optional query
    std::map<std::string, std::string> headers;  ///< Lower-case names
    std::string body;

    /**
     * @brief Header value, empty if absent
     *
     * @param name Lower-case header name
     */
    std::string header(const std::string& name) const;
};

/**
 * @brief Response produced by the router
 */
struct HttpResponse {
    int status;
    std::string content_type;
    std::vector<std::pair<std::string, std::string>> headers;  ///< Extra headers
    std::string body;

    HttpResponse() : status(200) {}

    static HttpResponse json_response(int status, const std::string& body);
    static HttpResponse error(const PremiumError& error);
};

/**
 * @brief Whether a Content-Type value names application/json
 *
 * Case-insensitive; parameters such as "; charset=utf-8" are allowed.
 */
bool is_json_media_type(const std::string& content_type);

/**
 * @brief Decode a quote request body
 *
 * @throws PremiumError InvalidInput unless the body is a JSON object with
 *         string members code, sumInsured and dateOfBirth
 */
QuoteRequest parse_quote_request(const std::string& body);

/**
 * @brief Dispatches requests to the premium service
 */
class Router {
public:
    explicit Router(PremiumService& service);

    /**
     * @brief Handle one request
     *
     * Never throws: failures become error responses.
     */
    HttpResponse handle(const HttpRequest& request);

private:
    PremiumService& service_;

    HttpResponse dispatch(const HttpRequest& request, const std::string& path);
    HttpResponse handle_quote(const HttpRequest& request);
};

} // namespace http
} // namespace premium

#endif // PREMIUM_HTTP_ROUTER_HPP
