/**
 * @file http_server.hpp
 * @brief Asynchronous HTTP/1.1 server for the premium API (Boost.Beast)
 *
 * A pool of worker threads runs one io_context. Each connection gets its
 * own strand, so a session's handlers never run concurrently. Requests are
 * handed to the Router synchronously on the worker thread, and every
 * completed request is written to the access log.
 */

#ifndef PREMIUM_HTTP_HTTP_SERVER_HPP
#define PREMIUM_HTTP_HTTP_SERVER_HPP

#include "router.hpp"
#include "../service_config.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <cstddef>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace premium {
namespace http {

/**
 * @brief Raised when the listener cannot be set up
 */
class ServerError : public std::runtime_error {
public:
    explicit ServerError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Listener and connection settings
 */
struct ServerOptions {
    std::string address;             ///< IPv4 or IPv6 literal
    unsigned short port;             ///< 0 picks an ephemeral port
    size_t threads;
    size_t body_limit;               ///< Larger bodies get 413
    int idle_timeout_seconds;        ///< Read/write timeout per connection
    std::string store_backend;       ///< Reported in the startup log

    ServerOptions()
        : address("0.0.0.0"), port(8000), threads(1), body_limit(64 * 1024),
          idle_timeout_seconds(30) {}
};

/**
 * @brief Server options from the service configuration
 */
ServerOptions make_server_options(const ServiceConfig& config);

class Listener;

/**
 * @brief HTTP server bound to a Router
 *
 * Usage Example:
 *   @code
 *   HttpServer server(router, options);
 *   server.run();   // blocks until SIGINT or SIGTERM
 *   @endcode
 *
 * Tests use start() / port() / stop() to run the server in-process.
 */
class HttpServer {
public:
    HttpServer(Router& router, ServerOptions options);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    /**
     * @brief Bind, listen and start the worker threads
     *
     * Returns once the listener accepts connections.
     *
     * @throws ServerError if the address is invalid or cannot be bound
     */
    void start();

    /**
     * @brief start(), then block until SIGINT or SIGTERM
     */
    void run();

    /**
     * @brief Stop accepting and halt the workers
     *
     * Safe to call more than once and from a worker thread. Workers are
     * joined by run() or the destructor.
     */
    void stop();

    /**
     * @brief Port the listener is bound to (valid after start())
     */
    unsigned short port() const { return bound_port_; }

    bool is_running() const;

private:
    Router& router_;
    ServerOptions options_;
    boost::asio::io_context ioc_;
    std::shared_ptr<Listener> listener_;
    std::unique_ptr<boost::asio::signal_set> signals_;
    std::vector<std::thread> workers_;
    unsigned short bound_port_;
    mutable std::mutex mutex_;
    bool running_;

    void join_workers();
};

} // namespace http
} // namespace premium

#endif // PREMIUM_HTTP_HTTP_SERVER_HPP
