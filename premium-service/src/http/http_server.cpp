#include "http_server.hpp"
#include "../logger.hpp"
#include <boost/asio/dispatch.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <csignal>
#include <optional>

namespace premium {
namespace http {

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace bhttp = boost::beast::http;
using tcp = boost::asio::ip::tcp;

namespace {

std::string to_std_string(beast::string_view view) {
    return std::string(view.data(), view.size());
}

std::string to_lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

std::string describe(const tcp::endpoint& endpoint) {
    return endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
}

} // anonymous namespace

ServerOptions make_server_options(const ServiceConfig& config) {
    ServerOptions options;
    options.address = config.address;
    options.port = static_cast<unsigned short>(config.port);
    options.threads = config.threads;
    options.body_limit = config.body_limit;
    options.idle_timeout_seconds = config.idle_timeout_seconds;
    options.store_backend = config.store;
    return options;
}

// One HTTP connection. Reads requests until the peer closes, the request
// asks for close, or the idle timeout expires.
class Session : public std::enable_shared_from_this<Session> {
public:
    Session(tcp::socket&& socket, Router& router, const ServerOptions& options)
        : stream_(std::move(socket)), router_(router), options_(options) {
        beast::error_code ec;
        tcp::endpoint remote = stream_.socket().remote_endpoint(ec);
        if (!ec) {
            remote_ = describe(remote);
        }
    }

    void run() {
        // Start on the connection's strand
        asio::dispatch(stream_.get_executor(),
                       beast::bind_front_handler(&Session::do_read, shared_from_this()));
    }

private:
    using Response = bhttp::response<bhttp::string_body>;

    beast::tcp_stream stream_;
    beast::flat_buffer buffer_;
    std::optional<bhttp::request_parser<bhttp::string_body>> parser_;
    Router& router_;
    const ServerOptions& options_;
    std::string remote_;
    std::chrono::steady_clock::time_point started_;

    void do_read() {
        parser_.emplace();
        parser_->body_limit(options_.body_limit);
        stream_.expires_after(std::chrono::seconds(options_.idle_timeout_seconds));

        bhttp::async_read(stream_, buffer_, *parser_,
                          beast::bind_front_handler(&Session::on_read, shared_from_this()));
    }

    void on_read(beast::error_code ec, std::size_t /*bytes*/) {
        started_ = std::chrono::steady_clock::now();

        if (ec == bhttp::error::end_of_stream) {
            return do_close();
        }
        if (ec == bhttp::error::body_limit) {
            PremiumError error(ErrorKind::InvalidInput, "Request body too large");
            HttpResponse too_large = HttpResponse::json_response(413, error.to_json());
            auto res = make_response(too_large, 11, false);
            const auto& header = parser_->get();
            return send(res, to_std_string(header.method_string()),
                        to_std_string(header.target()));
        }
        if (ec) {
            if (ec != beast::error::timeout && ec != asio::error::operation_aborted &&
                ec != asio::error::connection_reset) {
                Logger::get_instance().log_warning("http", "Read failed from " + remote_ +
                                                   ": " + ec.message());
            }
            return;
        }

        handle_request(parser_->release());
    }

    void handle_request(bhttp::request<bhttp::string_body>&& req) {
        HttpRequest request;
        request.method = to_std_string(req.method_string());
        request.target = to_std_string(req.target());
        for (const auto& field : req) {
            request.headers[to_lower(to_std_string(field.name_string()))] =
                to_std_string(field.value());
        }
        request.body = std::move(req.body());

        HttpResponse response = router_.handle(request);
        send(make_response(response, req.version(), req.keep_alive()),
             request.method, request.target);
    }

    std::shared_ptr<Response> make_response(const HttpResponse& response,
                                            unsigned version, bool keep_alive) {
        auto res = std::make_shared<Response>(static_cast<bhttp::status>(response.status), version);
        res->set(bhttp::field::server, "premium-server");
        if (!response.content_type.empty()) {
            res->set(bhttp::field::content_type, response.content_type);
        }
        for (const auto& [name, value] : response.headers) {
            res->set(name, value);
        }
        res->keep_alive(keep_alive);
        res->body() = response.body;
        res->prepare_payload();
        return res;
    }

    void send(std::shared_ptr<Response> res, std::string method, std::string target) {
        RequestRecord record;
        record.method = std::move(method);
        record.target = std::move(target);
        record.remote = remote_;
        record.status = static_cast<int>(res->result_int());
        record.response_bytes = res->body().size();

        bool close = res->need_eof();
        stream_.expires_after(std::chrono::seconds(options_.idle_timeout_seconds));

        bhttp::async_write(stream_, *res,
            [self = shared_from_this(), res, record, close](beast::error_code ec, std::size_t) mutable {
                self->on_write(std::move(record), close, ec);
            });
    }

    void on_write(RequestRecord record, bool close, beast::error_code ec) {
        record.duration_ms = std::chrono::duration<double, std::milli>(
            std::chrono::steady_clock::now() - started_).count();
        Logger::get_instance().log_request_completed(record);

        if (ec) {
            Logger::get_instance().log_warning("http", "Write failed to " + remote_ +
                                               ": " + ec.message());
            return;
        }
        if (close) {
            return do_close();
        }
        do_read();
    }

    void do_close() {
        beast::error_code ec;
        stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
        if (!ec) {
            do_drain();
        }
    }

    // Closing with unread request bytes resets the connection, and the peer
    // may then lose the response. Discard input until the peer closes.
    void do_drain() {
        buffer_.consume(buffer_.size());
        stream_.expires_after(std::chrono::seconds(options_.idle_timeout_seconds));
        stream_.async_read_some(buffer_.prepare(4096),
            [self = shared_from_this()](beast::error_code ec, std::size_t) {
                if (!ec) {
                    self->do_drain();
                }
            });
    }
};

// Accepts connections and starts a Session for each
class Listener : public std::enable_shared_from_this<Listener> {
public:
    Listener(asio::io_context& ioc, const tcp::endpoint& endpoint,
             Router& router, const ServerOptions& options)
        : ioc_(ioc), acceptor_(asio::make_strand(ioc)), router_(router), options_(options) {
        beast::error_code ec;

        acceptor_.open(endpoint.protocol(), ec);
        if (!ec) acceptor_.set_option(asio::socket_base::reuse_address(true), ec);
        if (!ec) acceptor_.bind(endpoint, ec);
        if (!ec) acceptor_.listen(asio::socket_base::max_listen_connections, ec);
        if (ec) {
            throw ServerError("Cannot listen on " + describe(endpoint) + ": " + ec.message());
        }
    }

    void run() {
        do_accept();
    }

    void stop() {
        asio::post(acceptor_.get_executor(), [self = shared_from_this()]() {
            beast::error_code ec;
            self->acceptor_.close(ec);
        });
    }

    // Only when no worker runs the io_context
    void close() {
        beast::error_code ec;
        acceptor_.close(ec);
    }

    unsigned short port() const {
        return acceptor_.local_endpoint().port();
    }

private:
    asio::io_context& ioc_;
    tcp::acceptor acceptor_;
    Router& router_;
    const ServerOptions& options_;

    void do_accept() {
        // Each connection gets its own strand
        acceptor_.async_accept(asio::make_strand(ioc_),
                               beast::bind_front_handler(&Listener::on_accept, shared_from_this()));
    }

    void on_accept(beast::error_code ec, tcp::socket socket) {
        if (ec == asio::error::operation_aborted || !acceptor_.is_open()) {
            return;
        }
        if (ec) {
            Logger::get_instance().log_warning("http", "Accept failed: " + ec.message());
        } else {
            std::make_shared<Session>(std::move(socket), router_, options_)->run();
        }
        do_accept();
    }
};

HttpServer::HttpServer(Router& router, ServerOptions options)
    : router_(router),
      options_(std::move(options)),
      ioc_(static_cast<int>(std::max<size_t>(1, options_.threads))),
      bound_port_(0),
      running_(false) {}

HttpServer::~HttpServer() {
    stop();
    join_workers();
}

void HttpServer::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_) {
        return;
    }

    if (options_.threads > MAX_SERVER_THREADS) {
        throw ServerError("Too many worker threads: " + std::to_string(options_.threads) +
                          " (at most " + std::to_string(MAX_SERVER_THREADS) + ")");
    }

    beast::error_code ec;
    asio::ip::address address = asio::ip::make_address(options_.address, ec);
    if (ec) {
        throw ServerError("Invalid listen address '" + options_.address + "': " + ec.message());
    }

    ioc_.restart();
    listener_ = std::make_shared<Listener>(ioc_, tcp::endpoint(address, options_.port),
                                           router_, options_);
    bound_port_ = listener_->port();
    listener_->run();

    size_t threads = std::max<size_t>(1, options_.threads);
    try {
        workers_.reserve(threads);
        for (size_t i = 0; i < threads; ++i) {
            workers_.emplace_back([this]() { ioc_.run(); });
        }
    } catch (const std::exception& e) {
        // Workers already started must leave ioc_.run() before they can be joined
        size_t started = workers_.size();
        ioc_.stop();
        join_workers();
        listener_->close();
        listener_.reset();
        throw ServerError("Cannot start " + std::to_string(threads) + " worker threads (" +
                          std::to_string(started) + " started): " + e.what());
    }
    running_ = true;

    Logger::get_instance().log_server_started(options_.address, bound_port_, threads,
                                              options_.store_backend);
}

void HttpServer::run() {
    signals_ = std::make_unique<asio::signal_set>(ioc_, SIGINT, SIGTERM);
    signals_->async_wait([this](const beast::error_code& ec, int signal_number) {
        if (ec) {
            return;
        }
        Logger::get_instance().log_server_stopped(signal_number == SIGINT ? "SIGINT" : "SIGTERM");
        stop();
    });

    start();
    join_workers();
}

void HttpServer::stop() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!running_) {
        return;
    }
    running_ = false;

    if (listener_) {
        listener_->stop();
    }
    if (signals_) {
        beast::error_code ec;
        signals_->cancel(ec);
    }
    ioc_.stop();
}

bool HttpServer::is_running() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return running_;
}

void HttpServer::join_workers() {
    for (auto& worker : workers_) {
        if (worker.joinable() && worker.get_id() != std::this_thread::get_id()) {
            worker.join();
        }
    }
    workers_.clear();
}

} // namespace http
} // namespace premium
