#pragma once

#include "upsync/network/http_parser.hpp"
#include "upsync/network/http_types.hpp"

#include <boost/asio.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <array>
#include <functional>
#include <memory>
#include <string>

namespace upsync {
namespace network {

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

using HttpRequestHandler = std::function<HttpResponse(const HttpRequest&)>;

/**
 * @brief Per-connection state for one request/response exchange
 *
 * Lifecycle:
 * 1. Created when a connection is accepted
 * 2. start() begins the async read chain
 * 3. The handler runs once the request is fully parsed
 * 4. Destroyed after the response is written (Connection: close)
 */
class HttpConnection : public std::enable_shared_from_this<HttpConnection> {
public:
    HttpConnection(tcp::socket socket, HttpRequestHandler handler);

    void start();

private:
    void do_read();
    void do_write(const HttpResponse& response);
    void handle_error(const std::string& message);

    static HttpResponse create_error_response(HttpStatus status, const std::string& message);

    tcp::socket socket_;
    HttpRequestHandler handler_;
    HttpParser parser_;
    std::array<char, 8192> buffer_;
};

/**
 * @brief Event-driven HTTP server on a caller-owned io_context
 *
 * Port 0 binds an ephemeral port; port() reports the one actually bound.
 *
 * Usage:
 * ```cpp
 * asio::io_context io_context;
 * HttpServer server(io_context, "127.0.0.1", 8080);
 * server.set_handler([](const HttpRequest& req) { ... });
 * io_context.run();
 * ```
 */
class HttpServer {
public:
    HttpServer(asio::io_context& io_context, const std::string& address, uint16_t port);

    /// Must be set before io_context runs
    void set_handler(HttpRequestHandler handler);

    uint16_t port() const { return port_; }

    /// Stop accepting; in-flight connections finish on their own
    void stop();

private:
    void do_accept();

    tcp::acceptor acceptor_;
    HttpRequestHandler handler_;
    uint16_t port_;
};

} // namespace network
} // namespace upsync
