#include "upsync/network/http_server.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace upsync {
namespace network {

// ──────────────────────────────────────────────────────────
// HttpConnection
// ──────────────────────────────────────────────────────────

HttpConnection::HttpConnection(tcp::socket socket, HttpRequestHandler handler)
    : socket_(std::move(socket))
    , handler_(std::move(handler))
    , parser_(ParseMode::Request) {
}

void HttpConnection::start() {
    do_read();
}

void HttpConnection::do_read() {
    auto self = shared_from_this();

    socket_.async_read_some(
        asio::buffer(buffer_),
        [this, self](boost::system::error_code ec, size_t bytes_transferred) {
            if (ec) {
                if (ec != asio::error::operation_aborted && ec != asio::error::eof) {
                    spdlog::debug("Read error: {}", ec.message());
                }
                return;
            }

            auto parse_result = parser_.parse(buffer_.data(), bytes_transferred);
            if (parse_result.is_error()) {
                handle_error("Parse error: " + parse_result.error().message);
                return;
            }

            if (!parse_result.value()) {
                do_read();
                return;
            }

            const HttpRequest& request = parser_.get_request();
            spdlog::debug("{} {} ({} bytes)",
                HttpMethodUtils::to_string(request.method),
                request.url,
                request.body.size());

            HttpResponse response;
            if (!handler_) {
                response = create_error_response(HttpStatus::SERVICE_UNAVAILABLE, "No handler installed");
            } else {
                try {
                    response = handler_(request);
                } catch (const std::exception& e) {
                    spdlog::error("Handler threw exception: {}", e.what());
                    response = create_error_response(HttpStatus::INTERNAL_SERVER_ERROR, "Internal server error");
                }
            }

            do_write(response);
        }
    );
}

void HttpConnection::do_write(const HttpResponse& response) {
    auto self = shared_from_this();

    HttpResponse outgoing = response;
    outgoing.set_header("Connection", "close");
    if (outgoing.get_header("Content-Length").empty()) {
        outgoing.set_header("Content-Length", std::to_string(outgoing.body.size()));
    }
    auto data_ptr = std::make_shared<std::vector<uint8_t>>(outgoing.serialize());

    asio::async_write(
        socket_,
        asio::buffer(*data_ptr),
        [this, self, data_ptr](boost::system::error_code ec, size_t bytes_transferred) {
            if (ec) {
                if (ec != asio::error::operation_aborted) {
                    spdlog::debug("Write error: {}", ec.message());
                }
                return;
            }
            spdlog::trace("Sent {} bytes", bytes_transferred);

            boost::system::error_code shutdown_ec;
            socket_.shutdown(tcp::socket::shutdown_both, shutdown_ec);
        }
    );
}

void HttpConnection::handle_error(const std::string& message) {
    spdlog::warn("Connection error: {}", message);
    do_write(create_error_response(HttpStatus::BAD_REQUEST, message));
}

HttpResponse HttpConnection::create_error_response(HttpStatus status, const std::string& message) {
    HttpResponse response(status);
    response.set_header("Content-Type", "application/json");
    response.set_body(nlohmann::json{{"detail", message}}.dump());
    return response;
}

// ──────────────────────────────────────────────────────────
// HttpServer
// ──────────────────────────────────────────────────────────

HttpServer::HttpServer(asio::io_context& io_context, const std::string& address, uint16_t port)
    : acceptor_(io_context, tcp::endpoint(asio::ip::make_address(address), port))
    , port_(acceptor_.local_endpoint().port()) {

    spdlog::info("HTTP server listening on {}:{}", address, port_);
    do_accept();
}

void HttpServer::set_handler(HttpRequestHandler handler) {
    handler_ = std::move(handler);
}

void HttpServer::stop() {
    boost::system::error_code ec;
    acceptor_.close(ec);
    if (ec) {
        spdlog::debug("Closing acceptor: {}", ec.message());
    }
}

void HttpServer::do_accept() {
    acceptor_.async_accept(
        [this](boost::system::error_code ec, tcp::socket socket) {
            if (ec == asio::error::operation_aborted || !acceptor_.is_open()) {
                return;
            }
            if (!ec) {
                std::make_shared<HttpConnection>(std::move(socket), handler_)->start();
            } else {
                spdlog::error("Accept error: {}", ec.message());
            }
            do_accept();
        }
    );
}

} // namespace network
} // namespace upsync
