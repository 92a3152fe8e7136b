#include "upsync/network/http_client.hpp"

#include "upsync/network/http_parser.hpp"

#include <boost/asio.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <spdlog/spdlog.h>

#include <openssl/ssl.h>

#include <array>
#include <memory>
#include <optional>
#include <type_traits>

namespace upsync {
namespace network {

namespace asio = boost::asio;
namespace ssl = boost::asio::ssl;
using tcp = asio::ip::tcp;
using TlsStream = ssl::stream<tcp::socket>;

namespace {

enum class Interruption {
    None,
    TimedOut,
    Cancelled
};

/**
 * @brief State of one request/response exchange
 *
 * Async chain: resolve -> connect -> [TLS handshake] -> write -> read*.
 * Every handler holds a shared_ptr to the exchange, so it stays alive
 * while operations are pending; run() returns once the chain and the
 * deadline timer have drained.
 */
template<typename Stream>
class Exchange : public std::enable_shared_from_this<Exchange<Stream>> {
public:
    static constexpr bool kTls = std::is_same_v<Stream, TlsStream>;

    Exchange(const Url& url,
             std::vector<uint8_t> request_bytes,
             std::chrono::milliseconds timeout,
             std::shared_ptr<ssl::context> tls_context,
             bool verify_peer)
        : url_(url)
        , request_bytes_(std::move(request_bytes))
        , timeout_(timeout)
        , tls_context_(std::move(tls_context))
        , verify_peer_(verify_peer)
        , resolver_(io_)
        , deadline_(io_)
        , parser_(ParseMode::Response) {
        if constexpr (kTls) {
            stream_ = std::make_unique<Stream>(io_, *tls_context_);
        } else {
            stream_ = std::make_unique<Stream>(io_);
        }
    }

    Result<HttpResponse> run() {
        auto self = this->shared_from_this();

        deadline_.expires_after(timeout_);
        deadline_.async_wait([self](boost::system::error_code ec) {
            if (!ec) {
                self->interrupt(Interruption::TimedOut);
            }
        });

        resolver_.async_resolve(
            url_.host,
            std::to_string(url_.port),
            [self](boost::system::error_code ec, tcp::resolver::results_type results) {
                self->on_resolve(ec, results);
            });

        io_.run();

        if (!outcome_) {
            return Err<HttpResponse>(ErrorKind::Server, "HTTP exchange ended without a result");
        }
        return std::move(*outcome_);
    }

    /// Thread-safe: hops onto the exchange's io_context
    void abort() {
        std::weak_ptr<Exchange> weak = this->shared_from_this();
        asio::post(io_, [weak]() {
            if (auto self = weak.lock()) {
                self->interrupt(Interruption::Cancelled);
            }
        });
    }

private:
    void interrupt(Interruption why) {
        if (outcome_) {
            return;
        }
        if (interruption_ == Interruption::None) {
            interruption_ = why;
        }
        resolver_.cancel();
        boost::system::error_code ignored;
        stream_->lowest_layer().close(ignored);
    }

    void on_resolve(boost::system::error_code ec, const tcp::resolver::results_type& results) {
        if (ec) {
            fail("resolve " + url_.host, ec);
            return;
        }

        auto self = this->shared_from_this();
        asio::async_connect(
            stream_->lowest_layer(),
            results,
            [self](boost::system::error_code connect_ec, const tcp::endpoint&) {
                self->on_connect(connect_ec);
            });
    }

    void on_connect(boost::system::error_code ec) {
        if (ec) {
            fail("connect to " + url_.authority(), ec);
            return;
        }

        if constexpr (kTls) {
            if (!SSL_set_tlsext_host_name(stream_->native_handle(), url_.host.c_str())) {
                complete(Err<HttpResponse>(ErrorKind::Server, "Failed to set TLS server name"));
                return;
            }
            if (verify_peer_) {
                stream_->set_verify_mode(ssl::verify_peer);
                stream_->set_verify_callback(ssl::host_name_verification(url_.host));
            } else {
                stream_->set_verify_mode(ssl::verify_none);
            }

            auto self = this->shared_from_this();
            stream_->async_handshake(ssl::stream_base::client, [self](boost::system::error_code hs_ec) {
                if (hs_ec) {
                    self->fail("TLS handshake", hs_ec);
                    return;
                }
                self->do_write();
            });
        } else {
            do_write();
        }
    }

    void do_write() {
        auto self = this->shared_from_this();
        asio::async_write(
            *stream_,
            asio::buffer(request_bytes_),
            [self](boost::system::error_code ec, size_t bytes_transferred) {
                if (ec) {
                    self->fail("send request", ec);
                    return;
                }
                spdlog::trace("Sent {} bytes to {}", bytes_transferred, self->url_.authority());
                self->do_read();
            });
    }

    void do_read() {
        auto self = this->shared_from_this();
        stream_->async_read_some(
            asio::buffer(buffer_),
            [self](boost::system::error_code ec, size_t bytes_transferred) {
                self->on_read(ec, bytes_transferred);
            });
    }

    void on_read(boost::system::error_code ec, size_t bytes_transferred) {
        if (bytes_transferred > 0) {
            auto parsed = parser_.parse(buffer_.data(), bytes_transferred);
            if (parsed.is_error()) {
                complete(Err<HttpResponse>(ErrorKind::Protocol, "Malformed response: " + parsed.error().message));
                return;
            }
            if (parsed.value()) {
                complete(Ok(parser_.get_response()));
                return;
            }
        }

        if (ec == asio::error::eof || ec == ssl::error::stream_truncated) {
            if (interruption_ != Interruption::None) {
                fail("read response", ec);
                return;
            }
            auto finished = parser_.finish();
            if (finished.is_error()) {
                complete(Err<HttpResponse>(ErrorKind::Protocol, finished.error().message));
            } else {
                complete(Ok(parser_.get_response()));
            }
            return;
        }
        if (ec) {
            fail("read response", ec);
            return;
        }
        do_read();
    }

    void fail(const std::string& stage, boost::system::error_code ec) {
        switch (interruption_) {
            case Interruption::Cancelled:
                complete(Err<HttpResponse>(ErrorKind::Cancelled, "Request to " + url_.authority() + " cancelled"));
                break;
            case Interruption::TimedOut:
                complete(Err<HttpResponse>(ErrorKind::Server,
                                           "Request to " + url_.authority() + " timed out after " +
                                               std::to_string(timeout_.count()) + "ms"));
                break;
            case Interruption::None:
                complete(Err<HttpResponse>(ErrorKind::Server, "Failed to " + stage + ": " + ec.message()));
                break;
        }
    }

    void complete(Result<HttpResponse> result) {
        if (outcome_) {
            return;
        }
        outcome_.emplace(std::move(result));
        deadline_.cancel();
        resolver_.cancel();
        boost::system::error_code ignored;
        stream_->lowest_layer().close(ignored);
    }

    Url url_;
    std::vector<uint8_t> request_bytes_;
    std::chrono::milliseconds timeout_;
    std::shared_ptr<ssl::context> tls_context_;
    bool verify_peer_;

    asio::io_context io_;
    tcp::resolver resolver_;
    std::unique_ptr<Stream> stream_;
    asio::steady_timer deadline_;

    HttpParser parser_;
    std::array<char, 8192> buffer_{};
    Interruption interruption_ = Interruption::None;
    std::optional<Result<HttpResponse>> outcome_;
};

Result<std::shared_ptr<ssl::context>> make_tls_context(const ClientOptions& options) {
    auto context = std::make_shared<ssl::context>(ssl::context::tls_client);
    boost::system::error_code ec;
    if (options.ca_file.empty()) {
        context->set_default_verify_paths(ec);
    } else {
        context->load_verify_file(options.ca_file, ec);
    }
    if (ec) {
        return Err<std::shared_ptr<ssl::context>>(ErrorKind::Config,
                                                  "Failed to load TLS trust store: " + ec.message());
    }
    return Ok(std::move(context));
}

template<typename Stream>
Result<HttpResponse> run_exchange(const Url& url,
                                  std::vector<uint8_t> bytes,
                                  const ClientOptions& options,
                                  std::shared_ptr<ssl::context> tls_context,
                                  const CancellationToken& cancel) {
    auto exchange = std::make_shared<Exchange<Stream>>(
        url, std::move(bytes), options.timeout, std::move(tls_context), options.verify_peer);

    auto registration = cancel.on_cancel([exchange]() { exchange->abort(); });
    return exchange->run();
}

} // namespace

HttpClient::HttpClient(ClientOptions options) : options_(std::move(options)) {}

Result<HttpResponse> HttpClient::send(const Url& url, HttpRequest request, const CancellationToken& cancel) const {
    if (cancel.is_cancelled()) {
        return Err<HttpResponse>(ErrorKind::Cancelled, "Request to " + url.authority() + " cancelled");
    }

    request.url = url.target;
    request.version = HttpVersion::HTTP_1_1;
    request.set_header("Host", url.authority());
    request.set_header("Connection", "close");
    if (!request.has_header("User-Agent")) {
        request.set_header("User-Agent", "upsync/1.0");
    }
    if (!request.has_header("Content-Length") &&
        (request.method == HttpMethod::POST || request.method == HttpMethod::PUT)) {
        request.set_header("Content-Length", std::to_string(request.body.size()));
    }

    spdlog::debug("{} {}", HttpMethodUtils::to_string(request.method), url.to_string());

    if (url.is_tls()) {
        auto tls_context = make_tls_context(options_);
        if (tls_context.is_error()) {
            return Err<HttpResponse>(tls_context.error());
        }
        return run_exchange<TlsStream>(url, request.serialize(), options_, tls_context.value(), cancel);
    }
    return run_exchange<tcp::socket>(url, request.serialize(), options_, nullptr, cancel);
}

} // namespace network
} // namespace upsync
