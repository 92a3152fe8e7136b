#pragma once

#include "upsync/core/cancellation.hpp"
#include "upsync/core/result.hpp"
#include "upsync/network/http_types.hpp"
#include "upsync/network/url.hpp"

#include <chrono>
#include <string>

namespace upsync {
namespace network {

struct ClientOptions {
    std::chrono::milliseconds timeout{120000};  ///< whole exchange, resolve to last byte
    bool verify_peer = true;
    std::string ca_file;                        ///< empty: system trust store
};

/**
 * @brief Blocking HTTP/1.1 client built on Boost.Asio
 *
 * Each send() performs one `Connection: close` exchange on a private
 * io_context, over plain TCP or TLS depending on the URL scheme. The
 * exchange is bounded by a steady_timer deadline and aborted from any
 * thread through the cancellation token.
 *
 * Failure mapping:
 * - token cancelled        -> ErrorKind::Cancelled
 * - resolve/connect/TLS/IO -> ErrorKind::Server
 * - deadline expired       -> ErrorKind::Server
 * - malformed response     -> ErrorKind::Protocol
 *
 * Non-2xx responses are returned as values; classifying them is the
 * caller's business.
 */
class HttpClient {
public:
    explicit HttpClient(ClientOptions options = {});

    Result<HttpResponse> send(const Url& url, HttpRequest request, const CancellationToken& cancel) const;

    const ClientOptions& options() const { return options_; }

private:
    ClientOptions options_;
};

} // namespace network
} // namespace upsync
