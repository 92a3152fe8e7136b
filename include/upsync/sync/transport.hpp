#pragma once

#include "upsync/core/cancellation.hpp"
#include "upsync/core/result.hpp"
#include "upsync/network/http_client.hpp"
#include "upsync/network/url.hpp"
#include "upsync/sync/scheduler.hpp"
#include "upsync/sync/wire.hpp"

#include <chrono>
#include <memory>
#include <string>

namespace upsync::sync {

/**
 * @brief One authenticated call per batch
 *
 * Failure kinds:
 * - Auth:       credential rejected; fatal, never retried automatically
 * - Validation: payload rejected; the batch is skipped
 * - Server:     5xx, network failure, timeout or malformed answer; retryable
 * - Cancelled:  aborted in flight; the batch must not be confirmed
 */
class BatchTransport {
public:
    virtual ~BatchTransport() = default;

    virtual Result<BatchAck> send(const Batch& batch,
                                  const std::string& credential,
                                  const CancellationToken& cancel) = 0;
};

struct TransportOptions {
    std::chrono::milliseconds timeout{120000};
    bool verify_peer = true;
    std::string ca_file;
};

/**
 * @brief BatchTransport over HTTP(S) POST
 *
 * Sends `Authorization: Bearer <credential>` and the `X-Upload-Token`
 * header older ingest services read.
 */
class HttpBatchTransport : public BatchTransport {
public:
    /// ErrorKind::Config for an unusable endpoint
    static Result<std::unique_ptr<HttpBatchTransport>> create(const std::string& endpoint,
                                                              TransportOptions options = {});

    Result<BatchAck> send(const Batch& batch,
                          const std::string& credential,
                          const CancellationToken& cancel) override;

    /// GET <endpoint>/status
    Result<RemoteStatus> fetch_status(const std::string& credential, const CancellationToken& cancel);

    const network::Url& endpoint() const { return endpoint_; }

private:
    HttpBatchTransport(network::Url endpoint, TransportOptions options);

    network::HttpRequest make_request(network::HttpMethod method, const std::string& credential) const;

    network::Url endpoint_;
    network::HttpClient client_;
};

/// Map a non-2xx response onto the transport failure kinds
Error classify_response(const network::HttpResponse& response);

} // namespace upsync::sync
