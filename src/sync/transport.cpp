#include "upsync/sync/transport.hpp"

#include <spdlog/spdlog.h>

namespace upsync::sync {

namespace {

network::ClientOptions client_options(const TransportOptions& options) {
    network::ClientOptions out;
    out.timeout = options.timeout;
    out.verify_peer = options.verify_peer;
    out.ca_file = options.ca_file;
    return out;
}

} // namespace

Error classify_response(const network::HttpResponse& response) {
    const int code = response.status_code;
    std::string fallback = response.reason_phrase.empty() ? "HTTP " + std::to_string(code) : response.reason_phrase;
    const std::string detail = error_detail(response.body_as_string(), fallback);
    const std::string message = "HTTP " + std::to_string(code) + ": " + detail;

    if (code == 401 || code == 403) {
        return Error{ErrorKind::Auth, message};
    }
    if (code >= 400 && code < 500) {
        // 408/429 are load shedding, not a rejected payload
        if (code == 408 || code == 429) {
            return Error{ErrorKind::Server, message};
        }
        return Error{ErrorKind::Validation, message};
    }
    return Error{ErrorKind::Server, message};
}

HttpBatchTransport::HttpBatchTransport(network::Url endpoint, TransportOptions options)
    : endpoint_(std::move(endpoint))
    , client_(client_options(options)) {
}

Result<std::unique_ptr<HttpBatchTransport>> HttpBatchTransport::create(const std::string& endpoint,
                                                                       TransportOptions options) {
    if (endpoint.empty()) {
        return Err<std::unique_ptr<HttpBatchTransport>>(ErrorKind::Config, "No upload endpoint configured");
    }
    auto url = network::parse_url(endpoint);
    if (url.is_error()) {
        return Err<std::unique_ptr<HttpBatchTransport>>(url.error());
    }
    if (!url.value().is_tls()) {
        spdlog::warn("Endpoint {} is not https; the credential travels in clear text", endpoint);
    }
    return Ok(std::unique_ptr<HttpBatchTransport>(new HttpBatchTransport(std::move(url.value()), std::move(options))));
}

network::HttpRequest HttpBatchTransport::make_request(network::HttpMethod method, const std::string& credential) const {
    network::HttpRequest request;
    request.method = method;
    request.set_header("Accept", "application/json");
    request.set_header("Authorization", "Bearer " + credential);
    request.set_header("X-Upload-Token", credential);
    return request;
}

Result<BatchAck> HttpBatchTransport::send(const Batch& batch,
                                          const std::string& credential,
                                          const CancellationToken& cancel) {
    if (credential.empty()) {
        return Err<BatchAck>(ErrorKind::Config, "No upload credential configured");
    }

    auto request = make_request(network::HttpMethod::POST, credential);
    request.set_header("Content-Type", "application/json");
    request.set_body(encode_batch(batch));

    auto response = client_.send(endpoint_, std::move(request), cancel);
    if (response.is_error()) {
        const auto& error = response.error();
        if (error.kind == ErrorKind::Cancelled || error.kind == ErrorKind::Config) {
            return Err<BatchAck>(error);
        }
        // Transport-level trouble is retryable whatever the cause
        return Err<BatchAck>(ErrorKind::Server, error.message);
    }

    const auto& http = response.value();
    if (!http.is_success()) {
        return Err<BatchAck>(classify_response(http));
    }

    auto ack = decode_ack(http.body_as_string());
    if (ack.is_error()) {
        return Err<BatchAck>(ErrorKind::Server, "Batch " + batch.batch_id() + ": " + ack.error().message);
    }
    return ack;
}

Result<RemoteStatus> HttpBatchTransport::fetch_status(const std::string& credential, const CancellationToken& cancel) {
    auto response = client_.send(endpoint_.with_path_suffix("/status"),
                                 make_request(network::HttpMethod::GET, credential),
                                 cancel);
    if (response.is_error()) {
        return Err<RemoteStatus>(response.error());
    }
    if (!response.value().is_success()) {
        return Err<RemoteStatus>(classify_response(response.value()));
    }
    return decode_status(response.value().body_as_string());
}

} // namespace upsync::sync
