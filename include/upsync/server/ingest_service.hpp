#pragma once

#include "upsync/core/result.hpp"
#include "upsync/network/http_server.hpp"
#include "upsync/network/http_types.hpp"
#include "upsync/sync/wire.hpp"

#include <boost/asio.hpp>

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace upsync::server {

struct IngestOptions {
    std::string upload_path = "/api/sync/upload";
    std::string token;          ///< empty: accept any caller
};

/**
 * @brief In-memory receiver implementing the per-batch upsert contract
 *
 *   POST <upload_path>         upsert a batch, answer insert/update counts
 *   GET  <upload_path>/status  counts and known content ids
 *
 * Re-sending a record updates it instead of inserting it again, so a
 * batch can be delivered any number of times. Failures can be injected
 * for tests.
 */
class IngestService {
public:
    explicit IngestService(IngestOptions options = {});

    network::HttpResponse handle(const network::HttpRequest& request);

    /// Split insert/update counts of one applied batch
    struct UpsertCounts {
        std::size_t articles_inserted = 0;
        std::size_t articles_updated = 0;
        std::size_t creators_inserted = 0;
        std::size_t creators_updated = 0;
    };

    UpsertCounts upsert(const sync::UploadPayload& payload);
    sync::RemoteStatus status() const;

    // Fault injection
    void fail_next(int status_code, std::string detail, std::size_t times = 1);
    void set_response_delay(std::chrono::milliseconds delay);

    /// Wake handlers sleeping in an injected delay
    void shutdown();

    std::vector<std::string> received_batch_ids() const;
    std::size_t upload_requests() const;
    std::size_t article_count() const;
    std::size_t creator_count() const;
    std::optional<sync::ContentRecord> find_content(const std::string& content_id) const;

private:
    struct InjectedFailure {
        int status_code;
        std::string detail;
    };

    network::HttpResponse handle_upload(const network::HttpRequest& request);
    network::HttpResponse handle_status(const network::HttpRequest& request);
    bool authorized(const network::HttpRequest& request) const;
    void wait_injected_delay();

    static network::HttpResponse json_response(network::HttpStatus status, const std::string& body);
    static network::HttpResponse error_response(int status_code, const std::string& detail);

    IngestOptions options_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool shutting_down_ = false;
    std::chrono::milliseconds delay_{0};
    std::deque<InjectedFailure> failures_;

    std::map<std::string, sync::ContentRecord> content_;     // ordered: status lists ids stably
    std::map<std::string, sync::CreatorRecord> creators_;
    std::vector<std::string> batch_ids_;
    std::size_t upload_requests_ = 0;
};

/**
 * @brief Serves an IngestService over HTTP on a background thread
 */
class IngestServer {
public:
    IngestServer(IngestService& service, const std::string& address, uint16_t port);
    ~IngestServer();

    IngestServer(const IngestServer&) = delete;
    IngestServer& operator=(const IngestServer&) = delete;

    void start();
    void stop();

    /// Block the calling thread on the event loop until stop()
    void run();

    uint16_t port() const { return server_->port(); }
    std::string url() const;

private:
    IngestService& service_;
    std::string address_;
    boost::asio::io_context io_context_;
    std::unique_ptr<network::HttpServer> server_;
    std::thread thread_;
};

} // namespace upsync::server
