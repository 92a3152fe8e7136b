#include "upsync/server/ingest_service.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace upsync::server {
using json = nlohmann::json;
using network::HttpMethod;
using network::HttpRequest;
using network::HttpResponse;
using network::HttpStatus;

namespace {

std::string path_of(const std::string& target) {
    return target.substr(0, target.find('?'));
}

} // namespace

IngestService::IngestService(IngestOptions options) : options_(std::move(options)) {}

HttpResponse IngestService::handle(const HttpRequest& request) {
    const std::string path = path_of(request.url);

    if (path == options_.upload_path) {
        if (request.method != HttpMethod::POST) {
            return error_response(405, "Use POST to upload");
        }
        return handle_upload(request);
    }
    if (path == options_.upload_path + "/status") {
        if (request.method != HttpMethod::GET) {
            return error_response(405, "Use GET for status");
        }
        return handle_status(request);
    }
    return error_response(404, "Not found: " + path);
}

HttpResponse IngestService::handle_upload(const HttpRequest& request) {
    if (!authorized(request)) {
        return error_response(401, "Invalid upload token");
    }

    wait_injected_delay();

    {
        std::lock_guard lock(mutex_);
        ++upload_requests_;
        if (!failures_.empty()) {
            auto failure = failures_.front();
            failures_.pop_front();
            spdlog::debug("Injected failure {} for upload", failure.status_code);
            return error_response(failure.status_code, failure.detail);
        }
    }

    auto payload = sync::decode_upload(request.body_as_string());
    if (payload.is_error()) {
        return error_response(422, payload.error().message);
    }

    const auto counts = upsert(payload.value());
    spdlog::info("Batch {}: articles +{} ~{}, creators +{} ~{}",
                 payload.value().batch_id.empty() ? "<unnamed>" : payload.value().batch_id,
                 counts.articles_inserted,
                 counts.articles_updated,
                 counts.creators_inserted,
                 counts.creators_updated);

    json body{
        {"insertedCount", counts.articles_inserted + counts.creators_inserted},
        {"updatedCount", counts.articles_updated + counts.creators_updated},
        {"articles_inserted", counts.articles_inserted},
        {"articles_updated", counts.articles_updated},
        {"creators_inserted", counts.creators_inserted},
        {"creators_updated", counts.creators_updated},
    };
    return json_response(HttpStatus::OK, body.dump());
}

HttpResponse IngestService::handle_status(const HttpRequest& request) {
    if (!authorized(request)) {
        return error_response(401, "Invalid upload token");
    }
    return json_response(HttpStatus::OK, sync::encode_status(status()));
}

IngestService::UpsertCounts IngestService::upsert(const sync::UploadPayload& payload) {
    std::lock_guard lock(mutex_);
    UpsertCounts counts;

    for (const auto& record : payload.content) {
        auto [it, inserted] = content_.insert_or_assign(record.content_id, record);
        (void)it;
        inserted ? ++counts.articles_inserted : ++counts.articles_updated;
    }
    for (const auto& record : payload.creators) {
        auto [it, inserted] = creators_.insert_or_assign(record.user_id, record);
        (void)it;
        inserted ? ++counts.creators_inserted : ++counts.creators_updated;
    }
    batch_ids_.push_back(payload.batch_id);
    return counts;
}

sync::RemoteStatus IngestService::status() const {
    std::lock_guard lock(mutex_);
    sync::RemoteStatus out;
    out.article_count = content_.size();
    out.creator_count = creators_.size();
    out.existing_content_ids.reserve(content_.size());
    for (const auto& [id, record] : content_) {
        out.existing_content_ids.push_back(id);
    }
    return out;
}

bool IngestService::authorized(const HttpRequest& request) const {
    if (options_.token.empty()) {
        return true;
    }
    const std::string bearer = request.get_header("Authorization");
    if (bearer == "Bearer " + options_.token) {
        return true;
    }
    return request.get_header("X-Upload-Token") == options_.token;
}

void IngestService::fail_next(int status_code, std::string detail, std::size_t times) {
    std::lock_guard lock(mutex_);
    for (std::size_t i = 0; i < times; ++i) {
        failures_.push_back({status_code, detail});
    }
}

void IngestService::set_response_delay(std::chrono::milliseconds delay) {
    std::lock_guard lock(mutex_);
    delay_ = delay;
}

void IngestService::shutdown() {
    {
        std::lock_guard lock(mutex_);
        shutting_down_ = true;
    }
    cv_.notify_all();
}

void IngestService::wait_injected_delay() {
    std::unique_lock lock(mutex_);
    if (delay_.count() <= 0) {
        return;
    }
    cv_.wait_for(lock, delay_, [this]() { return shutting_down_; });
}

std::vector<std::string> IngestService::received_batch_ids() const {
    std::lock_guard lock(mutex_);
    return batch_ids_;
}

std::size_t IngestService::upload_requests() const {
    std::lock_guard lock(mutex_);
    return upload_requests_;
}

std::size_t IngestService::article_count() const {
    std::lock_guard lock(mutex_);
    return content_.size();
}

std::size_t IngestService::creator_count() const {
    std::lock_guard lock(mutex_);
    return creators_.size();
}

std::optional<sync::ContentRecord> IngestService::find_content(const std::string& content_id) const {
    std::lock_guard lock(mutex_);
    auto it = content_.find(content_id);
    if (it == content_.end()) {
        return std::nullopt;
    }
    return it->second;
}

HttpResponse IngestService::json_response(HttpStatus status, const std::string& body) {
    HttpResponse response(status);
    response.set_header("Content-Type", "application/json");
    response.set_body(body);
    return response;
}

HttpResponse IngestService::error_response(int status_code, const std::string& detail) {
    HttpResponse response;
    response.status_code = status_code;
    response.reason_phrase = HttpResponse::get_reason_phrase(static_cast<HttpStatus>(status_code));
    response.set_header("Content-Type", "application/json");
    response.set_body(json{{"detail", detail}}.dump());
    return response;
}

// ──────────────────────────────────────────────────────────
// IngestServer
// ──────────────────────────────────────────────────────────

IngestServer::IngestServer(IngestService& service, const std::string& address, uint16_t port)
    : service_(service)
    , address_(address)
    , server_(std::make_unique<network::HttpServer>(io_context_, address, port)) {
    server_->set_handler([this](const HttpRequest& request) { return service_.handle(request); });
}

IngestServer::~IngestServer() {
    stop();
}

void IngestServer::start() {
    if (thread_.joinable()) {
        return;
    }
    thread_ = std::thread([this]() { run(); });
}

void IngestServer::run() {
    io_context_.run();
}

void IngestServer::stop() {
    service_.shutdown();
    boost::asio::post(io_context_, [this]() { server_->stop(); });
    io_context_.stop();
    if (thread_.joinable() && thread_.get_id() != std::this_thread::get_id()) {
        thread_.join();
    }
}

std::string IngestServer::url() const {
    return "http://" + address_ + ":" + std::to_string(port());
}

} // namespace upsync::server
