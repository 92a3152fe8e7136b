#include "upsync/server/ingest_service.hpp"
#include "upsync/sync/transport.hpp"

#include "../support/fixtures.hpp"

#include <nlohmann/json.hpp>
#include <gtest/gtest.h>

#include <thread>

using upsync::CancellationToken;
using upsync::ErrorKind;
using upsync::network::HttpMethod;
using upsync::network::HttpRequest;
using upsync::server::IngestOptions;
using upsync::server::IngestServer;
using upsync::server::IngestService;
using upsync::sync::Batch;
using upsync::sync::BatchScheduler;
using upsync::sync::HttpBatchTransport;
using upsync::test_support::make_content_list;
using json = nlohmann::json;

namespace {

constexpr const char* kToken = "secret-token";

HttpRequest upload_request(const std::string& body, const std::string& token = kToken) {
    HttpRequest request;
    request.method = HttpMethod::POST;
    request.url = "/api/sync/upload";
    request.set_header("Authorization", "Bearer " + token);
    request.set_body(body);
    return request;
}

Batch content_batch(std::size_t count, std::uint64_t sequence = 1) {
    auto batches = BatchScheduler::schedule(make_content_list(count), count, sequence);
    return batches.value().front();
}

IngestOptions with_token() {
    IngestOptions options;
    options.token = kToken;
    return options;
}

} // namespace

// ============================================================================
// Service, called directly
// ============================================================================

TEST(IngestServiceTest, UpsertIsIdempotent) {
    IngestService service(with_token());
    const auto body = upsync::sync::encode_batch(content_batch(3));

    auto first = service.handle(upload_request(body));
    ASSERT_EQ(first.status_code, 200);
    auto ack = json::parse(first.body_as_string());
    EXPECT_EQ(ack["insertedCount"], 3);
    EXPECT_EQ(ack["updatedCount"], 0);
    EXPECT_EQ(ack["articles_inserted"], 3);

    auto second = service.handle(upload_request(body));
    ASSERT_EQ(second.status_code, 200);
    ack = json::parse(second.body_as_string());
    EXPECT_EQ(ack["insertedCount"], 0);
    EXPECT_EQ(ack["updatedCount"], 3);

    EXPECT_EQ(service.article_count(), 3u);
    EXPECT_EQ(service.received_batch_ids(), (std::vector<std::string>{"articles-1", "articles-1"}));
}

TEST(IngestServiceTest, RejectsWrongToken) {
    IngestService service(with_token());
    auto response = service.handle(upload_request("{}", "wrong"));
    EXPECT_EQ(response.status_code, 401);
    EXPECT_EQ(json::parse(response.body_as_string())["detail"], "Invalid upload token");
    EXPECT_EQ(service.upload_requests(), 0u);
}

TEST(IngestServiceTest, AcceptsLegacyTokenHeader) {
    IngestService service(with_token());
    HttpRequest request;
    request.method = HttpMethod::POST;
    request.url = "/api/sync/upload";
    request.set_header("X-Upload-Token", kToken);
    request.set_body(upsync::sync::encode_batch(content_batch(1)));
    EXPECT_EQ(service.handle(request).status_code, 200);
}

TEST(IngestServiceTest, InvalidPayloadIs422) {
    IngestService service;
    auto response = service.handle(upload_request(R"({"contentRecords": [{"title": "no id"}]})"));
    EXPECT_EQ(response.status_code, 422);
    EXPECT_EQ(service.article_count(), 0u);
}

TEST(IngestServiceTest, RoutesByPathAndMethod) {
    IngestService service;

    HttpRequest unknown;
    unknown.method = HttpMethod::GET;
    unknown.url = "/elsewhere";
    EXPECT_EQ(service.handle(unknown).status_code, 404);

    HttpRequest wrong_method;
    wrong_method.method = HttpMethod::GET;
    wrong_method.url = "/api/sync/upload";
    EXPECT_EQ(service.handle(wrong_method).status_code, 405);

    HttpRequest status;
    status.method = HttpMethod::GET;
    status.url = "/api/sync/upload/status?verbose=1";
    EXPECT_EQ(service.handle(status).status_code, 200);
}

TEST(IngestServiceTest, InjectedFailuresAreConsumedInOrder) {
    IngestService service;
    service.fail_next(500, "database locked");
    service.fail_next(422, "bad batch");
    const auto body = upsync::sync::encode_batch(content_batch(2));

    EXPECT_EQ(service.handle(upload_request(body)).status_code, 500);
    EXPECT_EQ(service.handle(upload_request(body)).status_code, 422);
    EXPECT_EQ(service.handle(upload_request(body)).status_code, 200);
    EXPECT_EQ(service.upload_requests(), 3u);
    EXPECT_EQ(service.article_count(), 2u);
}

// ============================================================================
// HTTP transport against a live stub
// ============================================================================

class TransportEndToEndTest : public ::testing::Test {
protected:
    void SetUp() override {
        service_ = std::make_unique<IngestService>(with_token());
        server_ = std::make_unique<IngestServer>(*service_, "127.0.0.1", 0);
        server_->start();
    }

    void TearDown() override {
        server_->stop();
        server_.reset();
        service_.reset();
    }

    std::unique_ptr<HttpBatchTransport> transport(std::chrono::milliseconds timeout = std::chrono::seconds(10)) {
        upsync::sync::TransportOptions options;
        options.timeout = timeout;
        auto created = HttpBatchTransport::create(server_->url() + "/api/sync/upload", options);
        EXPECT_TRUE(created.is_ok());
        return std::move(created.value());
    }

    std::unique_ptr<IngestService> service_;
    std::unique_ptr<IngestServer> server_;
};

TEST_F(TransportEndToEndTest, SendsBatchAndReadsAck) {
    auto client = transport();
    CancellationToken cancel;

    auto ack = client->send(content_batch(5), kToken, cancel);
    ASSERT_TRUE(ack.is_ok()) << ack.error().message;
    EXPECT_EQ(ack.value().inserted, 5u);
    EXPECT_EQ(ack.value().updated, 0u);

    auto again = client->send(content_batch(5), kToken, cancel);
    ASSERT_TRUE(again.is_ok());
    EXPECT_EQ(again.value().inserted, 0u);
    EXPECT_EQ(again.value().updated, 5u);

    auto stored = service_->find_content("c4");
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->title, "Title c4");
}

TEST_F(TransportEndToEndTest, WrongTokenIsAuthError) {
    CancellationToken cancel;
    auto ack = transport()->send(content_batch(1), "nope", cancel);
    ASSERT_TRUE(ack.is_error());
    EXPECT_EQ(ack.error().kind, ErrorKind::Auth);
    EXPECT_NE(ack.error().message.find("Invalid upload token"), std::string::npos);
}

TEST_F(TransportEndToEndTest, EmptyCredentialIsConfigErrorWithoutRequest) {
    CancellationToken cancel;
    auto ack = transport()->send(content_batch(1), "", cancel);
    ASSERT_TRUE(ack.is_error());
    EXPECT_EQ(ack.error().kind, ErrorKind::Config);
    EXPECT_EQ(service_->upload_requests(), 0u);
}

TEST_F(TransportEndToEndTest, ServerAndValidationFailures) {
    auto client = transport();
    CancellationToken cancel;

    service_->fail_next(500, "database locked");
    auto server_error = client->send(content_batch(1), kToken, cancel);
    ASSERT_TRUE(server_error.is_error());
    EXPECT_EQ(server_error.error().kind, ErrorKind::Server);
    EXPECT_EQ(server_error.error().message, "HTTP 500: database locked");

    service_->fail_next(422, "bad batch");
    auto rejected = client->send(content_batch(1), kToken, cancel);
    ASSERT_TRUE(rejected.is_error());
    EXPECT_EQ(rejected.error().kind, ErrorKind::Validation);
}

TEST_F(TransportEndToEndTest, CancelAbortsInFlightRequest) {
    service_->set_response_delay(std::chrono::seconds(5));
    auto client = transport();
    CancellationToken cancel;

    std::thread canceller([cancel]() mutable {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        cancel.cancel();
    });

    const auto start = std::chrono::steady_clock::now();
    auto ack = client->send(content_batch(1), kToken, cancel);
    const auto elapsed = std::chrono::steady_clock::now() - start;
    canceller.join();

    ASSERT_TRUE(ack.is_error());
    EXPECT_EQ(ack.error().kind, ErrorKind::Cancelled);
    EXPECT_LT(elapsed, std::chrono::seconds(3));
}

TEST_F(TransportEndToEndTest, DeadlineIsServerError) {
    service_->set_response_delay(std::chrono::seconds(5));
    auto client = transport(std::chrono::milliseconds(200));
    CancellationToken cancel;

    auto ack = client->send(content_batch(1), kToken, cancel);
    ASSERT_TRUE(ack.is_error());
    EXPECT_EQ(ack.error().kind, ErrorKind::Server);
}

TEST_F(TransportEndToEndTest, FetchStatus) {
    auto client = transport();
    CancellationToken cancel;
    ASSERT_TRUE(client->send(content_batch(3), kToken, cancel).is_ok());

    auto status = client->fetch_status(kToken, cancel);
    ASSERT_TRUE(status.is_ok()) << status.error().message;
    EXPECT_EQ(status.value().article_count, 3u);
    EXPECT_EQ(status.value().creator_count, 0u);
    EXPECT_EQ(status.value().existing_content_ids, (std::vector<std::string>{"c0", "c1", "c2"}));
}

TEST(TransportTest, UnreachableEndpointIsServerError) {
    // Bind then release a port so nothing listens on it
    boost::asio::io_context context;
    boost::asio::ip::tcp::acceptor probe(context, {boost::asio::ip::make_address("127.0.0.1"), 0});
    const auto port = probe.local_endpoint().port();
    probe.close();

    upsync::sync::TransportOptions options;
    options.timeout = std::chrono::seconds(5);
    auto created = HttpBatchTransport::create("http://127.0.0.1:" + std::to_string(port) + "/upload", options);
    ASSERT_TRUE(created.is_ok());

    CancellationToken cancel;
    auto ack = created.value()->send(content_batch(1), kToken, cancel);
    ASSERT_TRUE(ack.is_error());
    EXPECT_EQ(ack.error().kind, ErrorKind::Server);
}

TEST(TransportTest, CreateRejectsBadEndpoint) {
    auto empty = HttpBatchTransport::create("");
    ASSERT_TRUE(empty.is_error());
    EXPECT_EQ(empty.error().kind, ErrorKind::Config);

    auto relative = HttpBatchTransport::create("/api/sync/upload");
    ASSERT_TRUE(relative.is_error());
    EXPECT_EQ(relative.error().kind, ErrorKind::Config);
}
