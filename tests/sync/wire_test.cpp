#include "upsync/sync/transport.hpp"
#include "upsync/sync/wire.hpp"

#include "../support/fixtures.hpp"

#include <nlohmann/json.hpp>
#include <gtest/gtest.h>

using upsync::ErrorKind;
using upsync::sync::Batch;
using upsync::sync::BatchScheduler;
using upsync::sync::EntityType;
using upsync::network::HttpResponse;
using upsync::network::HttpStatus;
using upsync::test_support::make_content_list;
using upsync::test_support::make_creator;
using json = nlohmann::json;

namespace {

HttpResponse response_with(int code, const std::string& body) {
    HttpResponse response;
    response.status_code = code;
    response.reason_phrase = "Reason";
    response.set_body(body);
    return response;
}

} // namespace

// ============================================================================
// Request body
// ============================================================================

TEST(WireTest, ContentBatchBody) {
    auto records = make_content_list(2);
    records[1].content_text = "Body";
    auto batches = BatchScheduler::schedule(records, 50, 3);
    ASSERT_TRUE(batches.is_ok());

    const auto doc = json::parse(upsync::sync::encode_batch(batches.value()[0]));
    EXPECT_EQ(doc.at("batchId"), "articles-3");
    ASSERT_EQ(doc.at("contentRecords").size(), 2u);
    EXPECT_TRUE(doc.at("creatorRecords").empty());

    const auto& first = doc.at("contentRecords")[0];
    EXPECT_EQ(first.at("content_id"), "c0");
    EXPECT_EQ(first.at("content_type"), "article");
    EXPECT_TRUE(first.at("content_text").is_null());
    EXPECT_TRUE(first.at("author_id").is_null());
    EXPECT_EQ(doc.at("contentRecords")[1].at("content_text"), "Body");
}

TEST(WireTest, CreatorBatchBody) {
    Batch batch;
    batch.entity_type = EntityType::Creator;
    batch.sequence = 1;
    batch.creators = {make_creator(7)};

    const auto doc = json::parse(upsync::sync::encode_batch(batch));
    EXPECT_EQ(doc.at("batchId"), "creators-1");
    EXPECT_TRUE(doc.at("contentRecords").empty());
    ASSERT_EQ(doc.at("creatorRecords").size(), 1u);
    EXPECT_EQ(doc.at("creatorRecords")[0].at("user_id"), "u7");
    EXPECT_EQ(doc.at("creatorRecords")[0].at("url_token"), "token-u7");
}

TEST(WireTest, InvalidUtf8IsReplacedNotThrown) {
    auto records = make_content_list(1);
    records[0].title = "bad \xC3 title";
    auto batches = BatchScheduler::schedule(records, 50, 1);
    ASSERT_TRUE(batches.is_ok());

    std::string body;
    ASSERT_NO_THROW(body = upsync::sync::encode_batch(batches.value()[0]));
    auto payload = upsync::sync::decode_upload(body);
    ASSERT_TRUE(payload.is_ok()) << payload.error().message;
    EXPECT_EQ(payload.value().content[0].title, "bad \xEF\xBF\xBD title");
}

TEST(WireTest, DecodeUploadAcceptsLegacyKeys) {
    auto payload = upsync::sync::decode_upload(R"({
        "articles": [{"content_id": "a1", "title": "T"}],
        "creators": [{"user_id": "u1"}],
        "batch_id": "legacy-1"
    })");
    ASSERT_TRUE(payload.is_ok()) << payload.error().message;
    EXPECT_EQ(payload.value().batch_id, "legacy-1");
    ASSERT_EQ(payload.value().content.size(), 1u);
    EXPECT_EQ(payload.value().content[0].content_type, "article");
    ASSERT_EQ(payload.value().creators.size(), 1u);
}

TEST(WireTest, DecodeUploadRejectsBadRecords) {
    auto not_object = upsync::sync::decode_upload("[1,2]");
    ASSERT_TRUE(not_object.is_error());
    EXPECT_EQ(not_object.error().kind, ErrorKind::Validation);

    auto missing_id = upsync::sync::decode_upload(R"({"contentRecords": [{"title": "no id"}]})");
    ASSERT_TRUE(missing_id.is_error());
    EXPECT_EQ(missing_id.error().kind, ErrorKind::Validation);

    auto empty_id = upsync::sync::decode_upload(R"({"creatorRecords": [{"user_id": ""}]})");
    ASSERT_TRUE(empty_id.is_error());
    EXPECT_EQ(empty_id.error().kind, ErrorKind::Validation);
}

// ============================================================================
// Acknowledgement
// ============================================================================

TEST(WireTest, DecodeAckCounts) {
    auto ack = upsync::sync::decode_ack(R"({"insertedCount": 48, "updatedCount": 2})");
    ASSERT_TRUE(ack.is_ok());
    EXPECT_EQ(ack.value().inserted, 48u);
    EXPECT_EQ(ack.value().updated, 2u);
}

TEST(WireTest, DecodeAckSumsLegacyCounts) {
    auto ack = upsync::sync::decode_ack(
        R"({"articles_inserted": 3, "articles_updated": 1, "creators_inserted": 2, "creators_updated": 0})");
    ASSERT_TRUE(ack.is_ok());
    EXPECT_EQ(ack.value().inserted, 5u);
    EXPECT_EQ(ack.value().updated, 1u);
}

TEST(WireTest, DecodeAckRejectsUnknownBodies) {
    EXPECT_EQ(upsync::sync::decode_ack("OK").error().kind, ErrorKind::Protocol);
    EXPECT_EQ(upsync::sync::decode_ack(R"({"status": "ok"})").error().kind, ErrorKind::Protocol);
}

TEST(WireTest, ErrorDetail) {
    EXPECT_EQ(upsync::sync::error_detail(R"({"detail": "Invalid upload token"})", "fallback"),
              "Invalid upload token");
    EXPECT_EQ(upsync::sync::error_detail("<html>oops</html>", "Bad Gateway"), "Bad Gateway");
    EXPECT_NE(upsync::sync::error_detail(R"({"detail": [{"loc": ["body"]}]})", "x").find("loc"),
              std::string::npos);
}

TEST(WireTest, StatusRoundTrip) {
    upsync::sync::RemoteStatus status;
    status.article_count = 2;
    status.creator_count = 1;
    status.existing_content_ids = {"a", "b"};

    auto decoded = upsync::sync::decode_status(upsync::sync::encode_status(status));
    ASSERT_TRUE(decoded.is_ok());
    EXPECT_EQ(decoded.value().article_count, 2u);
    EXPECT_EQ(decoded.value().existing_content_ids, (std::vector<std::string>{"a", "b"}));
}

// ============================================================================
// Response classification
// ============================================================================

TEST(ClassifyResponseTest, MapsStatusCodesToKinds) {
    using upsync::sync::classify_response;
    EXPECT_EQ(classify_response(response_with(401, "")).kind, ErrorKind::Auth);
    EXPECT_EQ(classify_response(response_with(403, "")).kind, ErrorKind::Auth);
    EXPECT_EQ(classify_response(response_with(400, "")).kind, ErrorKind::Validation);
    EXPECT_EQ(classify_response(response_with(413, "")).kind, ErrorKind::Validation);
    EXPECT_EQ(classify_response(response_with(422, "")).kind, ErrorKind::Validation);
    EXPECT_EQ(classify_response(response_with(408, "")).kind, ErrorKind::Server);
    EXPECT_EQ(classify_response(response_with(429, "")).kind, ErrorKind::Server);
    EXPECT_EQ(classify_response(response_with(500, "")).kind, ErrorKind::Server);
    EXPECT_EQ(classify_response(response_with(503, "")).kind, ErrorKind::Server);
}

TEST(ClassifyResponseTest, MessageCarriesDetail) {
    auto error = upsync::sync::classify_response(response_with(500, R"({"detail": "database locked"})"));
    EXPECT_EQ(error.message, "HTTP 500: database locked");

    auto fallback = upsync::sync::classify_response(response_with(502, ""));
    EXPECT_EQ(fallback.message, "HTTP 502: Reason");
}
