#pragma once

#include "upsync/core/result.hpp"
#include "upsync/source/records.hpp"
#include "upsync/sync/scheduler.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <string>
#include <vector>

namespace upsync::source {

// nlohmann::json ADL hooks; records travel with snake_case field names
void to_json(nlohmann::json& j, const ContentRecord& record);
void from_json(const nlohmann::json& j, ContentRecord& record);
void to_json(nlohmann::json& j, const CreatorRecord& record);
void from_json(const nlohmann::json& j, CreatorRecord& record);

} // namespace upsync::source

namespace upsync::sync {

/// Per-batch acknowledgement of the remote upsert
struct BatchAck {
    std::size_t inserted = 0;
    std::size_t updated = 0;
};

/// Decoded upload request body, as the ingest side sees it
struct UploadPayload {
    std::string batch_id;
    std::vector<ContentRecord> content;
    std::vector<CreatorRecord> creators;
};

/// What the ingest side already holds
struct RemoteStatus {
    std::size_t article_count = 0;
    std::size_t creator_count = 0;
    std::vector<std::string> existing_content_ids;
};

/**
 * @brief `{ "contentRecords": [...], "creatorRecords": [...], "batchId": "articles-3" }`
 *
 * The array for the other entity type is present and empty.
 */
std::string encode_batch(const Batch& batch);

/**
 * @brief Read `insertedCount`/`updatedCount`
 *
 * Falls back to the per-type keys older ingest services answer with
 * (`articles_inserted`, `creators_updated`, ...). ErrorKind::Protocol when
 * the body is not a JSON object or carries no counts at all.
 */
Result<BatchAck> decode_ack(const std::string& body);

/// `detail` of a `{ "detail": ... }` error body, else @p fallback
std::string error_detail(const std::string& body, const std::string& fallback);

/// ErrorKind::Validation for anything the ingest side should reject with 4xx
Result<UploadPayload> decode_upload(const std::string& body);

std::string encode_status(const RemoteStatus& status);
Result<RemoteStatus> decode_status(const std::string& body);

} // namespace upsync::sync
