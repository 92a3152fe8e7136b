#include "upsync/sync/wire.hpp"

#include <optional>

namespace upsync::source {
using json = nlohmann::json;

namespace {

template<typename T>
void put_optional(json& j, const char* key, const std::optional<T>& value) {
    if (value) {
        j[key] = *value;
    } else {
        j[key] = nullptr;
    }
}

std::optional<std::string> get_optional_string(const json& j, const char* key) {
    const auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

std::string get_string(const json& j, const char* key, const std::string& fallback = {}) {
    const auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return fallback;
    }
    return it->get<std::string>();
}

std::int64_t get_int(const json& j, const char* key) {
    const auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return 0;
    }
    return it->get<std::int64_t>();
}

} // namespace

void to_json(json& j, const ContentRecord& record) {
    j = json{
        {"content_id", record.content_id},
        {"content_type", record.content_type},
        {"title", record.title},
        {"created_time", record.created_time},
        {"updated_time", record.updated_time},
        {"voteup_count", record.voteup_count},
        {"comment_count", record.comment_count},
    };
    put_optional(j, "content_text", record.content_text);
    put_optional(j, "content_url", record.content_url);
    put_optional(j, "author_id", record.author_id);
    put_optional(j, "author_name", record.author_name);
    put_optional(j, "author_avatar", record.author_avatar);
}

void from_json(const json& j, ContentRecord& record) {
    record.content_id = j.at("content_id").get<std::string>();
    record.content_type = get_string(j, "content_type", "article");
    record.title = get_string(j, "title");
    record.content_text = get_optional_string(j, "content_text");
    record.content_url = get_optional_string(j, "content_url");
    record.created_time = get_int(j, "created_time");
    record.updated_time = get_int(j, "updated_time");
    record.voteup_count = get_int(j, "voteup_count");
    record.comment_count = get_int(j, "comment_count");
    record.author_id = get_optional_string(j, "author_id");
    record.author_name = get_optional_string(j, "author_name");
    record.author_avatar = get_optional_string(j, "author_avatar");
}

void to_json(json& j, const CreatorRecord& record) {
    j = json{
        {"user_id", record.user_id},
        {"url_token", record.url_token},
        {"user_nickname", record.user_nickname},
        {"fans", record.fans},
        {"follows", record.follows},
        {"answer_count", record.answer_count},
        {"article_count", record.article_count},
        {"voteup_count", record.voteup_count},
    };
    put_optional(j, "user_avatar", record.user_avatar);
    put_optional(j, "user_link", record.user_link);
    put_optional(j, "gender", record.gender);
}

void from_json(const json& j, CreatorRecord& record) {
    record.user_id = j.at("user_id").get<std::string>();
    record.url_token = get_string(j, "url_token");
    record.user_nickname = get_string(j, "user_nickname");
    record.user_avatar = get_optional_string(j, "user_avatar");
    record.user_link = get_optional_string(j, "user_link");
    record.gender = get_optional_string(j, "gender");
    record.fans = get_int(j, "fans");
    record.follows = get_int(j, "follows");
    record.answer_count = get_int(j, "answer_count");
    record.article_count = get_int(j, "article_count");
    record.voteup_count = get_int(j, "voteup_count");
}

} // namespace upsync::source

namespace upsync::sync {
using json = nlohmann::json;

namespace {

std::optional<std::size_t> count_at(const json& doc, const char* key) {
    const auto it = doc.find(key);
    if (it == doc.end() || !it->is_number_integer()) {
        return std::nullopt;
    }
    const auto value = it->get<std::int64_t>();
    return value < 0 ? 0 : static_cast<std::size_t>(value);
}

/// First present key of each name pair wins
const json* find_array(const json& doc, const char* key, const char* legacy_key) {
    for (const char* name : {key, legacy_key}) {
        const auto it = doc.find(name);
        if (it != doc.end() && !it->is_null()) {
            return &*it;
        }
    }
    return nullptr;
}

} // namespace

std::string encode_batch(const Batch& batch) {
    json doc;
    doc["contentRecords"] = batch.content;
    doc["creatorRecords"] = batch.creators;
    doc["batchId"] = batch.batch_id();
    return doc.dump(-1, ' ', false, json::error_handler_t::replace);
}

Result<BatchAck> decode_ack(const std::string& body) {
    const auto doc = json::parse(body, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        return Err<BatchAck>(ErrorKind::Protocol, "Acknowledgement is not a JSON object");
    }

    BatchAck ack;
    const auto inserted = count_at(doc, "insertedCount");
    const auto updated = count_at(doc, "updatedCount");
    if (inserted || updated) {
        ack.inserted = inserted.value_or(0);
        ack.updated = updated.value_or(0);
        return Ok(ack);
    }

    bool found = false;
    for (const char* key : {"articles_inserted", "creators_inserted"}) {
        if (auto value = count_at(doc, key)) {
            ack.inserted += *value;
            found = true;
        }
    }
    for (const char* key : {"articles_updated", "creators_updated"}) {
        if (auto value = count_at(doc, key)) {
            ack.updated += *value;
            found = true;
        }
    }
    if (!found) {
        return Err<BatchAck>(ErrorKind::Protocol, "Acknowledgement carries no insert/update counts");
    }
    return Ok(ack);
}

std::string error_detail(const std::string& body, const std::string& fallback) {
    const auto doc = json::parse(body, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        return fallback;
    }
    const auto it = doc.find("detail");
    if (it == doc.end()) {
        return fallback;
    }
    if (it->is_string()) {
        return it->get<std::string>();
    }
    // Validation frameworks answer with a list of field errors
    return it->dump();
}

Result<UploadPayload> decode_upload(const std::string& body) {
    const auto doc = json::parse(body, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        return Err<UploadPayload>(ErrorKind::Validation, "Request body is not a JSON object");
    }

    UploadPayload payload;
    try {
        if (const auto* content = find_array(doc, "contentRecords", "articles")) {
            payload.content = content->get<std::vector<ContentRecord>>();
        }
        if (const auto* creators = find_array(doc, "creatorRecords", "creators")) {
            payload.creators = creators->get<std::vector<CreatorRecord>>();
        }
        if (const auto* batch_id = find_array(doc, "batchId", "batch_id")) {
            payload.batch_id = batch_id->get<std::string>();
        }
    } catch (const json::exception& e) {
        return Err<UploadPayload>(ErrorKind::Validation, std::string("Invalid record: ") + e.what());
    }

    for (const auto& record : payload.content) {
        if (record.content_id.empty()) {
            return Err<UploadPayload>(ErrorKind::Validation, "content_id must not be empty");
        }
    }
    for (const auto& record : payload.creators) {
        if (record.user_id.empty()) {
            return Err<UploadPayload>(ErrorKind::Validation, "user_id must not be empty");
        }
    }
    return Ok(std::move(payload));
}

std::string encode_status(const RemoteStatus& status) {
    return json{
        {"article_count", status.article_count},
        {"creator_count", status.creator_count},
        {"existing_content_ids", status.existing_content_ids},
    }.dump();
}

Result<RemoteStatus> decode_status(const std::string& body) {
    const auto doc = json::parse(body, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        return Err<RemoteStatus>(ErrorKind::Protocol, "Status response is not a JSON object");
    }
    RemoteStatus status;
    try {
        status.article_count = doc.value("article_count", std::size_t{0});
        status.creator_count = doc.value("creator_count", std::size_t{0});
        status.existing_content_ids = doc.value("existing_content_ids", std::vector<std::string>{});
    } catch (const json::exception& e) {
        return Err<RemoteStatus>(ErrorKind::Protocol, std::string("Malformed status response: ") + e.what());
    }
    return Ok(std::move(status));
}

} // namespace upsync::sync
