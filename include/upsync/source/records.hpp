#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace upsync::source {

enum class EntityType {
    Content,
    Creator
};

inline const char* entity_label(EntityType type) {
    return type == EntityType::Content ? "articles" : "creators";
}

/**
 * @brief One crawled answer/article/post, keyed by content_id
 */
struct ContentRecord {
    std::string content_id;
    std::string content_type = "article";
    std::string title;
    std::optional<std::string> content_text;
    std::optional<std::string> content_url;
    std::int64_t created_time = 0;
    std::int64_t updated_time = 0;
    std::int64_t voteup_count = 0;
    std::int64_t comment_count = 0;
    std::optional<std::string> author_id;
    std::optional<std::string> author_name;
    std::optional<std::string> author_avatar;

    const std::string& id() const noexcept { return content_id; }
};

/**
 * @brief One content creator profile, keyed by user_id
 */
struct CreatorRecord {
    std::string user_id;
    std::string url_token;
    std::string user_nickname;
    std::optional<std::string> user_avatar;
    std::optional<std::string> user_link;
    std::optional<std::string> gender;
    std::int64_t fans = 0;
    std::int64_t follows = 0;
    std::int64_t answer_count = 0;
    std::int64_t article_count = 0;
    std::int64_t voteup_count = 0;

    const std::string& id() const noexcept { return user_id; }
};

} // namespace upsync::source
