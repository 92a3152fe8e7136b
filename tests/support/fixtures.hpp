#pragma once

#include "upsync/source/records.hpp"

#include <sqlite3.h>

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <unistd.h>

namespace upsync::test_support {

namespace fs = std::filesystem;

inline fs::path create_temp_dir(const std::string& prefix) {
    static std::atomic<uint64_t> counter{0};
    auto dir = fs::temp_directory_path() /
               fs::path(prefix + "_" + std::to_string(::getpid()) + "_" + std::to_string(counter.fetch_add(1)));
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

inline void write_text(const fs::path& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << content;
}

inline std::string content_id(std::size_t i) {
    return "c" + std::to_string(i);
}

inline std::string creator_id(std::size_t i) {
    return "u" + std::to_string(i);
}

/**
 * @brief Writes crawler-style snapshot files for extraction tests
 */
class SnapshotBuilder {
public:
    explicit SnapshotBuilder(const fs::path& path) {
        fs::remove(path);
        if (sqlite3_open(path.string().c_str(), &db_) != SQLITE_OK) {
            throw std::runtime_error("cannot create " + path.string());
        }
    }

    ~SnapshotBuilder() { sqlite3_close(db_); }

    SnapshotBuilder(const SnapshotBuilder&) = delete;
    SnapshotBuilder& operator=(const SnapshotBuilder&) = delete;

    SnapshotBuilder& exec(const std::string& sql) {
        char* message = nullptr;
        if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &message) != SQLITE_OK) {
            std::string error = message ? message : "unknown";
            sqlite3_free(message);
            throw std::runtime_error(error + " in: " + sql);
        }
        return *this;
    }

    /// Full content schema as the crawler writes it
    SnapshotBuilder& content_table() {
        return exec("CREATE TABLE zhihu_content ("
                    "id INTEGER PRIMARY KEY AUTOINCREMENT, content_id TEXT, content_type TEXT, "
                    "title TEXT, content_text TEXT, content_url TEXT, created_time INTEGER, "
                    "updated_time INTEGER, voteup_count INTEGER, comment_count INTEGER, "
                    "user_id TEXT, user_nickname TEXT, user_avatar TEXT)");
    }

    SnapshotBuilder& creator_table() {
        return exec("CREATE TABLE zhihu_creator ("
                    "id INTEGER PRIMARY KEY AUTOINCREMENT, user_id TEXT, url_token TEXT, "
                    "user_nickname TEXT, user_avatar TEXT, user_link TEXT, gender TEXT, "
                    "fans INTEGER, follows INTEGER, anwser_count INTEGER, article_count INTEGER, "
                    "get_voteup_count INTEGER)");
    }

    SnapshotBuilder& add_content(std::size_t count, std::size_t first = 0) {
        exec("BEGIN");
        for (std::size_t i = first; i < first + count; ++i) {
            const auto id = content_id(i);
            exec("INSERT INTO zhihu_content (content_id, content_type, title, content_text, content_url, "
                 "created_time, updated_time, voteup_count, comment_count, user_id, user_nickname, user_avatar) "
                 "VALUES ('" + id + "', 'answer', 'Title " + id + "', 'Body " + id + "', "
                 "'https://example.com/" + id + "', 1700000000, 1700000100, " + std::to_string(i) + ", 3, "
                 "'u" + std::to_string(i % 7) + "', 'Author', NULL)");
        }
        return exec("COMMIT");
    }

    SnapshotBuilder& add_creators(std::size_t count, std::size_t first = 0) {
        exec("BEGIN");
        for (std::size_t i = first; i < first + count; ++i) {
            const auto id = creator_id(i);
            exec("INSERT INTO zhihu_creator (user_id, url_token, user_nickname, user_avatar, user_link, gender, "
                 "fans, follows, anwser_count, article_count, get_voteup_count) "
                 "VALUES ('" + id + "', 'token-" + id + "', 'Nick " + id + "', NULL, "
                 "'https://example.com/people/" + id + "', '1', 10, 2, 5, 1, 99)");
        }
        return exec("COMMIT");
    }

private:
    sqlite3* db_ = nullptr;
};

inline source::ContentRecord make_content(std::size_t i) {
    source::ContentRecord record;
    record.content_id = content_id(i);
    record.title = "Title " + record.content_id;
    record.voteup_count = static_cast<std::int64_t>(i);
    return record;
}

inline std::vector<source::ContentRecord> make_content_list(std::size_t count) {
    std::vector<source::ContentRecord> records;
    for (std::size_t i = 0; i < count; ++i) {
        records.push_back(make_content(i));
    }
    return records;
}

inline source::CreatorRecord make_creator(std::size_t i) {
    source::CreatorRecord record;
    record.user_id = creator_id(i);
    record.url_token = "token-" + record.user_id;
    record.user_nickname = "Nick " + record.user_id;
    return record;
}

} // namespace upsync::test_support
