#include "upsync/source/extractor.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <sstream>

namespace upsync::source {
namespace fs = std::filesystem;

namespace {

// Column order here is the decode order below
const std::vector<std::vector<std::string>> kContentColumns{
    {"content_id"},
    {"content_type"},
    {"title"},
    {"content_text"},
    {"content_url"},
    {"created_time"},
    {"updated_time"},
    {"voteup_count"},
    {"comment_count"},
    {"user_id"},
    {"user_nickname"},
    {"user_avatar"},
};

const std::vector<std::vector<std::string>> kCreatorColumns{
    {"user_id"},
    {"url_token"},
    {"user_nickname"},
    {"user_avatar"},
    {"user_link"},
    {"gender"},
    {"fans"},
    {"follows"},
    {"anwser_count", "answer_count"},
    {"article_count"},
    {"get_voteup_count", "voteup_count"},
};

// Invalid UTF-8 sequences become U+FFFD so every record can be serialized
std::string valid_utf8(const std::string& text) {
    using nlohmann::json;
    const auto quoted = json(text).dump(-1, ' ', false, json::error_handler_t::replace);
    return json::parse(quoted).get<std::string>();
}

std::string text_or(const Statement& row, int index, std::string fallback) {
    auto value = row.column_text(index);
    if (!value || value->empty()) {
        return fallback;
    }
    return valid_utf8(*value);
}

std::optional<std::string> optional_text(const Statement& row, int index) {
    auto value = row.column_text(index);
    if (!value || value->empty()) {
        return std::nullopt;
    }
    return valid_utf8(*value);
}

ContentRecord decode_content(const Statement& row) {
    ContentRecord record;
    record.content_id = text_or(row, 0, "");
    record.content_type = text_or(row, 1, "article");
    record.title = text_or(row, 2, "");
    record.content_text = optional_text(row, 3);
    record.content_url = optional_text(row, 4);
    record.created_time = row.column_int64(5);
    record.updated_time = row.column_int64(6);
    record.voteup_count = row.column_int64(7);
    record.comment_count = row.column_int64(8);
    record.author_id = optional_text(row, 9);
    record.author_name = optional_text(row, 10);
    record.author_avatar = optional_text(row, 11);
    return record;
}

CreatorRecord decode_creator(const Statement& row) {
    CreatorRecord record;
    record.user_id = text_or(row, 0, "");
    record.url_token = text_or(row, 1, "");
    record.user_nickname = text_or(row, 2, "");
    record.user_avatar = optional_text(row, 3);
    record.user_link = optional_text(row, 4);
    record.gender = optional_text(row, 5);
    record.fans = row.column_int64(6);
    record.follows = row.column_int64(7);
    record.answer_count = row.column_int64(8);
    record.article_count = row.column_int64(9);
    record.voteup_count = row.column_int64(10);
    return record;
}

std::string quote_identifier(const std::string& name) {
    return "\"" + name + "\"";
}

} // namespace

SourceExtractor::SourceExtractor(Database db, fs::path path)
    : db_(std::move(db)),
      path_(std::move(path)),
      fingerprint_(path_.filename().string()) {}

Result<SourceExtractor> SourceExtractor::open(const fs::path& path) {
    auto db = Database::open_read_only(path.string());
    if (db.is_error()) {
        return Err<SourceExtractor>(db.error());
    }
    spdlog::debug("Opened snapshot {}", path.string());
    return Ok(SourceExtractor(std::move(db.value()), path));
}

Result<RecordStream<ContentRecord>> SourceExtractor::extract_content() {
    std::vector<ColumnSpec> columns;
    for (const auto& candidates : kContentColumns) {
        columns.push_back(ColumnSpec{candidates});
    }
    auto statement = select_columns(kContentTable, columns);
    if (statement.is_error()) {
        return Err<RecordStream<ContentRecord>>(statement.error());
    }
    if (!statement.value()) {
        spdlog::warn("Table {} not found in {}; no content records will be uploaded",
                     kContentTable, fingerprint_);
        return Ok(RecordStream<ContentRecord>());
    }
    return Ok(RecordStream<ContentRecord>(std::move(*statement.value()), decode_content));
}

Result<RecordStream<CreatorRecord>> SourceExtractor::extract_creators() {
    std::vector<ColumnSpec> columns;
    for (const auto& candidates : kCreatorColumns) {
        columns.push_back(ColumnSpec{candidates});
    }
    auto statement = select_columns(kCreatorTable, columns);
    if (statement.is_error()) {
        return Err<RecordStream<CreatorRecord>>(statement.error());
    }
    if (!statement.value()) {
        spdlog::warn("Table {} not found in {}; no creator records will be uploaded",
                     kCreatorTable, fingerprint_);
        return Ok(RecordStream<CreatorRecord>());
    }
    return Ok(RecordStream<CreatorRecord>(std::move(*statement.value()), decode_creator));
}

Result<std::size_t> SourceExtractor::count_content() {
    return count_rows(kContentTable);
}

Result<std::size_t> SourceExtractor::count_creators() {
    return count_rows(kCreatorTable);
}

Result<std::optional<Statement>> SourceExtractor::select_columns(const std::string& table,
                                                                 const std::vector<ColumnSpec>& columns) {
    auto exists = db_.table_exists(table);
    if (exists.is_error()) {
        return Err<std::optional<Statement>>(exists.error());
    }
    if (!exists.value()) {
        return Ok(std::optional<Statement>());
    }

    auto present = db_.table_columns(table);
    if (present.is_error()) {
        return Err<std::optional<Statement>>(present.error());
    }

    std::ostringstream sql;
    sql << "SELECT ";
    for (std::size_t i = 0; i < columns.size(); ++i) {
        if (i > 0) {
            sql << ", ";
        }
        const std::string* chosen = nullptr;
        for (const auto& candidate : columns[i].candidates) {
            if (present.value().count(candidate) > 0) {
                chosen = &candidate;
                break;
            }
        }
        if (chosen) {
            sql << quote_identifier(*chosen);
        } else {
            spdlog::warn("Column {}.{} missing; using default values", table, columns[i].candidates.front());
            sql << "NULL";
        }
    }
    // rowid order keeps re-opened files yielding the same sequence
    sql << " FROM " << quote_identifier(table) << " ORDER BY rowid";

    auto statement = db_.prepare(sql.str());
    if (statement.is_error()) {
        // WITHOUT ROWID tables: fall back to the table's natural order
        statement = db_.prepare(sql.str().substr(0, sql.str().rfind(" ORDER BY")));
        if (statement.is_error()) {
            return Err<std::optional<Statement>>(statement.error());
        }
    }
    return Ok(std::optional<Statement>(std::move(statement.value())));
}

Result<std::size_t> SourceExtractor::count_rows(const std::string& table) {
    auto exists = db_.table_exists(table);
    if (exists.is_error()) {
        return Err<std::size_t>(exists.error());
    }
    if (!exists.value()) {
        return Ok(std::size_t{0});
    }
    auto statement = db_.prepare("SELECT count(*) FROM " + quote_identifier(table));
    if (statement.is_error()) {
        return Err<std::size_t>(statement.error());
    }
    auto row = statement.value().step();
    if (row.is_error()) {
        return Err<std::size_t>(row.error());
    }
    return Ok(static_cast<std::size_t>(statement.value().column_int64(0)));
}

} // namespace upsync::source
