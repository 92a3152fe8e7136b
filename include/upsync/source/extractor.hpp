#pragma once

#include "upsync/core/result.hpp"
#include "upsync/source/records.hpp"
#include "upsync/source/sqlite.hpp"

#include <cstddef>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace upsync::source {

inline constexpr const char* kContentTable = "zhihu_content";
inline constexpr const char* kCreatorTable = "zhihu_creator";

/**
 * @brief Lazy, finite, restartable sequence of records backed by one query
 *
 * A default-constructed stream is empty; that is what a missing table
 * produces. Rows with an empty id are skipped.
 */
template<typename Record>
class RecordStream {
public:
    using Decoder = std::function<Record(const Statement&)>;

    RecordStream() = default;
    RecordStream(Statement statement, Decoder decoder)
        : statement_(std::move(statement)), decoder_(std::move(decoder)) {}

    Result<std::optional<Record>> next() {
        while (statement_ && !exhausted_) {
            auto row = statement_.step();
            if (row.is_error()) {
                return Err<std::optional<Record>>(row.error());
            }
            if (!row.value()) {
                exhausted_ = true;
                break;
            }
            Record record = decoder_(statement_);
            if (record.id().empty()) {
                ++skipped_;
                continue;
            }
            return Ok(std::optional<Record>(std::move(record)));
        }
        return Ok(std::optional<Record>());
    }

    Result<void> rewind() {
        exhausted_ = false;
        skipped_ = 0;
        if (!statement_) {
            return Ok();
        }
        return statement_.reset();
    }

    /// Rows dropped so far because they carried no id
    [[nodiscard]] std::size_t skipped_without_id() const noexcept { return skipped_; }

    /// false when the backing table was absent
    [[nodiscard]] bool has_source() const noexcept { return static_cast<bool>(statement_); }

private:
    Statement statement_;
    Decoder decoder_;
    bool exhausted_ = false;
    std::size_t skipped_ = 0;
};

/**
 * @brief Reads content and creator records out of a crawler snapshot file
 */
class SourceExtractor {
public:
    /// Fails with ErrorKind::Format when the file is missing or not a database
    static Result<SourceExtractor> open(const std::filesystem::path& path);

    Result<RecordStream<ContentRecord>> extract_content();
    Result<RecordStream<CreatorRecord>> extract_creators();

    Result<std::size_t> count_content();
    Result<std::size_t> count_creators();

    /// Identifies this snapshot for checkpointing: the file name
    [[nodiscard]] const std::string& fingerprint() const noexcept { return fingerprint_; }
    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    SourceExtractor(Database db, std::filesystem::path path);

    struct ColumnSpec {
        std::vector<std::string> candidates;  ///< first present wins
    };

    /// Empty optional when the table is absent
    Result<std::optional<Statement>> select_columns(const std::string& table,
                                                    const std::vector<ColumnSpec>& columns);
    Result<std::size_t> count_rows(const std::string& table);

    Database db_;
    std::filesystem::path path_;
    std::string fingerprint_;
};

/**
 * @brief Drain a stream into memory, keeping the first record per id
 */
template<typename Record>
Result<std::vector<Record>> collect_unique(RecordStream<Record>& stream, std::size_t* duplicates = nullptr) {
    std::vector<Record> records;
    std::unordered_set<std::string> seen;
    std::size_t dropped = 0;
    while (true) {
        auto next = stream.next();
        if (next.is_error()) {
            return Err<std::vector<Record>>(next.error());
        }
        if (!next.value()) {
            break;
        }
        if (!seen.insert(next.value()->id()).second) {
            ++dropped;
            continue;
        }
        records.push_back(std::move(*next.value()));
    }
    if (duplicates) {
        *duplicates = dropped;
    }
    return Ok(std::move(records));
}

} // namespace upsync::source
