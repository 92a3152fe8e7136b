#pragma once

#include "upsync/core/result.hpp"

#include <sqlite3.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <unordered_set>

namespace upsync::source {

/**
 * @brief Prepared statement with RAII finalize
 */
class Statement {
public:
    Statement() = default;
    explicit Statement(sqlite3_stmt* stmt) : stmt_(stmt, sqlite3_finalize) {}

    [[nodiscard]] sqlite3_stmt* get() const { return stmt_.get(); }
    [[nodiscard]] explicit operator bool() const { return stmt_ != nullptr; }

    [[nodiscard]] std::optional<std::string> column_text(int index) const;
    [[nodiscard]] std::int64_t column_int64(int index) const;
    [[nodiscard]] bool column_is_null(int index) const;

    /// true while a row is available
    Result<bool> step();
    Result<void> reset();

private:
    std::shared_ptr<sqlite3_stmt> stmt_;
};

/**
 * @brief Read-only SQLite connection
 *
 * Opening validates the header by touching sqlite_master, so a file that
 * is not a database fails here rather than on the first extraction query.
 */
class Database {
public:
    Database() = default;
    ~Database();

    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;
    Database(Database&& other) noexcept;
    Database& operator=(Database&& other) noexcept;

    [[nodiscard]] static Result<Database> open_read_only(const std::string& path);

    [[nodiscard]] bool is_open() const { return db_ != nullptr; }
    void close();

    [[nodiscard]] Result<Statement> prepare(const std::string& sql);

    [[nodiscard]] Result<bool> table_exists(const std::string& table);
    [[nodiscard]] Result<std::unordered_set<std::string>> table_columns(const std::string& table);

    [[nodiscard]] std::string last_error() const;

private:
    explicit Database(sqlite3* db) : db_(db) {}

    sqlite3* db_ = nullptr;
};

} // namespace upsync::source
