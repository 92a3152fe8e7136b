#include "upsync/source/sqlite.hpp"

#include <filesystem>

namespace upsync::source {

// ============================================================================
// Statement
// ============================================================================

std::optional<std::string> Statement::column_text(int index) const {
    const unsigned char* text = sqlite3_column_text(stmt_.get(), index);
    if (!text) {
        return std::nullopt;
    }
    const int length = sqlite3_column_bytes(stmt_.get(), index);
    return std::string(reinterpret_cast<const char*>(text), static_cast<std::size_t>(length));
}

std::int64_t Statement::column_int64(int index) const {
    return sqlite3_column_int64(stmt_.get(), index);
}

bool Statement::column_is_null(int index) const {
    return sqlite3_column_type(stmt_.get(), index) == SQLITE_NULL;
}

Result<bool> Statement::step() {
    const int rc = sqlite3_step(stmt_.get());
    if (rc == SQLITE_ROW) {
        return Ok(true);
    }
    if (rc == SQLITE_DONE) {
        return Ok(false);
    }
    return Err<bool>(ErrorKind::Format,
                     std::string("Failed to read row: ") + sqlite3_errmsg(sqlite3_db_handle(stmt_.get())));
}

Result<void> Statement::reset() {
    if (sqlite3_reset(stmt_.get()) != SQLITE_OK) {
        return Err<void>(ErrorKind::Format,
                         std::string("Failed to reset statement: ") +
                             sqlite3_errmsg(sqlite3_db_handle(stmt_.get())));
    }
    return Ok();
}

// ============================================================================
// Database
// ============================================================================

Database::~Database() {
    close();
}

Database::Database(Database&& other) noexcept : db_(other.db_) {
    other.db_ = nullptr;
}

Database& Database::operator=(Database&& other) noexcept {
    if (this != &other) {
        close();
        db_ = other.db_;
        other.db_ = nullptr;
    }
    return *this;
}

Result<Database> Database::open_read_only(const std::string& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return Err<Database>(ErrorKind::Format, "Source file not found: " + path);
    }

    sqlite3* handle = nullptr;
    const int rc = sqlite3_open_v2(path.c_str(), &handle, SQLITE_OPEN_READONLY, nullptr);
    Database db(handle);
    if (rc != SQLITE_OK) {
        return Err<Database>(ErrorKind::Format, "Failed to open " + path + ": " + db.last_error());
    }

    // sqlite3_open_v2 is lazy; the first read is what rejects a bad header
    auto probe = db.prepare("SELECT count(*) FROM sqlite_master");
    if (probe.is_error()) {
        return Err<Database>(ErrorKind::Format, path + " is not a readable database: " + probe.error().message);
    }
    auto row = probe.value().step();
    if (row.is_error()) {
        return Err<Database>(ErrorKind::Format, path + " is not a readable database: " + row.error().message);
    }

    return Ok(std::move(db));
}

void Database::close() {
    if (db_) {
        sqlite3_close_v2(db_);
        db_ = nullptr;
    }
}

Result<Statement> Database::prepare(const std::string& sql) {
    sqlite3_stmt* stmt = nullptr;
    const int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        if (stmt) {
            sqlite3_finalize(stmt);
        }
        return Err<Statement>(ErrorKind::Format, last_error());
    }
    return Ok(Statement(stmt));
}

Result<bool> Database::table_exists(const std::string& table) {
    auto stmt = prepare("SELECT 1 FROM sqlite_master WHERE type = 'table' AND name = ?1");
    if (stmt.is_error()) {
        return Err<bool>(stmt.error());
    }
    sqlite3_bind_text(stmt.value().get(), 1, table.c_str(), static_cast<int>(table.size()), SQLITE_TRANSIENT);
    return stmt.value().step();
}

Result<std::unordered_set<std::string>> Database::table_columns(const std::string& table) {
    // PRAGMA arguments cannot be bound; table names here are compile-time constants
    auto stmt = prepare("PRAGMA table_info(\"" + table + "\")");
    if (stmt.is_error()) {
        return Err<std::unordered_set<std::string>>(stmt.error());
    }

    std::unordered_set<std::string> columns;
    while (true) {
        auto row = stmt.value().step();
        if (row.is_error()) {
            return Err<std::unordered_set<std::string>>(row.error());
        }
        if (!row.value()) {
            break;
        }
        if (auto name = stmt.value().column_text(1)) {
            columns.insert(*name);
        }
    }
    return Ok(std::move(columns));
}

std::string Database::last_error() const {
    if (!db_) {
        return "database not open";
    }
    return sqlite3_errmsg(db_);
}

} // namespace upsync::source
