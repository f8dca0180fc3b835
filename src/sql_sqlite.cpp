#include "sqlulid.hpp"
#include <string_view>
#include "uuid.hpp"

namespace ulid::sql {

void bind(sqlite3_stmt* stmt, int idx, const Ulid& id, Column column) {
    int rc = SQLITE_OK;
    if (column == Column::Blob) {
        auto bytes = id.to_bytes();
        rc = sqlite3_bind_blob(stmt, idx, bytes.data(), static_cast<int>(bytes.size()), SQLITE_TRANSIENT);
    } else {
        std::string text = id.to_string();
        rc = sqlite3_bind_text(stmt, idx, text.c_str(), static_cast<int>(text.size()), SQLITE_TRANSIENT);
    }
    if (rc != SQLITE_OK) {
        ULID_THROW("bind: sqlite3_bind failed at index %d: %s", idx, sqlite3_errstr(rc));
    }
}

Result<Ulid> try_column(sqlite3_stmt* stmt, int col) {
    switch (sqlite3_column_type(stmt, col)) {
        case SQLITE_BLOB: {
            const void* data = sqlite3_column_blob(stmt, col);
            int len = sqlite3_column_bytes(stmt, col);
            return Ulid::try_from_bytes(static_cast<const uint8_t*>(data), static_cast<std::size_t>(len));
        }
        case SQLITE_TEXT: {
            const unsigned char* text = sqlite3_column_text(stmt, col);
            int len = sqlite3_column_bytes(stmt, col);
            return try_parse_any(std::string_view(reinterpret_cast<const char*>(text), static_cast<std::size_t>(len)));
        }
        case SQLITE_NULL:
            return failure<Ulid>(make_failure(ErrorKind::Type, "sqlite: column %d is NULL", col));
        default:
            return failure<Ulid>(make_failure(ErrorKind::Type,
                "sqlite: column %d is neither BLOB nor TEXT", col));
    }
}

Ulid column(sqlite3_stmt* stmt, int col) {
    return try_column(stmt, col).get();
}

SqliteStatement::SqliteStatement(sqlite3* db, const std::string& sql) {
    if (sqlite3_prepare_v2(db, sql.c_str(), static_cast<int>(sql.size()) + 1, &stmt_, nullptr) != SQLITE_OK) {
        std::string err = sqlite3_errmsg(db);
        ULID_THROW("SQLite prepare failed: %s: %s", sql.c_str(), err.c_str());
    }
}

SqliteStatement::~SqliteStatement() {
    if (stmt_) sqlite3_finalize(stmt_);
}

void SqliteStatement::bind_text(int idx, const std::string& value) {
    if (sqlite3_bind_text(stmt_, idx, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT) != SQLITE_OK) {
        ULID_THROW("bind: sqlite3_bind_text failed at index %d", idx);
    }
}

bool SqliteStatement::step() {
    int rc = sqlite3_step(stmt_);
    if (rc == SQLITE_ROW) return true;
    if (rc == SQLITE_DONE) return false;
    ULID_THROW("SQLite exec failed: %s", sqlite3_errmsg(sqlite3_db_handle(stmt_)));
}

void SqliteStatement::reset() {
    sqlite3_reset(stmt_);
    sqlite3_clear_bindings(stmt_);
}

} // namespace ulid::sql
