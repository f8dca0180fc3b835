#pragma once
#include <array>
#include <string>
#include <vector>
#include <libpq-fe.h>
#include <sqlite3.h>
#include "ulid.hpp"

namespace ulid::sql {

// How a ULID column is stored. Blob keeps the 16 big-endian bytes, which sort
// like the ULID itself; Text keeps the canonical string.
enum class Column { Blob,
    Text };

/****************** SQLite ******************/

void bind(sqlite3_stmt* stmt, int idx, const Ulid& id, Column column = Column::Blob);

// Reads a 16-byte BLOB, a 26 character TEXT or a UUID TEXT. NULL and the
// numeric storage classes fail with ErrorKind::Type.
Result<Ulid> try_column(sqlite3_stmt* stmt, int col);
Ulid column(sqlite3_stmt* stmt, int col);

// Owns a prepared statement; finalized on destruction.
class SqliteStatement {
public:
    SqliteStatement(sqlite3* db, const std::string& sql);
    ~SqliteStatement();

    SqliteStatement(const SqliteStatement&) = delete;
    SqliteStatement& operator=(const SqliteStatement&) = delete;

    void bind(int idx, const Ulid& id, Column column = Column::Blob) { sql::bind(stmt_, idx, id, column); }
    void bind_text(int idx, const std::string& value);

    // true while rows are produced, false once done.
    bool step();
    void reset();

    Result<Ulid> try_column(int col) const { return sql::try_column(stmt_, col); }
    Ulid column(int col) const { return sql::column(stmt_, col); }

    sqlite3_stmt* handle() const { return stmt_; }

private:
    sqlite3_stmt* stmt_ = nullptr;
};

/****************** PostgreSQL ******************/

static constexpr Oid UUID_OID = 2950;
static constexpr int PG_TEXT_FORMAT = 0;
static constexpr int PG_BINARY_FORMAT = 1;

// A ULID as a binary uuid parameter for PQexecParams.
struct PgParam {
    std::array<char, 16> bytes {};

    Oid type() const { return UUID_OID; }
    const char* value() const { return bytes.data(); }
    int length() const { return static_cast<int>(bytes.size()); }
    int format() const { return PG_BINARY_FORMAT; }
};

PgParam to_pg(const Ulid& id);

// Parallel parameter arrays for PQexecParams; owns the parameter storage.
class PgParams {
public:
    void add(const Ulid& id);
    void add_null();

    int count() const { return static_cast<int>(values_.size()); }
    const Oid* types() const { return types_.data(); }
    const char* const* values() const { return values_.data(); }
    const int* lengths() const { return lengths_.data(); }
    const int* formats() const { return formats_.data(); }

private:
    void repoint_();

    std::vector<PgParam> params_; // backing for values_
    std::vector<bool> null_;
    std::vector<Oid> types_;
    std::vector<const char*> values_;
    std::vector<int> lengths_;
    std::vector<int> formats_;
};

// Reads a uuid column in binary format (exactly 16 bytes) or text format
// (any UUID form). NULL fails with ErrorKind::Type.
Result<Ulid> try_from_pg(const PGresult* res, int row, int col);
Ulid from_pg(const PGresult* res, int row, int col);

} // namespace ulid::sql
