// sql_postgres.cpp
#include <string_view>
#include "sqlulid.hpp"
#include "uuid.hpp"

namespace ulid::sql {

PgParam to_pg(const Ulid& id) {
    PgParam p;
    auto bytes = id.to_bytes();
    for (std::size_t i = 0; i < bytes.size(); ++i) {
        p.bytes[i] = static_cast<char>(bytes[i]);
    }
    return p;
}

void PgParams::add(const Ulid& id) {
    params_.push_back(to_pg(id));
    null_.push_back(false);
    repoint_();
}

void PgParams::add_null() {
    params_.emplace_back();
    null_.push_back(true);
    repoint_();
}

// params_ may reallocate on every add, so the pointer arrays are rebuilt.
void PgParams::repoint_() {
    std::size_t n = params_.size();
    types_.assign(n, UUID_OID);
    values_.resize(n);
    lengths_.resize(n);
    formats_.assign(n, PG_BINARY_FORMAT);
    for (std::size_t i = 0; i < n; ++i) {
        values_[i] = null_[i] ? nullptr : params_[i].value();
        lengths_[i] = null_[i] ? 0 : params_[i].length();
    }
}

Result<Ulid> try_from_pg(const PGresult* res, int row, int col) {
    if (!res) ULID_THROW("Postgres: null result");
    if (row < 0 || row >= PQntuples(res) || col < 0 || col >= PQnfields(res)) {
        ULID_THROW("Postgres: no value at row %d column %d", row, col);
    }
    if (PQgetisnull(res, row, col)) {
        return failure<Ulid>(make_failure(ErrorKind::Type, "postgres: column %d is NULL", col));
    }

    const char* value = PQgetvalue(res, row, col);
    int len = PQgetlength(res, row, col);
    if (PQfformat(res, col) == PG_BINARY_FORMAT) {
        return Ulid::try_from_bytes(reinterpret_cast<const uint8_t*>(value), static_cast<std::size_t>(len));
    }
    auto uuid = Uuid::try_parse(std::string_view(value, static_cast<std::size_t>(len)));
    if (!uuid) return failure<Ulid>(uuid.error);
    return success(from_uuid(uuid.value));
}

Ulid from_pg(const PGresult* res, int row, int col) {
    return try_from_pg(res, row, col).get();
}

} // namespace ulid::sql
