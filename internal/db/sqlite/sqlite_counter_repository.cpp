#include "sqlite_counter_repository.hpp"

#include <sqlite3.h>

namespace prefixid::db::sqlite {

using prefixid::db::ErrorCode;
using prefixid::db::Result;

static void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

static void BindI64(sqlite3_stmt* st, int idx, int64_t v) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

static std::string ColText(sqlite3_stmt* st, int col) {
    const unsigned char* t = sqlite3_column_text(st, col);
    return t ? reinterpret_cast<const char*>(t) : "";
}

static int64_t ColI64(sqlite3_stmt* st, int col) {
    return static_cast<int64_t>(sqlite3_column_int64(st, col));
}

SqliteCounterRepository::SqliteCounterRepository(std::shared_ptr<SqliteDB> db, sql::CounterTable table)
    : db_(std::move(db)),
      table_(std::move(table)),
      select_sql_(table_.SelectSql(sql::Dialect::kSqlite)),
      insert_sql_(table_.InsertSql(sql::Dialect::kSqlite)),
      update_sql_(table_.UpdateSql(sql::Dialect::kSqlite)),
      list_sql_(table_.ListSql(sql::Dialect::kSqlite)) {}

std::unique_ptr<db::Transaction> SqliteCounterRepository::Begin() {
    return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteCounterRepository::TX(Transaction& t) {
    return static_cast<SqliteTransaction&>(t);
}

Result SqliteCounterRepository::Translate(sqlite3* db, int rc) {
    if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
        return Result::Ok();

    switch (rc & 0xff) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT:
            return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
        case SQLITE_IOERR:
        case SQLITE_CANTOPEN:
        case SQLITE_FULL:
            return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
        case SQLITE_CORRUPT:
        case SQLITE_NOTADB:
            return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
        default:
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
}

// ------------------------------------------------------------------
// Counters
// ------------------------------------------------------------------

Result SqliteCounterRepository::SelectCounter(Transaction& t, const std::string& segment_key,
                                              std::optional<int64_t>& value) {
    auto* db = TX(t).Handle();
    value.reset();

    // BEGIN IMMEDIATE already holds the database write lock; no row lock clause exists.
    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, select_sql_.c_str(), -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st, 1, segment_key);

    int rc = sqlite3_step(st);
    if (rc == SQLITE_ROW) {
        value = ColI64(st, 0);
        rc = SQLITE_OK;
    }
    sqlite3_finalize(st);

    return Translate(db, rc);
}

Result SqliteCounterRepository::InsertCounter(Transaction& t, const model::CounterRecord& r,
                                              uint64_t& rows_affected) {
    auto* db = TX(t).Handle();
    rows_affected = 0;

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, insert_sql_.c_str(), -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st, 1, r.segment_key);
    BindI64(st, 2, r.value);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);
    if (rc == SQLITE_DONE) {
        rows_affected = static_cast<uint64_t>(sqlite3_changes(db));
    }

    return Translate(db, rc);
}

Result SqliteCounterRepository::CompareAndSwapCounter(Transaction& t, const std::string& segment_key,
                                                      int64_t expected, int64_t next, uint64_t& rows_affected) {
    auto* db = TX(t).Handle();
    rows_affected = 0;

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, update_sql_.c_str(), -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindI64(st, 1, next);
    BindI64(st, 2, expected);
    BindText(st, 3, segment_key);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);
    if (rc == SQLITE_DONE) {
        rows_affected = static_cast<uint64_t>(sqlite3_changes(db));
    }

    return Translate(db, rc);
}

Result SqliteCounterRepository::ListCounters(Transaction& t, std::vector<model::CounterRecord>& out) {
    auto* db = TX(t).Handle();
    out.clear();

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, list_sql_.c_str(), -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    int rc;
    while ((rc = sqlite3_step(st)) == SQLITE_ROW) {
        model::CounterRecord r;
        r.segment_key = ColText(st, 0);
        r.value = ColI64(st, 1);
        out.push_back(std::move(r));
    }
    sqlite3_finalize(st);

    return Translate(db, rc);
}

}
