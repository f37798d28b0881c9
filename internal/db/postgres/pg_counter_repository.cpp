#include "pg_counter_repository.hpp"

namespace prefixid::db::postgres {

PgCounterRepository::PgCounterRepository(std::shared_ptr<PgPool> pool, sql::CounterTable table)
    : pool_(std::move(pool)),
      table_(std::move(table)),
      select_stmt_(pool_->RegisterStatement("select_counter", table_.SelectSql(sql::Dialect::kPostgres))),
      insert_stmt_(pool_->RegisterStatement("insert_counter", table_.InsertSql(sql::Dialect::kPostgres))),
      update_stmt_(pool_->RegisterStatement("update_counter", table_.UpdateSql(sql::Dialect::kPostgres))),
      list_stmt_(pool_->RegisterStatement("list_counters", table_.ListSql(sql::Dialect::kPostgres))) {
}

std::unique_ptr<db::Transaction> PgCounterRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgCounterRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgCounterRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e) != nullptr) {
    return Result::Err(ErrorCode::AlreadyExists, e.what());
  }
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e) != nullptr) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (dynamic_cast<const pqxx::serialization_failure*>(&e) != nullptr ||
      dynamic_cast<const pqxx::deadlock_detected*>(&e) != nullptr) {
    return Result::Err(ErrorCode::SerializationFailure, e.what());
  }
  if (dynamic_cast<const pqxx::broken_connection*>(&e) != nullptr ||
      dynamic_cast<const pqxx::in_doubt_error*>(&e) != nullptr) {
    return Result::Err(ErrorCode::IOError, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

Result PgCounterRepository::SelectCounter(Transaction& t, const std::string& segment_key, std::optional<int64_t>& value) {
  value.reset();
  try {
    // FOR UPDATE: a concurrent allocator blocks here until this transaction ends.
    auto res = TX(t).Work().exec_prepared(select_stmt_, segment_key);
    if (!res.empty()) {
      value = res[0][0].as<int64_t>();
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgCounterRepository::InsertCounter(Transaction& t, const model::CounterRecord& r, uint64_t& rows_affected) {
  rows_affected = 0;
  try {
    auto res      = TX(t).Work().exec_prepared(insert_stmt_, r.segment_key, r.value);
    rows_affected = static_cast<uint64_t>(res.affected_rows());
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgCounterRepository::CompareAndSwapCounter(Transaction& t, const std::string& segment_key, int64_t expected, int64_t next,
                                                  uint64_t& rows_affected) {
  rows_affected = 0;
  try {
    auto res      = TX(t).Work().exec_prepared(update_stmt_, next, expected, segment_key);
    rows_affected = static_cast<uint64_t>(res.affected_rows());
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgCounterRepository::ListCounters(Transaction& t, std::vector<model::CounterRecord>& out) {
  out.clear();
  try {
    auto res = TX(t).Work().exec_prepared(list_stmt_);
    out.reserve(res.size());
    for (const auto& row : res) {
      model::CounterRecord r;
      r.segment_key = row[0].c_str();
      r.value       = row[1].is_null() ? 0 : row[1].as<int64_t>();
      out.push_back(std::move(r));
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

} // namespace prefixid::db::postgres
