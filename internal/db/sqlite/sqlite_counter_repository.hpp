#pragma once

#include <memory>

#include "internal/db/api/counter_repository.hpp"
#include "internal/db/sql/counter_table.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace prefixid::db::sqlite {

class SqliteCounterRepository final : public db::CounterRepository {
public:
  SqliteCounterRepository(std::shared_ptr<SqliteDB> db, sql::CounterTable table);

  std::unique_ptr<Transaction> Begin() override;

  Result SelectCounter(Transaction&, const std::string& segment_key, std::optional<int64_t>& value) override;
  Result InsertCounter(Transaction&, const model::CounterRecord&, uint64_t& rows_affected) override;
  Result CompareAndSwapCounter(Transaction&, const std::string& segment_key, int64_t expected, int64_t next,
                               uint64_t& rows_affected) override;
  Result ListCounters(Transaction&, std::vector<model::CounterRecord>& out) override;

private:
  std::shared_ptr<SqliteDB> db_;
  sql::CounterTable table_;

  std::string select_sql_;
  std::string insert_sql_;
  std::string update_sql_;
  std::string list_sql_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
};

}
