#pragma once

#include "internal/db/api/counter_repository.hpp"
#include "internal/db/sql/counter_table.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace prefixid::db::postgres {

class PgCounterRepository final : public db::CounterRepository {
public:
  PgCounterRepository(std::shared_ptr<PgPool> pool, sql::CounterTable table);

  std::unique_ptr<Transaction> Begin() override;

  Result SelectCounter(Transaction&, const std::string& segment_key, std::optional<int64_t>& value) override;
  Result InsertCounter(Transaction&, const model::CounterRecord&, uint64_t& rows_affected) override;
  Result CompareAndSwapCounter(Transaction&, const std::string& segment_key, int64_t expected, int64_t next,
                               uint64_t& rows_affected) override;
  Result ListCounters(Transaction&, std::vector<model::CounterRecord>& out) override;

private:
  std::shared_ptr<PgPool> pool_;
  sql::CounterTable table_;

  // prepared statement names registered with pool_
  std::string select_stmt_;
  std::string insert_stmt_;
  std::string update_stmt_;
  std::string list_stmt_;

  static PgTransaction& TX(Transaction& t);
  static Result Translate(const std::exception&);
};

}
