#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/counter_record.hpp"

namespace prefixid::db {

/*
  Counter repository: the transactional execution context of the allocator.

  CRITICAL GUARANTEES:

  - All reads and writes run inside a Transaction
  - Reads inside a transaction see its own writes
  - CompareAndSwapCounter evaluates "value = expected" atomically per row
    against the latest committed value; a lost race reports 0 rows, never
    an error
  - InsertCounter never overwrites: an existing row reports 0 rows

  The DB is the source of truth for every counter series.
*/

class CounterRepository {
 public:
  virtual ~CounterRepository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Counter rows
  // ---------------------------------------------------------------------

  // Lock-qualified read. value is reset to nullopt when the row is absent.
  virtual Result SelectCounter(Transaction&, const std::string& segment_key, std::optional<int64_t>& value) = 0;

  virtual Result InsertCounter(Transaction&, const model::CounterRecord&, uint64_t& rows_affected) = 0;

  virtual Result CompareAndSwapCounter(Transaction&, const std::string& segment_key, int64_t expected, int64_t next,
                                       uint64_t& rows_affected) = 0;

  // Ordered by segment_key.
  virtual Result ListCounters(Transaction&, std::vector<model::CounterRecord>& out) = 0;
};

} // namespace prefixid::db
