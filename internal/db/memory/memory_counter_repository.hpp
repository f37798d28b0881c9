#pragma once

#include <condition_variable>
#include <map>
#include <mutex>
#include <optional>

#include "internal/db/api/counter_repository.hpp"

namespace prefixid::db::memory {

class MemoryTransaction;

/*
  In-process counter table.

  Row-level semantics modelled on a READ COMMITTED store:
  - reads see the committed value, or the reader's own pending write
  - a write marks the row as owned by the writing transaction until it
    commits or rolls back
  - a write to a row owned by another transaction waits for it to finish,
    then re-evaluates its predicate against the newly committed value

  No row locking on read, so concurrent allocators exercise the
  compare-and-swap retry path.
*/
class MemoryCounterRepository final : public db::CounterRepository {
public:
  MemoryCounterRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result SelectCounter(Transaction&, const std::string& segment_key, std::optional<int64_t>& value) override;
  Result InsertCounter(Transaction&, const model::CounterRecord&, uint64_t& rows_affected) override;
  Result CompareAndSwapCounter(Transaction&, const std::string& segment_key, int64_t expected, int64_t next,
                               uint64_t& rows_affected) override;
  Result ListCounters(Transaction&, std::vector<model::CounterRecord>& out) override;

private:
  friend class MemoryTransaction;

  struct Row {
    std::optional<int64_t> committed;
    std::optional<int64_t> pending;
    uint64_t owner = 0;  // 0 = no open writer
  };

  // Caller holds mutex_. Blocks while another transaction owns the row.
  Row& AwaitWritable(std::unique_lock<std::mutex>& lock, const std::string& segment_key, uint64_t tx_id);

  // Caller holds mutex_.
  void Finish(MemoryTransaction& tx, bool commit);

  std::mutex mutex_;
  std::condition_variable released_;
  std::map<std::string, Row> rows_;
  uint64_t next_tx_id_ = 1;
};

}
