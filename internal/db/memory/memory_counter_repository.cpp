#include "memory_counter_repository.hpp"

#include "memory_tx.hpp"

namespace prefixid::db::memory {

MemoryCounterRepository::MemoryCounterRepository() = default;

std::unique_ptr<db::Transaction> MemoryCounterRepository::Begin() {
  std::scoped_lock lock(mutex_);
  return std::make_unique<MemoryTransaction>(*this, next_tx_id_++);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

MemoryCounterRepository::Row& MemoryCounterRepository::AwaitWritable(std::unique_lock<std::mutex>& lock,
                                                                     const std::string& segment_key, uint64_t tx_id) {
  released_.wait(lock, [&] {
    auto it = rows_.find(segment_key);
    return it == rows_.end() || it->second.owner == 0 || it->second.owner == tx_id;
  });
  return rows_[segment_key];
}

void MemoryCounterRepository::Finish(MemoryTransaction& tx, bool commit) {
  for (const auto& key : tx.OwnedRows()) {
    auto it = rows_.find(key);
    if (it == rows_.end() || it->second.owner != tx.Id()) continue;

    auto& row = it->second;
    if (commit && row.pending.has_value()) {
      row.committed = row.pending;
    }
    row.pending.reset();
    row.owner = 0;
    if (!row.committed.has_value()) {
      rows_.erase(it);
    }
  }
  tx.OwnedRows().clear();
  released_.notify_all();
}

Result MemoryCounterRepository::SelectCounter(Transaction& t, const std::string& segment_key, std::optional<int64_t>& value) {
  auto&            tx = TX(t);
  std::scoped_lock lock(mutex_);

  value.reset();
  auto it = rows_.find(segment_key);
  if (it == rows_.end()) return Result::Ok();

  const auto& row = it->second;
  value           = (row.owner == tx.Id() && row.pending.has_value()) ? row.pending : row.committed;
  return Result::Ok();
}

Result MemoryCounterRepository::InsertCounter(Transaction& t, const model::CounterRecord& r, uint64_t& rows_affected) {
  auto&                        tx = TX(t);
  std::unique_lock<std::mutex> lock(mutex_);

  rows_affected = 0;
  auto& row     = AwaitWritable(lock, r.segment_key, tx.Id());
  if (row.committed.has_value() || (row.owner == tx.Id() && row.pending.has_value())) {
    return Result::Ok();
  }

  row.pending = r.value;
  row.owner   = tx.Id();
  tx.OwnedRows().insert(r.segment_key);
  rows_affected = 1;
  return Result::Ok();
}

Result MemoryCounterRepository::CompareAndSwapCounter(Transaction& t, const std::string& segment_key, int64_t expected, int64_t next,
                                                      uint64_t& rows_affected) {
  auto&                        tx = TX(t);
  std::unique_lock<std::mutex> lock(mutex_);

  rows_affected = 0;
  auto& row     = AwaitWritable(lock, segment_key, tx.Id());

  const auto current = (row.owner == tx.Id() && row.pending.has_value()) ? row.pending : row.committed;
  if (!current.has_value()) {
    // AwaitWritable may have created an empty placeholder.
    if (row.owner == 0) rows_.erase(segment_key);
    return Result::Ok();
  }
  if (*current != expected) return Result::Ok();

  row.pending = next;
  row.owner   = tx.Id();
  tx.OwnedRows().insert(segment_key);
  rows_affected = 1;
  return Result::Ok();
}

Result MemoryCounterRepository::ListCounters(Transaction& t, std::vector<model::CounterRecord>& out) {
  auto&            tx = TX(t);
  std::scoped_lock lock(mutex_);

  out.clear();
  for (const auto& [key, row] : rows_) {
    const auto value = (row.owner == tx.Id() && row.pending.has_value()) ? row.pending : row.committed;
    if (!value.has_value()) continue;
    out.push_back(model::CounterRecord{key, *value});
  }
  return Result::Ok();
}

} // namespace prefixid::db::memory
