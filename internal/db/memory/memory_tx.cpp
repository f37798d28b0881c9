#include "memory_tx.hpp"

#include <stdexcept>

namespace prefixid::db::memory {

MemoryTransaction::MemoryTransaction(MemoryCounterRepository& repo, uint64_t id) : repo_(repo), id_(id) {
}

MemoryTransaction::~MemoryTransaction() {
  if (!committed_) Rollback();
}

void MemoryTransaction::Commit() {
  if (committed_) {
    throw std::runtime_error("memory transaction already finished");
  }
  std::scoped_lock lock(repo_.mutex_);
  repo_.Finish(*this, true);
  committed_ = true;
}

void MemoryTransaction::Rollback() {
  if (committed_) {
    return;
  }
  std::scoped_lock lock(repo_.mutex_);
  repo_.Finish(*this, false);
  committed_ = true;
}

} // namespace prefixid::db::memory
