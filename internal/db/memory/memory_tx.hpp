#pragma once

#include <set>
#include <string>

#include "internal/db/api/transaction.hpp"
#include "memory_counter_repository.hpp"

namespace prefixid::db::memory {

/*
  Transaction = id + set of rows it currently owns
*/

class MemoryTransaction final : public db::Transaction {
 public:
  MemoryTransaction(MemoryCounterRepository& repo, uint64_t id);
  ~MemoryTransaction();

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

  uint64_t Id() const {
    return id_;
  }

  std::set<std::string>& OwnedRows() {
    return owned_;
  }

 private:
  MemoryCounterRepository& repo_;
  uint64_t                 id_;
  std::set<std::string>    owned_;
  bool                     committed_ = false;
};

} // namespace prefixid::db::memory
