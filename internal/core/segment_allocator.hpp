#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>

#include "internal/core/optimizer.hpp"
#include "internal/db/api/counter_repository.hpp"

namespace prefixid::core {

struct AllocatorSettings {
  // Value stored for a segment seen for the first time; also the first value handed out.
  int64_t initial_value = 1;

  int32_t           increment_size = 1;
  OptimizerStrategy optimizer      = OptimizerStrategy::kNone;

  // Consecutive compare-and-swap losses tolerated per round-trip; 0 = unbounded.
  uint32_t max_attempts = 1000;

  // Longest accepted segment key, matching the segment column width.
  uint32_t segment_value_length = 255;
};

/*
  SegmentedCounterAllocator

  Maps a segment key to a persistent counter and hands out strictly
  increasing values for it. Every storage round-trip runs in its own
  transaction, committed before any value of the reserved range leaves
  the allocator:

    read (lock-qualified) -> insert initial value if absent
      -> UPDATE ... SET value=next WHERE value=read AND segment=key
      -> 0 rows: another allocator moved the row, read again

  Errors:
    util::InvalidSegmentKey    empty or over-long key, before any storage access
    util::StorageFailure       begin/statement/commit failure, int64 overflow
    util::ContentionExhausted  max_attempts consecutive lost updates

  Thread-safe; one instance may serve every thread of the process.
*/
class SegmentedCounterAllocator {
 public:
  // Throws util::ConfigurationError for invalid optimizer settings.
  SegmentedCounterAllocator(std::shared_ptr<db::CounterRepository> repository, AllocatorSettings settings);

  int64_t Allocate(const std::string& segment_key);

  const Optimizer& GetOptimizer() const {
    return *optimizer_;
  }

  OptimizerStrategy Strategy() const {
    return optimizer_->Strategy();
  }

  // Successful storage round-trips since construction.
  uint64_t TableAccessCount() const {
    return access_count_.load(std::memory_order_relaxed);
  }

 private:
  void    ValidateSegmentKey(const std::string& segment_key) const;
  int64_t NextSourceValue(const std::string& segment_key);

  std::shared_ptr<db::CounterRepository> repository_;
  AllocatorSettings                      settings_;
  std::unique_ptr<Optimizer>             optimizer_;
  std::atomic<uint64_t>                  access_count_{0};
};

} // namespace prefixid::core
