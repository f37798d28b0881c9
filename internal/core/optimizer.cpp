#include "internal/core/optimizer.hpp"

#include <string>

#include "internal/util/errors.hpp"

namespace prefixid::core {

std::string_view ToString(OptimizerStrategy strategy) {
  switch (strategy) {
    case OptimizerStrategy::kNone:
      return "none";
    case OptimizerStrategy::kPooled:
      return "pooled";
  }
  return "unknown";
}

std::optional<OptimizerStrategy> ParseOptimizerStrategy(std::string_view name) {
  if (name == "none") {
    return OptimizerStrategy::kNone;
  }
  if (name == "pooled") {
    return OptimizerStrategy::kPooled;
  }
  return std::nullopt;
}

OptimizerStrategy ImplicitOptimizerStrategy(int32_t increment_size) {
  return increment_size <= 1 ? OptimizerStrategy::kNone : OptimizerStrategy::kPooled;
}

// ------------------------------------------------------------
// NoopOptimizer
// ------------------------------------------------------------

int64_t NoopOptimizer::Generate(const std::string& segment_key, const AccessCallback& next_source_value) {
  const int64_t value = next_source_value();

  std::lock_guard lock(mutex_);
  last_source_[segment_key] = value;
  return value;
}

std::optional<int64_t> NoopOptimizer::LastSourceValue(const std::string& segment_key) const {
  std::lock_guard lock(mutex_);
  auto            it = last_source_.find(segment_key);
  if (it == last_source_.end()) return std::nullopt;
  return it->second;
}

// ------------------------------------------------------------
// PooledOptimizer
// ------------------------------------------------------------

PooledOptimizer::PooledOptimizer(int32_t increment_size) : increment_size_(increment_size) {
}

PooledOptimizer::SegmentPool& PooledOptimizer::PoolFor(const std::string& segment_key) {
  std::lock_guard lock(pools_mutex_);
  auto&           pool = pools_[segment_key];
  if (!pool) {
    pool = std::make_unique<SegmentPool>();
  }
  return *pool;
}

int64_t PooledOptimizer::Generate(const std::string& segment_key, const AccessCallback& next_source_value) {
  auto&           pool = PoolFor(segment_key);
  std::lock_guard lock(pool.mutex);

  if (pool.next >= pool.upper_limit) {
    // the allocator refuses to reserve a block past the int64 range
    const int64_t lo = next_source_value();

    pool.last_source = lo;
    pool.next        = lo;
    pool.upper_limit = lo + increment_size_;
  }

  return pool.next++;
}

std::optional<int64_t> PooledOptimizer::LastSourceValue(const std::string& segment_key) const {
  SegmentPool* pool = nullptr;
  {
    std::lock_guard lock(pools_mutex_);
    auto            it = pools_.find(segment_key);
    if (it == pools_.end()) return std::nullopt;
    pool = it->second.get();
  }

  std::lock_guard lock(pool->mutex);
  return pool->last_source;
}

std::unique_ptr<Optimizer> BuildOptimizer(OptimizerStrategy strategy, int32_t increment_size) {
  if (increment_size < 1) {
    throw util::ConfigurationError("optimizer: increment size must be at least 1, got " + std::to_string(increment_size));
  }

  switch (strategy) {
    case OptimizerStrategy::kNone:
      if (increment_size != 1) {
        throw util::ConfigurationError("optimizer: 'none' requires increment size 1, got " + std::to_string(increment_size) +
                                       "; use 'pooled' to reserve blocks");
      }
      return std::make_unique<NoopOptimizer>();
    case OptimizerStrategy::kPooled:
      return std::make_unique<PooledOptimizer>(increment_size);
  }
  throw util::ConfigurationError("optimizer: unknown strategy");
}

} // namespace prefixid::core
