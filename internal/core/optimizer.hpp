#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace prefixid::core {

enum class OptimizerStrategy {
  kNone,    // one storage round-trip per value
  kPooled,  // one storage round-trip per block of increment_size values
};

std::string_view ToString(OptimizerStrategy strategy);

// "none" / "pooled"; nullopt for anything else.
std::optional<OptimizerStrategy> ParseOptimizerStrategy(std::string_view name);

OptimizerStrategy ImplicitOptimizerStrategy(int32_t increment_size);

// Performs one storage round-trip for the segment and returns the source
// value it reserved.
using AccessCallback = std::function<int64_t()>;

/*
  Optimizer

  Decides how source values reserved in storage turn into handed-out
  values. Implementations are thread-safe.
*/
class Optimizer {
 public:
  virtual ~Optimizer() = default;

  virtual int64_t Generate(const std::string& segment_key, const AccessCallback& next_source_value) = 0;

  // true: the stored value advances by IncrementSize() per round-trip.
  virtual bool ApplyIncrementSizeToSourceValues() const = 0;

  virtual int32_t           IncrementSize() const = 0;
  virtual OptimizerStrategy Strategy() const      = 0;

  // Last source value obtained from storage for the segment, if any.
  virtual std::optional<int64_t> LastSourceValue(const std::string& segment_key) const = 0;
};

class NoopOptimizer final : public Optimizer {
 public:
  int64_t Generate(const std::string& segment_key, const AccessCallback& next_source_value) override;

  bool ApplyIncrementSizeToSourceValues() const override {
    return false;
  }
  int32_t IncrementSize() const override {
    return 1;
  }
  OptimizerStrategy Strategy() const override {
    return OptimizerStrategy::kNone;
  }

  std::optional<int64_t> LastSourceValue(const std::string& segment_key) const override;

 private:
  mutable std::mutex                       mutex_;
  std::unordered_map<std::string, int64_t> last_source_;
};

/*
  PooledOptimizer

  The source value is the low end of a reserved block:
  storage moves from lo to lo + increment_size and this process hands out
  lo .. lo + increment_size - 1 without further round-trips. Each segment
  has its own pool. The rest of a block is lost when the process exits.
*/
class PooledOptimizer final : public Optimizer {
 public:
  explicit PooledOptimizer(int32_t increment_size);

  int64_t Generate(const std::string& segment_key, const AccessCallback& next_source_value) override;

  bool ApplyIncrementSizeToSourceValues() const override {
    return true;
  }
  int32_t IncrementSize() const override {
    return increment_size_;
  }
  OptimizerStrategy Strategy() const override {
    return OptimizerStrategy::kPooled;
  }

  std::optional<int64_t> LastSourceValue(const std::string& segment_key) const override;

 private:
  struct SegmentPool {
    // Held across the refill round-trip so concurrent callers never both
    // refill the same segment. Other segments are unaffected.
    std::mutex mutex;

    std::optional<int64_t> last_source;
    int64_t                next        = 0;
    int64_t                upper_limit = 0;  // exclusive
  };

  SegmentPool& PoolFor(const std::string& segment_key);

  int32_t increment_size_;

  // Guards the map only; entries are never erased.
  mutable std::mutex                                           pools_mutex_;
  std::unordered_map<std::string, std::unique_ptr<SegmentPool>> pools_;
};

// Throws util::ConfigurationError for increment_size < 1, or kNone with
// increment_size != 1.
std::unique_ptr<Optimizer> BuildOptimizer(OptimizerStrategy strategy, int32_t increment_size);

} // namespace prefixid::core
