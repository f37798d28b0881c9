#include "internal/core/segment_allocator.hpp"

#include <exception>
#include <limits>
#include <optional>
#include <utility>

#include "internal/db/model/counter_record.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace prefixid::core {

using observability::IntField;
using observability::StringField;

namespace {

void ThrowIfDbError(const db::Result& result, const std::string& context, const std::string& segment_key) {
  if (result) {
    return;
  }

  const auto message = context + " '" + segment_key + "'" + (result.message.empty() ? "" : ": " + result.message);
  PREFIXID_LOG_WARN("counter storage failure", {StringField("segment", segment_key), StringField("code", db::ToString(result.code)),
                                                StringField("error", result.message)});
  throw util::StorageFailure(message, result.code);
}

} // namespace

SegmentedCounterAllocator::SegmentedCounterAllocator(std::shared_ptr<db::CounterRepository> repository, AllocatorSettings settings)
    : repository_(std::move(repository)),
      settings_(settings),
      optimizer_(BuildOptimizer(settings.optimizer, settings.increment_size)) {
  if (!repository_) {
    throw util::ConfigurationError("allocator: counter repository is required");
  }
  if (settings_.segment_value_length == 0) {
    throw util::ConfigurationError("allocator: segment value length must be positive");
  }
}

void SegmentedCounterAllocator::ValidateSegmentKey(const std::string& segment_key) const {
  if (segment_key.empty()) {
    throw util::InvalidSegmentKey("allocate: segment key must not be empty");
  }
  if (segment_key.size() > settings_.segment_value_length) {
    throw util::InvalidSegmentKey("allocate: segment key '" + segment_key + "' exceeds " + std::to_string(settings_.segment_value_length) +
                                  " characters");
  }
}

int64_t SegmentedCounterAllocator::Allocate(const std::string& segment_key) {
  ValidateSegmentKey(segment_key);
  return optimizer_->Generate(segment_key, [this, &segment_key] { return NextSourceValue(segment_key); });
}

int64_t SegmentedCounterAllocator::NextSourceValue(const std::string& segment_key) {
  const int64_t step = optimizer_->ApplyIncrementSizeToSourceValues() ? optimizer_->IncrementSize() : 1;

  std::unique_ptr<db::Transaction> tx;
  try {
    tx = repository_->Begin();
  } catch (const std::exception& e) {
    PREFIXID_LOG_WARN("counter transaction failed to start", {StringField("segment", segment_key), StringField("error", e.what())});
    throw util::StorageFailure("begin counter transaction for '" + segment_key + "': " + e.what(), db::ErrorCode::IOError);
  }

  for (uint32_t attempt = 1;; ++attempt) {
    std::optional<int64_t> stored;
    ThrowIfDbError(repository_->SelectCounter(*tx, segment_key, stored), "read counter", segment_key);

    int64_t value         = 0;
    bool    lost_the_race = false;
    if (!stored.has_value()) {
      value = settings_.initial_value;

      uint64_t inserted = 0;
      ThrowIfDbError(repository_->InsertCounter(*tx, db::model::CounterRecord{segment_key, value}, inserted), "initialize counter",
                     segment_key);
      // a concurrent allocator created the row first
      lost_the_race = inserted == 0;
    } else {
      value = *stored;
    }

    if (!lost_the_race) {
      if (value > std::numeric_limits<int64_t>::max() - step) {
        throw util::StorageFailure("counter '" + segment_key + "' cannot advance past " + std::to_string(value) + " without overflow",
                                   db::ErrorCode::ConstraintViolation);
      }

      uint64_t updated = 0;
      ThrowIfDbError(repository_->CompareAndSwapCounter(*tx, segment_key, value, value + step, updated), "update counter", segment_key);
      if (updated > 1) {
        throw util::StorageFailure("update counter '" + segment_key + "': " + std::to_string(updated) + " rows share one segment key",
                                   db::ErrorCode::ConstraintViolation);
      }

      if (updated == 1) {
        try {
          tx->Commit();
        } catch (const std::exception& e) {
          PREFIXID_LOG_WARN("counter commit failed", {StringField("segment", segment_key), StringField("error", e.what())});
          throw util::StorageFailure("commit counter '" + segment_key + "': " + e.what(), db::ErrorCode::IOError);
        }

        const auto accesses = access_count_.fetch_add(1, std::memory_order_relaxed) + 1;
        PREFIXID_LOG_DEBUG("counter advanced", {StringField("segment", segment_key), IntField("value", value), IntField("next", value + step),
                                                IntField("attempts", attempt), IntField("table_accesses", static_cast<int64_t>(accesses))});
        return value;
      }
    }

    if (settings_.max_attempts != 0 && attempt >= settings_.max_attempts) {
      PREFIXID_LOG_WARN("counter contention exhausted", {StringField("segment", segment_key), IntField("attempts", attempt)});
      throw util::ContentionExhausted("allocate '" + segment_key + "': lost " + std::to_string(attempt) +
                                      " consecutive updates to concurrent allocators");
    }
    PREFIXID_LOG_DEBUG("counter update lost a race; retrying", {StringField("segment", segment_key), IntField("attempt", attempt)});
  }
}

} // namespace prefixid::core
