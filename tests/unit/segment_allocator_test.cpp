#include "internal/core/segment_allocator.hpp"

#include <cassert>
#include <functional>
#include <iostream>
#include <limits>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/db/memory/memory_counter_repository.hpp"
#include "internal/util/errors.hpp"

namespace {

using prefixid::core::AllocatorSettings;
using prefixid::core::OptimizerStrategy;
using prefixid::core::SegmentedCounterAllocator;
using prefixid::db::CounterRepository;
using prefixid::db::ErrorCode;
using prefixid::db::Result;
using prefixid::db::Transaction;
using prefixid::db::memory::MemoryCounterRepository;
using prefixid::db::model::CounterRecord;

/*
  Delegates to a real repository and lets a test inject failures,
  lost updates and concurrent writers.
*/
class HookedRepository final : public CounterRepository {
 public:
  explicit HookedRepository(std::shared_ptr<CounterRepository> inner) : inner_(std::move(inner)) {
  }

  std::unique_ptr<Transaction> Begin() override {
    ++begins;
    if (fail_begin) {
      throw std::runtime_error("connection refused");
    }
    return inner_->Begin();
  }

  Result SelectCounter(Transaction& tx, const std::string& segment_key, std::optional<int64_t>& value) override {
    ++selects;
    if (select_error) {
      return *select_error;
    }
    return inner_->SelectCounter(tx, segment_key, value);
  }

  Result InsertCounter(Transaction& tx, const CounterRecord& record, uint64_t& rows_affected) override {
    ++inserts;
    return inner_->InsertCounter(tx, record, rows_affected);
  }

  Result CompareAndSwapCounter(Transaction& tx, const std::string& segment_key, int64_t expected, int64_t next,
                               uint64_t& rows_affected) override {
    ++swaps;
    if (forced_losses > 0) {
      --forced_losses;
      rows_affected = 0;
      return Result::Ok();
    }
    if (before_swap) {
      auto hook = std::move(before_swap);
      before_swap = nullptr;
      hook();
    }
    return inner_->CompareAndSwapCounter(tx, segment_key, expected, next, rows_affected);
  }

  Result ListCounters(Transaction& tx, std::vector<CounterRecord>& out) override {
    return inner_->ListCounters(tx, out);
  }

  bool                  fail_begin = false;
  std::optional<Result> select_error;
  int                   forced_losses = 0;
  std::function<void()> before_swap;

  int begins  = 0;
  int selects = 0;
  int inserts = 0;
  int swaps   = 0;

 private:
  std::shared_ptr<CounterRepository> inner_;
};

std::optional<int64_t> StoredValue(CounterRepository& repo, const std::string& segment_key) {
  auto                   tx = repo.Begin();
  std::optional<int64_t> value;
  assert(repo.SelectCounter(*tx, segment_key, value));
  tx->Commit();
  return value;
}

void Seed(CounterRepository& repo, const std::string& segment_key, int64_t value) {
  auto     tx       = repo.Begin();
  uint64_t inserted = 0;
  assert(repo.InsertCounter(*tx, CounterRecord{segment_key, value}, inserted));
  assert(inserted == 1);
  tx->Commit();
}

void TestFirstAllocationStartsAtInitialValue() {
  auto                      store = std::make_shared<MemoryCounterRepository>();
  SegmentedCounterAllocator allocator(store, AllocatorSettings{});

  assert(allocator.Allocate("INV") == 1);
  assert(allocator.Allocate("INV") == 2);
  assert(allocator.Allocate("INV") == 3);
  assert(allocator.TableAccessCount() == 3);
  assert(StoredValue(*store, "INV") == 4);

  SegmentedCounterAllocator offset(std::make_shared<MemoryCounterRepository>(), AllocatorSettings{.initial_value = 100});
  assert(offset.Allocate("INV") == 100);
  assert(offset.Allocate("INV") == 101);
}

void TestSegmentsAreIndependent() {
  SegmentedCounterAllocator allocator(std::make_shared<MemoryCounterRepository>(), AllocatorSettings{});

  assert(allocator.Allocate("INV") == 1);
  assert(allocator.Allocate("INV") == 2);
  assert(allocator.Allocate("PO") == 1);
  assert(allocator.Allocate("INV") == 3);
  assert(allocator.Allocate("PO") == 2);
}

void TestConcurrentWriterForcesRetry() {
  auto                      store  = std::make_shared<MemoryCounterRepository>();
  auto                      hooked = std::make_shared<HookedRepository>(store);
  SegmentedCounterAllocator allocator(hooked, AllocatorSettings{});
  SegmentedCounterAllocator competitor(store, AllocatorSettings{});

  assert(allocator.Allocate("INV") == 1);

  // competitor commits 2 between our read and our update
  int64_t competitor_value = 0;
  hooked->before_swap      = [&] { competitor_value = competitor.Allocate("INV"); };
  hooked->swaps            = 0;

  assert(allocator.Allocate("INV") == 3);
  assert(competitor_value == 2);
  assert(hooked->swaps == 2);
  assert(StoredValue(*store, "INV") == 4);
}

void TestPermanentContentionIsReported() {
  auto                      store  = std::make_shared<MemoryCounterRepository>();
  auto                      hooked = std::make_shared<HookedRepository>(store);
  SegmentedCounterAllocator allocator(hooked, AllocatorSettings{.max_attempts = 5});

  assert(allocator.Allocate("INV") == 1);

  hooked->forced_losses = 1000;
  hooked->swaps         = 0;
  bool threw            = false;
  try {
    (void)allocator.Allocate("INV");
  } catch (const prefixid::util::ContentionExhausted&) {
    threw = true;
  }
  assert(threw);
  assert(hooked->swaps == 5);
  assert(allocator.TableAccessCount() == 1);

  // nothing was consumed by the failed call
  hooked->forced_losses = 0;
  assert(allocator.Allocate("INV") == 2);
}

void TestZeroMaxAttemptsRetriesUntilSuccess() {
  auto                      hooked = std::make_shared<HookedRepository>(std::make_shared<MemoryCounterRepository>());
  SegmentedCounterAllocator allocator(hooked, AllocatorSettings{.max_attempts = 0});

  hooked->forced_losses = 2500;
  assert(allocator.Allocate("INV") == 1);
  assert(hooked->swaps == 2501);
}

void TestStorageErrorsSurfaceAsStorageFailure() {
  auto                      hooked = std::make_shared<HookedRepository>(std::make_shared<MemoryCounterRepository>());
  SegmentedCounterAllocator allocator(hooked, AllocatorSettings{});

  hooked->select_error = Result::Err(ErrorCode::IOError, "disk unplugged");
  bool threw           = false;
  try {
    (void)allocator.Allocate("INV");
  } catch (const prefixid::util::StorageFailure& e) {
    threw = true;
    assert(e.Code() == ErrorCode::IOError);
  }
  assert(threw);

  hooked->select_error.reset();
  hooked->fail_begin = true;
  threw              = false;
  try {
    (void)allocator.Allocate("INV");
  } catch (const prefixid::util::StorageFailure&) {
    threw = true;
  }
  assert(threw);

  hooked->fail_begin = false;
  assert(allocator.Allocate("INV") == 1);
  assert(allocator.TableAccessCount() == 1);
}

void TestInvalidKeysNeverReachStorage() {
  auto                      hooked = std::make_shared<HookedRepository>(std::make_shared<MemoryCounterRepository>());
  SegmentedCounterAllocator allocator(hooked, AllocatorSettings{.segment_value_length = 8});

  for (const std::string key : {std::string(), std::string("TOO-LONG-KEY")}) {
    bool threw = false;
    try {
      (void)allocator.Allocate(key);
    } catch (const prefixid::util::InvalidSegmentKey&) {
      threw = true;
    }
    assert(threw);
  }
  assert(hooked->begins == 0);
  assert(allocator.Allocate("EXACTLY8") == 1);
}

void TestPooledReservesBlocks() {
  auto                      store = std::make_shared<MemoryCounterRepository>();
  SegmentedCounterAllocator allocator(store, AllocatorSettings{.increment_size = 5, .optimizer = OptimizerStrategy::kPooled});

  std::vector<int64_t> values;
  for (int i = 0; i < 7; ++i) {
    values.push_back(allocator.Allocate("PER"));
  }
  assert((values == std::vector<int64_t>{1, 2, 3, 4, 5, 6, 7}));
  assert(allocator.TableAccessCount() == 2);
  assert(StoredValue(*store, "PER") == 11);
  assert(allocator.GetOptimizer().LastSourceValue("PER") == 6);
}

void TestOverflowIsRefused() {
  auto store = std::make_shared<MemoryCounterRepository>();
  Seed(*store, "MAX", std::numeric_limits<int64_t>::max());

  SegmentedCounterAllocator allocator(store, AllocatorSettings{});
  bool                      threw = false;
  try {
    (void)allocator.Allocate("MAX");
  } catch (const prefixid::util::StorageFailure&) {
    threw = true;
  }
  assert(threw);
  assert(StoredValue(*store, "MAX") == std::numeric_limits<int64_t>::max());
}

void TestInvalidSettingsAreRejected() {
  bool threw = false;
  try {
    SegmentedCounterAllocator allocator(std::make_shared<MemoryCounterRepository>(),
                                        AllocatorSettings{.increment_size = 10, .optimizer = OptimizerStrategy::kNone});
  } catch (const prefixid::util::ConfigurationError&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestFirstAllocationStartsAtInitialValue();
  TestSegmentsAreIndependent();
  TestConcurrentWriterForcesRetry();
  TestPermanentContentionIsReported();
  TestZeroMaxAttemptsRetriesUntilSuccess();
  TestStorageErrorsSurfaceAsStorageFailure();
  TestInvalidKeysNeverReachStorage();
  TestPooledReservesBlocks();
  TestOverflowIsRefused();
  TestInvalidSettingsAreRejected();

  std::cout << "prefixid_unit_segment_allocator: pass\n";
  return 0;
}
