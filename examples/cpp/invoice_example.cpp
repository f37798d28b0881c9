#include <iostream>
#include <memory>
#include <string>

#include "internal/core/prefixed_id_generator.hpp"
#include "internal/db/memory/memory_counter_repository.hpp"

namespace {

struct Invoice {
  std::string series;  // "INV" for invoices, "CRN" for credit notes
  double      amount = 0;
};

} // namespace

int main() {
  using namespace prefixid;

  // Memory-backed store; swap in a SqliteCounterRepository to persist across runs.
  auto store     = std::make_shared<db::memory::MemoryCounterRepository>();
  auto allocator = std::make_shared<core::SegmentedCounterAllocator>(store, core::AllocatorSettings{});
  auto generator = std::make_shared<core::PrefixedIdGenerator>("invoice", "", allocator, core::NumberFormat());

  core::EntityIdGenerator<Invoice> invoice_ids(generator, [](const Invoice& invoice) { return invoice.series; });

  for (const auto& invoice : {Invoice{"INV", 120.0}, Invoice{"INV", 75.5}, Invoice{"CRN", -20.0}, Invoice{"INV", 310.0}}) {
    std::cout << invoice_ids.Generate(invoice) << " " << invoice.amount << "\n";
  }

  std::cout << "storage round-trips: " << allocator->TableAccessCount() << "\n";
  return 0;
}
