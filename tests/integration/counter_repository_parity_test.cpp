#include <algorithm>
#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/db/api/counter_repository.hpp"
#include "internal/db/memory/memory_counter_repository.hpp"
#include "internal/db/model/counter_record.hpp"
#include "internal/db/sql/counter_table.hpp"

#if PREFIXID_DB_SQLITE
#include "internal/db/sqlite/sqlite_counter_repository.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#endif

#if PREFIXID_DB_POSTGRES
#include "internal/db/postgres/pg_counter_repository.hpp"
#include "internal/db/postgres/pg_pool.hpp"
#endif

namespace {

using prefixid::db::CounterRepository;
using prefixid::db::memory::MemoryCounterRepository;
using prefixid::db::model::CounterRecord;
using prefixid::db::sql::CounterTable;

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                              name;
  std::function<std::shared_ptr<CounterRepository>()>      make_repository;
  std::function<bool()>                                    supports_restart;
  std::function<void(std::shared_ptr<CounterRepository>&)> restart;
  std::function<void()>                                    cleanup;
  bool                                                     supports_parallel_transactions = true;
};

std::optional<int64_t> Read(CounterRepository& repo, const std::string& key) {
  auto                   tx = repo.Begin();
  std::optional<int64_t> value;
  assert(repo.SelectCounter(*tx, key, value));
  tx->Commit();
  return value;
}

void VerifyInsertIfAbsent(CounterRepository& repo, const std::string& key) {
  auto tx = repo.Begin();

  std::optional<int64_t> value = 99;
  assert(repo.SelectCounter(*tx, key, value));
  assert(!value.has_value());

  uint64_t rows = 0;
  assert(repo.InsertCounter(*tx, CounterRecord{key, 1}, rows));
  assert(rows == 1);

  // visible to its own transaction before commit
  assert(repo.SelectCounter(*tx, key, value));
  assert(value == 1);

  assert(repo.InsertCounter(*tx, CounterRecord{key, 50}, rows));
  assert(rows == 0);
  assert(!tx->IsCommitted());
  tx->Commit();
  assert(tx->IsCommitted());

  assert(Read(repo, key) == 1);

  auto again = repo.Begin();
  assert(repo.InsertCounter(*again, CounterRecord{key, 50}, rows));
  assert(rows == 0);
  again->Commit();
  assert(Read(repo, key) == 1);
}

void VerifyCompareAndSwap(CounterRepository& repo, const std::string& key) {
  auto     tx   = repo.Begin();
  uint64_t rows = 0;
  assert(repo.InsertCounter(*tx, CounterRecord{key, 10}, rows));

  assert(repo.CompareAndSwapCounter(*tx, key, 9, 11, rows));
  assert(rows == 0);

  assert(repo.CompareAndSwapCounter(*tx, key, 10, 11, rows));
  assert(rows == 1);

  std::optional<int64_t> value;
  assert(repo.SelectCounter(*tx, key, value));
  assert(value == 11);

  assert(repo.CompareAndSwapCounter(*tx, key + "-absent", 0, 1, rows));
  assert(rows == 0);
  tx->Commit();

  assert(Read(repo, key) == 11);
  assert(!Read(repo, key + "-absent").has_value());
}

void VerifyRollbackBehavior(CounterRepository& repo, const std::string& key) {
  {
    auto     tx   = repo.Begin();
    uint64_t rows = 0;
    assert(repo.InsertCounter(*tx, CounterRecord{key, 5}, rows));
    assert(rows == 1);
    tx->Rollback();
    assert(tx->IsCommitted());
  }
  assert(!Read(repo, key).has_value());

  {
    auto     tx   = repo.Begin();
    uint64_t rows = 0;
    assert(repo.InsertCounter(*tx, CounterRecord{key, 5}, rows));
    tx->Commit();
  }

  {
    // dropped without commit
    auto     tx   = repo.Begin();
    uint64_t rows = 0;
    assert(repo.CompareAndSwapCounter(*tx, key, 5, 6, rows));
    assert(rows == 1);
  }
  assert(Read(repo, key) == 5);
}

void VerifyStaleCompareAndSwap(CounterRepository& repo, const std::string& key, bool supports_parallel_transactions) {
  {
    auto     tx   = repo.Begin();
    uint64_t rows = 0;
    assert(repo.InsertCounter(*tx, CounterRecord{key, 5}, rows));
    tx->Commit();
  }

  std::unique_ptr<prefixid::db::Transaction> late;

  auto first = repo.Begin();
  if (supports_parallel_transactions) {
    late = repo.Begin();
  }

  uint64_t rows = 0;
  assert(repo.CompareAndSwapCounter(*first, key, 5, 6, rows));
  assert(rows == 1);
  first->Commit();

  if (!late) {
    late = repo.Begin();
  }
  // the writer that read 5 earlier loses
  assert(repo.CompareAndSwapCounter(*late, key, 5, 6, rows));
  assert(rows == 0);
  late->Commit();

  assert(Read(repo, key) == 6);
}

void VerifyListIsOrdered(CounterRepository& repo, const std::string& prefix) {
  {
    auto     tx   = repo.Begin();
    uint64_t rows = 0;
    for (const auto* suffix : {"c", "a", "b"}) {
      assert(repo.InsertCounter(*tx, CounterRecord{prefix + suffix, 1}, rows));
    }
    tx->Commit();
  }

  auto                       tx = repo.Begin();
  std::vector<CounterRecord> out;
  assert(repo.ListCounters(*tx, out));
  tx->Commit();

  assert(std::is_sorted(out.begin(), out.end(), [](const auto& l, const auto& r) { return l.segment_key < r.segment_key; }));

  std::vector<std::string> mine;
  for (const auto& record : out) {
    if (record.segment_key.rfind(prefix, 0) == 0) {
      mine.push_back(record.segment_key);
    }
  }
  assert((mine == std::vector<std::string>{prefix + "a", prefix + "b", prefix + "c"}));
}

void VerifyRestartDurability(BackendFactory& backend, const std::string& key) {
  if (!backend.supports_restart()) {
    return;
  }

  auto repo = backend.make_repository();
  {
    auto     tx   = repo->Begin();
    uint64_t rows = 0;
    assert(repo->InsertCounter(*tx, CounterRecord{key, 41}, rows));
    assert(repo->CompareAndSwapCounter(*tx, key, 41, 42, rows));
    tx->Commit();
  }

  backend.restart(repo);
  assert(Read(*repo, key) == 42);
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name                           = "memory",
      .make_repository                = []() { return std::make_shared<MemoryCounterRepository>(); },
      .supports_restart               = []() { return false; },
      .restart                        = [](std::shared_ptr<CounterRepository>&) {},
      .cleanup                        = []() {},
      .supports_parallel_transactions = true,
  };
}

#if PREFIXID_DB_SQLITE
BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("prefixid_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();

  // non-default layout to exercise generated SQL
  auto make_repo = [db_path]() {
    CounterTable table("parity_sequences", "series", 64, "hi");
    auto         db = std::make_shared<prefixid::db::sqlite::SqliteDB>(db_path);
    db->Exec(table.CreateTableSql());
    return std::make_shared<prefixid::db::sqlite::SqliteCounterRepository>(std::move(db), table);
  };

  return BackendFactory{
      .name                           = "sqlite",
      .make_repository                = make_repo,
      .supports_restart               = []() { return true; },
      .restart                        = [make_repo](std::shared_ptr<CounterRepository>& repo) { repo = make_repo(); },
      .cleanup                        = [db_path]() {
        for (const auto* suffix : {"", "-wal", "-shm"}) {
          std::filesystem::remove(db_path + suffix);
        }
      },
      .supports_parallel_transactions = false,
  };
}
#endif

#if PREFIXID_DB_POSTGRES
BackendFactory MakePostgresFactory() {
  const char* uri = std::getenv("PREFIXID_TEST_POSTGRES_URI");
  if (uri == nullptr || std::string(uri).empty()) {
    throw std::runtime_error("PREFIXID_TEST_POSTGRES_URI is not set");
  }

  auto conninfo = std::string(uri);
  auto table    = CounterTable("prefixid_parity_" + std::to_string(NowMs()), "series", 64, "hi");

  auto make_repo = [conninfo, table]() {
    auto       pool = std::make_shared<prefixid::db::postgres::PgPool>(conninfo);
    auto       conn = pool->Acquire();
    pqxx::work tx(*conn);
    tx.exec(table.CreateTableSql());
    tx.commit();
    return std::make_shared<prefixid::db::postgres::PgCounterRepository>(std::move(pool), table);
  };

  return BackendFactory{
      .name                           = "postgres",
      .make_repository                = make_repo,
      .supports_restart               = []() { return true; },
      .restart                        = [make_repo](std::shared_ptr<CounterRepository>& repo) { repo = make_repo(); },
      .cleanup                        = [conninfo, table]() {
        pqxx::connection conn(conninfo);
        pqxx::work       tx(conn);
        tx.exec("DROP TABLE IF EXISTS " + table.TableName() + ";");
        tx.commit();
      },
      .supports_parallel_transactions = true,
  };
}
#endif

#if PREFIXID_DB_POSTGRES
// A connection opened before a statement is registered still gets it
// prepared the next time it is checked out.
void VerifyPoolPreparesRegisteredStatements(const std::string& conninfo) {
  auto pool = std::make_shared<prefixid::db::postgres::PgPool>(conninfo, 1);
  { auto warm = pool->Acquire(); }

  const auto name  = pool->RegisterStatement("ping", "SELECT $1::bigint + 1");
  const auto again = pool->RegisterStatement("ping_again", "SELECT $1::bigint + 1");
  assert(name == again);
  assert(pool->RegisterStatement("other", "SELECT 2") != name);

  auto       conn = pool->Acquire();
  pqxx::work tx(*conn);
  auto       res = tx.exec_prepared(name, int64_t{41});
  assert(res[0][0].as<int64_t>() == 42);
  tx.commit();
}
#endif

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";
  auto repo = backend.make_repository();

  VerifyInsertIfAbsent(*repo, backend.name + "-insert");
  VerifyCompareAndSwap(*repo, backend.name + "-cas");
  VerifyRollbackBehavior(*repo, backend.name + "-rollback");
  VerifyStaleCompareAndSwap(*repo, backend.name + "-stale", backend.supports_parallel_transactions);
  VerifyListIsOrdered(*repo, backend.name + "-list-");

  VerifyRestartDurability(backend, backend.name + "-durable");

  repo.reset();
  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());

#if PREFIXID_DB_SQLITE
  backends.push_back(MakeSqliteFactory());
#endif

#if PREFIXID_DB_POSTGRES
  try {
    backends.push_back(MakePostgresFactory());
    VerifyPoolPreparesRegisteredStatements(std::getenv("PREFIXID_TEST_POSTGRES_URI"));
  } catch (const std::exception& ex) {
    std::cout << "skipping postgres integration suite: " << ex.what() << "\n";
  }
#endif

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  std::cout << "prefixid_integration_counter_repository_parity: pass\n";
  return 0;
}
