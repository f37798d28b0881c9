#include "factory.hpp"

#include <set>
#include <string>
#include <utility>
#include <vector>

#include "internal/db/memory/memory_counter_repository.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#if PREFIXID_DB_SQLITE
#include "internal/db/sqlite/sqlite_counter_repository.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#endif
#if PREFIXID_DB_POSTGRES
#include "internal/db/postgres/pg_counter_repository.hpp"
#include "internal/db/postgres/pg_pool.hpp"
#endif

namespace prefixid::factory {

using observability::IntField;
using observability::StringField;

namespace {

std::vector<core::GeneratorSettings> ResolveAll(const runtime::config::RuntimeConfig& config) {
  if (config.generators_size() == 0) {
    throw util::ConfigurationError("config: at least one generator is required");
  }

  std::vector<core::GeneratorSettings> all;
  std::map<std::string, db::sql::CounterTable> tables;
  for (const auto& generator : config.generators()) {
    auto settings = core::ResolveGeneratorSettings(generator);

    for (const auto& seen : all) {
      if (seen.name == settings.name) {
        throw util::ConfigurationError("config: duplicate generator name '" + settings.name + "'");
      }
    }

    const auto& table = settings.table;
    auto [it, inserted] = tables.emplace(table.TableName(), table);
    if (!inserted && (it->second.SegmentColumn() != table.SegmentColumn() || it->second.ValueColumn() != table.ValueColumn() ||
                      it->second.SegmentLength() != table.SegmentLength())) {
      throw util::ConfigurationError("config: table '" + table.TableName() + "' is configured with conflicting column layouts");
    }

    all.push_back(std::move(settings));
  }
  return all;
}

// First generator naming each table wins; layouts are checked equal in ResolveAll.
std::vector<db::sql::CounterTable> DistinctTables(const std::vector<core::GeneratorSettings>& all) {
  std::set<std::string>              seen;
  std::vector<db::sql::CounterTable> tables;
  for (const auto& settings : all) {
    if (seen.insert(settings.table.TableName()).second) {
      tables.push_back(settings.table);
    }
  }
  return tables;
}

#if PREFIXID_DB_SQLITE
void BootstrapSqliteSchema(const std::shared_ptr<db::sqlite::SqliteDB>& sqlite_db, const std::vector<db::sql::CounterTable>& tables) {
  for (const auto& table : tables) {
    sqlite_db->Exec(table.CreateTableSql());
    PREFIXID_LOG_INFO("counter table ready", {StringField("backend", "sqlite"), StringField("table", table.TableName())});
  }
}
#endif

#if PREFIXID_DB_POSTGRES
void BootstrapPostgresSchema(const std::shared_ptr<db::postgres::PgPool>& pool, const std::vector<db::sql::CounterTable>& tables) {
  auto        conn = pool->Acquire();
  pqxx::work tx(*conn);

  for (const auto& table : tables) {
    tx.exec(table.CreateTableSql());
  }
  tx.commit();

  for (const auto& table : tables) {
    PREFIXID_LOG_INFO("counter table ready", {StringField("backend", "postgres"), StringField("table", table.TableName())});
  }
}
#endif

// Returns one repository per entry of `all`, in order.
std::vector<std::shared_ptr<db::CounterRepository>> BuildRepositories(const runtime::config::RuntimeConfig& config,
                                                                      const std::vector<core::GeneratorSettings>& all) {
  std::vector<std::shared_ptr<db::CounterRepository>> repositories;
  const auto& database = config.database();

  if (database.has_sqlite()) {
#if PREFIXID_DB_SQLITE
    if (database.sqlite().path().empty()) {
      throw util::ConfigurationError("config: database.sqlite.path is required");
    }
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path());
    BootstrapSqliteSchema(sqlite_db, DistinctTables(all));
    for (const auto& settings : all) {
      repositories.push_back(std::make_shared<db::sqlite::SqliteCounterRepository>(sqlite_db, settings.table));
    }
    PREFIXID_LOG_INFO("database backend", {StringField("backend", "sqlite"), StringField("path", sqlite_db->Path())});
    return repositories;
#else
    throw util::ConfigurationError("config: sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if PREFIXID_DB_POSTGRES
    if (database.postgres().connection_uri().empty()) {
      throw util::ConfigurationError("config: database.postgres.connection_uri is required");
    }
    const auto max_connections = database.postgres().max_connections() == 0 ? 16u : database.postgres().max_connections();
    auto       pool            = std::make_shared<db::postgres::PgPool>(database.postgres().connection_uri(), max_connections);
    BootstrapPostgresSchema(pool, DistinctTables(all));
    for (const auto& settings : all) {
      repositories.push_back(std::make_shared<db::postgres::PgCounterRepository>(pool, settings.table));
    }
    PREFIXID_LOG_INFO("database backend", {StringField("backend", "postgres"), IntField("max_connections", max_connections)});
    return repositories;
#else
    throw util::ConfigurationError("config: postgres backend requested but not enabled at build time");
#endif
  }

  // memory: one store per table, shared by the generators that name it
  std::map<std::string, std::shared_ptr<db::CounterRepository>> by_table;
  for (const auto& settings : all) {
    auto& repository = by_table[settings.table.TableName()];
    if (!repository) {
      repository = std::make_shared<db::memory::MemoryCounterRepository>();
    }
    repositories.push_back(repository);
  }
  PREFIXID_LOG_INFO("database backend", {StringField("backend", "memory")});
  return repositories;
}

} // namespace

core::PrefixedIdGenerator& Runtime::Generator(const std::string& name) const {
  auto it = generators.find(name);
  if (it == generators.end()) {
    throw util::ConfigurationError("unknown generator '" + name + "'");
  }
  return *it->second;
}

db::CounterRepository& Runtime::Repository(const std::string& generator_name) const {
  auto it = repositories.find(generator_name);
  if (it == repositories.end()) {
    throw util::ConfigurationError("unknown generator '" + generator_name + "'");
  }
  return *it->second;
}

std::shared_ptr<core::PrefixedIdGenerator> BuildGenerator(const core::GeneratorSettings& settings,
                                                          std::shared_ptr<db::CounterRepository> repository) {
  auto allocator = std::make_shared<core::SegmentedCounterAllocator>(std::move(repository), settings.allocator);
  return std::make_shared<core::PrefixedIdGenerator>(settings.name, settings.discriminator, std::move(allocator), settings.number_format);
}

/*
    Build generators and their repositories
*/
Runtime Build(const prefixid::runtime::config::RuntimeConfig& config) {
  const auto all          = ResolveAll(config);
  auto       repositories = BuildRepositories(config, all);

  Runtime runtime;
  for (size_t i = 0; i < all.size(); ++i) {
    const auto& settings = all[i];
    runtime.generators.emplace(settings.name, BuildGenerator(settings, repositories[i]));
    runtime.repositories.emplace(settings.name, repositories[i]);

    PREFIXID_LOG_INFO("generator ready", {StringField("generator", settings.name), StringField("table", settings.table.TableName()),
                                          StringField("optimizer", core::ToString(settings.allocator.optimizer)),
                                          IntField("increment_size", settings.allocator.increment_size),
                                          StringField("number_format", settings.number_format.Pattern())});
  }
  return runtime;
}

} // namespace prefixid::factory
