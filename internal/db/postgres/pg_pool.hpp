#pragma once

#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <pqxx/pqxx>
#include <string>
#include <unordered_map>
#include <vector>

namespace prefixid::db::postgres {

/*
  PgPool

  Connection pool shared by every PgCounterRepository of a runtime.

  Design notes:
  -------------
  - Each transaction gets its own connection.
  - libpqxx connections are NOT thread-safe -> do not share.
  - Acquire() blocks once max_connections are checked out.
  - Registered statements are prepared on every connection before it is
    handed out. Connections opened earlier catch up on their next Acquire().

  Lifetime:
    Repository owns shared_ptr<PgPool>
    Transaction acquires shared_ptr<pqxx::connection>
*/

class PgPool : public std::enable_shared_from_this<PgPool> {
 public:
  explicit PgPool(std::string conninfo, std::size_t max_connections = 16);

  // Acquire a ready-to-use connection; returned to the pool on release.
  std::shared_ptr<pqxx::connection> Acquire();

  // Returns the name to pass to exec_prepared(). Identical SQL shares one
  // name, so repositories over the same table reuse the statement.
  std::string RegisterStatement(const std::string& kind, const std::string& sql);

 private:
  struct Statement {
    std::string name;
    std::string sql;
  };

  std::shared_ptr<pqxx::connection> Wrap(pqxx::connection* conn);
  void                              Release(pqxx::connection* conn);
  void                              PrepareStatements(pqxx::connection& conn);
  void                              Discard(const pqxx::connection* conn);

  std::string conninfo_;
  std::size_t max_connections_;

  std::mutex                                     mutex_;
  std::condition_variable                        cv_;
  std::vector<std::unique_ptr<pqxx::connection>> idle_;
  std::size_t                                    live_connections_ = 0;

  // append-only; prepared_counts_ tracks how far each connection got
  std::vector<Statement>                                   statements_;
  std::unordered_map<const pqxx::connection*, std::size_t> prepared_counts_;
};

} // namespace prefixid::db::postgres
