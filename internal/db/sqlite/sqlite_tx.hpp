#pragma once

#include <memory>
#include <mutex>

#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace prefixid::db::sqlite {

/*
  SQLite transaction wrapper.

  Uses BEGIN IMMEDIATE:
    - grabs the write lock before the counter is read
    - concurrent writers wait on busy_timeout instead of racing
*/
class SqliteTransaction final : public db::Transaction {
public:
  explicit SqliteTransaction(std::shared_ptr<SqliteDB> db);
  ~SqliteTransaction();

  sqlite3* Handle() const { return db_->Handle(); }

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override { return committed_; }

private:
  // the connection is free for the next transaction once this one ends
  void ReleaseConnection();

  std::shared_ptr<SqliteDB> db_;
  std::unique_lock<std::mutex> connection_lock_;
  bool committed_ = false;
};

}
