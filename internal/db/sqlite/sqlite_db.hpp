#pragma once

#include <sqlite3.h>

#include <mutex>
#include <string>

namespace prefixid::db::sqlite {

/*
  Thin RAII wrapper around one sqlite3* connection.

  A connection runs one transaction at a time; SqliteTransaction holds
  TransactionMutex() for its lifetime so threads sharing a connection
  queue up instead of nesting BEGINs. Separate SqliteDB instances on the
  same file are independent writers arbitrated by SQLite's file lock.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  std::mutex& TransactionMutex() {
    return tx_mutex_;
  }

  // Execute a SQL string (used for pragmas/bootstrap/transaction control)
  void Exec(const std::string& sql);

  // Configure recommended PRAGMAs (WAL, busy timeout, etc.)
  void Configure();

 private:
  sqlite3*    db_ = nullptr;
  std::string path_;
  std::mutex  tx_mutex_;
};

} // namespace prefixid::db::sqlite
