#include "sqlite_tx.hpp"

#include <exception>

#include "internal/observability/logging.hpp"

namespace prefixid::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)), connection_lock_(db_->TransactionMutex()) {
  db_->Exec("BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  if (!committed_) {
    try {
      db_->Exec("ROLLBACK;");
    } catch (const std::exception& e) {
      PREFIXID_LOG_WARN("sqlite rollback failed", {observability::StringField("path", db_->Path()),
                                                   observability::StringField("error", e.what())});
    }
  }
}

void SqliteTransaction::Commit() {
  db_->Exec("COMMIT;");
  committed_ = true;
  ReleaseConnection();
}

void SqliteTransaction::Rollback() {
  db_->Exec("ROLLBACK;");
  committed_ = true;
  ReleaseConnection();
}

void SqliteTransaction::ReleaseConnection() {
  if (connection_lock_.owns_lock()) {
    connection_lock_.unlock();
  }
}

} // namespace prefixid::db::sqlite
