#include "pg_pool.hpp"

namespace prefixid::db::postgres {

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)),
      max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::string PgPool::RegisterStatement(const std::string& kind, const std::string& sql) {
  std::lock_guard lock(mutex_);
  for (const auto& statement : statements_) {
    if (statement.sql == sql) return statement.name;
  }

  statements_.push_back({"prefixid_" + kind + "_" + std::to_string(statements_.size()), sql});
  return statements_.back().name;
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  std::unique_ptr<pqxx::connection> conn;
  {
    std::unique_lock lock(mutex_);
    for (;;) {
      while (!conn && !idle_.empty()) {
        auto candidate = std::move(idle_.back());
        idle_.pop_back();
        if (candidate->is_open()) {
          conn = std::move(candidate);
          break;
        }
        prepared_counts_.erase(candidate.get());
        --live_connections_;
      }
      if (conn) break;

      if (live_connections_ < max_connections_) {
        ++live_connections_;
        break;
      }

      cv_.wait(lock, [this] {
        return !idle_.empty() || live_connections_ < max_connections_;
      });
    }
  }

  // the slot is reserved; connecting and preparing happen unlocked
  try {
    if (!conn) {
      conn = std::make_unique<pqxx::connection>(conninfo_);
    }
    PrepareStatements(*conn);
  } catch (...) {
    Discard(conn.get());
    throw;
  }

  return Wrap(conn.release());
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  std::vector<Statement> pending;
  {
    std::lock_guard lock(mutex_);
    const std::size_t done = prepared_counts_[&conn];
    pending.assign(statements_.begin() + static_cast<std::ptrdiff_t>(done), statements_.end());
  }

  for (const auto& statement : pending) {
    conn.prepare(statement.name, statement.sql);
  }

  std::lock_guard lock(mutex_);
  prepared_counts_[&conn] += pending.size();
}

void PgPool::Discard(const pqxx::connection* conn) {
  {
    std::lock_guard lock(mutex_);
    if (conn != nullptr) {
      prepared_counts_.erase(conn);
    }
    --live_connections_;
  }
  cv_.notify_one();
}

std::shared_ptr<pqxx::connection> PgPool::Wrap(pqxx::connection* conn) {
  std::weak_ptr<PgPool> weak_self = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn, [weak_self](pqxx::connection* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void PgPool::Release(pqxx::connection* conn) {
  {
    std::lock_guard lock(mutex_);
    idle_.emplace_back(conn);
  }
  cv_.notify_one();
}

} // namespace prefixid::db::postgres
