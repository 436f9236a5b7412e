#include "sqlite_pool.hpp"

#include <stdexcept>

namespace infragraph::db::sqlite {

SqlitePool::SqlitePool(SqliteOptions options, std::size_t max_connections)
    : options_(std::move(options)),
      max_connections_(max_connections == 0 ? 1 : max_connections) {
  if (options_.path.empty() || options_.path == ":memory:") {
    throw std::invalid_argument("sqlite backend requires a database file path");
  }
}

std::shared_ptr<SqliteDB> SqlitePool::Acquire() {
  for (;;) {
    {
      std::unique_lock lock(mutex_);

      if (!idle_.empty()) {
        auto conn = std::move(idle_.back());
        idle_.pop_back();
        return Wrap(conn.release());
      }

      if (live_connections_ < max_connections_) {
        ++live_connections_;
        lock.unlock();

        try {
          return Wrap(new SqliteDB(options_));
        } catch (const SqliteError&) {
          std::lock_guard rollback_lock(mutex_);
          --live_connections_;
          cv_.notify_one();
          throw;
        }
      }

      cv_.wait(lock, [this] {
        return !idle_.empty() || live_connections_ < max_connections_;
      });
    }
  }
}

std::shared_ptr<SqliteDB> SqlitePool::Wrap(SqliteDB* conn) {
  std::weak_ptr<SqlitePool> weak_self = shared_from_this();
  return std::shared_ptr<SqliteDB>(conn, [weak_self](SqliteDB* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void SqlitePool::Release(SqliteDB* conn) {
  {
    std::lock_guard lock(mutex_);
    idle_.emplace_back(conn);
  }
  cv_.notify_one();
}

} // namespace infragraph::db::sqlite
