#pragma once

#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <vector>

#include "sqlite_db.hpp"

namespace infragraph::db::sqlite {

/*
  SqlitePool

  Connection factory used by SqliteRepository.

  - Each transaction gets its own connection, so a read snapshot on one
    connection is never blocked by the writer on another (WAL).
  - Connections return to the idle list when the last shared_ptr drops.
  - The database must be a file: every connection opens the same path.
*/

class SqlitePool : public std::enable_shared_from_this<SqlitePool> {
 public:
  explicit SqlitePool(SqliteOptions options, std::size_t max_connections = 8);

  // Acquire a ready-to-use connection; blocks while all are checked out.
  std::shared_ptr<SqliteDB> Acquire();

  const SqliteOptions& Options() const {
    return options_;
  }

 private:
  std::shared_ptr<SqliteDB> Wrap(SqliteDB* conn);
  void                      Release(SqliteDB* conn);

  SqliteOptions options_;
  std::size_t   max_connections_;

  std::mutex                             mutex_;
  std::condition_variable                cv_;
  std::vector<std::unique_ptr<SqliteDB>> idle_;
  std::size_t                            live_connections_ = 0;
};

} // namespace infragraph::db::sqlite
