#pragma once

#include <sqlite3.h>

#include <memory>
#include <stdexcept>
#include <string>

namespace infragraph::db::sqlite {

struct SqliteOptions {
  std::string path;
  bool        wal_mode        = true;
  int         busy_timeout_ms = 5000;
};

/*
  sqlite3 failure carrying the primary result code (SQLITE_BUSY, ...).
*/
class SqliteError : public std::runtime_error {
 public:
  SqliteError(int rc, const std::string& msg) : std::runtime_error(msg), rc_(rc) {
  }

  int rc() const {
    return rc_;
  }

 private:
  int rc_;
};

/*
  Thin RAII wrapper around one sqlite3* connection.
*/
class SqliteDB {
 public:
  explicit SqliteDB(SqliteOptions options);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  // Execute a SQL string (used for pragmas/schema/transaction control)
  void Exec(const std::string& sql);

  // Prepare a statement (caller must sqlite3_finalize)
  sqlite3_stmt* Prepare(const std::string& sql);

  // Configure recommended PRAGMAs (WAL, foreign keys, etc.)
  void Configure();

 private:
  sqlite3*      db_ = nullptr;
  SqliteOptions options_;
};

} // namespace infragraph::db::sqlite
