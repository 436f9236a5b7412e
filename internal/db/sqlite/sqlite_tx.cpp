#include "sqlite_tx.hpp"

#include <spdlog/spdlog.h>

#include "internal/db/api/result.hpp"

namespace infragraph::db::sqlite {

namespace {

ErrorCode CodeOf(int rc) {
  switch (rc & 0xff) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return ErrorCode::Busy;
    case SQLITE_IOERR:
      return ErrorCode::IOError;
    case SQLITE_CORRUPT:
      return ErrorCode::Corruption;
    default:
      return ErrorCode::InternalError;
  }
}

} // namespace

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db, bool read_only) : db_(std::move(db)), read_only_(read_only) {
  try {
    db_->Exec(read_only_ ? "BEGIN DEFERRED;" : "BEGIN IMMEDIATE;");
  } catch (const SqliteError& e) {
    throw DbError(CodeOf(e.rc()), std::string("sqlite begin: ") + e.what());
  }
}

SqliteTransaction::~SqliteTransaction() {
  if (!finished_) {
    try {
      db_->Exec("ROLLBACK;");
    } catch (const SqliteError& e) {
      spdlog::warn("sqlite rollback failed: {}", e.what());
    }
  }
}

void SqliteTransaction::Commit() {
  try {
    db_->Exec("COMMIT;");
  } catch (const SqliteError& e) {
    throw DbError(CodeOf(e.rc()), std::string("sqlite commit: ") + e.what());
  }
  committed_ = true;
  finished_  = true;
}

void SqliteTransaction::Rollback() {
  finished_ = true;
  try {
    db_->Exec("ROLLBACK;");
  } catch (const SqliteError& e) {
    throw DbError(CodeOf(e.rc()), std::string("sqlite rollback: ") + e.what());
  }
}

} // namespace infragraph::db::sqlite
