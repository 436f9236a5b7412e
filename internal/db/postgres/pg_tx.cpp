#include "pg_tx.hpp"

#include <spdlog/spdlog.h>

#include "internal/db/api/result.hpp"
#include "pg_errors.hpp"

namespace infragraph::db::postgres {

PgTransaction::PgTransaction(std::shared_ptr<PgPool> pool, bool read_only) : read_only_(read_only) {
  try {
    conn_ = pool->Acquire();
    if (read_only_) {
      tx_ = std::make_unique<pqxx::read_transaction>(*conn_);
    } else {
      tx_ = std::make_unique<pqxx::transaction<pqxx::isolation_level::serializable>>(*conn_);
    }
  } catch (const pqxx::failure& e) {
    throw ToDbError(e, "postgres begin");
  }
}

PgTransaction::~PgTransaction() {
  if (!finished_ && tx_) {
    try {
      tx_->abort();
    } catch (const pqxx::failure& e) {
      spdlog::warn("postgres rollback failed: {}", e.what());
    }
  }
}

void PgTransaction::Commit() {
  finished_ = true;
  try {
    tx_->commit();
  } catch (const pqxx::failure& e) {
    throw ToDbError(e, "postgres commit");
  }
  committed_ = true;
}

void PgTransaction::Rollback() {
  finished_ = true;
  try {
    tx_->abort();
  } catch (const pqxx::failure& e) {
    throw ToDbError(e, "postgres rollback");
  }
}

}
