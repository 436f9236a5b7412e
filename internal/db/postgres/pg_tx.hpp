#pragma once

#include <memory>
#include <pqxx/pqxx>
#include "internal/db/api/transaction.hpp"
#include "pg_pool.hpp"

namespace infragraph::db::postgres {

/*
  Writers run SERIALIZABLE; a lost race surfaces as
  pqxx::serialization_failure on a statement or at commit.
  Readers use pqxx::read_transaction.
*/
class PgTransaction final : public db::Transaction {
public:
  PgTransaction(std::shared_ptr<PgPool> pool, bool read_only);
  ~PgTransaction();

  pqxx::transaction_base& Work() { return *tx_; }

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override { return committed_; }
  bool IsReadOnly() const override { return read_only_; }

private:
  std::shared_ptr<pqxx::connection> conn_;
  std::unique_ptr<pqxx::transaction_base> tx_;
  bool read_only_ = false;
  bool committed_ = false;
  bool finished_ = false;
};

}
