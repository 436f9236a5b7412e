#pragma once

namespace infragraph::db {

/*
  Abstract transaction.

  Semantics guaranteed for ALL backends:

  - Changes are invisible until Commit()
  - After Commit() all reads see the change
  - Rollback() discards all writes
  - Destructor MUST rollback if not committed
  - Commit() throws DbError if a concurrent writer invalidated the snapshot

  SQLite: BEGIN IMMEDIATE (read-only: BEGIN DEFERRED)
  Postgres: SERIALIZABLE transaction (read-only: pqxx::read_transaction)
  Memory: snapshot copy-on-write + version check at commit
*/

class Transaction {
public:
  virtual ~Transaction() = default;

  // commit changes atomically
  virtual void Commit() = 0;

  // explicit rollback
  virtual void Rollback() = 0;

  // true if commit already performed
  virtual bool IsCommitted() const = 0;

  virtual bool IsReadOnly() const = 0;
};

}
