#pragma once

#include <set>
#include <string>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace infragraph::db::memory {

/*
  Transaction = snapshot + read set + write set

  Tokens name what a statement depended on or changed: a row, a tier scan,
  a lifecycle record, a listing. Commit fails with Conflict when a read
  token was written by a transaction that committed after the snapshot.
*/

class MemoryTransaction final : public db::Transaction {
 public:
  MemoryTransaction(MemoryRepository& repo, bool read_only);
  ~MemoryTransaction();

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }
  bool IsReadOnly() const override {
    return read_only_;
  }

  MemoryRepository::State& Mutable();
  const MemoryRepository::State& View() const {
    return working_;
  }

  // Read-only snapshots never conflict, so they keep no read set.
  void NoteRead(std::string token);
  void NoteWrite(std::string token);

  void TouchRow(const MemoryRepository::RowKey& key);
  void TouchChangeSet(const std::string& id);
  void TouchEditSession(const std::string& id);

 private:
  // callers hold repo_.mutex_
  void ReleaseSnapshotLocked();
  void PruneTokensLocked();

  MemoryRepository&       repo_;
  MemoryRepository::State working_;
  uint64_t                snapshot_version_ = 0;
  bool                    read_only_        = false;
  bool                    committed_        = false;
  bool                    rolled_back_      = false;
  bool                    snapshot_live_    = false;

  std::set<std::string>              reads_;
  std::set<std::string>              writes_;
  std::set<MemoryRepository::RowKey> touched_rows_;
  std::set<std::string>              touched_change_sets_;
  std::set<std::string>              touched_edit_sessions_;
};

} // namespace infragraph::db::memory
