#include "memory_tx.hpp"

#include <stdexcept>

#include "internal/db/api/result.hpp"

namespace infragraph::db::memory {

namespace {

// Copies the working value of each touched key over the committed one,
// erasing keys the transaction removed.
template <typename Map, typename Keys>
void MergeTouched(Map& committed, const Map& working, const Keys& keys) {
  for (const auto& key : keys) {
    auto it = working.find(key);
    if (it == working.end()) {
      committed.erase(key);
    } else {
      committed.insert_or_assign(key, it->second);
    }
  }
}

} // namespace

MemoryTransaction::MemoryTransaction(MemoryRepository& repo, bool read_only) : repo_(repo), read_only_(read_only) {
  std::scoped_lock lock(repo_.mutex_);
  working_          = repo_.committed_; // snapshot copy
  snapshot_version_ = repo_.committed_version_;
  if (!read_only_) {
    repo_.live_snapshots_.insert(snapshot_version_);
    snapshot_live_ = true;
  }
}

MemoryTransaction::~MemoryTransaction() {
  if (!committed_ && !rolled_back_) Rollback();
}

MemoryRepository::State& MemoryTransaction::Mutable() {
  if (read_only_) {
    throw std::logic_error("write attempted in read-only transaction");
  }
  return working_;
}

void MemoryTransaction::ReleaseSnapshotLocked() {
  if (!snapshot_live_) return;
  repo_.live_snapshots_.erase(repo_.live_snapshots_.find(snapshot_version_));
  snapshot_live_ = false;
}

void MemoryTransaction::PruneTokensLocked() {
  // a writer only conflicts with versions newer than its snapshot
  const uint64_t horizon = repo_.live_snapshots_.empty() ? repo_.committed_version_ : *repo_.live_snapshots_.begin();
  for (auto it = repo_.token_versions_.begin(); it != repo_.token_versions_.end();) {
    if (it->second <= horizon) {
      it = repo_.token_versions_.erase(it);
    } else {
      ++it;
    }
  }
}

void MemoryTransaction::NoteRead(std::string token) {
  if (!read_only_) reads_.insert(std::move(token));
}

void MemoryTransaction::NoteWrite(std::string token) {
  writes_.insert(std::move(token));
}

void MemoryTransaction::TouchRow(const MemoryRepository::RowKey& key) {
  touched_rows_.insert(key);
}

void MemoryTransaction::TouchChangeSet(const std::string& id) {
  touched_change_sets_.insert(id);
}

void MemoryTransaction::TouchEditSession(const std::string& id) {
  touched_edit_sessions_.insert(id);
}

void MemoryTransaction::Commit() {
  if (committed_ || rolled_back_) {
    throw std::logic_error("transaction already finished");
  }
  if (read_only_) {
    committed_ = true;
    return;
  }

  std::scoped_lock lock(repo_.mutex_);
  ReleaseSnapshotLocked();
  if (writes_.empty()) {
    committed_ = true;
    return;
  }

  for (const auto& token : reads_) {
    auto it = repo_.token_versions_.find(token);
    if (it != repo_.token_versions_.end() && it->second > snapshot_version_) {
      rolled_back_ = true;
      throw DbError(ErrorCode::Conflict, "transaction conflict: " + token + " was modified by a concurrent transaction");
    }
  }

  MergeTouched(repo_.committed_.records, working_.records, touched_rows_);
  MergeTouched(repo_.committed_.change_sets, working_.change_sets, touched_change_sets_);
  MergeTouched(repo_.committed_.edit_sessions, working_.edit_sessions, touched_edit_sessions_);

  const uint64_t version = ++repo_.committed_version_;
  for (const auto& token : writes_) {
    repo_.token_versions_[token] = version;
  }
  PruneTokensLocked();
  committed_ = true;
}

void MemoryTransaction::Rollback() {
  std::scoped_lock lock(repo_.mutex_);
  ReleaseSnapshotLocked();
  rolled_back_ = true;
}

} // namespace infragraph::db::memory
