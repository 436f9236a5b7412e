#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <set>
#include <tuple>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace infragraph::db::memory {

class MemoryTransaction;

/*
  In-process repository.

  Every transaction works on a private copy of the committed state. At
  commit only the rows it touched are merged back, after checking that
  nothing it read was rewritten by a writer that committed in between.
*/
class MemoryRepository : public db::Repository {
public:
  // (record_kind, object_id, tier_kind, tier_id)
  using RowKey = std::tuple<int, std::string, int, std::string>;

  static RowKey KeyOf(model::RecordKind kind, const std::string& object_id, const model::TierKey& tier);

  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;
  std::unique_ptr<Transaction> BeginRead() override;

  // Write tokens retained for conflict checks of open writers.
  std::size_t TrackedTokenCount();

  Result UpsertRecord(Transaction&, const model::RecordRow&) override;
  std::optional<model::RecordRow> GetRecord(Transaction&, model::RecordKind, const std::string&, const model::TierKey&) override;
  std::vector<model::RecordRow> ListRecordsByTier(Transaction&, const model::TierKey&) override;
  std::vector<std::string> ListObjectIds(Transaction&, model::RecordKind, const std::string& kind_tag,
                                         const std::vector<model::TierKey>& tiers) override;
  std::vector<model::RecordRow> ListEdgesByTail(Transaction&, const std::string& edge_kind, const std::string& tail_object_id,
                                                const std::vector<model::TierKey>& tiers) override;
  std::vector<model::RecordRow> ListEdgesByHead(Transaction&, const std::string& edge_kind, const std::string& head_object_id,
                                                const std::vector<model::TierKey>& tiers) override;
  Result DeleteRecord(Transaction&, model::RecordKind, const std::string&, const model::TierKey&) override;
  Result DeleteRecordsByTier(Transaction&, const model::TierKey&) override;

  Result InsertChangeSet(Transaction&, const model::ChangeSetRecord&) override;
  std::optional<model::ChangeSetRecord> GetChangeSet(Transaction&, const std::string&) override;
  Result TransitionChangeSet(Transaction&, const std::string&, v1::ChangeSetStatus expected, v1::ChangeSetStatus next,
                             uint64_t updated_at_ms) override;
  std::vector<model::ChangeSetRecord> ListChangeSets(Transaction&, const std::string& workspace_id,
                                                     std::optional<v1::ChangeSetStatus> status) override;

  Result InsertEditSession(Transaction&, const model::EditSessionRecord&) override;
  std::optional<model::EditSessionRecord> GetEditSession(Transaction&, const std::string&) override;
  Result TransitionEditSession(Transaction&, const std::string&, v1::EditSessionStatus expected, v1::EditSessionStatus next,
                               uint64_t updated_at_ms) override;
  std::vector<model::EditSessionRecord> ListEditSessions(Transaction&, const std::string& change_set_id,
                                                         std::optional<v1::EditSessionStatus> status) override;

private:
  friend class MemoryTransaction;

  struct State {
    std::map<RowKey, model::RecordRow> records;
    std::unordered_map<std::string, model::ChangeSetRecord> change_sets;
    std::unordered_map<std::string, model::EditSessionRecord> edit_sessions;
  };

  std::mutex mutex_;
  State committed_;
  uint64_t committed_version_ = 0;
  // conflict token -> commit version that last wrote it; entries no open
  // writer can conflict with are pruned at commit
  std::unordered_map<std::string, uint64_t> token_versions_;
  // snapshot versions of open read-write transactions
  std::multiset<uint64_t> live_snapshots_;
};

}
