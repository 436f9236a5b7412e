#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_pool.hpp"
#include "sqlite_tx.hpp"

namespace infragraph::db::sqlite {

class SqliteRepository : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqlitePool> pool);

  // Create tables and indexes if missing.
  void BootstrapSchema();

  std::unique_ptr<Transaction> Begin() override;
  std::unique_ptr<Transaction> BeginRead() override;

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
  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);

  std::vector<model::RecordRow> ListEdges(Transaction& t, const std::string& edge_kind, const std::string& endpoint,
                                          const std::vector<model::TierKey>& tiers, bool by_head);

  std::shared_ptr<SqlitePool> pool_;
};

}
