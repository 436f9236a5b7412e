#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/change_set_record.hpp"
#include "internal/db/model/edit_session_record.hpp"
#include "internal/db/model/record_row.hpp"

namespace infragraph::db {

/*
  Repository abstraction: the persistence boundary of the versioning engine.

  CRITICAL GUARANTEES:

  - All writes require a Transaction from Begin()
  - Reads inside a transaction see its writes
  - Versioned rows are keyed by (record_kind, object_id, tier); at most one
    row exists per key
  - Transition*() are compare-and-set: they fail with Conflict when the
    stored status is not the expected one

  The DB is the source of truth for:
    versioned graph rows (every tier)
    change sets
    edit sessions
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // Snapshot for pure reads; never blocks on or blocks a writer.
  virtual std::unique_ptr<Transaction> BeginRead() = 0;

  // ---------------------------------------------------------------------
  // Versioned rows
  // ---------------------------------------------------------------------

  // Create-or-replace the row at (record_kind, object_id, tier).
  virtual Result UpsertRecord(Transaction&, const model::RecordRow&) = 0;

  virtual std::optional<model::RecordRow> GetRecord(Transaction&, model::RecordKind kind, const std::string& object_id,
                                                    const model::TierKey& tier) = 0;

  // Every row of every kind at the tier, ordered by (record_kind, object_id).
  virtual std::vector<model::RecordRow> ListRecordsByTier(Transaction&, const model::TierKey& tier) = 0;

  // Distinct object ids of `kind` with a row at any of `tiers`, ordered.
  // An empty kind_tag matches every kind tag.
  virtual std::vector<std::string> ListObjectIds(Transaction&, model::RecordKind kind, const std::string& kind_tag,
                                                 const std::vector<model::TierKey>& tiers) = 0;

  // Edge rows of `edge_kind` at any of `tiers` whose tail / head is object_id.
  virtual std::vector<model::RecordRow> ListEdgesByTail(Transaction&, const std::string& edge_kind, const std::string& tail_object_id,
                                                        const std::vector<model::TierKey>& tiers) = 0;

  virtual std::vector<model::RecordRow> ListEdgesByHead(Transaction&, const std::string& edge_kind, const std::string& head_object_id,
                                                        const std::vector<model::TierKey>& tiers) = 0;

  virtual Result DeleteRecord(Transaction&, model::RecordKind kind, const std::string& object_id, const model::TierKey& tier) = 0;

  virtual Result DeleteRecordsByTier(Transaction&, const model::TierKey& tier) = 0;

  // ---------------------------------------------------------------------
  // Change sets
  // ---------------------------------------------------------------------

  virtual Result InsertChangeSet(Transaction&, const model::ChangeSetRecord&) = 0;

  virtual std::optional<model::ChangeSetRecord> GetChangeSet(Transaction&, const std::string& id) = 0;

  virtual Result TransitionChangeSet(Transaction&, const std::string& id, v1::ChangeSetStatus expected, v1::ChangeSetStatus next,
                                     uint64_t updated_at_ms) = 0;

  // Ordered by created_at_ms, newest first.
  virtual std::vector<model::ChangeSetRecord> ListChangeSets(Transaction&, const std::string& workspace_id,
                                                             std::optional<v1::ChangeSetStatus> status) = 0;

  // ---------------------------------------------------------------------
  // Edit sessions
  // ---------------------------------------------------------------------

  virtual Result InsertEditSession(Transaction&, const model::EditSessionRecord&) = 0;

  virtual std::optional<model::EditSessionRecord> GetEditSession(Transaction&, const std::string& id) = 0;

  virtual Result TransitionEditSession(Transaction&, const std::string& id, v1::EditSessionStatus expected, v1::EditSessionStatus next,
                                       uint64_t updated_at_ms) = 0;

  // Ordered by created_at_ms, oldest first.
  virtual std::vector<model::EditSessionRecord> ListEditSessions(Transaction&, const std::string& change_set_id,
                                                                 std::optional<v1::EditSessionStatus> status) = 0;
};

} // namespace infragraph::db
