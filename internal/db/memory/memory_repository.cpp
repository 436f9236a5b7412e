#include "memory_repository.hpp"

#include <algorithm>
#include <set>
#include <string>

#include "memory_tx.hpp"

namespace infragraph::db::memory {

namespace {

bool InTiers(const model::TierKey& tier, const std::vector<model::TierKey>& tiers) {
  return std::find(tiers.begin(), tiers.end(), tier) != tiers.end();
}

// Conflict tokens. A tier token stands for every scan over that tier.
std::string TierToken(const model::TierKey& tier) {
  return "tier/" + std::to_string(static_cast<int>(tier.kind)) + "/" + tier.id;
}

std::string RowToken(model::RecordKind kind, const std::string& object_id, const model::TierKey& tier) {
  return "row/" + std::to_string(static_cast<int>(kind)) + "/" + object_id + "@" + TierToken(tier);
}

std::string ChangeSetToken(const std::string& id) {
  return "change-set/" + id;
}

std::string WorkspaceToken(const std::string& workspace_id) {
  return "workspace/" + workspace_id + "/change-sets";
}

std::string EditSessionToken(const std::string& id) {
  return "edit-session/" + id;
}

std::string SessionListToken(const std::string& change_set_id) {
  return "change-set/" + change_set_id + "/edit-sessions";
}

} // namespace

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this, false);
}

std::unique_ptr<db::Transaction> MemoryRepository::BeginRead() {
  return std::make_unique<MemoryTransaction>(*this, true);
}

std::size_t MemoryRepository::TrackedTokenCount() {
  std::scoped_lock lock(mutex_);
  return token_versions_.size();
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

static void NoteTierScans(MemoryTransaction& tx, const std::vector<model::TierKey>& tiers) {
  for (const auto& tier : tiers) tx.NoteRead(TierToken(tier));
}

static void WriteRow(MemoryTransaction& tx, model::RecordKind kind, const std::string& object_id, const model::TierKey& tier) {
  tx.TouchRow(MemoryRepository::KeyOf(kind, object_id, tier));
  tx.NoteWrite(RowToken(kind, object_id, tier));
  tx.NoteWrite(TierToken(tier));
}

MemoryRepository::RowKey MemoryRepository::KeyOf(model::RecordKind kind, const std::string& object_id, const model::TierKey& tier) {
  return RowKey{static_cast<int>(kind), object_id, static_cast<int>(tier.kind), tier.id};
}

// ------------------------------------------------------------------
// Versioned rows
// ------------------------------------------------------------------

Result MemoryRepository::UpsertRecord(Transaction& t, const model::RecordRow& r) {
  auto& tx = TX(t);
  tx.Mutable().records[KeyOf(r.record_kind, r.object_id, r.tier)] = r;
  WriteRow(tx, r.record_kind, r.object_id, r.tier);
  return Result::Ok();
}

std::optional<model::RecordRow> MemoryRepository::GetRecord(Transaction& t, model::RecordKind kind, const std::string& object_id,
                                                            const model::TierKey& tier) {
  auto& tx = TX(t);
  tx.NoteRead(RowToken(kind, object_id, tier));
  const auto& s  = tx.View();
  auto        it = s.records.find(KeyOf(kind, object_id, tier));
  if (it == s.records.end()) return std::nullopt;
  return it->second;
}

std::vector<model::RecordRow> MemoryRepository::ListRecordsByTier(Transaction& t, const model::TierKey& tier) {
  auto& tx = TX(t);
  tx.NoteRead(TierToken(tier));
  std::vector<model::RecordRow> out;
  for (const auto& [_, row] : tx.View().records)
    if (row.tier == tier) out.push_back(row);
  return out;
}

std::vector<std::string> MemoryRepository::ListObjectIds(Transaction& t, model::RecordKind kind, const std::string& kind_tag,
                                                         const std::vector<model::TierKey>& tiers) {
  auto& tx = TX(t);
  NoteTierScans(tx, tiers);
  std::set<std::string> ids;
  for (const auto& [_, row] : tx.View().records) {
    if (row.record_kind != kind || !InTiers(row.tier, tiers)) continue;
    if (!kind_tag.empty() && row.kind_tag != kind_tag) continue;
    ids.insert(row.object_id);
  }
  return {ids.begin(), ids.end()};
}

std::vector<model::RecordRow> MemoryRepository::ListEdgesByTail(Transaction& t, const std::string& edge_kind, const std::string& tail_object_id,
                                                                const std::vector<model::TierKey>& tiers) {
  auto& tx = TX(t);
  NoteTierScans(tx, tiers);
  std::vector<model::RecordRow> out;
  for (const auto& [_, row] : tx.View().records) {
    if (row.record_kind == model::RecordKind::kEdge && row.kind_tag == edge_kind && row.tail_object_id == tail_object_id && InTiers(row.tier, tiers))
      out.push_back(row);
  }
  return out;
}

std::vector<model::RecordRow> MemoryRepository::ListEdgesByHead(Transaction& t, const std::string& edge_kind, const std::string& head_object_id,
                                                                const std::vector<model::TierKey>& tiers) {
  auto& tx = TX(t);
  NoteTierScans(tx, tiers);
  std::vector<model::RecordRow> out;
  for (const auto& [_, row] : tx.View().records) {
    if (row.record_kind == model::RecordKind::kEdge && row.kind_tag == edge_kind && row.head_object_id == head_object_id && InTiers(row.tier, tiers))
      out.push_back(row);
  }
  return out;
}

Result MemoryRepository::DeleteRecord(Transaction& t, model::RecordKind kind, const std::string& object_id, const model::TierKey& tier) {
  auto& tx = TX(t);
  tx.Mutable().records.erase(KeyOf(kind, object_id, tier));
  WriteRow(tx, kind, object_id, tier);
  return Result::Ok();
}

Result MemoryRepository::DeleteRecordsByTier(Transaction& t, const model::TierKey& tier) {
  auto& tx      = TX(t);
  auto& records = tx.Mutable().records;
  tx.NoteRead(TierToken(tier));
  for (auto it = records.begin(); it != records.end();) {
    if (it->second.tier == tier) {
      WriteRow(tx, it->second.record_kind, it->second.object_id, tier);
      it = records.erase(it);
    } else {
      ++it;
    }
  }
  return Result::Ok();
}

// ------------------------------------------------------------------
// Change sets
// ------------------------------------------------------------------

Result MemoryRepository::InsertChangeSet(Transaction& t, const model::ChangeSetRecord& r) {
  auto& tx = TX(t);
  auto& s  = tx.Mutable();
  tx.NoteRead(ChangeSetToken(r.id));
  if (s.change_sets.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, "change set " + r.id);
  s.change_sets[r.id] = r;
  tx.TouchChangeSet(r.id);
  tx.NoteWrite(ChangeSetToken(r.id));
  tx.NoteWrite(WorkspaceToken(r.workspace_id));
  return Result::Ok();
}

std::optional<model::ChangeSetRecord> MemoryRepository::GetChangeSet(Transaction& t, const std::string& id) {
  auto& tx = TX(t);
  tx.NoteRead(ChangeSetToken(id));
  const auto& s  = tx.View();
  auto        it = s.change_sets.find(id);
  if (it == s.change_sets.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::TransitionChangeSet(Transaction& t, const std::string& id, v1::ChangeSetStatus expected, v1::ChangeSetStatus next,
                                             uint64_t updated_at_ms) {
  auto& tx = TX(t);
  auto& s  = tx.Mutable();
  tx.NoteRead(ChangeSetToken(id));
  auto it = s.change_sets.find(id);
  if (it == s.change_sets.end()) return Result::Err(ErrorCode::NotFound, "change set " + id);
  if (it->second.status != expected) return Result::Err(ErrorCode::Conflict, "change set " + id + " status changed concurrently");
  it->second.status        = next;
  it->second.updated_at_ms = updated_at_ms;
  tx.TouchChangeSet(id);
  tx.NoteWrite(ChangeSetToken(id));
  tx.NoteWrite(WorkspaceToken(it->second.workspace_id));
  return Result::Ok();
}

std::vector<model::ChangeSetRecord> MemoryRepository::ListChangeSets(Transaction& t, const std::string& workspace_id,
                                                                     std::optional<v1::ChangeSetStatus> status) {
  auto& tx = TX(t);
  tx.NoteRead(WorkspaceToken(workspace_id));
  std::vector<model::ChangeSetRecord> out;
  for (const auto& [_, r] : tx.View().change_sets) {
    if (r.workspace_id != workspace_id) continue;
    if (status.has_value() && r.status != *status) continue;
    out.push_back(r);
  }
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
    if (a.created_at_ms != b.created_at_ms) return a.created_at_ms > b.created_at_ms;
    return a.id < b.id;
  });
  return out;
}

// ------------------------------------------------------------------
// Edit sessions
// ------------------------------------------------------------------

Result MemoryRepository::InsertEditSession(Transaction& t, const model::EditSessionRecord& r) {
  auto& tx = TX(t);
  auto& s  = tx.Mutable();
  tx.NoteRead(EditSessionToken(r.id));
  if (s.edit_sessions.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, "edit session " + r.id);
  s.edit_sessions[r.id] = r;
  tx.TouchEditSession(r.id);
  tx.NoteWrite(EditSessionToken(r.id));
  tx.NoteWrite(SessionListToken(r.change_set_id));
  return Result::Ok();
}

std::optional<model::EditSessionRecord> MemoryRepository::GetEditSession(Transaction& t, const std::string& id) {
  auto& tx = TX(t);
  tx.NoteRead(EditSessionToken(id));
  const auto& s  = tx.View();
  auto        it = s.edit_sessions.find(id);
  if (it == s.edit_sessions.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::TransitionEditSession(Transaction& t, const std::string& id, v1::EditSessionStatus expected, v1::EditSessionStatus next,
                                               uint64_t updated_at_ms) {
  auto& tx = TX(t);
  auto& s  = tx.Mutable();
  tx.NoteRead(EditSessionToken(id));
  auto it = s.edit_sessions.find(id);
  if (it == s.edit_sessions.end()) return Result::Err(ErrorCode::NotFound, "edit session " + id);
  if (it->second.status != expected) return Result::Err(ErrorCode::Conflict, "edit session " + id + " status changed concurrently");
  it->second.status        = next;
  it->second.updated_at_ms = updated_at_ms;
  tx.TouchEditSession(id);
  tx.NoteWrite(EditSessionToken(id));
  tx.NoteWrite(SessionListToken(it->second.change_set_id));
  return Result::Ok();
}

std::vector<model::EditSessionRecord> MemoryRepository::ListEditSessions(Transaction& t, const std::string& change_set_id,
                                                                         std::optional<v1::EditSessionStatus> status) {
  auto& tx = TX(t);
  tx.NoteRead(SessionListToken(change_set_id));
  std::vector<model::EditSessionRecord> out;
  for (const auto& [_, r] : tx.View().edit_sessions) {
    if (r.change_set_id != change_set_id) continue;
    if (status.has_value() && r.status != *status) continue;
    out.push_back(r);
  }
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
    if (a.created_at_ms != b.created_at_ms) return a.created_at_ms < b.created_at_ms;
    return a.id < b.id;
  });
  return out;
}

} // namespace infragraph::db::memory
