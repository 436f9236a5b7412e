#include "pg_repository.hpp"

#include <mutex>
#include <unordered_map>

#include "internal/db/sql/sql_queries.hpp"

namespace infragraph::db::postgres {

namespace {

const std::string& Q(const char* sqlite_query) {
  // converted once per distinct statement
  static std::mutex                                   mutex;
  static std::unordered_map<const char*, std::string> cache;
  std::lock_guard                                     lock(mutex);
  auto                                                it = cache.find(sqlite_query);
  if (it == cache.end()) {
    it = cache.emplace(sqlite_query, sql::ToNumberedPlaceholders(sqlite_query)).first;
  }
  return it->second;
}

void AppendTiers(pqxx::params& p, const std::vector<model::TierKey>& tiers) {
  for (const auto& tier : tiers) {
    p.append(static_cast<int>(tier.kind));
    p.append(tier.id);
  }
}

model::RecordRow ReadRecord(const pqxx::row& row) {
  model::RecordRow r;
  auto             kind = infragraph::model::RecordKindFromInt(row[0].as<int>());
  auto             tier = infragraph::model::TierKindFromInt(row[2].as<int>());
  if (!kind || !tier) {
    throw DbError(ErrorCode::Corruption, "graph_record row has unknown record or tier kind");
  }
  r.record_kind    = *kind;
  r.object_id      = row[1].c_str();
  r.tier           = {*tier, row[3].c_str()};
  r.workspace_id   = row[4].c_str();
  r.kind_tag       = row[5].c_str();
  r.tail_object_id = row[6].c_str();
  r.head_object_id = row[7].c_str();
  r.payload        = row[8].c_str();
  r.deleted        = row[9].as<bool>();
  r.version        = row[10].as<uint64_t>();
  r.created_at_ms  = row[11].as<uint64_t>();
  r.updated_at_ms  = row[12].as<uint64_t>();
  return r;
}

model::ChangeSetRecord ReadChangeSet(const pqxx::row& row) {
  model::ChangeSetRecord r;
  r.id            = row[0].c_str();
  r.name          = row[1].c_str();
  r.workspace_id  = row[2].c_str();
  r.status        = static_cast<v1::ChangeSetStatus>(row[3].as<int>());
  r.created_at_ms = row[4].as<uint64_t>();
  r.updated_at_ms = row[5].as<uint64_t>();
  return r;
}

model::EditSessionRecord ReadEditSession(const pqxx::row& row) {
  model::EditSessionRecord r;
  r.id            = row[0].c_str();
  r.name          = row[1].c_str();
  r.change_set_id = row[2].c_str();
  r.workspace_id  = row[3].c_str();
  r.status        = static_cast<v1::EditSessionStatus>(row[4].as<int>());
  r.created_at_ms = row[5].as<uint64_t>();
  r.updated_at_ms = row[6].as<uint64_t>();
  return r;
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

void PgRepository::BootstrapSchema() {
  auto       conn = pool_->Acquire();
  pqxx::work tx(*conn);
  for (const char* ddl : sql::kPostgresSchema) {
    tx.exec(ddl);
  }
  tx.commit();
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_, false);
}

std::unique_ptr<db::Transaction> PgRepository::BeginRead() {
  return std::make_unique<PgTransaction>(pool_, true);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const pqxx::failure& e) {
  return Result::Err(CodeOf(e), e.what());
}

// ------------------------------------------------------------------
// Versioned rows
// ------------------------------------------------------------------

Result PgRepository::UpsertRecord(Transaction& t, const model::RecordRow& r) {
  try {
    TX(t).Work().exec_params(Q(sql::UPSERT_RECORD), static_cast<int>(r.record_kind), r.object_id, static_cast<int>(r.tier.kind), r.tier.id,
                             r.workspace_id, r.kind_tag, r.tail_object_id, r.head_object_id, r.payload, r.deleted, r.version, r.created_at_ms,
                             r.updated_at_ms);
    return Result::Ok();
  } catch (const pqxx::failure& e) {
    return Translate(e);
  }
}

std::optional<model::RecordRow> PgRepository::GetRecord(Transaction& t, model::RecordKind kind, const std::string& object_id,
                                                        const model::TierKey& tier) {
  try {
    auto res = TX(t).Work().exec_params(Q(sql::SELECT_RECORD), static_cast<int>(kind), object_id, static_cast<int>(tier.kind), tier.id);
    if (res.empty()) return std::nullopt;
    return ReadRecord(res[0]);
  } catch (const pqxx::failure& e) {
    throw ToDbError(e, "get record");
  }
}

std::vector<model::RecordRow> PgRepository::ListRecordsByTier(Transaction& t, const model::TierKey& tier) {
  try {
    auto res = TX(t).Work().exec_params(Q(sql::SELECT_RECORDS_BY_TIER), static_cast<int>(tier.kind), tier.id);

    std::vector<model::RecordRow> out;
    out.reserve(res.size());
    for (const auto& row : res) out.push_back(ReadRecord(row));
    return out;
  } catch (const pqxx::failure& e) {
    throw ToDbError(e, "list records by tier");
  }
}

std::vector<std::string> PgRepository::ListObjectIds(Transaction& t, model::RecordKind kind, const std::string& kind_tag,
                                                     const std::vector<model::TierKey>& tiers) {
  pqxx::params p;
  p.append(static_cast<int>(kind));
  if (!kind_tag.empty()) p.append(kind_tag);
  AppendTiers(p, tiers);

  try {
    auto res = TX(t).Work().exec_params(sql::ToNumberedPlaceholders(sql::SelectObjectIds(tiers.size(), !kind_tag.empty())), p);

    std::vector<std::string> out;
    out.reserve(res.size());
    for (const auto& row : res) out.emplace_back(row[0].c_str());
    return out;
  } catch (const pqxx::failure& e) {
    throw ToDbError(e, "list object ids");
  }
}

std::vector<model::RecordRow> PgRepository::ListEdges(Transaction& t, const std::string& edge_kind, const std::string& endpoint,
                                                      const std::vector<model::TierKey>& tiers, bool by_head) {
  pqxx::params p;
  p.append(static_cast<int>(model::RecordKind::kEdge));
  p.append(edge_kind);
  p.append(endpoint);
  AppendTiers(p, tiers);

  try {
    auto res = TX(t).Work().exec_params(sql::ToNumberedPlaceholders(sql::SelectEdges(tiers.size(), by_head)), p);

    std::vector<model::RecordRow> out;
    out.reserve(res.size());
    for (const auto& row : res) out.push_back(ReadRecord(row));
    return out;
  } catch (const pqxx::failure& e) {
    throw ToDbError(e, "list edges");
  }
}

std::vector<model::RecordRow> PgRepository::ListEdgesByTail(Transaction& t, const std::string& edge_kind, const std::string& tail_object_id,
                                                            const std::vector<model::TierKey>& tiers) {
  return ListEdges(t, edge_kind, tail_object_id, tiers, false);
}

std::vector<model::RecordRow> PgRepository::ListEdgesByHead(Transaction& t, const std::string& edge_kind, const std::string& head_object_id,
                                                            const std::vector<model::TierKey>& tiers) {
  return ListEdges(t, edge_kind, head_object_id, tiers, true);
}

Result PgRepository::DeleteRecord(Transaction& t, model::RecordKind kind, const std::string& object_id, const model::TierKey& tier) {
  try {
    TX(t).Work().exec_params(Q(sql::DELETE_RECORD), static_cast<int>(kind), object_id, static_cast<int>(tier.kind), tier.id);
    return Result::Ok();
  } catch (const pqxx::failure& e) {
    return Translate(e);
  }
}

Result PgRepository::DeleteRecordsByTier(Transaction& t, const model::TierKey& tier) {
  try {
    TX(t).Work().exec_params(Q(sql::DELETE_RECORDS_BY_TIER), static_cast<int>(tier.kind), tier.id);
    return Result::Ok();
  } catch (const pqxx::failure& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Change sets
// ------------------------------------------------------------------

Result PgRepository::InsertChangeSet(Transaction& t, const model::ChangeSetRecord& r) {
  try {
    TX(t).Work().exec_params(Q(sql::INSERT_CHANGE_SET), r.id, r.name, r.workspace_id, static_cast<int>(r.status), r.created_at_ms, r.updated_at_ms);
    return Result::Ok();
  } catch (const pqxx::failure& e) {
    return Translate(e);
  }
}

std::optional<model::ChangeSetRecord> PgRepository::GetChangeSet(Transaction& t, const std::string& id) {
  try {
    auto res = TX(t).Work().exec_params(Q(sql::SELECT_CHANGE_SET), id);
    if (res.empty()) return std::nullopt;
    return ReadChangeSet(res[0]);
  } catch (const pqxx::failure& e) {
    throw ToDbError(e, "get change set");
  }
}

Result PgRepository::TransitionChangeSet(Transaction& t, const std::string& id, v1::ChangeSetStatus expected, v1::ChangeSetStatus next,
                                         uint64_t updated_at_ms) {
  try {
    auto res = TX(t).Work().exec_params(Q(sql::TRANSITION_CHANGE_SET), static_cast<int>(next), updated_at_ms, id, static_cast<int>(expected));
    if (res.affected_rows() == 1) return Result::Ok();
  } catch (const pqxx::failure& e) {
    return Translate(e);
  }

  if (!GetChangeSet(t, id)) return Result::Err(ErrorCode::NotFound, "change set " + id);
  return Result::Err(ErrorCode::Conflict, "change set " + id + " status changed concurrently");
}

std::vector<model::ChangeSetRecord> PgRepository::ListChangeSets(Transaction& t, const std::string& workspace_id,
                                                                 std::optional<v1::ChangeSetStatus> status) {
  pqxx::params p;
  p.append(workspace_id);
  if (status) p.append(static_cast<int>(*status));

  try {
    auto res = TX(t).Work().exec_params(sql::ToNumberedPlaceholders(sql::SelectChangeSets(status.has_value())), p);

    std::vector<model::ChangeSetRecord> out;
    out.reserve(res.size());
    for (const auto& row : res) out.push_back(ReadChangeSet(row));
    return out;
  } catch (const pqxx::failure& e) {
    throw ToDbError(e, "list change sets");
  }
}

// ------------------------------------------------------------------
// Edit sessions
// ------------------------------------------------------------------

Result PgRepository::InsertEditSession(Transaction& t, const model::EditSessionRecord& r) {
  try {
    TX(t).Work().exec_params(Q(sql::INSERT_EDIT_SESSION), r.id, r.name, r.change_set_id, r.workspace_id, static_cast<int>(r.status),
                             r.created_at_ms, r.updated_at_ms);
    return Result::Ok();
  } catch (const pqxx::failure& e) {
    return Translate(e);
  }
}

std::optional<model::EditSessionRecord> PgRepository::GetEditSession(Transaction& t, const std::string& id) {
  try {
    auto res = TX(t).Work().exec_params(Q(sql::SELECT_EDIT_SESSION), id);
    if (res.empty()) return std::nullopt;
    return ReadEditSession(res[0]);
  } catch (const pqxx::failure& e) {
    throw ToDbError(e, "get edit session");
  }
}

Result PgRepository::TransitionEditSession(Transaction& t, const std::string& id, v1::EditSessionStatus expected, v1::EditSessionStatus next,
                                           uint64_t updated_at_ms) {
  try {
    auto res = TX(t).Work().exec_params(Q(sql::TRANSITION_EDIT_SESSION), static_cast<int>(next), updated_at_ms, id, static_cast<int>(expected));
    if (res.affected_rows() == 1) return Result::Ok();
  } catch (const pqxx::failure& e) {
    return Translate(e);
  }

  if (!GetEditSession(t, id)) return Result::Err(ErrorCode::NotFound, "edit session " + id);
  return Result::Err(ErrorCode::Conflict, "edit session " + id + " status changed concurrently");
}

std::vector<model::EditSessionRecord> PgRepository::ListEditSessions(Transaction& t, const std::string& change_set_id,
                                                                     std::optional<v1::EditSessionStatus> status) {
  pqxx::params p;
  p.append(change_set_id);
  if (status) p.append(static_cast<int>(*status));

  try {
    auto res = TX(t).Work().exec_params(sql::ToNumberedPlaceholders(sql::SelectEditSessions(status.has_value())), p);

    std::vector<model::EditSessionRecord> out;
    out.reserve(res.size());
    for (const auto& row : res) out.push_back(ReadEditSession(row));
    return out;
  } catch (const pqxx::failure& e) {
    throw ToDbError(e, "list edit sessions");
  }
}

} // namespace infragraph::db::postgres
