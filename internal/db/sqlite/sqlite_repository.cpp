#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include "internal/db/sql/sql_queries.hpp"

namespace infragraph::db::sqlite {

using infragraph::db::ErrorCode;
using infragraph::db::Result;

namespace {

// Finalizes on scope exit.
class Statement {
 public:
  Statement(sqlite3* db, const std::string& sql) : db_(db) {
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st_, nullptr) != SQLITE_OK) {
      std::string msg = sqlite3_errmsg(db);
      sqlite3_finalize(st_);
      st_ = nullptr;
      throw DbError(ErrorCode::InternalError, "sqlite prepare: " + msg);
    }
  }
  ~Statement() {
    sqlite3_finalize(st_);
  }

  Statement(const Statement&)            = delete;
  Statement& operator=(const Statement&) = delete;

  sqlite3_stmt* get() const {
    return st_;
  }

  // SQLITE_ROW -> true, SQLITE_DONE -> false, anything else throws.
  bool StepRow() {
    int rc = sqlite3_step(st_);
    if (rc == SQLITE_ROW) return true;
    if (rc == SQLITE_DONE) return false;
    throw DbError((rc & 0xff) == SQLITE_BUSY ? ErrorCode::Busy : ErrorCode::InternalError, std::string("sqlite step: ") + sqlite3_errmsg(db_));
  }

 private:
  sqlite3*      db_;
  sqlite3_stmt* st_ = nullptr;
};

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindI32(sqlite3_stmt* st, int idx, int v) {
  sqlite3_bind_int(st, idx, v);
}

// Binds (tier_kind, tier_id) pairs starting at idx; returns the next index.
int BindTiers(sqlite3_stmt* st, int idx, const std::vector<model::TierKey>& tiers) {
  for (const auto& tier : tiers) {
    BindI32(st, idx++, static_cast<int>(tier.kind));
    BindText(st, idx++, tier.id);
  }
  return idx;
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

int ColI32(sqlite3_stmt* st, int col) {
  return sqlite3_column_int(st, col);
}

model::RecordRow ReadRecord(sqlite3_stmt* st) {
  model::RecordRow r;
  auto             kind = infragraph::model::RecordKindFromInt(ColI32(st, 0));
  auto             tier = infragraph::model::TierKindFromInt(ColI32(st, 2));
  if (!kind || !tier) {
    throw DbError(ErrorCode::Corruption, "graph_record row has unknown record or tier kind");
  }
  r.record_kind    = *kind;
  r.object_id      = ColText(st, 1);
  r.tier           = {*tier, ColText(st, 3)};
  r.workspace_id   = ColText(st, 4);
  r.kind_tag       = ColText(st, 5);
  r.tail_object_id = ColText(st, 6);
  r.head_object_id = ColText(st, 7);
  r.payload        = ColText(st, 8);
  r.deleted        = ColI32(st, 9) != 0;
  r.version        = ColU64(st, 10);
  r.created_at_ms  = ColU64(st, 11);
  r.updated_at_ms  = ColU64(st, 12);
  return r;
}

model::ChangeSetRecord ReadChangeSet(sqlite3_stmt* st) {
  model::ChangeSetRecord r;
  r.id            = ColText(st, 0);
  r.name          = ColText(st, 1);
  r.workspace_id  = ColText(st, 2);
  r.status        = static_cast<v1::ChangeSetStatus>(ColI32(st, 3));
  r.created_at_ms = ColU64(st, 4);
  r.updated_at_ms = ColU64(st, 5);
  return r;
}

model::EditSessionRecord ReadEditSession(sqlite3_stmt* st) {
  model::EditSessionRecord r;
  r.id            = ColText(st, 0);
  r.name          = ColText(st, 1);
  r.change_set_id = ColText(st, 2);
  r.workspace_id  = ColText(st, 3);
  r.status        = static_cast<v1::EditSessionStatus>(ColI32(st, 4));
  r.created_at_ms = ColU64(st, 5);
  r.updated_at_ms = ColU64(st, 6);
  return r;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqlitePool> pool)
    : pool_(std::move(pool)) {}

void SqliteRepository::BootstrapSchema() {
  auto conn = pool_->Acquire();
  for (const char* ddl : sql::kSqliteSchema) {
    conn->Exec(ddl);
  }
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(pool_->Acquire(), false);
}

std::unique_ptr<db::Transaction> SqliteRepository::BeginRead() {
  return std::make_unique<SqliteTransaction>(pool_->Acquire(), true);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
    return Result::Ok();

  switch (rc & 0xff) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

// ------------------------------------------------------------------
// Versioned rows
// ------------------------------------------------------------------

Result SqliteRepository::UpsertRecord(Transaction& t, const model::RecordRow& r) {
  auto*     db = TX(t).Handle();
  Statement st(db, sql::UPSERT_RECORD);

  BindI32(st.get(), 1, static_cast<int>(r.record_kind));
  BindText(st.get(), 2, r.object_id);
  BindI32(st.get(), 3, static_cast<int>(r.tier.kind));
  BindText(st.get(), 4, r.tier.id);
  BindText(st.get(), 5, r.workspace_id);
  BindText(st.get(), 6, r.kind_tag);
  BindText(st.get(), 7, r.tail_object_id);
  BindText(st.get(), 8, r.head_object_id);
  BindText(st.get(), 9, r.payload);
  BindI32(st.get(), 10, r.deleted ? 1 : 0);
  BindU64(st.get(), 11, r.version);
  BindU64(st.get(), 12, r.created_at_ms);
  BindU64(st.get(), 13, r.updated_at_ms);

  return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::RecordRow> SqliteRepository::GetRecord(Transaction& t, model::RecordKind kind, const std::string& object_id,
                                                            const model::TierKey& tier) {
  Statement st(TX(t).Handle(), sql::SELECT_RECORD);
  BindI32(st.get(), 1, static_cast<int>(kind));
  BindText(st.get(), 2, object_id);
  BindI32(st.get(), 3, static_cast<int>(tier.kind));
  BindText(st.get(), 4, tier.id);

  if (!st.StepRow()) return std::nullopt;
  return ReadRecord(st.get());
}

std::vector<model::RecordRow> SqliteRepository::ListRecordsByTier(Transaction& t, const model::TierKey& tier) {
  Statement st(TX(t).Handle(), sql::SELECT_RECORDS_BY_TIER);
  BindI32(st.get(), 1, static_cast<int>(tier.kind));
  BindText(st.get(), 2, tier.id);

  std::vector<model::RecordRow> out;
  while (st.StepRow()) out.push_back(ReadRecord(st.get()));
  return out;
}

std::vector<std::string> SqliteRepository::ListObjectIds(Transaction& t, model::RecordKind kind, const std::string& kind_tag,
                                                         const std::vector<model::TierKey>& tiers) {
  Statement st(TX(t).Handle(), sql::SelectObjectIds(tiers.size(), !kind_tag.empty()));
  int       idx = 1;
  BindI32(st.get(), idx++, static_cast<int>(kind));
  if (!kind_tag.empty()) BindText(st.get(), idx++, kind_tag);
  BindTiers(st.get(), idx, tiers);

  std::vector<std::string> out;
  while (st.StepRow()) out.push_back(ColText(st.get(), 0));
  return out;
}

std::vector<model::RecordRow> SqliteRepository::ListEdges(Transaction& t, const std::string& edge_kind, const std::string& endpoint,
                                                          const std::vector<model::TierKey>& tiers, bool by_head) {
  Statement st(TX(t).Handle(), sql::SelectEdges(tiers.size(), by_head));
  BindI32(st.get(), 1, static_cast<int>(model::RecordKind::kEdge));
  BindText(st.get(), 2, edge_kind);
  BindText(st.get(), 3, endpoint);
  BindTiers(st.get(), 4, tiers);

  std::vector<model::RecordRow> out;
  while (st.StepRow()) out.push_back(ReadRecord(st.get()));
  return out;
}

std::vector<model::RecordRow> SqliteRepository::ListEdgesByTail(Transaction& t, const std::string& edge_kind, const std::string& tail_object_id,
                                                                const std::vector<model::TierKey>& tiers) {
  return ListEdges(t, edge_kind, tail_object_id, tiers, false);
}

std::vector<model::RecordRow> SqliteRepository::ListEdgesByHead(Transaction& t, const std::string& edge_kind, const std::string& head_object_id,
                                                                const std::vector<model::TierKey>& tiers) {
  return ListEdges(t, edge_kind, head_object_id, tiers, true);
}

Result SqliteRepository::DeleteRecord(Transaction& t, model::RecordKind kind, const std::string& object_id, const model::TierKey& tier) {
  auto*     db = TX(t).Handle();
  Statement st(db, sql::DELETE_RECORD);
  BindI32(st.get(), 1, static_cast<int>(kind));
  BindText(st.get(), 2, object_id);
  BindI32(st.get(), 3, static_cast<int>(tier.kind));
  BindText(st.get(), 4, tier.id);
  return Translate(db, sqlite3_step(st.get()));
}

Result SqliteRepository::DeleteRecordsByTier(Transaction& t, const model::TierKey& tier) {
  auto*     db = TX(t).Handle();
  Statement st(db, sql::DELETE_RECORDS_BY_TIER);
  BindI32(st.get(), 1, static_cast<int>(tier.kind));
  BindText(st.get(), 2, tier.id);
  return Translate(db, sqlite3_step(st.get()));
}

// ------------------------------------------------------------------
// Change sets
// ------------------------------------------------------------------

Result SqliteRepository::InsertChangeSet(Transaction& t, const model::ChangeSetRecord& r) {
  auto*     db = TX(t).Handle();
  Statement st(db, sql::INSERT_CHANGE_SET);
  BindText(st.get(), 1, r.id);
  BindText(st.get(), 2, r.name);
  BindText(st.get(), 3, r.workspace_id);
  BindI32(st.get(), 4, static_cast<int>(r.status));
  BindU64(st.get(), 5, r.created_at_ms);
  BindU64(st.get(), 6, r.updated_at_ms);

  int rc = sqlite3_step(st.get());
  if ((rc & 0xff) == SQLITE_CONSTRAINT) return Result::Err(ErrorCode::AlreadyExists, "change set " + r.id);
  return Translate(db, rc);
}

std::optional<model::ChangeSetRecord> SqliteRepository::GetChangeSet(Transaction& t, const std::string& id) {
  Statement st(TX(t).Handle(), sql::SELECT_CHANGE_SET);
  BindText(st.get(), 1, id);
  if (!st.StepRow()) return std::nullopt;
  return ReadChangeSet(st.get());
}

Result SqliteRepository::TransitionChangeSet(Transaction& t, const std::string& id, v1::ChangeSetStatus expected, v1::ChangeSetStatus next,
                                             uint64_t updated_at_ms) {
  auto* db = TX(t).Handle();
  {
    Statement st(db, sql::TRANSITION_CHANGE_SET);
    BindI32(st.get(), 1, static_cast<int>(next));
    BindU64(st.get(), 2, updated_at_ms);
    BindText(st.get(), 3, id);
    BindI32(st.get(), 4, static_cast<int>(expected));
    auto res = Translate(db, sqlite3_step(st.get()));
    if (!res) return res;
  }
  if (sqlite3_changes(db) == 1) return Result::Ok();

  if (!GetChangeSet(t, id)) return Result::Err(ErrorCode::NotFound, "change set " + id);
  return Result::Err(ErrorCode::Conflict, "change set " + id + " status changed concurrently");
}

std::vector<model::ChangeSetRecord> SqliteRepository::ListChangeSets(Transaction& t, const std::string& workspace_id,
                                                                     std::optional<v1::ChangeSetStatus> status) {
  Statement st(TX(t).Handle(), sql::SelectChangeSets(status.has_value()));
  BindText(st.get(), 1, workspace_id);
  if (status) BindI32(st.get(), 2, static_cast<int>(*status));

  std::vector<model::ChangeSetRecord> out;
  while (st.StepRow()) out.push_back(ReadChangeSet(st.get()));
  return out;
}

// ------------------------------------------------------------------
// Edit sessions
// ------------------------------------------------------------------

Result SqliteRepository::InsertEditSession(Transaction& t, const model::EditSessionRecord& r) {
  auto*     db = TX(t).Handle();
  Statement st(db, sql::INSERT_EDIT_SESSION);
  BindText(st.get(), 1, r.id);
  BindText(st.get(), 2, r.name);
  BindText(st.get(), 3, r.change_set_id);
  BindText(st.get(), 4, r.workspace_id);
  BindI32(st.get(), 5, static_cast<int>(r.status));
  BindU64(st.get(), 6, r.created_at_ms);
  BindU64(st.get(), 7, r.updated_at_ms);

  int rc = sqlite3_step(st.get());
  if (sqlite3_extended_errcode(db) == SQLITE_CONSTRAINT_PRIMARYKEY) return Result::Err(ErrorCode::AlreadyExists, "edit session " + r.id);
  return Translate(db, rc);
}

std::optional<model::EditSessionRecord> SqliteRepository::GetEditSession(Transaction& t, const std::string& id) {
  Statement st(TX(t).Handle(), sql::SELECT_EDIT_SESSION);
  BindText(st.get(), 1, id);
  if (!st.StepRow()) return std::nullopt;
  return ReadEditSession(st.get());
}

Result SqliteRepository::TransitionEditSession(Transaction& t, const std::string& id, v1::EditSessionStatus expected, v1::EditSessionStatus next,
                                               uint64_t updated_at_ms) {
  auto* db = TX(t).Handle();
  {
    Statement st(db, sql::TRANSITION_EDIT_SESSION);
    BindI32(st.get(), 1, static_cast<int>(next));
    BindU64(st.get(), 2, updated_at_ms);
    BindText(st.get(), 3, id);
    BindI32(st.get(), 4, static_cast<int>(expected));
    auto res = Translate(db, sqlite3_step(st.get()));
    if (!res) return res;
  }
  if (sqlite3_changes(db) == 1) return Result::Ok();

  if (!GetEditSession(t, id)) return Result::Err(ErrorCode::NotFound, "edit session " + id);
  return Result::Err(ErrorCode::Conflict, "edit session " + id + " status changed concurrently");
}

std::vector<model::EditSessionRecord> SqliteRepository::ListEditSessions(Transaction& t, const std::string& change_set_id,
                                                                         std::optional<v1::EditSessionStatus> status) {
  Statement st(TX(t).Handle(), sql::SelectEditSessions(status.has_value()));
  BindText(st.get(), 1, change_set_id);
  if (status) BindI32(st.get(), 2, static_cast<int>(*status));

  std::vector<model::EditSessionRecord> out;
  while (st.StepRow()) out.push_back(ReadEditSession(st.get()));
  return out;
}

} // namespace infragraph::db::sqlite
