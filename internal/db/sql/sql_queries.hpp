#pragma once

#include <cstddef>
#include <string>

namespace infragraph::db::sql {

/*
  Canonical SQL.

  Statements use '?' placeholders (SQLite). The Postgres backend carries its
  own $n-numbered copies next to the code that binds them.

  Every versioned row lives in graph_record keyed by
  (record_kind, object_id, tier_kind, tier_id). Head rows use tier_id=''.
*/

// ---------------------------------------------------------------------
// Schema
// ---------------------------------------------------------------------

static constexpr const char* kSqliteSchema[] = {
    "CREATE TABLE IF NOT EXISTS graph_record ("
    " record_kind INTEGER NOT NULL,"
    " object_id TEXT NOT NULL,"
    " tier_kind INTEGER NOT NULL,"
    " tier_id TEXT NOT NULL,"
    " workspace_id TEXT NOT NULL,"
    " kind_tag TEXT NOT NULL,"
    " tail_object_id TEXT NOT NULL DEFAULT '',"
    " head_object_id TEXT NOT NULL DEFAULT '',"
    " payload TEXT NOT NULL,"
    " deleted INTEGER NOT NULL DEFAULT 0,"
    " version INTEGER NOT NULL,"
    " created_at_ms INTEGER NOT NULL,"
    " updated_at_ms INTEGER NOT NULL,"
    " PRIMARY KEY (record_kind, object_id, tier_kind, tier_id));",
    "CREATE INDEX IF NOT EXISTS graph_record_tier_idx ON graph_record(tier_kind, tier_id);",
    "CREATE INDEX IF NOT EXISTS graph_record_tail_idx ON graph_record(record_kind, kind_tag, tail_object_id);",
    "CREATE INDEX IF NOT EXISTS graph_record_head_idx ON graph_record(record_kind, kind_tag, head_object_id);",
    "CREATE TABLE IF NOT EXISTS change_set ("
    " id TEXT PRIMARY KEY,"
    " name TEXT NOT NULL,"
    " workspace_id TEXT NOT NULL,"
    " status INTEGER NOT NULL,"
    " created_at_ms INTEGER NOT NULL,"
    " updated_at_ms INTEGER NOT NULL);",
    "CREATE INDEX IF NOT EXISTS change_set_workspace_idx ON change_set(workspace_id, status);",
    "CREATE TABLE IF NOT EXISTS edit_session ("
    " id TEXT PRIMARY KEY,"
    " name TEXT NOT NULL,"
    " change_set_id TEXT NOT NULL REFERENCES change_set(id),"
    " workspace_id TEXT NOT NULL,"
    " status INTEGER NOT NULL,"
    " created_at_ms INTEGER NOT NULL,"
    " updated_at_ms INTEGER NOT NULL);",
    "CREATE INDEX IF NOT EXISTS edit_session_change_set_idx ON edit_session(change_set_id, status);",
};

static constexpr const char* kPostgresSchema[] = {
    "CREATE TABLE IF NOT EXISTS graph_record ("
    " record_kind SMALLINT NOT NULL,"
    " object_id TEXT NOT NULL,"
    " tier_kind SMALLINT NOT NULL,"
    " tier_id TEXT NOT NULL,"
    " workspace_id TEXT NOT NULL,"
    " kind_tag TEXT NOT NULL,"
    " tail_object_id TEXT NOT NULL DEFAULT '',"
    " head_object_id TEXT NOT NULL DEFAULT '',"
    " payload JSONB NOT NULL,"
    " deleted BOOLEAN NOT NULL DEFAULT FALSE,"
    " version BIGINT NOT NULL,"
    " created_at_ms BIGINT NOT NULL,"
    " updated_at_ms BIGINT NOT NULL,"
    " PRIMARY KEY (record_kind, object_id, tier_kind, tier_id));",
    "CREATE INDEX IF NOT EXISTS graph_record_tier_idx ON graph_record(tier_kind, tier_id);",
    "CREATE INDEX IF NOT EXISTS graph_record_tail_idx ON graph_record(record_kind, kind_tag, tail_object_id);",
    "CREATE INDEX IF NOT EXISTS graph_record_head_idx ON graph_record(record_kind, kind_tag, head_object_id);",
    "CREATE TABLE IF NOT EXISTS change_set ("
    " id TEXT PRIMARY KEY,"
    " name TEXT NOT NULL,"
    " workspace_id TEXT NOT NULL,"
    " status SMALLINT NOT NULL,"
    " created_at_ms BIGINT NOT NULL,"
    " updated_at_ms BIGINT NOT NULL);",
    "CREATE INDEX IF NOT EXISTS change_set_workspace_idx ON change_set(workspace_id, status);",
    "CREATE TABLE IF NOT EXISTS edit_session ("
    " id TEXT PRIMARY KEY,"
    " name TEXT NOT NULL,"
    " change_set_id TEXT NOT NULL REFERENCES change_set(id),"
    " workspace_id TEXT NOT NULL,"
    " status SMALLINT NOT NULL,"
    " created_at_ms BIGINT NOT NULL,"
    " updated_at_ms BIGINT NOT NULL);",
    "CREATE INDEX IF NOT EXISTS edit_session_change_set_idx ON edit_session(change_set_id, status);",
};

// ---------------------------------------------------------------------
// graph_record
// ---------------------------------------------------------------------

#define INFRAGRAPH_RECORD_COLUMNS                                                                                 \
  "record_kind,object_id,tier_kind,tier_id,workspace_id,kind_tag,tail_object_id,head_object_id,payload,deleted," \
  "version,created_at_ms,updated_at_ms"

static constexpr const char* RECORD_COLUMNS = INFRAGRAPH_RECORD_COLUMNS;

static constexpr const char* UPSERT_RECORD =
    "INSERT INTO graph_record(" INFRAGRAPH_RECORD_COLUMNS ")"
    " VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?)"
    " ON CONFLICT(record_kind,object_id,tier_kind,tier_id) DO UPDATE SET"
    " workspace_id=excluded.workspace_id,"
    " kind_tag=excluded.kind_tag,"
    " tail_object_id=excluded.tail_object_id,"
    " head_object_id=excluded.head_object_id,"
    " payload=excluded.payload,"
    " deleted=excluded.deleted,"
    " version=excluded.version,"
    " updated_at_ms=excluded.updated_at_ms;";

static constexpr const char* SELECT_RECORD =
    "SELECT " INFRAGRAPH_RECORD_COLUMNS
    " FROM graph_record WHERE record_kind=? AND object_id=? AND tier_kind=? AND tier_id=?;";

static constexpr const char* SELECT_RECORDS_BY_TIER =
    "SELECT " INFRAGRAPH_RECORD_COLUMNS
    " FROM graph_record WHERE tier_kind=? AND tier_id=? ORDER BY record_kind, object_id;";

static constexpr const char* DELETE_RECORD =
    "DELETE FROM graph_record WHERE record_kind=? AND object_id=? AND tier_kind=? AND tier_id=?;";

static constexpr const char* DELETE_RECORDS_BY_TIER =
    "DELETE FROM graph_record WHERE tier_kind=? AND tier_id=?;";

#undef INFRAGRAPH_RECORD_COLUMNS

// "((tier_kind=? AND tier_id=?) OR ...)", two parameters per tier.
inline std::string TierFilter(std::size_t tier_count) {
  if (tier_count == 0) return "1=0";
  std::string out = "(";
  for (std::size_t i = 0; i < tier_count; ++i) {
    if (i > 0) out += " OR ";
    out += "(tier_kind=? AND tier_id=?)";
  }
  return out + ")";
}

// params: record_kind, [kind_tag], tiers...
inline std::string SelectObjectIds(std::size_t tier_count, bool with_kind_tag) {
  std::string out = "SELECT DISTINCT object_id FROM graph_record WHERE record_kind=?";
  if (with_kind_tag) out += " AND kind_tag=?";
  return out + " AND " + TierFilter(tier_count) + " ORDER BY object_id;";
}

// params: record_kind, kind_tag, endpoint object id, tiers...
inline std::string SelectEdges(std::size_t tier_count, bool by_head) {
  std::string out = std::string("SELECT ") + RECORD_COLUMNS + " FROM graph_record WHERE record_kind=? AND kind_tag=? AND ";
  out += by_head ? "head_object_id=?" : "tail_object_id=?";
  return out + " AND " + TierFilter(tier_count) + " ORDER BY object_id, tier_kind DESC;";
}

// ---------------------------------------------------------------------
// change_set
// ---------------------------------------------------------------------

static constexpr const char* INSERT_CHANGE_SET =
    "INSERT INTO change_set(id,name,workspace_id,status,created_at_ms,updated_at_ms)"
    " VALUES(?,?,?,?,?,?);";

static constexpr const char* SELECT_CHANGE_SET =
    "SELECT id,name,workspace_id,status,created_at_ms,updated_at_ms"
    " FROM change_set WHERE id=?;";

static constexpr const char* TRANSITION_CHANGE_SET =
    "UPDATE change_set SET status=?,updated_at_ms=? WHERE id=? AND status=?;";

static constexpr const char* SELECT_CHANGE_SETS =
    "SELECT id,name,workspace_id,status,created_at_ms,updated_at_ms"
    " FROM change_set WHERE workspace_id=?";

inline std::string SelectChangeSets(bool with_status) {
  return std::string(SELECT_CHANGE_SETS) + (with_status ? " AND status=?" : "") + " ORDER BY created_at_ms DESC, id;";
}

// ---------------------------------------------------------------------
// edit_session
// ---------------------------------------------------------------------

static constexpr const char* INSERT_EDIT_SESSION =
    "INSERT INTO edit_session(id,name,change_set_id,workspace_id,status,created_at_ms,updated_at_ms)"
    " VALUES(?,?,?,?,?,?,?);";

static constexpr const char* SELECT_EDIT_SESSION =
    "SELECT id,name,change_set_id,workspace_id,status,created_at_ms,updated_at_ms"
    " FROM edit_session WHERE id=?;";

static constexpr const char* TRANSITION_EDIT_SESSION =
    "UPDATE edit_session SET status=?,updated_at_ms=? WHERE id=? AND status=?;";

static constexpr const char* SELECT_EDIT_SESSIONS =
    "SELECT id,name,change_set_id,workspace_id,status,created_at_ms,updated_at_ms"
    " FROM edit_session WHERE change_set_id=?";

inline std::string SelectEditSessions(bool with_status) {
  return std::string(SELECT_EDIT_SESSIONS) + (with_status ? " AND status=?" : "") + " ORDER BY created_at_ms, id;";
}

// '?' placeholders rewritten to Postgres $1..$n.
inline std::string ToNumberedPlaceholders(const std::string& query) {
  std::string out;
  out.reserve(query.size() + 16);
  int  next      = 1;
  bool in_string = false;
  for (char c : query) {
    if (c == '\'') in_string = !in_string;
    if (c == '?' && !in_string) {
      out += '$';
      out += std::to_string(next++);
    } else {
      out += c;
    }
  }
  return out;
}

} // namespace infragraph::db::sql
