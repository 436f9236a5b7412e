#include <cassert>
#include <chrono>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"

#if INFRAGRAPH_DB_SQLITE
#include "internal/db/sqlite/sqlite_pool.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

namespace {

using infragraph::db::Repository;
using infragraph::db::memory::MemoryRepository;
using infragraph::db::model::ChangeSetRecord;
using infragraph::db::model::EditSessionRecord;
using infragraph::db::model::RecordRow;
using infragraph::model::RecordKind;
using infragraph::model::TierKey;

namespace v1 = infragraph::v1;

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
};

RecordRow Entity(const std::string& id, const TierKey& tier, const std::string& type, uint64_t version = 1) {
  RecordRow row;
  row.record_kind   = RecordKind::kEntity;
  row.object_id     = id;
  row.tier          = tier;
  row.workspace_id  = "w";
  row.kind_tag      = type;
  row.payload       = R"({"entityType":")" + type + R"(","name":")" + id + R"("})";
  row.version       = version;
  row.created_at_ms = 100;
  row.updated_at_ms = 100 + version;
  return row;
}

RecordRow Edge(const std::string& id, const TierKey& tier, const std::string& kind, const std::string& tail, const std::string& head) {
  RecordRow row;
  row.record_kind    = RecordKind::kEdge;
  row.object_id      = id;
  row.tier           = tier;
  row.workspace_id   = "w";
  row.kind_tag       = kind;
  row.tail_object_id = tail;
  row.head_object_id = head;
  row.payload        = R"({"edgeKind":")" + kind + R"("})";
  row.version        = 1;
  return row;
}

ChangeSetRecord ChangeSet(const std::string& id, uint64_t created_at_ms, const std::string& workspace_id = "w") {
  ChangeSetRecord cs;
  cs.id            = id;
  cs.name          = "cs " + id;
  cs.workspace_id  = workspace_id;
  cs.status        = v1::CHANGE_SET_STATUS_OPEN;
  cs.created_at_ms = created_at_ms;
  cs.updated_at_ms = created_at_ms;
  return cs;
}

EditSessionRecord EditSession(const std::string& id, const std::string& change_set_id, uint64_t created_at_ms) {
  EditSessionRecord es;
  es.id            = id;
  es.name          = "es " + id;
  es.change_set_id = change_set_id;
  es.workspace_id  = "w";
  es.status        = v1::EDIT_SESSION_STATUS_OPEN;
  es.created_at_ms = created_at_ms;
  es.updated_at_ms = created_at_ms;
  return es;
}

void VerifyRowsRoundTripPerTier(Repository& repo) {
  {
    auto tx = repo.Begin();
    assert(repo.UpsertRecord(*tx, Entity("b", TierKey::Head(), "service")));
    assert(repo.UpsertRecord(*tx, Entity("a", TierKey::Head(), "application")));
    assert(repo.UpsertRecord(*tx, Entity("a", TierKey::ChangeSet("cs1"), "application", 2)));

    auto tombstone    = Entity("b", TierKey::EditSession("es1"), "service", 2);
    tombstone.deleted = true;
    assert(repo.UpsertRecord(*tx, tombstone));

    // reads inside the transaction see its writes
    assert(repo.GetRecord(*tx, RecordKind::kEntity, "a", TierKey::ChangeSet("cs1")).has_value());
    tx->Commit();
  }

  auto tx = repo.BeginRead();

  auto head_a = repo.GetRecord(*tx, RecordKind::kEntity, "a", TierKey::Head());
  assert(head_a && head_a->version == 1 && head_a->kind_tag == "application");
  assert(head_a->payload == R"({"entityType":"application","name":"a"})");
  assert(head_a->created_at_ms == 100 && head_a->updated_at_ms == 101);
  assert(head_a->workspace_id == "w");

  auto cs_a = repo.GetRecord(*tx, RecordKind::kEntity, "a", TierKey::ChangeSet("cs1"));
  assert(cs_a && cs_a->version == 2 && cs_a->tier == TierKey::ChangeSet("cs1"));

  auto es_b = repo.GetRecord(*tx, RecordKind::kEntity, "b", TierKey::EditSession("es1"));
  assert(es_b && es_b->deleted);

  assert(!repo.GetRecord(*tx, RecordKind::kNode, "a", TierKey::Head()).has_value());
  assert(!repo.GetRecord(*tx, RecordKind::kEntity, "a", TierKey::ChangeSet("other")).has_value());

  const auto head = repo.ListRecordsByTier(*tx, TierKey::Head());
  assert(head.size() == 2 && head[0].object_id == "a" && head[1].object_id == "b");

  const auto all = repo.ListObjectIds(*tx, RecordKind::kEntity, {}, {TierKey::EditSession("es1"), TierKey::ChangeSet("cs1"), TierKey::Head()});
  assert((all == std::vector<std::string>{"a", "b"}));

  const auto services = repo.ListObjectIds(*tx, RecordKind::kEntity, "service", {TierKey::Head()});
  assert((services == std::vector<std::string>{"b"}));

  assert(repo.ListObjectIds(*tx, RecordKind::kEntity, {}, {TierKey::ChangeSet("nobody")}).empty());
  tx->Commit();
}

void VerifyEdgeScans(Repository& repo) {
  {
    auto tx = repo.Begin();
    assert(repo.UpsertRecord(*tx, Edge("e1", TierKey::Head(), "Includes", "sys", "app1")));
    assert(repo.UpsertRecord(*tx, Edge("e2", TierKey::Head(), "Includes", "sys", "app2")));
    assert(repo.UpsertRecord(*tx, Edge("e3", TierKey::Head(), "Configures", "sys", "app1")));
    assert(repo.UpsertRecord(*tx, Edge("e1", TierKey::ChangeSet("cs2"), "Includes", "sys", "app3")));
    tx->Commit();
  }

  auto tx = repo.BeginRead();

  auto head_only = repo.ListEdgesByTail(*tx, "Includes", "sys", {TierKey::Head()});
  assert(head_only.size() == 2);

  auto with_cs = repo.ListEdgesByTail(*tx, "Includes", "sys", {TierKey::ChangeSet("cs2"), TierKey::Head()});
  assert(with_cs.size() == 3);

  auto into_app3 = repo.ListEdgesByHead(*tx, "Includes", "app3", {TierKey::ChangeSet("cs2"), TierKey::Head()});
  assert(into_app3.size() == 1 && into_app3[0].object_id == "e1" && into_app3[0].tier == TierKey::ChangeSet("cs2"));
  assert(into_app3[0].tail_object_id == "sys");

  assert(repo.ListEdgesByHead(*tx, "Configures", "app1", {TierKey::Head()}).size() == 1);
  assert(repo.ListEdgesByTail(*tx, "Includes", "app1", {TierKey::Head()}).empty());
  tx->Commit();
}

void VerifyDeletes(Repository& repo) {
  auto tx = repo.Begin();
  assert(repo.UpsertRecord(*tx, Entity("x", TierKey::EditSession("es9"), "service")));
  assert(repo.UpsertRecord(*tx, Entity("y", TierKey::EditSession("es9"), "service")));
  assert(repo.UpsertRecord(*tx, Entity("x", TierKey::ChangeSet("cs9"), "service")));

  assert(repo.DeleteRecord(*tx, RecordKind::kEntity, "x", TierKey::ChangeSet("cs9")));
  assert(!repo.GetRecord(*tx, RecordKind::kEntity, "x", TierKey::ChangeSet("cs9")).has_value());

  assert(repo.DeleteRecordsByTier(*tx, TierKey::EditSession("es9")));
  assert(repo.ListRecordsByTier(*tx, TierKey::EditSession("es9")).empty());
  tx->Commit();
}

void VerifyRollbackDiscardsWrites(Repository& repo) {
  {
    auto tx = repo.Begin();
    assert(repo.UpsertRecord(*tx, Entity("ghost", TierKey::Head(), "service")));
    assert(repo.InsertChangeSet(*tx, ChangeSet("ghost-cs", 1)));
    tx->Rollback();
  }
  {
    auto tx = repo.Begin();
    assert(repo.UpsertRecord(*tx, Entity("ghost", TierKey::Head(), "service")));
    // dropped without commit
  }

  auto tx = repo.BeginRead();
  assert(!repo.GetRecord(*tx, RecordKind::kEntity, "ghost", TierKey::Head()).has_value());
  assert(!repo.GetChangeSet(*tx, "ghost-cs").has_value());
  tx->Commit();
}

void VerifyChangeSetLifecycle(Repository& repo) {
  auto tx = repo.Begin();
  assert(repo.InsertChangeSet(*tx, ChangeSet("old", 10)));
  assert(repo.InsertChangeSet(*tx, ChangeSet("new", 30)));
  assert(repo.InsertChangeSet(*tx, ChangeSet("mid", 20)));
  assert(repo.InsertChangeSet(*tx, ChangeSet("foreign", 40, "other")));
  assert(!repo.InsertChangeSet(*tx, ChangeSet("old", 10)));

  assert(repo.TransitionChangeSet(*tx, "mid", v1::CHANGE_SET_STATUS_OPEN, v1::CHANGE_SET_STATUS_APPLIED, 50));
  auto stale = repo.TransitionChangeSet(*tx, "mid", v1::CHANGE_SET_STATUS_OPEN, v1::CHANGE_SET_STATUS_ABANDONED, 60);
  assert(stale.code == infragraph::db::ErrorCode::Conflict);
  auto missing = repo.TransitionChangeSet(*tx, "nope", v1::CHANGE_SET_STATUS_OPEN, v1::CHANGE_SET_STATUS_APPLIED, 60);
  assert(missing.code == infragraph::db::ErrorCode::NotFound);

  auto mid = repo.GetChangeSet(*tx, "mid");
  assert(mid && mid->status == v1::CHANGE_SET_STATUS_APPLIED && mid->updated_at_ms == 50);
  assert(mid->name == "cs mid" && mid->created_at_ms == 20);

  const auto all = repo.ListChangeSets(*tx, "w", std::nullopt);
  assert(all.size() == 3);
  assert(all[0].id == "new" && all[1].id == "mid" && all[2].id == "old");

  const auto open = repo.ListChangeSets(*tx, "w", v1::CHANGE_SET_STATUS_OPEN);
  assert(open.size() == 2 && open[0].id == "new" && open[1].id == "old");

  const auto applied = repo.ListChangeSets(*tx, "w", v1::CHANGE_SET_STATUS_APPLIED);
  assert(applied.size() == 1 && applied[0].id == "mid");
  tx->Commit();
}

void VerifyEditSessionLifecycle(Repository& repo) {
  auto tx = repo.Begin();
  assert(repo.InsertChangeSet(*tx, ChangeSet("host", 1)));
  assert(repo.InsertEditSession(*tx, EditSession("s2", "host", 20)));
  assert(repo.InsertEditSession(*tx, EditSession("s1", "host", 10)));
  assert(repo.InsertEditSession(*tx, EditSession("s3", "host", 30)));

  assert(repo.TransitionEditSession(*tx, "s3", v1::EDIT_SESSION_STATUS_OPEN, v1::EDIT_SESSION_STATUS_SAVED, 40));
  auto stale = repo.TransitionEditSession(*tx, "s3", v1::EDIT_SESSION_STATUS_OPEN, v1::EDIT_SESSION_STATUS_CANCELED, 50);
  assert(stale.code == infragraph::db::ErrorCode::Conflict);
  assert(repo.TransitionEditSession(*tx, "nope", v1::EDIT_SESSION_STATUS_OPEN, v1::EDIT_SESSION_STATUS_SAVED, 50).code ==
         infragraph::db::ErrorCode::NotFound);

  auto s3 = repo.GetEditSession(*tx, "s3");
  assert(s3 && s3->status == v1::EDIT_SESSION_STATUS_SAVED && s3->change_set_id == "host");

  const auto open = repo.ListEditSessions(*tx, "host", v1::EDIT_SESSION_STATUS_OPEN);
  assert(open.size() == 2 && open[0].id == "s1" && open[1].id == "s2");
  assert(repo.ListEditSessions(*tx, "host", std::nullopt).size() == 3);
  assert(repo.ListEditSessions(*tx, "elsewhere", std::nullopt).empty());
  tx->Commit();
}

void VerifyRestartDurability(BackendFactory& backend) {
  if (!backend.supports_restart()) {
    return;
  }

  auto repo = backend.make_repository();
  {
    auto tx = repo->Begin();
    assert(repo->UpsertRecord(*tx, Entity("durable", TierKey::ChangeSet("keep"), "system", 7)));
    assert(repo->InsertChangeSet(*tx, ChangeSet("keep", 5)));
    tx->Commit();
  }

  backend.restart(repo);

  auto tx  = repo->BeginRead();
  auto row = repo->GetRecord(*tx, RecordKind::kEntity, "durable", TierKey::ChangeSet("keep"));
  assert(row && row->version == 7);
  assert(repo->GetChangeSet(*tx, "keep").has_value());
  tx->Commit();
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name             = "memory",
      .make_repository  = []() { return std::make_shared<MemoryRepository>(); },
      .supports_restart = []() { return false; },
      .restart          = [](std::shared_ptr<Repository>&) {},
      .cleanup          = []() {},
  };
}

#if INFRAGRAPH_DB_SQLITE
BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("infragraph_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();

  auto make_repo = [db_path]() {
    infragraph::db::sqlite::SqliteOptions options;
    options.path = db_path;
    auto repo    = std::make_shared<infragraph::db::sqlite::SqliteRepository>(std::make_shared<infragraph::db::sqlite::SqlitePool>(options));
    repo->BootstrapSchema();
    return std::shared_ptr<Repository>(std::move(repo));
  };

  return BackendFactory{
      .name             = "sqlite",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) {
        repo.reset();
        repo = make_repo();
      },
      .cleanup = [db_path]() {
        std::filesystem::remove(db_path);
        std::filesystem::remove(db_path + "-wal");
        std::filesystem::remove(db_path + "-shm");
      },
  };
}
#endif

void RunParity(BackendFactory backend) {
  {
    auto repo = backend.make_repository();
    VerifyRowsRoundTripPerTier(*repo);
    VerifyEdgeScans(*repo);
    VerifyDeletes(*repo);
    VerifyRollbackDiscardsWrites(*repo);
    VerifyChangeSetLifecycle(*repo);
    VerifyEditSessionLifecycle(*repo);
  }
  backend.cleanup();

  VerifyRestartDurability(backend);
  backend.cleanup();

  std::cout << "repository parity [" << backend.name << "]: pass\n";
}

} // namespace

int main() {
  RunParity(MakeMemoryFactory());
#if INFRAGRAPH_DB_SQLITE
  RunParity(MakeSqliteFactory());
#endif

  std::cout << "infragraph_integration_repository_parity: pass\n";
  return 0;
}
