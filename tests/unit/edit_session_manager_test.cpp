#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "internal/util/errors.hpp"
#include "tests/test_support.hpp"

namespace {

using namespace infragraph;
using infragraph::testing::Engine;
using infragraph::testing::Named;
using infragraph::testing::Throws;
using model::Context;

const std::string kWs = "w";

std::vector<db::model::RecordRow> RowsAt(Engine& engine, const model::TierKey& tier) {
  auto uow  = engine.store->BeginRead();
  auto rows = uow->Repository().ListRecordsByTier(uow->Tx(), tier);
  uow->Commit();
  return rows;
}

void TestNewRequiresOpenChangeSet() {
  Engine engine;
  assert(Throws<util::NotFound>([&] { engine.edit_sessions->New("missing"); }));

  const auto cs      = engine.change_sets->New(kWs);
  const auto session = engine.edit_sessions->New(cs.id());
  assert(session.status() == v1::EDIT_SESSION_STATUS_OPEN);
  assert(session.change_set_id() == cs.id());
  assert(session.workspace_id() == kWs);
  assert(!session.name().empty());

  assert(Throws<util::InvalidArgument>([&] { engine.edit_sessions->New(cs.id(), "other-workspace"); }));

  engine.change_sets->Apply(cs.id());
  assert(Throws<util::InvalidState>([&] { engine.edit_sessions->New(cs.id()); }));
}

void TestSavePromotesDraftsToChangeSet() {
  Engine engine;
  engine.store->WriteEntity("svc", Context::Head(kWs), Named("service", "svc"));

  const auto cs      = engine.change_sets->New(kWs);
  const auto session = engine.edit_sessions->New(cs.id());
  const auto in_es   = Context::ForEditSession(kWs, cs.id(), session.id());
  const auto in_cs   = Context::ForChangeSet(kWs, cs.id());

  engine.store->WriteEntity("app", in_es, Named("application", "app"));
  engine.store->Remove<v1::EntityBody>("svc", in_es);

  const auto saved = engine.edit_sessions->Save(session.id());
  assert(saved.status() == v1::EDIT_SESSION_STATUS_SAVED);

  assert(RowsAt(engine, model::TierKey::EditSession(session.id())).empty());
  assert(RowsAt(engine, model::TierKey::ChangeSet(cs.id())).size() == 2);

  assert(engine.store->ResolveEntity("app", in_cs).tier == model::TierKey::ChangeSet(cs.id()));
  // the tombstone moved with the session and still hides head
  assert(Throws<util::NotFound>([&] { engine.store->ResolveEntity("svc", in_cs); }));
  assert(engine.store->ResolveEntity("svc", Context::Head(kWs)).body.name() == "svc");
}

void TestSaveOverwritesChangeSetRows() {
  Engine engine;
  const auto cs    = engine.change_sets->New(kWs);
  const auto in_cs = Context::ForChangeSet(kWs, cs.id());

  engine.store->WriteEntity("app", in_cs, Named("application", "before"));

  const auto session = engine.edit_sessions->New(cs.id());
  engine.store->WriteEntity("app", Context::ForEditSession(kWs, cs.id(), session.id()), [](v1::EntityBody& body) { body.set_name("after"); });
  engine.edit_sessions->Save(session.id());

  const auto app = engine.store->ResolveEntity("app", in_cs);
  assert(app.body.name() == "after");
  assert(app.audit.version == 2);
}

void TestSecondSaveChangesNothing() {
  Engine engine;
  const auto cs      = engine.change_sets->New(kWs);
  const auto session = engine.edit_sessions->New(cs.id());
  engine.store->WriteEntity("app", Context::ForEditSession(kWs, cs.id(), session.id()), Named("application", "app"));

  engine.edit_sessions->Save(session.id());
  const auto before = RowsAt(engine, model::TierKey::ChangeSet(cs.id()));
  const auto events = engine.events.size();

  assert(Throws<util::InvalidState>([&] { engine.edit_sessions->Save(session.id()); }));

  const auto after = RowsAt(engine, model::TierKey::ChangeSet(cs.id()));
  assert(before.size() == after.size());
  for (std::size_t i = 0; i < before.size(); ++i) {
    assert(before[i].object_id == after[i].object_id);
    assert(before[i].payload == after[i].payload);
    assert(before[i].version == after[i].version);
  }
  assert(engine.events.size() == events);
}

void TestCancelLeavesChangeSetUntouched() {
  Engine engine;
  const auto cs    = engine.change_sets->New(kWs);
  const auto in_cs = Context::ForChangeSet(kWs, cs.id());
  engine.store->WriteEntity("app", in_cs, Named("application", "app"));

  const auto session = engine.edit_sessions->New(cs.id());
  const auto in_es   = Context::ForEditSession(kWs, cs.id(), session.id());
  engine.store->WriteEntity("app", in_es, [](v1::EntityBody& body) { body.set_name("changed"); });
  engine.store->WriteEntity("new", in_es, Named("service", "new"));

  const auto before   = RowsAt(engine, model::TierKey::ChangeSet(cs.id()));
  const auto canceled = engine.edit_sessions->Cancel(session.id());
  assert(canceled.status() == v1::EDIT_SESSION_STATUS_CANCELED);

  assert(RowsAt(engine, model::TierKey::EditSession(session.id())).empty());
  const auto after = RowsAt(engine, model::TierKey::ChangeSet(cs.id()));
  assert(after.size() == before.size());
  assert(after[0].payload == before[0].payload && after[0].version == before[0].version);

  assert(Throws<util::InvalidState>([&] { engine.edit_sessions->Cancel(session.id()); }));
  assert(Throws<util::InvalidState>([&] { engine.edit_sessions->Save(session.id()); }));
  assert(Throws<util::NotFound>([&] { engine.edit_sessions->Cancel("missing"); }));
}

void TestGetAndListOpen() {
  Engine engine;
  const auto cs = engine.change_sets->New(kWs);
  const auto a  = engine.edit_sessions->New(cs.id(), kWs, "a");
  const auto b  = engine.edit_sessions->New(cs.id(), kWs, "b");
  engine.edit_sessions->Cancel(a.id());

  assert(engine.edit_sessions->Get(a.id()).status() == v1::EDIT_SESSION_STATUS_CANCELED);
  assert(engine.edit_sessions->Get(b.id()).name() == "b");
  assert(Throws<util::NotFound>([&] { engine.edit_sessions->Get("missing"); }));

  const auto open = engine.edit_sessions->ListOpen(cs.id());
  assert(open.size() == 1 && open[0].id() == b.id());
}

void TestLifecycleEventsAfterCommit() {
  Engine engine;
  const auto cs = engine.change_sets->New(kWs);
  engine.events.clear();

  const auto session = engine.edit_sessions->New(cs.id());
  engine.store->WriteEntity("x", Context::ForEditSession(kWs, cs.id(), session.id()), Named("application", "x"));
  engine.edit_sessions->Save(session.id());

  // opened, draft written, draft promoted, saved
  assert(engine.events.size() == 4);
  assert(engine.events[0].kind == notify::EventKind::kEditSession);
  assert(engine.events[2].kind == notify::EventKind::kEntity);
  assert(engine.events[2].tier == model::TierKey::ChangeSet(cs.id()));
  assert(engine.events[3].kind == notify::EventKind::kEditSession);
  assert(engine.events[3].payload_json->find("EDIT_SESSION_STATUS_SAVED") != std::string::npos);
}

} // namespace

int main() {
  TestNewRequiresOpenChangeSet();
  TestSavePromotesDraftsToChangeSet();
  TestSaveOverwritesChangeSetRows();
  TestSecondSaveChangesNothing();
  TestCancelLeavesChangeSetUntouched();
  TestGetAndListOpen();
  TestLifecycleEventsAfterCommit();

  std::cout << "infragraph_unit_edit_session: pass\n";
  return 0;
}
