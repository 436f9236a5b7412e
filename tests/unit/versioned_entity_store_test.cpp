#include <cassert>
#include <iostream>
#include <string>

#include "internal/db/api/repository.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/line_diff.hpp"
#include "tests/test_support.hpp"

namespace {

using namespace infragraph;
using infragraph::testing::Engine;
using infragraph::testing::Named;
using infragraph::testing::Throws;
using model::Context;

const std::string kWs = "w";

struct Scope {
  std::string change_set_id;
  std::string edit_session_id;
  Context     change_set;
  Context     session;
};

Scope Open(Engine& engine) {
  Scope scope;
  scope.change_set_id   = engine.change_sets->New(kWs).id();
  scope.edit_session_id = engine.edit_sessions->New(scope.change_set_id).id();
  scope.change_set      = Context::ForChangeSet(kWs, scope.change_set_id);
  scope.session         = Context::ForEditSession(kWs, scope.change_set_id, scope.edit_session_id);
  return scope;
}

void TestResolveFallsBackToHead() {
  Engine engine;
  engine.store->WriteEntity("svc", Context::Head(kWs), Named("service", "svc"));

  auto scope = Open(engine);
  const auto via_session = engine.store->ResolveEntity("svc", scope.session);
  assert(via_session.tier.IsHead());
  assert(via_session.body.name() == "svc");

  assert(Throws<util::NotFound>([&] { engine.store->ResolveEntity("missing", scope.session); }));
}

void TestSessionDraftIsInvisibleOutsideTheSession() {
  Engine engine;
  auto   scope = Open(engine);

  engine.store->WriteEntity("app-1", scope.session, Named("application", "app-1"));

  assert(engine.store->ResolveEntity("app-1", scope.session).tier == model::TierKey::EditSession(scope.edit_session_id));
  assert(Throws<util::NotFound>([&] { engine.store->ResolveEntity("app-1", scope.change_set); }));
  assert(Throws<util::NotFound>([&] { engine.store->ResolveEntity("app-1", Context::Head(kWs)); }));

  // a sibling session under the same change set sees nothing either
  const auto sibling = engine.edit_sessions->New(scope.change_set_id).id();
  assert(Throws<util::NotFound>([&] { engine.store->ResolveEntity("app-1", Context::ForEditSession(kWs, scope.change_set_id, sibling)); }));
}

void TestFirstWriteClonesTheVisibleAncestor() {
  Engine engine;
  engine.store->WriteEntity("svc", Context::Head(kWs), [](v1::EntityBody& body) {
    body.set_entity_type("service");
    body.set_name("svc");
    body.mutable_service()->set_image("nginx:1");
    body.mutable_service()->set_replicas(1);
  });

  auto scope = Open(engine);
  const auto draft = engine.store->WriteEntity("svc", scope.session, [](v1::EntityBody& body) { body.mutable_service()->set_replicas(3); });

  // untouched fields come from head
  assert(draft.body.name() == "svc");
  assert(draft.body.service().image() == "nginx:1");
  assert(draft.body.service().replicas() == 3);
  assert(draft.audit.version == 2);

  // head is unchanged
  assert(engine.store->ResolveEntity("svc", Context::Head(kWs)).body.service().replicas() == 1);

  // later writes mutate the draft in place
  const auto again = engine.store->WriteEntity("svc", scope.session, [](v1::EntityBody& body) { body.mutable_service()->set_image("nginx:2"); });
  assert(again.body.service().replicas() == 3);
  assert(again.audit.version == 3);
  assert(again.audit.created_at_ms == draft.audit.created_at_ms);
}

void TestEmptyIdCreatesNewObject() {
  Engine engine;
  const auto created = engine.store->WriteEntity({}, Context::Head(kWs), Named("system", "production"));
  assert(created.object_id.size() == 36);
  assert(created.audit.version == 1);
  assert(engine.store->ResolveEntity(created.object_id, Context::Head(kWs)).body.name() == "production");
}

void TestWritesRequireOpenTiers() {
  Engine engine;
  auto   scope = Open(engine);

  engine.edit_sessions->Cancel(scope.edit_session_id);
  assert(Throws<util::InvalidState>([&] { engine.store->WriteEntity("x", scope.session, Named("application", "x")); }));

  engine.change_sets->Abandon(scope.change_set_id);
  assert(Throws<util::InvalidState>([&] { engine.store->WriteEntity("x", scope.change_set, Named("application", "x")); }));

  assert(Throws<util::NotFound>([&] { engine.store->WriteEntity("x", Context::ForChangeSet(kWs, "nope"), Named("application", "x")); }));
  assert(Throws<util::InvalidArgument>([&] { engine.store->WriteEntity("x", Context::Head(), Named("application", "x")); }));
}

void TestSessionMustBelongToTheChangeSet() {
  Engine engine;
  auto   first  = Open(engine);
  auto   second = Open(engine);

  const auto mixed = Context::ForEditSession(kWs, second.change_set_id, first.edit_session_id);
  assert(Throws<util::InvalidArgument>([&] { engine.store->ResolveEntity("x", mixed); }));
  assert(Throws<util::InvalidArgument>([&] { engine.store->WriteEntity("x", mixed, Named("application", "x")); }));
}

void TestValidationRejectsBadPayloads() {
  Engine engine;
  assert(Throws<util::InvalidArgument>([&] { engine.store->WriteEntity("x", Context::Head(kWs), Named("application", "")); }));

  engine.store->WriteEntity("x", Context::Head(kWs), Named("application", "x"));
  assert(Throws<util::InvalidArgument>([&] { engine.store->WriteEntity("x", Context::Head(kWs), Named("service", "x")); }));
  assert(engine.events.size() == 1);
}

void TestRemoveWritesTombstoneOverAncestors() {
  Engine engine;
  engine.store->WriteEntity("svc", Context::Head(kWs), Named("service", "svc"));

  auto scope = Open(engine);
  engine.store->Remove<v1::EntityBody>("svc", scope.session);

  assert(Throws<util::NotFound>([&] { engine.store->ResolveEntity("svc", scope.session); }));
  assert(engine.store->ResolveEntity("svc", scope.change_set).tier.IsHead());

  // the tombstone is a row of its own at the session tier
  auto uow  = engine.store->BeginRead();
  auto row  = uow->Repository().GetRecord(uow->Tx(), model::RecordKind::kEntity, "svc", model::TierKey::EditSession(scope.edit_session_id));
  uow->Commit();
  assert(row.has_value() && row->deleted);

  assert(Throws<util::NotFound>([&] { engine.store->Remove<v1::EntityBody>("svc", scope.session); }));

  // writing again resurrects the object from an empty body
  const auto revived = engine.store->WriteEntity("svc", scope.session, Named("service", "svc-2"));
  assert(revived.body.name() == "svc-2");
}

void TestRemoveOfDraftOnlyObjectDropsTheRow() {
  Engine engine;
  auto   scope = Open(engine);

  engine.store->WriteEntity("tmp", scope.session, Named("application", "tmp"));
  engine.store->Remove<v1::EntityBody>("tmp", scope.session);

  auto uow = engine.store->BeginRead();
  assert(uow->Repository().ListRecordsByTier(uow->Tx(), model::TierKey::EditSession(scope.edit_session_id)).empty());
  uow->Commit();
}

void TestRemoveAtHeadDeletes() {
  Engine engine;
  engine.store->WriteEntity("svc", Context::Head(kWs), Named("service", "svc"));
  engine.store->Remove<v1::EntityBody>("svc", Context::Head(kWs));
  assert(Throws<util::NotFound>([&] { engine.store->ResolveEntity("svc", Context::Head(kWs)); }));
  assert(Throws<util::NotFound>([&] { engine.store->Remove<v1::EntityBody>("svc", Context::Head(kWs)); }));
}

void TestListResolvesEachMember() {
  Engine engine;
  engine.store->WriteEntity("b", Context::Head(kWs), Named("service", "b"));
  engine.store->WriteEntity("a", Context::Head(kWs), Named("application", "a"));
  engine.store->WriteEntity("c", Context::Head(kWs), Named("service", "c"));

  auto scope = Open(engine);
  engine.store->WriteEntity("b", scope.session, [](v1::EntityBody& body) { body.set_name("b-draft"); });
  engine.store->Remove<v1::EntityBody>("c", scope.session);
  engine.store->WriteEntity("d", scope.session, Named("service", "d"));

  const auto all = engine.store->ListEntities(scope.session);
  assert(all.size() == 3);
  assert(all[0].object_id == "a" && all[1].object_id == "b" && all[2].object_id == "d");
  assert(all[1].body.name() == "b-draft");

  const auto services = engine.store->ListEntities(scope.session, "service");
  assert(services.size() == 2);

  assert(engine.store->ListEntities(Context::Head(kWs)).size() == 3);
}

void TestNodesAndEdgesShareTheTierRules() {
  Engine engine;
  auto   scope = Open(engine);

  engine.store->Write<v1::NodeBody>("n1", scope.session, [](v1::NodeBody& body) {
    body.set_object_type("application");
    body.set_entity_object_id("app");
    auto* position = body.add_positions();
    position->set_context_id("root");
    position->set_x(10);
  });
  assert(engine.store->Resolve<v1::NodeBody>("n1", scope.session).body.positions(0).x() == 10);
  assert(Throws<util::NotFound>([&] { engine.store->Resolve<v1::NodeBody>("n1", scope.change_set); }));

  engine.store->Write<v1::EdgeBody>("e1", scope.session, infragraph::testing::Link("Includes", "sys", "app"));
  assert(engine.store->List<v1::EdgeBody>(scope.session, "Includes").size() == 1);
  assert(engine.store->List<v1::EdgeBody>(scope.session, "Configures").empty());
}

void TestCorruptPayloadIsSerializationError() {
  Engine engine;

  auto                   uow = engine.store->BeginWrite();
  db::model::RecordRow row;
  row.record_kind  = model::RecordKind::kEntity;
  row.object_id    = "bad";
  row.tier         = model::TierKey::Head();
  row.workspace_id = kWs;
  row.kind_tag     = "service";
  row.payload      = R"({"entityType":"application","name":"bad"})";
  row.version      = 1;
  assert(uow->Repository().UpsertRecord(uow->Tx(), row));
  uow->Commit();

  assert(Throws<util::SerializationError>([&] { engine.store->ResolveEntity("bad", Context::Head(kWs)); }));
}

void TestEventsFollowCommits() {
  Engine engine;
  auto   scope = Open(engine);
  engine.events.clear();

  engine.store->WriteEntity("x", scope.session, Named("application", "x"));
  assert(engine.events.size() == 1);
  assert(engine.events[0].kind == notify::EventKind::kEntity);
  assert(engine.events[0].tier == model::TierKey::EditSession(scope.edit_session_id));
  assert(engine.events[0].payload_json.has_value());

  {
    auto uow = engine.store->BeginWrite();
    engine.store->Write<v1::EntityBody>(*uow, "y", scope.session, Named("application", "y"));
    // rolled back on scope exit
  }
  assert(engine.events.size() == 1);
  assert(Throws<util::NotFound>([&] { engine.store->ResolveEntity("y", scope.session); }));
}

bool HasLine(const std::string& text, char prefix, const std::string& fragment) {
  for (const auto& line : util::SplitLines(text)) {
    if (!line.empty() && line[0] == prefix && line.find(fragment) != std::string::npos) {
      return true;
    }
  }
  return false;
}

void TestDiffAgainstHead() {
  Engine engine;
  engine.store->WriteEntity("svc", Context::Head(kWs), [](v1::EntityBody& body) {
    body.set_entity_type("service");
    body.set_name("svc");
    body.mutable_service()->set_image("nginx:1");
    body.mutable_service()->set_replicas(1);
  });
  auto scope = Open(engine);

  // untouched: both sides present, nothing changed
  auto diff = engine.store->Diff<v1::EntityBody>("svc", scope.session);
  assert(diff.object_id() == "svc");
  assert(!diff.changed());
  assert(diff.current_json() == diff.head_json());
  assert(diff.changed_fields().empty());
  assert(!HasLine(diff.diff(), '-', "") && !HasLine(diff.diff(), '+', ""));

  engine.store->WriteEntity("svc", scope.session, [](v1::EntityBody& body) { body.mutable_service()->set_replicas(3); });
  diff = engine.store->Diff<v1::EntityBody>("svc", scope.session);
  assert(diff.changed());
  assert(HasLine(diff.diff(), '-', "\"replicas\": 1"));
  assert(HasLine(diff.diff(), '+', "\"replicas\": 3"));
  assert(HasLine(diff.diff(), ' ', "\"image\": \"nginx:1\""));
  assert(diff.changed_fields_size() == 1);
  assert(diff.changed_fields(0).find("replicas") != std::string::npos);

  // the change set does not see the session draft
  assert(!engine.store->Diff<v1::EntityBody>("svc", scope.change_set).changed());

  // created in the change set: no head side
  engine.store->WriteEntity("fresh", scope.change_set, Named("application", "fresh"));
  diff = engine.store->Diff<v1::EntityBody>("fresh", scope.change_set);
  assert(diff.changed());
  assert(diff.head_json().empty() && diff.diff().empty());
  assert(diff.current_json().find("\"fresh\"") != std::string::npos);

  // removed in the change set: current reads as an empty document
  engine.store->Remove<v1::EntityBody>("svc", scope.change_set);
  diff = engine.store->Diff<v1::EntityBody>("svc", scope.change_set);
  assert(diff.changed());
  assert(diff.current_json() == "{}");
  assert(HasLine(diff.diff(), '-', "\"name\": \"svc\""));
  assert(HasLine(diff.diff(), '+', "{}"));

  assert(Throws<util::InvalidArgument>([&] { engine.store->Diff<v1::EntityBody>("svc", Context::Head(kWs)); }));
  assert(Throws<util::NotFound>([&] { engine.store->Diff<v1::EntityBody>("missing", scope.session); }));
  assert(Throws<util::NotFound>([&] { engine.store->Diff<v1::NodeBody>("svc", scope.session); }));
}

} // namespace

int main() {
  TestResolveFallsBackToHead();
  TestSessionDraftIsInvisibleOutsideTheSession();
  TestFirstWriteClonesTheVisibleAncestor();
  TestEmptyIdCreatesNewObject();
  TestWritesRequireOpenTiers();
  TestSessionMustBelongToTheChangeSet();
  TestValidationRejectsBadPayloads();
  TestRemoveWritesTombstoneOverAncestors();
  TestRemoveOfDraftOnlyObjectDropsTheRow();
  TestRemoveAtHeadDeletes();
  TestListResolvesEachMember();
  TestNodesAndEdgesShareTheTierRules();
  TestCorruptPayloadIsSerializationError();
  TestEventsFollowCommits();
  TestDiffAgainstHead();

  std::cout << "infragraph_unit_versioned_entity_store: pass\n";
  return 0;
}
