#include <cassert>
#include <iostream>
#include <set>
#include <string>

#include "internal/util/errors.hpp"
#include "tests/test_support.hpp"

namespace {

using namespace infragraph;
using infragraph::testing::Engine;
using infragraph::testing::Named;
using infragraph::testing::Throws;
using model::Context;

const std::string kWs = "w";

std::size_t RowCount(Engine& engine, const model::TierKey& tier) {
  auto       uow  = engine.store->BeginRead();
  const auto rows = uow->Repository().ListRecordsByTier(uow->Tx(), tier);
  uow->Commit();
  return rows.size();
}

void TestNewDefaultsAndValidation() {
  Engine engine;
  assert(Throws<util::InvalidArgument>([&] { engine.change_sets->New(""); }));

  const auto named = engine.change_sets->New(kWs, "rollout");
  assert(named.name() == "rollout");
  assert(named.status() == v1::CHANGE_SET_STATUS_OPEN);
  assert(named.workspace_id() == kWs);
  assert(!named.id().empty());

  // RFC 3339 timestamp, e.g. 2026-01-02T03:04:05.678Z
  const auto stamped = engine.change_sets->New(kWs);
  assert(stamped.name().find('T') != std::string::npos);
  assert(stamped.name().back() == 'Z');
  assert(stamped.id() != named.id());
}

void TestApplyPromotesEveryRowToHead() {
  Engine engine;
  engine.store->WriteEntity("old", Context::Head(kWs), Named("service", "old"));
  engine.store->WriteEntity("kept", Context::Head(kWs), Named("service", "kept"));

  const auto cs    = engine.change_sets->New(kWs);
  const auto in_cs = Context::ForChangeSet(kWs, cs.id());
  engine.store->WriteEntity("a", in_cs, Named("application", "a"));
  engine.store->WriteEntity("b", in_cs, Named("application", "b"));
  engine.store->WriteEntity("kept", in_cs, [](v1::EntityBody& body) { body.set_name("kept-v2"); });
  engine.store->Remove<v1::EntityBody>("old", in_cs);
  assert(RowCount(engine, model::TierKey::ChangeSet(cs.id())) == 4);

  const auto applied = engine.change_sets->Apply(cs.id());
  assert(applied.status() == v1::CHANGE_SET_STATUS_APPLIED);

  assert(RowCount(engine, model::TierKey::ChangeSet(cs.id())) == 0);
  // a, b, kept; the tombstone removed old instead of landing on head
  assert(RowCount(engine, model::TierKey::Head()) == 3);

  const auto head = Context::Head(kWs);
  assert(engine.store->ResolveEntity("a", head).body.name() == "a");
  assert(engine.store->ResolveEntity("kept", head).body.name() == "kept-v2");
  assert(engine.store->ResolveEntity("kept", head).audit.version == 2);
  assert(Throws<util::NotFound>([&] { engine.store->ResolveEntity("old", head); }));
}

void TestApplyAndAbandonAreOneShot() {
  Engine engine;
  const auto applied = engine.change_sets->New(kWs);
  engine.change_sets->Apply(applied.id());
  assert(Throws<util::InvalidState>([&] { engine.change_sets->Apply(applied.id()); }));
  assert(Throws<util::InvalidState>([&] { engine.change_sets->Abandon(applied.id()); }));

  const auto abandoned = engine.change_sets->New(kWs);
  engine.change_sets->Abandon(abandoned.id());
  assert(Throws<util::InvalidState>([&] { engine.change_sets->Apply(abandoned.id()); }));

  assert(Throws<util::NotFound>([&] { engine.change_sets->Apply("missing"); }));
  assert(Throws<util::NotFound>([&] { engine.change_sets->Abandon("missing"); }));
}

void TestAbandonDiscardsRowsAndLeavesHead() {
  Engine engine;
  engine.store->WriteEntity("svc", Context::Head(kWs), Named("service", "svc"));

  const auto cs    = engine.change_sets->New(kWs);
  const auto in_cs = Context::ForChangeSet(kWs, cs.id());
  engine.store->WriteEntity("svc", in_cs, [](v1::EntityBody& body) { body.set_name("renamed"); });
  engine.store->WriteEntity("new", in_cs, Named("application", "new"));

  const auto abandoned = engine.change_sets->Abandon(cs.id());
  assert(abandoned.status() == v1::CHANGE_SET_STATUS_ABANDONED);
  assert(RowCount(engine, model::TierKey::ChangeSet(cs.id())) == 0);

  const auto head = Context::Head(kWs);
  assert(engine.store->ResolveEntity("svc", head).body.name() == "svc");
  assert(Throws<util::NotFound>([&] { engine.store->ResolveEntity("new", head); }));
}

void TestClosingCancelsOpenSessions() {
  Engine engine;
  const auto cs      = engine.change_sets->New(kWs);
  const auto open    = engine.edit_sessions->New(cs.id());
  const auto saved   = engine.edit_sessions->New(cs.id());
  const auto in_open = Context::ForEditSession(kWs, cs.id(), open.id());

  engine.store->WriteEntity("draft", in_open, Named("application", "draft"));
  engine.edit_sessions->Save(saved.id());

  engine.change_sets->Apply(cs.id());

  assert(engine.edit_sessions->Get(open.id()).status() == v1::EDIT_SESSION_STATUS_CANCELED);
  assert(engine.edit_sessions->Get(saved.id()).status() == v1::EDIT_SESSION_STATUS_SAVED);
  assert(RowCount(engine, model::TierKey::EditSession(open.id())) == 0);
  // unsaved drafts never reach head
  assert(Throws<util::NotFound>([&] { engine.store->ResolveEntity("draft", Context::Head(kWs)); }));

  const auto other   = engine.change_sets->New(kWs);
  const auto session = engine.edit_sessions->New(other.id());
  engine.change_sets->Abandon(other.id());
  assert(engine.edit_sessions->Get(session.id()).status() == v1::EDIT_SESSION_STATUS_CANCELED);
}

void TestListsAndCounts() {
  Engine engine;
  const auto a = engine.change_sets->New(kWs, "a");
  const auto b = engine.change_sets->New(kWs, "b");
  const auto c = engine.change_sets->New(kWs, "c");
  engine.change_sets->New("elsewhere", "d");

  engine.change_sets->Apply(a.id());
  engine.change_sets->Abandon(b.id());

  const auto open = engine.change_sets->ListOpen(kWs);
  assert(open.size() == 1 && open[0].id() == c.id());

  const auto applied = engine.change_sets->ListApplied(kWs);
  assert(applied.size() == 1 && applied[0].id() == a.id());

  const auto counts = engine.change_sets->Counts(kWs);
  assert(counts.open() == 1);
  assert(counts.closed() == 2);

  const auto empty = engine.change_sets->Counts("nobody");
  assert(empty.open() == 0 && empty.closed() == 0);

  assert(engine.change_sets->Get(b.id()).status() == v1::CHANGE_SET_STATUS_ABANDONED);
  assert(Throws<util::NotFound>([&] { engine.change_sets->Get("missing"); }));
}

void TestListOpenIsNewestFirst() {
  Engine engine;
  std::set<std::string> ids;
  for (int i = 0; i < 3; ++i) {
    ids.insert(engine.change_sets->New(kWs).id());
  }

  const auto open = engine.change_sets->ListOpen(kWs);
  assert(open.size() == 3);
  for (std::size_t i = 1; i < open.size(); ++i) {
    const auto prev = open[i - 1].created_at();
    const auto cur  = open[i].created_at();
    assert(prev.seconds() > cur.seconds() || (prev.seconds() == cur.seconds() && prev.nanos() >= cur.nanos()));
  }
  for (const auto& change_set : open) {
    assert(ids.count(change_set.id()) == 1);
  }
}

void TestFailedApplyPromotesNothing() {
  Engine engine;
  const auto cs = engine.change_sets->New(kWs);
  engine.store->WriteEntity("a", Context::ForChangeSet(kWs, cs.id()), Named("application", "a"));

  // an aborted unit of work leaves both tiers as they were
  {
    auto uow = engine.store->BeginWrite();
    engine.change_sets->Apply(*uow, cs.id());
  }

  assert(engine.change_sets->Get(cs.id()).status() == v1::CHANGE_SET_STATUS_OPEN);
  assert(RowCount(engine, model::TierKey::ChangeSet(cs.id())) == 1);
  assert(RowCount(engine, model::TierKey::Head()) == 0);
}

} // namespace

int main() {
  TestNewDefaultsAndValidation();
  TestApplyPromotesEveryRowToHead();
  TestApplyAndAbandonAreOneShot();
  TestAbandonDiscardsRowsAndLeavesHead();
  TestClosingCancelsOpenSessions();
  TestListsAndCounts();
  TestListOpenIsNewestFirst();
  TestFailedApplyPromotesNothing();

  std::cout << "infragraph_unit_change_set: pass\n";
  return 0;
}
