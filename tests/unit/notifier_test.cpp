#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/core/unit_of_work.hpp"
#include "internal/notify/logging_notifier.hpp"
#include "internal/notify/notification_batch.hpp"
#include "internal/notify/notifier_hub.hpp"
#include "internal/util/errors.hpp"
#include "tests/test_support.hpp"

namespace {

using namespace infragraph;
using infragraph::testing::Engine;
using infragraph::testing::Named;
using infragraph::testing::Throws;
using model::Context;

notify::ChangeEvent Event(const std::string& object_id) {
  notify::ChangeEvent event;
  event.kind         = notify::EventKind::kEntity;
  event.object_id    = object_id;
  event.workspace_id = "w";
  event.payload_json = "{}";
  event.version      = 1;
  return event;
}

void TestHubFanOutAndUnsubscribe() {
  notify::NotifierHub      hub;
  std::vector<std::string> first;
  std::vector<std::string> second;

  const auto a = hub.Subscribe([&](const notify::ChangeEvent& event) { first.push_back(event.object_id); });
  const auto b = hub.Subscribe([&](const notify::ChangeEvent& event) { second.push_back(event.object_id); });
  assert(hub.SubscriberCount() == 2);

  hub.Publish(Event("x"));
  assert(first.size() == 1 && second.size() == 1);

  assert(hub.Unsubscribe(a));
  assert(!hub.Unsubscribe(a));
  hub.Publish(Event("y"));
  assert(first.size() == 1);
  assert(second.size() == 2 && second[1] == "y");

  assert(hub.Unsubscribe(b));
  assert(hub.SubscriberCount() == 0);
  hub.Publish(Event("z"));
}

void TestThrowingSinkIsIsolated() {
  notify::NotifierHub hub;
  int                 delivered = 0;

  hub.Subscribe([](const notify::ChangeEvent&) { throw std::runtime_error("consumer down"); });
  hub.Subscribe([&](const notify::ChangeEvent&) { ++delivered; });

  hub.Publish(Event("x"));
  assert(delivered == 1);
}

void TestBatchFlushAndDiscard() {
  auto                     hub = std::make_shared<notify::NotifierHub>();
  std::vector<std::string> seen;
  hub->Subscribe([&](const notify::ChangeEvent& event) { seen.push_back(event.object_id); });

  notify::NotificationBatch batch(hub);
  batch.Queue(Event("a"));
  batch.Queue(Event("b"));
  assert(batch.Size() == 2);
  assert(seen.empty());

  assert(batch.Flush() == 2);
  assert(batch.Size() == 0);
  assert((seen == std::vector<std::string>{"a", "b"}));

  batch.Queue(Event("c"));
  batch.Discard();
  assert(batch.Flush() == 0);
  assert(seen.size() == 2);

  // no notifier: events are dropped
  notify::NotificationBatch silent(nullptr);
  silent.Queue(Event("d"));
  assert(silent.Flush() == 0);
}

struct FailingNotifier final : notify::ChangeNotifier {
  void Publish(const notify::ChangeEvent&) override {
    throw std::runtime_error("broker unreachable");
  }
};

void TestFailingNotifierDoesNotUndoCommit() {
  auto                 repository = std::make_shared<db::memory::MemoryRepository>();
  auto                 notifier   = std::make_shared<FailingNotifier>();
  core::ChangeSetManager change_sets(repository, notifier);

  const auto cs = change_sets.New("w");
  assert(change_sets.Get(cs.id()).status() == v1::CHANGE_SET_STATUS_OPEN);

  notify::NotificationBatch batch(notifier);
  batch.Queue(Event("a"));
  assert(batch.Flush() == 0);
}

void TestEventsOnlyAfterCommit() {
  Engine engine;
  engine.events.clear();

  {
    auto uow = engine.store->BeginWrite();
    engine.store->Write<v1::EntityBody>(*uow, "a", Context::Head("w"), Named("application", "a"));
    engine.store->Write<v1::EntityBody>(*uow, "b", Context::Head("w"), Named("application", "b"));
    assert(engine.events.empty());
    uow->Commit();
  }
  assert(engine.events.size() == 2);
  assert(engine.events[0].object_id == "a");
  assert(engine.events[1].object_id == "b");

  // rolled back: nothing published
  {
    auto uow = engine.store->BeginWrite();
    engine.store->Write<v1::EntityBody>(*uow, "c", Context::Head("w"), Named("application", "c"));
  }
  assert(engine.events.size() == 2);
  assert(Throws<util::NotFound>([&] { engine.store->ResolveEntity("c", Context::Head("w")); }));
}

void TestReadOnlyUnitRejectsEvents() {
  Engine engine;
  auto   uow = engine.store->BeginRead();
  assert(uow->IsReadOnly());
  assert(Throws<std::logic_error>([&] { uow->Queue(Event("x")); }));
  uow->Commit();
}

void TestLoggingNotifierAcceptsEvents() {
  notify::LoggingNotifier logger;
  logger.Publish(Event("a"));

  auto tombstone         = Event("b");
  tombstone.deleted      = true;
  tombstone.payload_json = std::nullopt;
  tombstone.tier         = model::TierKey::ChangeSet("cs");
  logger.Publish(tombstone);
}

} // namespace

int main() {
  TestHubFanOutAndUnsubscribe();
  TestThrowingSinkIsIsolated();
  TestBatchFlushAndDiscard();
  TestFailingNotifierDoesNotUndoCommit();
  TestEventsOnlyAfterCommit();
  TestReadOnlyUnitRejectsEvents();
  TestLoggingNotifierAcceptsEvents();

  std::cout << "infragraph_unit_notifier: pass\n";
  return 0;
}
