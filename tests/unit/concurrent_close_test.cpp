#include <atomic>
#include <cassert>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"
#include "tests/test_support.hpp"

#if INFRAGRAPH_DB_SQLITE
#include "internal/db/sqlite/sqlite_pool.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

namespace {

using namespace infragraph;
using infragraph::testing::Engine;
using infragraph::testing::Named;
using infragraph::testing::Throws;
using model::Context;

const std::string kWs = "w";

/*
  Repository that lets a rival writer save the session right after the
  engine read it, so the engine's commit races a finished transaction.
*/
template <typename Base>
class RacingRepository final : public Base {
 public:
  template <typename... Args>
  explicit RacingRepository(Args&&... args) : Base(std::forward<Args>(args)...) {}

  void Arm(std::string edit_session_id) {
    target_ = std::move(edit_session_id);
  }

  std::optional<db::model::EditSessionRecord> GetEditSession(db::Transaction& tx, const std::string& id) override {
    auto session = Base::GetEditSession(tx, id);
    if (!target_.empty() && id == target_) {
      target_.clear();
      auto rival = this->Begin();
      auto moved = this->TransitionEditSession(*rival, id, v1::EDIT_SESSION_STATUS_OPEN, v1::EDIT_SESSION_STATUS_SAVED, util::NowMillis());
      assert(moved);
      rival->Commit();
    }
    return session;
  }

 private:
  std::string target_;
};

/*
  Repository that holds the first two readers of an armed session or change
  set until both have read it, so two closes of it always overlap.
*/
template <typename Base>
class RendezvousRepository final : public Base {
 public:
  template <typename... Args>
  explicit RendezvousRepository(Args&&... args) : Base(std::forward<Args>(args)...) {}

  void Arm(std::string edit_session_id) {
    std::scoped_lock lock(mutex_);
    target_  = std::move(edit_session_id);
    arrived_ = 0;
  }

  std::optional<db::model::EditSessionRecord> GetEditSession(db::Transaction& tx, const std::string& id) override {
    auto session = Base::GetEditSession(tx, id);
    Meet(id);
    return session;
  }

  std::optional<db::model::ChangeSetRecord> GetChangeSet(db::Transaction& tx, const std::string& id) override {
    auto change_set = Base::GetChangeSet(tx, id);
    Meet(id);
    return change_set;
  }

 private:
  void Meet(const std::string& id) {
    std::unique_lock lock(mutex_);
    if (id != target_ || arrived_ >= 2) return;
    if (++arrived_ == 2) {
      cv_.notify_all();
    } else {
      const bool met = cv_.wait_for(lock, std::chrono::seconds(10), [this] { return arrived_ >= 2; });
      assert(met);
    }
  }

  std::mutex              mutex_;
  std::condition_variable cv_;
  std::string             target_;
  int                     arrived_ = 0;
};

#if INFRAGRAPH_DB_SQLITE
// Database file removed on scope exit.
class SqliteFile {
 public:
  SqliteFile() : path_((std::filesystem::temp_directory_path() / ("infragraph_concurrent_close_" + util::NewId() + ".db")).string()) {}
  ~SqliteFile() {
    std::filesystem::remove(path_);
    std::filesystem::remove(path_ + "-wal");
    std::filesystem::remove(path_ + "-shm");
  }

  template <template <typename> class Wrapper>
  std::shared_ptr<Wrapper<db::sqlite::SqliteRepository>> Open() const {
    db::sqlite::SqliteOptions options;
    options.path     = path_;
    options.wal_mode = true;
    auto repo        = std::make_shared<Wrapper<db::sqlite::SqliteRepository>>(std::make_shared<db::sqlite::SqlitePool>(options));
    repo->BootstrapSchema();
    return repo;
  }

 private:
  std::string path_;
};
#endif

template <typename Repo>
void LosingSaveReportsConflict(const std::shared_ptr<Repo>& repository) {
  Engine engine(repository);

  const auto cs      = engine.change_sets->New(kWs);
  const auto session = engine.edit_sessions->New(cs.id());
  engine.store->WriteEntity("app", Context::ForEditSession(kWs, cs.id(), session.id()), Named("application", "app"));
  engine.events.clear();

  repository->Arm(session.id());
  assert(Throws<util::Conflict>([&] { engine.edit_sessions->Save(session.id()); }));

  // the rival's transition stands; the loser promoted nothing
  assert(engine.edit_sessions->Get(session.id()).status() == v1::EDIT_SESSION_STATUS_SAVED);
  assert(Throws<util::NotFound>([&] { engine.store->ResolveEntity("app", Context::ForChangeSet(kWs, cs.id())); }));
  assert(engine.events.empty());

  // a retry sees the settled state
  assert(Throws<util::InvalidState>([&] { engine.edit_sessions->Save(session.id()); }));
}

template <typename Repo>
void OverlappingSavesHaveOneWinner(const std::function<std::shared_ptr<Repo>()>& open, int rounds) {
  for (int round = 0; round < rounds; ++round) {
    auto   repository = open();
    Engine engine(repository);
    const auto cs      = engine.change_sets->New(kWs);
    const auto session = engine.edit_sessions->New(cs.id());
    engine.store->WriteEntity("app", Context::ForEditSession(kWs, cs.id(), session.id()), Named("application", "app"));
    repository->Arm(session.id());

    std::atomic<int>         saved{0};
    std::atomic<int>         conflicted{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 2; ++i) {
      threads.emplace_back([&] {
        try {
          engine.edit_sessions->Save(session.id());
          ++saved;
        } catch (const util::Conflict&) {
          ++conflicted;
        }
      });
    }
    for (auto& thread : threads) {
      thread.join();
    }

    assert(saved.load() == 1);
    assert(conflicted.load() == 1);
    assert(engine.edit_sessions->Get(session.id()).status() == v1::EDIT_SESSION_STATUS_SAVED);
    assert(engine.store->ResolveEntity("app", Context::ForChangeSet(kWs, cs.id())).audit.version == 1);
  }
}

template <typename Repo>
void OverlappingAppliesHaveOneWinner(const std::shared_ptr<Repo>& repository) {
  Engine engine(repository);
  const auto cs      = engine.change_sets->New(kWs);
  const auto session = engine.edit_sessions->New(cs.id());
  engine.store->WriteEntity("app", Context::ForEditSession(kWs, cs.id(), session.id()), Named("application", "app"));
  engine.edit_sessions->Save(session.id());
  repository->Arm(cs.id());

  std::atomic<int>         applied{0};
  std::atomic<int>         conflicted{0};
  std::vector<std::thread> threads;
  for (int i = 0; i < 2; ++i) {
    threads.emplace_back([&] {
      try {
        engine.change_sets->Apply(cs.id());
        ++applied;
      } catch (const util::Conflict&) {
        ++conflicted;
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  assert(applied.load() == 1);
  assert(conflicted.load() == 1);
  assert(engine.store->ResolveEntity("app", Context::Head(kWs)).audit.version == 1);

  // a later call is a plain repeat
  assert(Throws<util::InvalidState>([&] { engine.change_sets->Apply(cs.id()); }));
}

template <typename Repo>
void DistinctChangeSetsApplyIndependently(const std::shared_ptr<Repo>& repository) {
  Engine engine(repository);

  std::vector<std::string> ids;
  for (const std::string name : {"left", "right"}) {
    const auto cs = engine.change_sets->New(kWs, name);
    engine.store->WriteEntity(name, Context::ForChangeSet(kWs, cs.id()), Named("application", name));
    ids.push_back(cs.id());
  }

  std::atomic<int>         applied{0};
  std::vector<std::thread> threads;
  for (const auto& id : ids) {
    threads.emplace_back([&engine, &applied, id] {
      engine.change_sets->Apply(id);
      ++applied;
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  assert(applied.load() == 2);
  assert(engine.store->ListEntities(Context::Head(kWs)).size() == 2);
  assert(engine.change_sets->ListOpen(kWs).empty());
}

void TestMemory() {
  LosingSaveReportsConflict(std::make_shared<RacingRepository<db::memory::MemoryRepository>>());
  OverlappingSavesHaveOneWinner<RendezvousRepository<db::memory::MemoryRepository>>(
      [] { return std::make_shared<RendezvousRepository<db::memory::MemoryRepository>>(); }, 20);
  for (int round = 0; round < 20; ++round) {
    OverlappingAppliesHaveOneWinner(std::make_shared<RendezvousRepository<db::memory::MemoryRepository>>());
    DistinctChangeSetsApplyIndependently(std::make_shared<db::memory::MemoryRepository>());
  }
  std::cout << "concurrent save [memory]: pass\n";
}

#if INFRAGRAPH_DB_SQLITE
void TestSqlite() {
  {
    SqliteFile file;
    LosingSaveReportsConflict(file.Open<RacingRepository>());
  }
  for (int round = 0; round < 5; ++round) {
    SqliteFile file;
    OverlappingSavesHaveOneWinner<RendezvousRepository<db::sqlite::SqliteRepository>>(
        [&file] { return file.Open<RendezvousRepository>(); }, 1);
  }
  for (int round = 0; round < 5; ++round) {
    SqliteFile overlapping;
    OverlappingAppliesHaveOneWinner(overlapping.Open<RendezvousRepository>());
    SqliteFile distinct;
    DistinctChangeSetsApplyIndependently(distinct.Open<RendezvousRepository>());
  }
  std::cout << "concurrent save [sqlite]: pass\n";
}
#endif

} // namespace

int main() {
  TestMemory();
#if INFRAGRAPH_DB_SQLITE
  TestSqlite();
#endif

  std::cout << "infragraph_unit_concurrent_close: pass\n";
  return 0;
}
