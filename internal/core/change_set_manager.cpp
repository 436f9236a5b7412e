#include "internal/core/change_set_manager.hpp"

#include <stdexcept>

#include <google/protobuf/util/time_util.h>

#include "internal/core/db_errors.hpp"
#include "internal/core/lifecycle_records.hpp"
#include "internal/core/tier_promotion.hpp"
#include "internal/model/state_machine.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace infragraph::core {

using observability::IntField;
using observability::ScopeField;
using observability::StringField;

ChangeSetManager::ChangeSetManager(std::shared_ptr<db::Repository> repository, std::shared_ptr<notify::ChangeNotifier> notifier)
    : repository_(std::move(repository)), notifier_(std::move(notifier)) {
  if (!repository_) {
    throw std::invalid_argument("ChangeSetManager requires a repository");
  }
}

std::unique_ptr<UnitOfWork> ChangeSetManager::BeginWrite() const {
  return std::make_unique<UnitOfWork>(*repository_, notifier_);
}

std::unique_ptr<UnitOfWork> ChangeSetManager::BeginRead() const {
  return std::make_unique<UnitOfWork>(*repository_, notifier_, UnitOfWork::Mode::kReadOnly);
}

v1::ChangeSetStatus ChangeSetManager::StatusOf(const std::string& change_set_id) const {
  auto       uow        = BeginRead();
  const auto change_set = uow->Repository().GetChangeSet(uow->Tx(), change_set_id);
  uow->Commit();
  return change_set ? change_set->status : v1::CHANGE_SET_STATUS_UNSPECIFIED;
}

db::model::ChangeSetRecord ChangeSetManager::LoadOpen(UnitOfWork& uow, const std::string& change_set_id) const {
  auto change_set = uow.Repository().GetChangeSet(uow.Tx(), change_set_id);
  if (!change_set) {
    throw util::NotFound("change set " + change_set_id + " not found");
  }
  if (change_set->status != v1::CHANGE_SET_STATUS_OPEN) {
    throw util::InvalidState("change set " + change_set_id + " is " + std::string(model::ToString(change_set->status)));
  }
  return *change_set;
}

void ChangeSetManager::Transition(UnitOfWork& uow, db::model::ChangeSetRecord& change_set, v1::ChangeSetStatus next) const {
  const auto now = util::NowMillis();
  ThrowIfDbError(uow.Repository().TransitionChangeSet(uow.Tx(), change_set.id, change_set.status, next, now),
                 "change set " + change_set.id + " -> " + std::string(model::ToString(next)));
  change_set.status        = next;
  change_set.updated_at_ms = now;
  uow.Queue(LifecycleEvent(change_set));
}

// ------------------------------------------------------------------
// new
// ------------------------------------------------------------------

v1::ChangeSet ChangeSetManager::New(UnitOfWork& uow, const std::string& workspace_id, const std::string& name) {
  if (workspace_id.empty()) {
    throw util::InvalidArgument("change set requires a workspace_id");
  }

  const auto now = util::Now();

  db::model::ChangeSetRecord change_set;
  change_set.id            = util::NewId();
  change_set.name          = name.empty() ? google::protobuf::util::TimeUtil::ToString(util::ToProto(now)) : name;
  change_set.workspace_id  = workspace_id;
  change_set.status        = v1::CHANGE_SET_STATUS_OPEN;
  change_set.created_at_ms = util::ToUnixMillis(now);
  change_set.updated_at_ms = change_set.created_at_ms;

  ThrowIfDbError(uow.Repository().InsertChangeSet(uow.Tx(), change_set), "insert change set " + change_set.id);
  uow.Queue(LifecycleEvent(change_set));
  return ToProto(change_set);
}

v1::ChangeSet ChangeSetManager::New(const std::string& workspace_id, const std::string& name) {
  return Observed("ChangeSetManager.New", workspace_id, [&] {
    auto uow        = BeginWrite();
    auto change_set = New(*uow, workspace_id, name);
    uow->Commit();

    INFRAGRAPH_LOG_INFO("change set opened", {ScopeField(change_set.id()), StringField("workspace_id", workspace_id)});
    return change_set;
  });
}

// ------------------------------------------------------------------
// apply
// ------------------------------------------------------------------

v1::ChangeSet ChangeSetManager::Apply(UnitOfWork& uow, const std::string& change_set_id, std::size_t* promoted_rows) {
  auto change_set = LoadOpen(uow, change_set_id);

  const auto promoted = PromoteTier(uow, model::TierKey::ChangeSet(change_set.id), model::TierKey::Head());
  CancelOpenSessions(uow, change_set.id, util::NowMillis());
  Transition(uow, change_set, v1::CHANGE_SET_STATUS_APPLIED);

  if (promoted_rows) {
    *promoted_rows = promoted;
  }
  return ToProto(change_set);
}

v1::ChangeSet ChangeSetManager::Apply(const std::string& change_set_id) {
  return Observed("ChangeSetManager.Apply", change_set_id, [&] {
    const bool  was_open   = StatusOf(change_set_id) == v1::CHANGE_SET_STATUS_OPEN;
    std::size_t promoted   = 0;
    auto        change_set = CloseOrConflict(was_open, "change set " + change_set_id, [&] {
      auto uow     = BeginWrite();
      auto applied = Apply(*uow, change_set_id, &promoted);
      uow->Commit();
      return applied;
    });

    observability::Metrics::Instance().AddPromotedRows(model::ToString(model::TierKind::kHead), promoted);
    INFRAGRAPH_LOG_INFO("change set applied", {ScopeField(change_set.id()), StringField("workspace_id", change_set.workspace_id()),
                                               IntField("promoted_rows", static_cast<std::int64_t>(promoted))});
    return change_set;
  });
}

// ------------------------------------------------------------------
// abandon
// ------------------------------------------------------------------

v1::ChangeSet ChangeSetManager::Abandon(UnitOfWork& uow, const std::string& change_set_id) {
  auto change_set = LoadOpen(uow, change_set_id);

  DiscardTier(uow, model::TierKey::ChangeSet(change_set.id));
  CancelOpenSessions(uow, change_set.id, util::NowMillis());
  Transition(uow, change_set, v1::CHANGE_SET_STATUS_ABANDONED);
  return ToProto(change_set);
}

v1::ChangeSet ChangeSetManager::Abandon(const std::string& change_set_id) {
  return Observed("ChangeSetManager.Abandon", change_set_id, [&] {
    const bool was_open   = StatusOf(change_set_id) == v1::CHANGE_SET_STATUS_OPEN;
    auto       change_set = CloseOrConflict(was_open, "change set " + change_set_id, [&] {
      auto uow       = BeginWrite();
      auto abandoned = Abandon(*uow, change_set_id);
      uow->Commit();
      return abandoned;
    });

    INFRAGRAPH_LOG_INFO("change set abandoned", {ScopeField(change_set.id()), StringField("workspace_id", change_set.workspace_id())});
    return change_set;
  });
}

// ------------------------------------------------------------------
// queries
// ------------------------------------------------------------------

v1::ChangeSet ChangeSetManager::Get(const std::string& change_set_id) const {
  return Observed("ChangeSetManager.Get", change_set_id, [&] {
    auto uow        = BeginRead();
    auto change_set = uow->Repository().GetChangeSet(uow->Tx(), change_set_id);
    uow->Commit();
    if (!change_set) {
      throw util::NotFound("change set " + change_set_id + " not found");
    }
    return ToProto(*change_set);
  });
}

std::vector<v1::ChangeSet> ChangeSetManager::List(std::string_view operation, const std::string& workspace_id, v1::ChangeSetStatus status) const {
  return Observed(operation, workspace_id, [&] {
    auto       uow         = BeginRead();
    const auto change_sets = uow->Repository().ListChangeSets(uow->Tx(), workspace_id, status);
    uow->Commit();

    std::vector<v1::ChangeSet> out;
    out.reserve(change_sets.size());
    for (const auto& change_set : change_sets) {
      out.push_back(ToProto(change_set));
    }
    return out;
  });
}

std::vector<v1::ChangeSet> ChangeSetManager::ListOpen(const std::string& workspace_id) const {
  return List("ChangeSetManager.ListOpen", workspace_id, v1::CHANGE_SET_STATUS_OPEN);
}

std::vector<v1::ChangeSet> ChangeSetManager::ListApplied(const std::string& workspace_id) const {
  return List("ChangeSetManager.ListApplied", workspace_id, v1::CHANGE_SET_STATUS_APPLIED);
}

v1::ChangeSetCounts ChangeSetManager::Counts(UnitOfWork& uow, const std::string& workspace_id) const {
  v1::ChangeSetCounts counts;
  for (const auto& change_set : uow.Repository().ListChangeSets(uow.Tx(), workspace_id, std::nullopt)) {
    if (change_set.status == v1::CHANGE_SET_STATUS_OPEN) {
      counts.set_open(counts.open() + 1);
    } else if (model::IsTerminal(change_set.status)) {
      counts.set_closed(counts.closed() + 1);
    }
  }
  return counts;
}

v1::ChangeSetCounts ChangeSetManager::Counts(const std::string& workspace_id) const {
  return Observed("ChangeSetManager.Counts", workspace_id, [&] {
    auto uow    = BeginRead();
    auto counts = Counts(*uow, workspace_id);
    uow->Commit();
    return counts;
  });
}

} // namespace infragraph::core
