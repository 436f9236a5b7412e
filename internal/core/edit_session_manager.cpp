#include "internal/core/edit_session_manager.hpp"

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

EditSessionManager::EditSessionManager(std::shared_ptr<db::Repository> repository, std::shared_ptr<notify::ChangeNotifier> notifier)
    : repository_(std::move(repository)), notifier_(std::move(notifier)) {
  if (!repository_) {
    throw std::invalid_argument("EditSessionManager requires a repository");
  }
}

std::unique_ptr<UnitOfWork> EditSessionManager::BeginWrite() const {
  return std::make_unique<UnitOfWork>(*repository_, notifier_);
}

v1::EditSessionStatus EditSessionManager::StatusOf(const std::string& edit_session_id) const {
  UnitOfWork uow(*repository_, notifier_, UnitOfWork::Mode::kReadOnly);
  const auto session = uow.Repository().GetEditSession(uow.Tx(), edit_session_id);
  uow.Commit();
  return session ? session->status : v1::EDIT_SESSION_STATUS_UNSPECIFIED;
}

db::model::EditSessionRecord EditSessionManager::LoadOpen(UnitOfWork& uow, const std::string& edit_session_id) const {
  auto session = uow.Repository().GetEditSession(uow.Tx(), edit_session_id);
  if (!session) {
    throw util::NotFound("edit session " + edit_session_id + " not found");
  }
  if (session->status != v1::EDIT_SESSION_STATUS_OPEN) {
    throw util::InvalidState("edit session " + edit_session_id + " is " + std::string(model::ToString(session->status)));
  }
  return *session;
}

void EditSessionManager::Transition(UnitOfWork& uow, db::model::EditSessionRecord& session, v1::EditSessionStatus next) const {
  const auto now = util::NowMillis();
  ThrowIfDbError(uow.Repository().TransitionEditSession(uow.Tx(), session.id, session.status, next, now),
                 "edit session " + session.id + " -> " + std::string(model::ToString(next)));
  session.status        = next;
  session.updated_at_ms = now;
  uow.Queue(LifecycleEvent(session));
}

// ------------------------------------------------------------------
// new
// ------------------------------------------------------------------

v1::EditSession EditSessionManager::New(UnitOfWork& uow, const std::string& change_set_id, const std::string& workspace_id, const std::string& name) {
  auto change_set = uow.Repository().GetChangeSet(uow.Tx(), change_set_id);
  if (!change_set) {
    throw util::NotFound("change set " + change_set_id + " not found");
  }
  if (change_set->status != v1::CHANGE_SET_STATUS_OPEN) {
    throw util::InvalidState("change set " + change_set_id + " is " + std::string(model::ToString(change_set->status)) +
                             "; sessions need an open change set");
  }
  if (!workspace_id.empty() && workspace_id != change_set->workspace_id) {
    throw util::InvalidArgument("change set " + change_set_id + " belongs to workspace " + change_set->workspace_id + ", not " + workspace_id);
  }

  const auto now = util::Now();

  db::model::EditSessionRecord session;
  session.id            = util::NewId();
  session.name          = name.empty() ? google::protobuf::util::TimeUtil::ToString(util::ToProto(now)) : name;
  session.change_set_id = change_set_id;
  session.workspace_id  = change_set->workspace_id;
  session.status        = v1::EDIT_SESSION_STATUS_OPEN;
  session.created_at_ms = util::ToUnixMillis(now);
  session.updated_at_ms = session.created_at_ms;

  ThrowIfDbError(uow.Repository().InsertEditSession(uow.Tx(), session), "insert edit session " + session.id);
  uow.Queue(LifecycleEvent(session));
  return ToProto(session);
}

v1::EditSession EditSessionManager::New(const std::string& change_set_id, const std::string& workspace_id, const std::string& name) {
  return Observed("EditSessionManager.New", change_set_id, [&] {
    auto uow     = BeginWrite();
    auto session = New(*uow, change_set_id, workspace_id, name);
    uow->Commit();

    INFRAGRAPH_LOG_INFO("edit session opened", {ScopeField(change_set_id, session.id())});
    return session;
  });
}

// ------------------------------------------------------------------
// save
// ------------------------------------------------------------------

v1::EditSession EditSessionManager::Save(UnitOfWork& uow, const std::string& edit_session_id, std::size_t* promoted_rows) {
  auto session = LoadOpen(uow, edit_session_id);

  auto change_set = uow.Repository().GetChangeSet(uow.Tx(), session.change_set_id);
  if (!change_set) {
    throw util::NotFound("change set " + session.change_set_id + " not found");
  }
  if (change_set->status != v1::CHANGE_SET_STATUS_OPEN) {
    throw util::InvalidState("change set " + change_set->id + " is " + std::string(model::ToString(change_set->status)));
  }

  const auto promoted = PromoteTier(uow, model::TierKey::EditSession(session.id), model::TierKey::ChangeSet(session.change_set_id));
  Transition(uow, session, v1::EDIT_SESSION_STATUS_SAVED);

  if (promoted_rows) {
    *promoted_rows = promoted;
  }
  return ToProto(session);
}

v1::EditSession EditSessionManager::Save(const std::string& edit_session_id) {
  return Observed("EditSessionManager.Save", edit_session_id, [&] {
    const bool  was_open = StatusOf(edit_session_id) == v1::EDIT_SESSION_STATUS_OPEN;
    std::size_t promoted = 0;
    auto        session  = CloseOrConflict(was_open, "edit session " + edit_session_id, [&] {
      auto uow   = BeginWrite();
      auto saved = Save(*uow, edit_session_id, &promoted);
      uow->Commit();
      return saved;
    });

    observability::Metrics::Instance().AddPromotedRows(model::ToString(model::TierKind::kChangeSet), promoted);
    INFRAGRAPH_LOG_INFO("edit session saved", {ScopeField(session.change_set_id(), session.id()),
                                               IntField("promoted_rows", static_cast<std::int64_t>(promoted))});
    return session;
  });
}

// ------------------------------------------------------------------
// cancel
// ------------------------------------------------------------------

v1::EditSession EditSessionManager::Cancel(UnitOfWork& uow, const std::string& edit_session_id) {
  auto session = LoadOpen(uow, edit_session_id);
  DiscardTier(uow, model::TierKey::EditSession(session.id));
  Transition(uow, session, v1::EDIT_SESSION_STATUS_CANCELED);
  return ToProto(session);
}

v1::EditSession EditSessionManager::Cancel(const std::string& edit_session_id) {
  return Observed("EditSessionManager.Cancel", edit_session_id, [&] {
    const bool was_open = StatusOf(edit_session_id) == v1::EDIT_SESSION_STATUS_OPEN;
    auto       session  = CloseOrConflict(was_open, "edit session " + edit_session_id, [&] {
      auto uow      = BeginWrite();
      auto canceled = Cancel(*uow, edit_session_id);
      uow->Commit();
      return canceled;
    });

    INFRAGRAPH_LOG_INFO("edit session canceled",
                        {ScopeField(session.change_set_id(), session.id())});
    return session;
  });
}

// ------------------------------------------------------------------
// queries
// ------------------------------------------------------------------

v1::EditSession EditSessionManager::Get(const std::string& edit_session_id) const {
  return Observed("EditSessionManager.Get", edit_session_id, [&] {
    UnitOfWork uow(*repository_, notifier_, UnitOfWork::Mode::kReadOnly);
    auto       session = uow.Repository().GetEditSession(uow.Tx(), edit_session_id);
    uow.Commit();
    if (!session) {
      throw util::NotFound("edit session " + edit_session_id + " not found");
    }
    return ToProto(*session);
  });
}

std::vector<v1::EditSession> EditSessionManager::ListOpen(const std::string& change_set_id) const {
  return Observed("EditSessionManager.ListOpen", change_set_id, [&] {
    UnitOfWork uow(*repository_, notifier_, UnitOfWork::Mode::kReadOnly);
    const auto sessions = uow.Repository().ListEditSessions(uow.Tx(), change_set_id, v1::EDIT_SESSION_STATUS_OPEN);
    uow.Commit();

    std::vector<v1::EditSession> out;
    out.reserve(sessions.size());
    for (const auto& session : sessions) {
      out.push_back(ToProto(session));
    }
    return out;
  });
}

} // namespace infragraph::core
