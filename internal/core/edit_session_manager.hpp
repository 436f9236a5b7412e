#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "infragraph/v1.hpp"
#include "internal/core/unit_of_work.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/notify/change_notifier.hpp"

namespace infragraph::core {

/*
  Edit session lifecycle: Open -> Saved | Canceled.

  Save promotes every draft row of the session onto its change set tier and
  Cancel drops them; both run as one transaction and fail with
  util::InvalidState unless the session is Open when the call starts. A
  session closed by a concurrent call while this one runs surfaces as
  util::Conflict.
*/
class EditSessionManager {
 public:
  EditSessionManager(std::shared_ptr<db::Repository> repository, std::shared_ptr<notify::ChangeNotifier> notifier);

  // An empty workspace_id inherits the change set's workspace.
  v1::EditSession New(const std::string& change_set_id, const std::string& workspace_id = {}, const std::string& name = {});
  v1::EditSession New(UnitOfWork& uow, const std::string& change_set_id, const std::string& workspace_id = {}, const std::string& name = {});

  v1::EditSession Save(const std::string& edit_session_id);
  // promoted_rows, when given, receives the number of draft rows moved.
  v1::EditSession Save(UnitOfWork& uow, const std::string& edit_session_id, std::size_t* promoted_rows = nullptr);

  v1::EditSession Cancel(const std::string& edit_session_id);
  v1::EditSession Cancel(UnitOfWork& uow, const std::string& edit_session_id);

  v1::EditSession Get(const std::string& edit_session_id) const;

  // Oldest first.
  std::vector<v1::EditSession> ListOpen(const std::string& change_set_id) const;

 private:
  // Status in a fresh read snapshot; UNSPECIFIED for an unknown session.
  v1::EditSessionStatus StatusOf(const std::string& edit_session_id) const;
  db::model::EditSessionRecord LoadOpen(UnitOfWork& uow, const std::string& edit_session_id) const;
  void Transition(UnitOfWork& uow, db::model::EditSessionRecord& session, v1::EditSessionStatus next) const;

  std::unique_ptr<UnitOfWork> BeginWrite() const;

  std::shared_ptr<db::Repository>         repository_;
  std::shared_ptr<notify::ChangeNotifier> notifier_;
};

} // namespace infragraph::core
