#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "infragraph/v1.hpp"
#include "internal/core/unit_of_work.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/notify/change_notifier.hpp"

namespace infragraph::core {

/*
  Change set lifecycle: Open -> Applied | Abandoned.

  Apply promotes every change set row onto Head, cancels the sessions still
  open under it and marks it Applied, all in one transaction; nothing is
  promoted when any step fails. Abandon discards the rows instead. Closing a
  change set that another call closed meanwhile is util::Conflict; closing
  one that was already closed is util::InvalidState.
*/
class ChangeSetManager {
 public:
  ChangeSetManager(std::shared_ptr<db::Repository> repository, std::shared_ptr<notify::ChangeNotifier> notifier);

  // An empty name defaults to the creation timestamp (RFC 3339).
  v1::ChangeSet New(const std::string& workspace_id, const std::string& name = {});
  v1::ChangeSet New(UnitOfWork& uow, const std::string& workspace_id, const std::string& name = {});

  v1::ChangeSet Apply(const std::string& change_set_id);
  v1::ChangeSet Apply(UnitOfWork& uow, const std::string& change_set_id, std::size_t* promoted_rows = nullptr);

  v1::ChangeSet Abandon(const std::string& change_set_id);
  v1::ChangeSet Abandon(UnitOfWork& uow, const std::string& change_set_id);

  v1::ChangeSet Get(const std::string& change_set_id) const;

  // Newest first.
  std::vector<v1::ChangeSet> ListOpen(const std::string& workspace_id) const;
  std::vector<v1::ChangeSet> ListApplied(const std::string& workspace_id) const;

  // open, closed (applied + abandoned)
  v1::ChangeSetCounts Counts(const std::string& workspace_id) const;
  v1::ChangeSetCounts Counts(UnitOfWork& uow, const std::string& workspace_id) const;

 private:
  // Status in a fresh read snapshot; UNSPECIFIED for an unknown change set.
  v1::ChangeSetStatus StatusOf(const std::string& change_set_id) const;
  db::model::ChangeSetRecord LoadOpen(UnitOfWork& uow, const std::string& change_set_id) const;
  void Transition(UnitOfWork& uow, db::model::ChangeSetRecord& change_set, v1::ChangeSetStatus next) const;
  std::vector<v1::ChangeSet> List(std::string_view operation, const std::string& workspace_id, v1::ChangeSetStatus status) const;

  std::unique_ptr<UnitOfWork> BeginWrite() const;
  std::unique_ptr<UnitOfWork> BeginRead() const;

  std::shared_ptr<db::Repository>         repository_;
  std::shared_ptr<notify::ChangeNotifier> notifier_;
};

} // namespace infragraph::core
