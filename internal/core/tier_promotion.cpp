#include "internal/core/tier_promotion.hpp"

#include "internal/core/db_errors.hpp"
#include "internal/core/lifecycle_records.hpp"

namespace infragraph::core {

std::size_t PromoteTier(UnitOfWork& uow, const model::TierKey& from, const model::TierKey& to) {
  auto&      repo = uow.Repository();
  auto&      tx   = uow.Tx();
  const auto rows = repo.ListRecordsByTier(tx, from);

  for (auto row : rows) {
    if (row.deleted && to.IsHead()) {
      ThrowIfDbError(repo.DeleteRecord(tx, row.record_kind, row.object_id, to), "promote tombstone " + row.object_id);
      uow.Queue(RowRemovedEvent(row, to));
      continue;
    }

    row.tier = to;
    ThrowIfDbError(repo.UpsertRecord(tx, row), "promote " + row.object_id);
    uow.Queue(RowWrittenEvent(row));
  }

  ThrowIfDbError(repo.DeleteRecordsByTier(tx, from), "clear " + model::ToString(from));
  return rows.size();
}

std::size_t DiscardTier(UnitOfWork& uow, const model::TierKey& tier) {
  auto&      repo = uow.Repository();
  auto&      tx   = uow.Tx();
  const auto rows = repo.ListRecordsByTier(tx, tier);

  ThrowIfDbError(repo.DeleteRecordsByTier(tx, tier), "discard " + model::ToString(tier));
  for (const auto& row : rows) {
    uow.Queue(RowRemovedEvent(row, tier));
  }
  return rows.size();
}

std::size_t CancelOpenSessions(UnitOfWork& uow, const std::string& change_set_id, std::uint64_t now_ms) {
  auto&      repo     = uow.Repository();
  auto&      tx       = uow.Tx();
  const auto sessions = repo.ListEditSessions(tx, change_set_id, v1::EDIT_SESSION_STATUS_OPEN);

  for (auto session : sessions) {
    DiscardTier(uow, model::TierKey::EditSession(session.id));
    ThrowIfDbError(repo.TransitionEditSession(tx, session.id, v1::EDIT_SESSION_STATUS_OPEN, v1::EDIT_SESSION_STATUS_CANCELED, now_ms),
                   "cancel edit session " + session.id);
    session.status        = v1::EDIT_SESSION_STATUS_CANCELED;
    session.updated_at_ms = now_ms;
    uow.Queue(LifecycleEvent(session));
  }
  return sessions.size();
}

} // namespace infragraph::core
