#pragma once

#include <string>

#include "infragraph/v1.hpp"
#include "internal/db/model/change_set_record.hpp"
#include "internal/db/model/edit_session_record.hpp"
#include "internal/db/model/record_row.hpp"
#include "internal/notify/change_event.hpp"
#include "internal/util/errors.hpp"

namespace infragraph::core {

v1::ChangeSet   ToProto(const db::model::ChangeSetRecord& record);
v1::EditSession ToProto(const db::model::EditSessionRecord& record);

notify::EventKind EventKindOf(model::RecordKind kind);

// Event for a row written (or tombstoned) at row.tier.
notify::ChangeEvent RowWrittenEvent(const db::model::RecordRow& row);

// Event for a row removed from `tier` outright.
notify::ChangeEvent RowRemovedEvent(const db::model::RecordRow& row, const model::TierKey& tier);

notify::ChangeEvent LifecycleEvent(const db::model::ChangeSetRecord& record);
notify::ChangeEvent LifecycleEvent(const db::model::EditSessionRecord& record);

/*
  Runs a close (save, cancel, apply, abandon) in its own write transaction.
  `was_open` comes from a read snapshot taken before that transaction: a
  record that was open then and is no longer open inside it was closed by a
  concurrent call, which is a conflict rather than a repeated close.
*/
template <typename Fn>
auto CloseOrConflict(bool was_open, const std::string& subject, Fn&& close) -> decltype(close()) {
  try {
    return close();
  } catch (const util::InvalidState& e) {
    if (!was_open) throw;
    throw util::Conflict(subject + " was closed by a concurrent call: " + e.what());
  }
}

} // namespace infragraph::core
