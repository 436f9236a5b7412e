#include "internal/core/lifecycle_records.hpp"

#include <google/protobuf/util/json_util.h>

#include "internal/util/time.hpp"

namespace infragraph::core {

namespace {

std::optional<std::string> ToJson(const google::protobuf::Message& message) {
  std::string json;
  if (!google::protobuf::util::MessageToJsonString(message, &json).ok()) {
    return std::nullopt;
  }
  return json;
}

} // namespace

v1::ChangeSet ToProto(const db::model::ChangeSetRecord& record) {
  v1::ChangeSet out;
  out.set_id(record.id);
  out.set_name(record.name);
  out.set_workspace_id(record.workspace_id);
  out.set_status(record.status);
  *out.mutable_created_at() = util::MillisToProto(record.created_at_ms);
  *out.mutable_updated_at() = util::MillisToProto(record.updated_at_ms);
  return out;
}

v1::EditSession ToProto(const db::model::EditSessionRecord& record) {
  v1::EditSession out;
  out.set_id(record.id);
  out.set_name(record.name);
  out.set_change_set_id(record.change_set_id);
  out.set_workspace_id(record.workspace_id);
  out.set_status(record.status);
  *out.mutable_created_at() = util::MillisToProto(record.created_at_ms);
  *out.mutable_updated_at() = util::MillisToProto(record.updated_at_ms);
  return out;
}

notify::EventKind EventKindOf(model::RecordKind kind) {
  switch (kind) {
    case model::RecordKind::kNode:
      return notify::EventKind::kNode;
    case model::RecordKind::kEdge:
      return notify::EventKind::kEdge;
    case model::RecordKind::kEntity:
    default:
      return notify::EventKind::kEntity;
  }
}

notify::ChangeEvent RowWrittenEvent(const db::model::RecordRow& row) {
  notify::ChangeEvent event;
  event.kind         = EventKindOf(row.record_kind);
  event.object_id    = row.object_id;
  event.workspace_id = row.workspace_id;
  event.tier         = row.tier;
  event.deleted      = row.deleted;
  event.version      = row.version;
  if (!row.deleted) {
    event.payload_json = row.payload;
  }
  return event;
}

notify::ChangeEvent RowRemovedEvent(const db::model::RecordRow& row, const model::TierKey& tier) {
  notify::ChangeEvent event;
  event.kind         = EventKindOf(row.record_kind);
  event.object_id    = row.object_id;
  event.workspace_id = row.workspace_id;
  event.tier         = tier;
  event.deleted      = true;
  event.version      = row.version;
  return event;
}

notify::ChangeEvent LifecycleEvent(const db::model::ChangeSetRecord& record) {
  notify::ChangeEvent event;
  event.kind         = notify::EventKind::kChangeSet;
  event.object_id    = record.id;
  event.workspace_id = record.workspace_id;
  event.tier         = model::TierKey::ChangeSet(record.id);
  event.payload_json = ToJson(ToProto(record));
  return event;
}

notify::ChangeEvent LifecycleEvent(const db::model::EditSessionRecord& record) {
  notify::ChangeEvent event;
  event.kind         = notify::EventKind::kEditSession;
  event.object_id    = record.id;
  event.workspace_id = record.workspace_id;
  event.tier         = model::TierKey::EditSession(record.id);
  event.payload_json = ToJson(ToProto(record));
  return event;
}

} // namespace infragraph::core
