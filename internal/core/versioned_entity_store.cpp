#include "internal/core/versioned_entity_store.hpp"

#include <sstream>
#include <stdexcept>
#include <tuple>

#include <google/protobuf/util/message_differencer.h>

#include "internal/core/db_errors.hpp"
#include "internal/core/lifecycle_records.hpp"
#include "internal/model/record_traits.hpp"
#include "internal/model/state_machine.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/line_diff.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace infragraph::core {

namespace {

using db::model::RecordRow;

template <typename Body>
using Traits = model::RecordTraits<Body>;

template <typename Body>
std::string OperationName(std::string_view verb) {
  return "store." + std::string(verb) + "." + std::string(model::ToString(Traits<Body>::kRecordKind));
}

// First row of object_id along chain, tombstones included.
std::optional<RecordRow> FirstRow(UnitOfWork& uow, model::RecordKind kind, const std::string& object_id, const std::vector<model::TierKey>& chain) {
  for (const auto& tier : chain) {
    if (auto row = uow.Repository().GetRecord(uow.Tx(), kind, object_id, tier)) {
      return row;
    }
  }
  return std::nullopt;
}

template <typename Body>
model::VersionedRecord<Body> Decode(const RecordRow& row) {
  model::VersionedRecord<Body> record;
  record.object_id    = row.object_id;
  record.workspace_id = row.workspace_id;
  record.tier         = row.tier;
  model::DecodePayload(row.payload, &record.body);
  if (Traits<Body>::KindTag(record.body) != row.kind_tag) {
    throw util::SerializationError(std::string(model::ToString(row.record_kind)) + " " + row.object_id + " at " + model::ToString(row.tier) +
                                   ": payload kind '" + Traits<Body>::KindTag(record.body) + "' does not match declared kind '" + row.kind_tag +
                                   "'");
  }
  record.audit.version       = row.version;
  record.audit.created_at_ms = row.created_at_ms;
  record.audit.updated_at_ms = row.updated_at_ms;
  return record;
}

// One entry per difference reported by MessageDifferencer.
std::vector<std::string> ChangedFields(const google::protobuf::Message& before, const google::protobuf::Message& after) {
  std::string report;
  {
    // the report is flushed when the differencer goes away
    google::protobuf::util::MessageDifferencer differencer;
    differencer.ReportDifferencesToString(&report);
    differencer.Compare(before, after);
  }
  return util::SplitLines(report);
}

std::string JoinLines(const std::vector<std::string>& lines) {
  std::ostringstream out;
  for (std::size_t i = 0; i < lines.size(); ++i) {
    if (i > 0) out << '\n';
    out << lines[i];
  }
  return out.str();
}

} // namespace

VersionedEntityStore::VersionedEntityStore(std::shared_ptr<db::Repository> repository, std::shared_ptr<notify::ChangeNotifier> notifier)
    : repository_(std::move(repository)), notifier_(std::move(notifier)) {
  if (!repository_) {
    throw std::invalid_argument("VersionedEntityStore requires a repository");
  }
}

std::unique_ptr<UnitOfWork> VersionedEntityStore::BeginWrite() const {
  return std::make_unique<UnitOfWork>(*repository_, notifier_, UnitOfWork::Mode::kReadWrite);
}

std::unique_ptr<UnitOfWork> VersionedEntityStore::BeginRead() const {
  return std::make_unique<UnitOfWork>(*repository_, notifier_, UnitOfWork::Mode::kReadOnly);
}

std::vector<model::TierKey> VersionedEntityStore::ReadChain(UnitOfWork& uow, const model::Context& ctx) const {
  if (!ctx.edit_session_id) {
    return ctx.ResolutionChain();
  }

  auto session = uow.Repository().GetEditSession(uow.Tx(), *ctx.edit_session_id);
  if (!session) {
    throw util::NotFound("edit session " + *ctx.edit_session_id + " not found");
  }
  if (ctx.change_set_id && *ctx.change_set_id != session->change_set_id) {
    throw util::InvalidArgument("edit session " + session->id + " belongs to change set " + session->change_set_id + ", not " +
                                *ctx.change_set_id);
  }
  return {model::TierKey::EditSession(session->id), model::TierKey::ChangeSet(session->change_set_id), model::TierKey::Head()};
}

VersionedEntityStore::WriteTarget VersionedEntityStore::ResolveWriteTarget(UnitOfWork& uow, const model::Context& ctx) const {
  auto& repo = uow.Repository();
  auto& tx   = uow.Tx();

  std::optional<std::string> change_set_id = ctx.change_set_id;
  std::string                workspace_id;

  if (ctx.edit_session_id) {
    auto session = repo.GetEditSession(tx, *ctx.edit_session_id);
    if (!session) {
      throw util::NotFound("edit session " + *ctx.edit_session_id + " not found");
    }
    if (session->status != v1::EDIT_SESSION_STATUS_OPEN) {
      throw util::InvalidState("edit session " + session->id + " is " + std::string(model::ToString(session->status)) + "; writes need an open session");
    }
    if (change_set_id && *change_set_id != session->change_set_id) {
      throw util::InvalidArgument("edit session " + session->id + " belongs to change set " + session->change_set_id + ", not " + *change_set_id);
    }
    change_set_id = session->change_set_id;
    workspace_id  = session->workspace_id;
  }

  if (change_set_id) {
    auto change_set = repo.GetChangeSet(tx, *change_set_id);
    if (!change_set) {
      throw util::NotFound("change set " + *change_set_id + " not found");
    }
    if (change_set->status != v1::CHANGE_SET_STATUS_OPEN) {
      throw util::InvalidState("change set " + change_set->id + " is " + std::string(model::ToString(change_set->status)) +
                               "; writes need an open change set");
    }
    if (workspace_id.empty()) {
      workspace_id = change_set->workspace_id;
    }

    if (ctx.edit_session_id) {
      return {model::TierKey::EditSession(*ctx.edit_session_id), {model::TierKey::ChangeSet(*change_set_id), model::TierKey::Head()}, workspace_id};
    }
    return {model::TierKey::ChangeSet(*change_set_id), {model::TierKey::Head()}, workspace_id};
  }

  if (ctx.workspace_id.empty()) {
    throw util::InvalidArgument("head writes require a workspace_id");
  }
  return {model::TierKey::Head(), {}, ctx.workspace_id};
}

template <typename Body>
std::optional<model::VersionedRecord<Body>> VersionedEntityStore::FindVisible(UnitOfWork& uow, const std::string& object_id,
                                                                              const std::vector<model::TierKey>& chain) const {
  auto row = FirstRow(uow, Traits<Body>::kRecordKind, object_id, chain);
  if (!row || row->deleted) {
    return std::nullopt;
  }
  return Decode<Body>(*row);
}

// ------------------------------------------------------------------
// resolve
// ------------------------------------------------------------------

template <typename Body>
model::VersionedRecord<Body> VersionedEntityStore::Resolve(UnitOfWork& uow, const std::string& object_id, const model::Context& ctx) const {
  auto record = FindVisible<Body>(uow, object_id, ReadChain(uow, ctx));
  if (!record) {
    throw util::NotFound(std::string(model::ToString(Traits<Body>::kRecordKind)) + " " + object_id + " not found (" + model::Describe(ctx) + ")");
  }
  return std::move(*record);
}

template <typename Body>
model::VersionedRecord<Body> VersionedEntityStore::Resolve(const std::string& object_id, const model::Context& ctx) const {
  return Observed(OperationName<Body>("resolve"), object_id, [&] {
    auto uow    = BeginRead();
    auto record = Resolve<Body>(*uow, object_id, ctx);
    uow->Commit();
    return record;
  });
}

// ------------------------------------------------------------------
// write
// ------------------------------------------------------------------

template <typename Body>
model::VersionedRecord<Body> VersionedEntityStore::Write(UnitOfWork& uow, const std::string& object_id, const model::Context& ctx,
                                                         const Mutation<Body>& mutate) {
  constexpr auto kind = Traits<Body>::kRecordKind;

  const auto target = ResolveWriteTarget(uow, ctx);
  const auto id     = object_id.empty() ? util::NewId() : object_id;
  const auto now    = util::NowMillis();
  auto&      repo   = uow.Repository();
  auto&      tx     = uow.Tx();

  Body                       body;
  std::optional<std::string> base_kind;
  std::uint64_t              base_version = 0;
  std::uint64_t              created_at   = now;

  // in place when the draft exists, otherwise clone the visible ancestor
  auto base = repo.GetRecord(tx, kind, id, target.tier);
  if (!base) {
    base = FirstRow(uow, kind, id, target.ancestors);
  }
  if (base) {
    base_version = base->version;
    if (!base->deleted) {
      body       = Decode<Body>(*base).body;
      base_kind  = base->kind_tag;
      created_at = base->created_at_ms;
    }
  }

  if (mutate) {
    mutate(body);
  }
  Traits<Body>::Validate(body);
  if (base_kind && Traits<Body>::KindTag(body) != *base_kind) {
    throw util::InvalidArgument(std::string(model::ToString(kind)) + " " + id + " cannot change kind from '" + *base_kind + "' to '" +
                                Traits<Body>::KindTag(body) + "'");
  }

  RecordRow row;
  row.record_kind  = kind;
  row.object_id    = id;
  row.tier         = target.tier;
  row.workspace_id = target.workspace_id;
  row.kind_tag     = Traits<Body>::KindTag(body);
  std::tie(row.tail_object_id, row.head_object_id) = Traits<Body>::Endpoints(body);
  row.payload       = model::EncodePayload(body);
  row.deleted       = false;
  row.version       = base_version + 1;
  row.created_at_ms = created_at;
  row.updated_at_ms = now;

  ThrowIfDbError(repo.UpsertRecord(tx, row), "write " + std::string(model::ToString(kind)) + " " + id);
  uow.Queue(RowWrittenEvent(row));

  model::VersionedRecord<Body> record;
  record.object_id           = id;
  record.workspace_id        = row.workspace_id;
  record.tier                = row.tier;
  record.body                = std::move(body);
  record.audit.version       = row.version;
  record.audit.created_at_ms = row.created_at_ms;
  record.audit.updated_at_ms = row.updated_at_ms;
  return record;
}

template <typename Body>
model::VersionedRecord<Body> VersionedEntityStore::Write(const std::string& object_id, const model::Context& ctx, const Mutation<Body>& mutate) {
  return Observed(OperationName<Body>("write"), object_id, [&] {
    auto uow    = BeginWrite();
    auto record = Write<Body>(*uow, object_id, ctx, mutate);
    uow->Commit();
    return record;
  });
}

// ------------------------------------------------------------------
// remove
// ------------------------------------------------------------------

template <typename Body>
void VersionedEntityStore::Remove(UnitOfWork& uow, const std::string& object_id, const model::Context& ctx) {
  constexpr auto kind = Traits<Body>::kRecordKind;

  const auto target = ResolveWriteTarget(uow, ctx);
  auto&      repo   = uow.Repository();
  auto&      tx     = uow.Tx();

  auto chain = target.ancestors;
  chain.insert(chain.begin(), target.tier);
  auto visible = FirstRow(uow, kind, object_id, chain);
  if (!visible || visible->deleted) {
    throw util::NotFound(std::string(model::ToString(kind)) + " " + object_id + " not found (" + model::Describe(ctx) + ")");
  }

  // a live row below the target still shows through unless shadowed
  auto below = FirstRow(uow, kind, object_id, target.ancestors);
  if (below && !below->deleted) {
    auto tombstone          = *visible;
    tombstone.tier          = target.tier;
    tombstone.workspace_id  = target.workspace_id;
    tombstone.deleted       = true;
    tombstone.version       = visible->version + 1;
    tombstone.updated_at_ms = util::NowMillis();
    ThrowIfDbError(repo.UpsertRecord(tx, tombstone), "tombstone " + object_id);
    uow.Queue(RowWrittenEvent(tombstone));
    return;
  }

  ThrowIfDbError(repo.DeleteRecord(tx, kind, object_id, target.tier), "delete " + object_id);
  uow.Queue(RowRemovedEvent(*visible, target.tier));
}

template <typename Body>
void VersionedEntityStore::Remove(const std::string& object_id, const model::Context& ctx) {
  Observed(OperationName<Body>("remove"), object_id, [&] {
    auto uow = BeginWrite();
    Remove<Body>(*uow, object_id, ctx);
    uow->Commit();
  });
}

// ------------------------------------------------------------------
// list
// ------------------------------------------------------------------

template <typename Body>
std::vector<model::VersionedRecord<Body>> VersionedEntityStore::List(UnitOfWork& uow, const model::Context& ctx, const std::string& kind_tag) const {
  const auto chain = ReadChain(uow, ctx);
  const auto ids   = uow.Repository().ListObjectIds(uow.Tx(), Traits<Body>::kRecordKind, kind_tag, chain);

  std::vector<model::VersionedRecord<Body>> out;
  out.reserve(ids.size());
  for (const auto& id : ids) {
    auto record = FindVisible<Body>(uow, id, chain);
    if (!record) {
      continue;
    }
    if (!kind_tag.empty() && record->Kind() != kind_tag) {
      continue;
    }
    out.push_back(std::move(*record));
  }
  return out;
}

template <typename Body>
std::vector<model::VersionedRecord<Body>> VersionedEntityStore::List(const model::Context& ctx, const std::string& kind_tag) const {
  return Observed(OperationName<Body>("list"), kind_tag, [&] {
    auto uow     = BeginRead();
    auto records = List<Body>(*uow, ctx, kind_tag);
    uow->Commit();
    return records;
  });
}

// ------------------------------------------------------------------
// diff
// ------------------------------------------------------------------

template <typename Body>
v1::RecordDiff VersionedEntityStore::Diff(UnitOfWork& uow, const std::string& object_id, const model::Context& ctx) const {
  constexpr auto kind = Traits<Body>::kRecordKind;

  if (!ctx.change_set_id && !ctx.edit_session_id) {
    throw util::InvalidArgument("diff of " + std::string(model::ToString(kind)) + " " + object_id + " needs a change set or edit session context");
  }

  const auto chain   = ReadChain(uow, ctx);
  const auto current = FindVisible<Body>(uow, object_id, chain);
  const auto head    = FindVisible<Body>(uow, object_id, {model::TierKey::Head()});
  if (!current && !head && !FirstRow(uow, kind, object_id, chain)) {
    throw util::NotFound(std::string(model::ToString(kind)) + " " + object_id + " not found (" + model::Describe(ctx) + ")");
  }

  v1::RecordDiff diff;
  diff.set_object_id(object_id);
  diff.set_current_json(current ? model::EncodePrettyPayload(current->body) : "{}");
  if (head) {
    diff.set_head_json(model::EncodePrettyPayload(head->body));
    diff.set_diff(JoinLines(util::LineDiff(diff.head_json(), diff.current_json())));
  }

  if (current && head) {
    for (auto& line : ChangedFields(head->body, current->body)) {
      diff.add_changed_fields(std::move(line));
    }
    diff.set_changed(diff.changed_fields_size() > 0);
  } else {
    diff.set_changed(current.has_value() || head.has_value());
  }
  return diff;
}

template <typename Body>
v1::RecordDiff VersionedEntityStore::Diff(const std::string& object_id, const model::Context& ctx) const {
  return Observed(OperationName<Body>("diff"), object_id, [&] {
    auto uow  = BeginRead();
    auto diff = Diff<Body>(*uow, object_id, ctx);
    uow->Commit();
    return diff;
  });
}

// ------------------------------------------------------------------
// instantiations
// ------------------------------------------------------------------

#define INFRAGRAPH_INSTANTIATE_STORE(Body)                                                                                                            \
  template model::VersionedRecord<Body> VersionedEntityStore::Resolve<Body>(const std::string&, const model::Context&) const;                       \
  template model::VersionedRecord<Body> VersionedEntityStore::Resolve<Body>(UnitOfWork&, const std::string&, const model::Context&) const;          \
  template model::VersionedRecord<Body> VersionedEntityStore::Write<Body>(const std::string&, const model::Context&, const Mutation<Body>&);         \
  template model::VersionedRecord<Body> VersionedEntityStore::Write<Body>(UnitOfWork&, const std::string&, const model::Context&,                   \
                                                                          const Mutation<Body>&);                                                   \
  template void VersionedEntityStore::Remove<Body>(const std::string&, const model::Context&);                                                     \
  template void VersionedEntityStore::Remove<Body>(UnitOfWork&, const std::string&, const model::Context&);                                        \
  template std::vector<model::VersionedRecord<Body>> VersionedEntityStore::List<Body>(const model::Context&, const std::string&) const;            \
  template std::vector<model::VersionedRecord<Body>> VersionedEntityStore::List<Body>(UnitOfWork&, const model::Context&, const std::string&) const; \
  template v1::RecordDiff VersionedEntityStore::Diff<Body>(const std::string&, const model::Context&) const;                                       \
  template v1::RecordDiff VersionedEntityStore::Diff<Body>(UnitOfWork&, const std::string&, const model::Context&) const;

INFRAGRAPH_INSTANTIATE_STORE(v1::EntityBody)
INFRAGRAPH_INSTANTIATE_STORE(v1::NodeBody)
INFRAGRAPH_INSTANTIATE_STORE(v1::EdgeBody)

#undef INFRAGRAPH_INSTANTIATE_STORE

} // namespace infragraph::core
