#include "application_service.hpp"

#include <stdexcept>

#include "internal/core/change_set_manager.hpp"
#include "internal/core/db_errors.hpp"
#include "internal/core/edit_session_manager.hpp"
#include "internal/core/graph_traversal.hpp"
#include "internal/core/versioned_entity_store.hpp"
#include "internal/model/record_traits.hpp"
#include "internal/observability/logging.hpp"

namespace infragraph::service {

using observability::StringField;

namespace {

constexpr const char* kProductionSystem = "production";

v1::LabelListItem Label(const std::string& label, const std::string& value) {
  v1::LabelListItem item;
  item.set_label(label);
  item.set_value(value);
  return item;
}

std::vector<model::Entity> WorkspaceEntities(core::VersionedEntityStore& store, core::UnitOfWork& uow, const std::string& workspace_id,
                                             std::string_view entity_type) {
  std::vector<model::Entity> out;
  for (auto& entity : store.List<v1::EntityBody>(uow, model::Context::Head(workspace_id), std::string(entity_type))) {
    if (entity.workspace_id == workspace_id) {
      out.push_back(std::move(entity));
    }
  }
  return out;
}

} // namespace

ApplicationService::ApplicationService(ServiceContext ctx) : ctx_(ctx), nodes_(std::move(ctx)) {
  if (!ctx_.change_sets || !ctx_.edit_sessions) {
    throw std::invalid_argument("ApplicationService requires change set and edit session managers");
  }
}

// ------------------------------------------------------------------
// Create
// ------------------------------------------------------------------

v1::ApplicationListEntry ApplicationService::Create(const std::string& workspace_id, const std::string& name) {
  return core::Observed("ApplicationService.Create", name, [&] {
    auto uow = ctx_.store->BeginWrite();

    const auto change_set   = ctx_.change_sets->New(*uow, workspace_id);
    const auto edit_session = ctx_.edit_sessions->New(*uow, change_set.id(), workspace_id);
    const auto session_ctx  = model::Context::ForEditSession(workspace_id, change_set.id(), edit_session.id());

    const auto created = nodes_.CreateNode(*uow, session_ctx, std::string(model::kApplicationType), name);
    ctx_.edit_sessions->Save(*uow, edit_session.id());
    ctx_.change_sets->Apply(*uow, change_set.id());

    v1::ApplicationListEntry entry;
    entry.set_application_id(created.entity.object_id);
    *entry.mutable_application() = created.entity.body;

    const auto head = model::Context::Head(workspace_id);
    for (const auto& system : WorkspaceEntities(*ctx_.store, *uow, workspace_id, model::kSystemType)) {
      if (system.body.name() != kProductionSystem) {
        continue;
      }
      nodes_.Connect(*uow, head, std::string(model::kIncludesEdge), system.object_id, created.entity.object_id);
      entry.add_system_ids(system.object_id);
      break;
    }

    *entry.mutable_change_set_counts() = ctx_.change_sets->Counts(*uow, workspace_id);
    uow->Commit();

    INFRAGRAPH_LOG_INFO("application created", {StringField("application_id", entry.application_id()), StringField("workspace_id", workspace_id),
                                                StringField("change_set_id", change_set.id())});
    return entry;
  });
}

// ------------------------------------------------------------------
// Queries
// ------------------------------------------------------------------

std::vector<v1::ApplicationListEntry> ApplicationService::List(const std::string& workspace_id) {
  return core::Observed("ApplicationService.List", workspace_id, [&] {
    auto uow = ctx_.store->BeginRead();

    const auto counts = ctx_.change_sets->Counts(*uow, workspace_id);

    std::vector<v1::ApplicationListEntry> out;
    for (const auto& application : WorkspaceEntities(*ctx_.store, *uow, workspace_id, model::kApplicationType)) {
      v1::ApplicationListEntry entry;
      entry.set_application_id(application.object_id);
      *entry.mutable_application()       = application.body;
      *entry.mutable_change_set_counts() = counts;
      for (const auto& edge : ctx_.traversal->Predecessors(*uow, std::string(model::kIncludesEdge), application.object_id, model::Context::Head(workspace_id))) {
        entry.add_system_ids(edge.body.tail_vertex().object_id());
      }
      out.push_back(std::move(entry));
    }
    uow->Commit();
    return out;
  });
}

v1::ApplicationContext ApplicationService::Context(const std::string& application_id, const std::string& workspace_id) {
  return core::Observed("ApplicationService.Context", application_id, [&] {
    v1::ApplicationContext out;
    {
      auto       uow         = ctx_.store->BeginRead();
      const auto application = ctx_.store->Resolve<v1::EntityBody>(*uow, application_id, model::Context::Head(workspace_id));
      out.set_application_name(application.body.name());
      for (const auto& system : WorkspaceEntities(*ctx_.store, *uow, workspace_id, model::kSystemType)) {
        *out.add_systems() = Label(system.body.name(), system.object_id);
      }
      uow->Commit();
    }

    for (const auto& change_set : ctx_.change_sets->ListOpen(workspace_id)) {
      *out.add_open_change_sets() = Label(change_set.name(), change_set.id());
    }
    for (const auto& change_set : ctx_.change_sets->ListApplied(workspace_id)) {
      *out.add_revisions() = Label(change_set.name(), change_set.id());
    }
    return out;
  });
}

v1::ApplicationEntities ApplicationService::AllEntities(const std::string& application_id, const model::Context& ctx) {
  return core::Observed("ApplicationService.AllEntities", application_id, [&] {
    auto uow = ctx_.store->BeginRead();

    const auto root = ctx_.store->Resolve<v1::EntityBody>(*uow, application_id, ctx);

    v1::ApplicationEntities out;
    for (const auto& edge : ctx_.traversal->Successors(*uow, std::string(model::kIncludesEdge), root.object_id, ctx)) {
      const auto entity = ctx_.store->Resolve<v1::EntityBody>(*uow, edge.body.head_vertex().object_id(), ctx);
      *out.add_entities() = Label(entity.body.name(), entity.object_id);
    }
    uow->Commit();
    return out;
  });
}

} // namespace infragraph::service
