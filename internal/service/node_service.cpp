#include "node_service.hpp"

#include <cmath>
#include <queue>
#include <stdexcept>
#include <unordered_set>

#include "internal/core/db_errors.hpp"
#include "internal/core/graph_traversal.hpp"
#include "internal/core/versioned_entity_store.hpp"
#include "internal/graph/edge_kind_registry.hpp"
#include "internal/model/record_traits.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace infragraph::service {

using observability::DoubleField;
using observability::ScopeField;
using observability::StringField;

namespace {

// Built-in kinds carry typed properties; start them empty.
void InitProperties(v1::EntityBody& body) {
  if (body.entity_type() == model::kApplicationType) {
    body.mutable_application();
  } else if (body.entity_type() == model::kSystemType) {
    body.mutable_system();
  } else if (body.entity_type() == model::kServiceType) {
    body.mutable_service();
  }
}

} // namespace

NodeService::NodeService(ServiceContext ctx) : ctx_(std::move(ctx)) {
  if (!ctx_.store || !ctx_.traversal || !ctx_.edge_kinds) {
    throw std::invalid_argument("NodeService requires store, traversal and edge kind registry");
  }
}

// ------------------------------------------------------------------
// CreateNode
// ------------------------------------------------------------------

CreatedNode NodeService::CreateNode(core::UnitOfWork& uow, const model::Context& ctx, const std::string& entity_type, const std::string& name) {
  if (!ctx.edit_session_id) {
    throw util::InvalidArgument("nodes are created inside an edit session");
  }

  CreatedNode created;
  created.entity = ctx_.store->Write<v1::EntityBody>(uow, {}, ctx, [&](v1::EntityBody& body) {
    body.set_entity_type(entity_type);
    body.set_name(name);
    InitProperties(body);
  });
  created.node = ctx_.store->Write<v1::NodeBody>(uow, {}, ctx, [&](v1::NodeBody& body) {
    body.set_object_type(entity_type);
    body.set_entity_object_id(created.entity.object_id);
  });
  return created;
}

CreatedNode NodeService::CreateNode(const model::Context& ctx, const std::string& entity_type, const std::string& name) {
  return core::Observed("NodeService.CreateNode", name, [&] {
    auto uow     = ctx_.store->BeginWrite();
    auto created = CreateNode(*uow, ctx, entity_type, name);
    uow->Commit();

    INFRAGRAPH_LOG_INFO("node created", {ScopeField(ctx.change_set_id.value_or(""), *ctx.edit_session_id), StringField("entity_id", created.entity.object_id),
                                         StringField("node_id", created.node.object_id), StringField("entity_type", entity_type)});
    return created;
  });
}

// ------------------------------------------------------------------
// Connect
// ------------------------------------------------------------------

bool NodeService::Reaches(core::UnitOfWork& uow, const model::Context& ctx, const std::string& edge_kind, const std::string& from,
                          const std::string& to) const {
  std::queue<std::string>         q;
  std::unordered_set<std::string> visited;

  q.push(from);
  visited.insert(from);

  while (!q.empty()) {
    const auto node = q.front();
    q.pop();
    if (node == to) {
      return true;
    }

    for (const auto& edge : ctx_.traversal->Successors(uow, edge_kind, node, ctx)) {
      const auto& next = edge.body.head_vertex().object_id();
      if (visited.insert(next).second) {
        q.push(next);
      }
    }
  }
  return false;
}

model::Edge NodeService::Connect(core::UnitOfWork& uow, const model::Context& ctx, const std::string& edge_kind, const std::string& tail_object_id,
                                 const std::string& head_object_id) {
  const auto kind = graph::Require(*ctx_.edge_kinds, edge_kind);

  const auto tail = ctx_.store->Resolve<v1::EntityBody>(uow, tail_object_id, ctx);
  const auto head = ctx_.store->Resolve<v1::EntityBody>(uow, head_object_id, ctx);

  if (kind.acyclic && Reaches(uow, ctx, edge_kind, head_object_id, tail_object_id)) {
    throw util::InvalidArgument(edge_kind + " edge " + tail_object_id + " -> " + head_object_id + " would create a cycle");
  }

  return ctx_.store->Write<v1::EdgeBody>(uow, {}, ctx, [&](v1::EdgeBody& body) {
    body.set_edge_kind(edge_kind);
    body.mutable_tail_vertex()->set_object_id(tail.object_id);
    body.mutable_tail_vertex()->set_kind(tail.Kind());
    body.mutable_head_vertex()->set_object_id(head.object_id);
    body.mutable_head_vertex()->set_kind(head.Kind());
  });
}

model::Edge NodeService::Connect(const model::Context& ctx, const std::string& edge_kind, const std::string& tail_object_id,
                                 const std::string& head_object_id) {
  return core::Observed("NodeService.Connect", tail_object_id, [&] {
    auto uow  = ctx_.store->BeginWrite();
    auto edge = Connect(*uow, ctx, edge_kind, tail_object_id, head_object_id);
    uow->Commit();
    return edge;
  });
}

// ------------------------------------------------------------------
// DeleteObject
// ------------------------------------------------------------------

void NodeService::DeleteObject(const model::Context& ctx, const std::string& object_id) {
  core::Observed("NodeService.DeleteObject", object_id, [&] {
    auto uow = ctx_.store->BeginWrite();
    ctx_.store->Remove<v1::EntityBody>(*uow, object_id, ctx);
    uow->Commit();
  });
}

// ------------------------------------------------------------------
// Positions
// ------------------------------------------------------------------

model::Node NodeService::SetPosition(core::UnitOfWork& uow, const model::Context& ctx, const std::string& node_id, const std::string& context_id,
                                     double x, double y) {
  if (context_id.empty()) {
    throw util::InvalidArgument("node position needs a context_id");
  }
  if (!std::isfinite(x) || !std::isfinite(y)) {
    throw util::InvalidArgument("node position of " + node_id + " must be finite");
  }

  // NotFound rather than a fresh node under node_id
  ctx_.store->Resolve<v1::NodeBody>(uow, node_id, ctx);

  return ctx_.store->Write<v1::NodeBody>(uow, node_id, ctx, [&](v1::NodeBody& body) {
    for (auto& position : *body.mutable_positions()) {
      if (position.context_id() == context_id) {
        position.set_x(x);
        position.set_y(y);
        return;
      }
    }
    auto* position = body.add_positions();
    position->set_context_id(context_id);
    position->set_x(x);
    position->set_y(y);
  });
}

model::Node NodeService::SetPosition(const model::Context& ctx, const std::string& node_id, const std::string& context_id, double x, double y) {
  return core::Observed("NodeService.SetPosition", node_id, [&] {
    auto uow  = ctx_.store->BeginWrite();
    auto node = SetPosition(*uow, ctx, node_id, context_id, x, y);
    uow->Commit();

    INFRAGRAPH_LOG_DEBUG("node moved", {ScopeField(ctx.change_set_id.value_or(""), ctx.edit_session_id.value_or("")), StringField("node_id", node_id),
                                        StringField("context_id", context_id), DoubleField("x", x), DoubleField("y", y)});
    return node;
  });
}

std::vector<v1::NodePosition> NodeService::Positions(const model::Context& ctx, const std::string& node_id) const {
  const auto node = ctx_.store->Resolve<v1::NodeBody>(node_id, ctx);
  return {node.body.positions().begin(), node.body.positions().end()};
}

} // namespace infragraph::service
