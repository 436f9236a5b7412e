#pragma once

#include <string>
#include <vector>

#include "internal/core/unit_of_work.hpp"
#include "internal/model/context.hpp"
#include "internal/model/versioned_record.hpp"
#include "service_context.hpp"

namespace infragraph::service {

struct CreatedNode {
  model::Entity entity;
  model::Node   node;
};

/*
  Schematic editing inside an edit session: entities with the node that
  renders them, and the edges between them.
*/
class NodeService {
 public:
  explicit NodeService(ServiceContext ctx);

  // ctx must name an edit session.
  CreatedNode CreateNode(const model::Context& ctx, const std::string& entity_type, const std::string& name);
  CreatedNode CreateNode(core::UnitOfWork& uow, const model::Context& ctx, const std::string& entity_type, const std::string& name);

  // Edge kinds declared acyclic reject an edge that would close a cycle.
  model::Edge Connect(const model::Context& ctx, const std::string& edge_kind, const std::string& tail_object_id, const std::string& head_object_id);
  model::Edge Connect(core::UnitOfWork& uow, const model::Context& ctx, const std::string& edge_kind, const std::string& tail_object_id,
                      const std::string& head_object_id);

  void DeleteObject(const model::Context& ctx, const std::string& object_id);

  // Upserts the node's position for one rendering context (schematic,
  // component view) keyed by context_id. Other contexts keep theirs.
  model::Node SetPosition(const model::Context& ctx, const std::string& node_id, const std::string& context_id, double x, double y);
  model::Node SetPosition(core::UnitOfWork& uow, const model::Context& ctx, const std::string& node_id, const std::string& context_id, double x,
                          double y);

  // Every position stored on the node, in insertion order.
  std::vector<v1::NodePosition> Positions(const model::Context& ctx, const std::string& node_id) const;

 private:
  bool Reaches(core::UnitOfWork& uow, const model::Context& ctx, const std::string& edge_kind, const std::string& from, const std::string& to) const;

  ServiceContext ctx_;
};

} // namespace infragraph::service
