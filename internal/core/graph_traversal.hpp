#pragma once

#include <memory>
#include <string>
#include <vector>

#include "internal/core/versioned_entity_store.hpp"

namespace infragraph::core {

/*
  One-hop edge queries over the versioned graph.

  Edges and the entities at their far end resolve under the same context as
  entity reads. An edge whose far end no longer resolves (deleted, or never
  visible in this context) is dropped from the result instead of failing the
  call. Any other error propagates.
*/
class GraphTraversal {
 public:
  explicit GraphTraversal(std::shared_ptr<const VersionedEntityStore> store);

  // Edges of edge_kind whose tail is object_id, ordered by edge id.
  std::vector<model::Edge> Successors(const std::string& edge_kind, const std::string& object_id, const model::Context& ctx) const;
  std::vector<model::Edge> Successors(UnitOfWork& uow, const std::string& edge_kind, const std::string& object_id, const model::Context& ctx) const;

  // Edges of edge_kind whose head is object_id, ordered by edge id.
  std::vector<model::Edge> Predecessors(const std::string& edge_kind, const std::string& object_id, const model::Context& ctx) const;
  std::vector<model::Edge> Predecessors(UnitOfWork& uow, const std::string& edge_kind, const std::string& object_id,
                                        const model::Context& ctx) const;

  // Head entities of Successors(), in edge order.
  std::vector<model::Entity> SuccessorEntities(const std::string& edge_kind, const std::string& object_id, const model::Context& ctx) const;

 private:
  enum class Direction {
    kOutgoing,
    kIncoming,
  };

  std::vector<model::Edge> Adjacent(UnitOfWork& uow, Direction direction, const std::string& edge_kind, const std::string& object_id,
                                    const model::Context& ctx) const;

  std::shared_ptr<const VersionedEntityStore> store_;
};

} // namespace infragraph::core
