#include "internal/core/graph_traversal.hpp"

#include <algorithm>
#include <stdexcept>

#include "internal/core/db_errors.hpp"
#include "internal/util/errors.hpp"

namespace infragraph::core {

GraphTraversal::GraphTraversal(std::shared_ptr<const VersionedEntityStore> store) : store_(std::move(store)) {
  if (!store_) {
    throw std::invalid_argument("GraphTraversal requires a store");
  }
}

std::vector<model::Edge> GraphTraversal::Adjacent(UnitOfWork& uow, Direction direction, const std::string& edge_kind, const std::string& object_id,
                                                  const model::Context& ctx) const {
  const auto chain    = store_->ReadChain(uow, ctx);
  const bool outgoing = direction == Direction::kOutgoing;
  auto       rows     = outgoing ? uow.Repository().ListEdgesByTail(uow.Tx(), edge_kind, object_id, chain)
                                 : uow.Repository().ListEdgesByHead(uow.Tx(), edge_kind, object_id, chain);

  // rows from several tiers may describe the same edge
  std::vector<std::string> edge_ids;
  edge_ids.reserve(rows.size());
  for (const auto& row : rows) {
    edge_ids.push_back(row.object_id);
  }
  std::sort(edge_ids.begin(), edge_ids.end());
  edge_ids.erase(std::unique(edge_ids.begin(), edge_ids.end()), edge_ids.end());

  std::vector<model::Edge> out;
  out.reserve(edge_ids.size());
  for (const auto& edge_id : edge_ids) {
    model::Edge edge;
    try {
      edge = store_->Resolve<v1::EdgeBody>(uow, edge_id, ctx);
    } catch (const util::NotFound&) {
      continue;
    }

    // a more specific tier may have rewired or re-kinded the edge
    const auto& near = outgoing ? edge.body.tail_vertex().object_id() : edge.body.head_vertex().object_id();
    const auto& far  = outgoing ? edge.body.head_vertex().object_id() : edge.body.tail_vertex().object_id();
    if (edge.Kind() != edge_kind || near != object_id) {
      continue;
    }

    try {
      store_->Resolve<v1::EntityBody>(uow, far, ctx);
    } catch (const util::NotFound&) {
      continue;
    }
    out.push_back(std::move(edge));
  }
  return out;
}

std::vector<model::Edge> GraphTraversal::Successors(UnitOfWork& uow, const std::string& edge_kind, const std::string& object_id,
                                                    const model::Context& ctx) const {
  return Adjacent(uow, Direction::kOutgoing, edge_kind, object_id, ctx);
}

std::vector<model::Edge> GraphTraversal::Successors(const std::string& edge_kind, const std::string& object_id, const model::Context& ctx) const {
  return Observed("GraphTraversal.Successors", object_id, [&] {
    auto uow   = store_->BeginRead();
    auto edges = Successors(*uow, edge_kind, object_id, ctx);
    uow->Commit();
    return edges;
  });
}

std::vector<model::Edge> GraphTraversal::Predecessors(UnitOfWork& uow, const std::string& edge_kind, const std::string& object_id,
                                                      const model::Context& ctx) const {
  return Adjacent(uow, Direction::kIncoming, edge_kind, object_id, ctx);
}

std::vector<model::Edge> GraphTraversal::Predecessors(const std::string& edge_kind, const std::string& object_id, const model::Context& ctx) const {
  return Observed("GraphTraversal.Predecessors", object_id, [&] {
    auto uow   = store_->BeginRead();
    auto edges = Predecessors(*uow, edge_kind, object_id, ctx);
    uow->Commit();
    return edges;
  });
}

std::vector<model::Entity> GraphTraversal::SuccessorEntities(const std::string& edge_kind, const std::string& object_id,
                                                             const model::Context& ctx) const {
  return Observed("GraphTraversal.SuccessorEntities", object_id, [&] {
    auto uow   = store_->BeginRead();
    auto edges = Successors(*uow, edge_kind, object_id, ctx);

    std::vector<model::Entity> entities;
    entities.reserve(edges.size());
    for (const auto& edge : edges) {
      entities.push_back(store_->Resolve<v1::EntityBody>(*uow, edge.body.head_vertex().object_id(), ctx));
    }
    uow->Commit();
    return entities;
  });
}

} // namespace infragraph::core
