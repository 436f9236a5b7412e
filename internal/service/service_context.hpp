#pragma once

#include <memory>

namespace infragraph::core {
class VersionedEntityStore;
class ChangeSetManager;
class EditSessionManager;
class GraphTraversal;
} // namespace infragraph::core
namespace infragraph::graph {
class EdgeKindRegistry;
}

namespace infragraph::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<infragraph::core::VersionedEntityStore> store;
  std::shared_ptr<infragraph::core::ChangeSetManager>     change_sets;
  std::shared_ptr<infragraph::core::EditSessionManager>   edit_sessions;
  std::shared_ptr<infragraph::core::GraphTraversal>       traversal;
  std::shared_ptr<infragraph::graph::EdgeKindRegistry>    edge_kinds;
};

} // namespace infragraph::service
