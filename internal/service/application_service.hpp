#pragma once

#include <string>
#include <vector>

#include "infragraph/v1.hpp"
#include "internal/model/context.hpp"
#include "node_service.hpp"
#include "service_context.hpp"

namespace infragraph::service {

/*
  Workspace-level application catalogue built on the versioned graph.
*/
class ApplicationService {
 public:
  explicit ApplicationService(ServiceContext ctx);

  // Creates, saves and applies the application in one transaction, then
  // includes it in the workspace's "production" system when one exists.
  v1::ApplicationListEntry Create(const std::string& workspace_id, const std::string& name);

  // Head applications of the workspace, ordered by id.
  std::vector<v1::ApplicationListEntry> List(const std::string& workspace_id);

  v1::ApplicationContext Context(const std::string& application_id, const std::string& workspace_id);

  // Includes successors of the application; unresolvable ones are skipped.
  v1::ApplicationEntities AllEntities(const std::string& application_id, const model::Context& ctx);

 private:
  ServiceContext ctx_;
  NodeService    nodes_;
};

} // namespace infragraph::service
