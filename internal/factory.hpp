#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/core/change_set_manager.hpp"
#include "internal/core/edit_session_manager.hpp"
#include "internal/core/graph_traversal.hpp"
#include "internal/core/versioned_entity_store.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/graph/edge_kind_registry.hpp"
#include "internal/notify/notifier_hub.hpp"
#include "internal/service/application_service.hpp"
#include "internal/service/node_service.hpp"

namespace infragraph::factory {

/*
  Runtime

  Owns every long-lived component of the engine.
  Everything here lives for the lifetime of the process.
*/
struct Runtime {
  std::shared_ptr<db::Repository>     repository;
  std::shared_ptr<notify::NotifierHub> notifier;

  std::shared_ptr<core::VersionedEntityStore> store;
  std::shared_ptr<core::ChangeSetManager>     change_sets;
  std::shared_ptr<core::EditSessionManager>   edit_sessions;
  std::shared_ptr<core::GraphTraversal>       traversal;
  std::shared_ptr<graph::EdgeKindRegistry>    edge_kinds;

  std::shared_ptr<service::NodeService>        node_service;
  std::shared_ptr<service::ApplicationService> application_service;
};

/*
  Backend selected by config.database(); the schema is bootstrapped before
  the repository is returned. This is the ONLY place allowed to know
  concrete DB types.
*/
std::shared_ptr<db::Repository> BuildRepository(const infragraph::runtime::config::RuntimeConfig& config);

/*
  BuildRuntime

  Composition root: repository, notifier hub, core and services.
*/
Runtime BuildRuntime(const infragraph::runtime::config::RuntimeConfig& config);

} // namespace infragraph::factory
