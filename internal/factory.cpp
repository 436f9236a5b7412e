#include "factory.hpp"

#include <memory>
#include <stdexcept>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/notify/logging_notifier.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/service_context.hpp"
#if INFRAGRAPH_DB_SQLITE
#include "internal/db/sqlite/sqlite_pool.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if INFRAGRAPH_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace infragraph::factory {

using observability::StringField;

std::shared_ptr<db::Repository> BuildRepository(const infragraph::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if INFRAGRAPH_DB_SQLITE
    const auto& sqlite = database.sqlite();

    db::sqlite::SqliteOptions options;
    options.path     = sqlite.path();
    options.wal_mode = sqlite.has_wal_mode() ? sqlite.wal_mode() : true;
    if (sqlite.busy_timeout_ms() > 0) {
      options.busy_timeout_ms = static_cast<int>(sqlite.busy_timeout_ms());
    }

    auto pool = sqlite.max_connections() > 0 ? std::make_shared<db::sqlite::SqlitePool>(options, sqlite.max_connections())
                                             : std::make_shared<db::sqlite::SqlitePool>(options);
    auto repository = std::make_shared<db::sqlite::SqliteRepository>(std::move(pool));
    repository->BootstrapSchema();

    INFRAGRAPH_LOG_INFO("database ready", {StringField("backend", "sqlite"), StringField("path", options.path)});
    return repository;
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if INFRAGRAPH_DB_POSTGRES
    const auto& postgres = database.postgres();

    auto pool = postgres.max_connections() > 0 ? std::make_shared<db::postgres::PgPool>(postgres.connection_uri(), postgres.max_connections())
                                               : std::make_shared<db::postgres::PgPool>(postgres.connection_uri());
    auto repository = std::make_shared<db::postgres::PgRepository>(std::move(pool));
    repository->BootstrapSchema();

    INFRAGRAPH_LOG_INFO("database ready", {StringField("backend", "postgres")});
    return repository;
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  INFRAGRAPH_LOG_INFO("database ready", {StringField("backend", "memory")});
  return std::make_shared<db::memory::MemoryRepository>();
}

/*
    Build full engine dependency graph
*/
Runtime BuildRuntime(const infragraph::runtime::config::RuntimeConfig& config) {
  Runtime runtime;

  // ------------------------------------------------------------------
  // Persistence and notification
  // ------------------------------------------------------------------
  runtime.repository = BuildRepository(config);
  runtime.notifier   = std::make_shared<notify::NotifierHub>();

  if (config.notifier().log_events()) {
    auto logging = std::make_shared<notify::LoggingNotifier>();
    runtime.notifier->Subscribe([logging](const notify::ChangeEvent& event) { logging->Publish(event); });
  }

  // ------------------------------------------------------------------
  // Core components
  // ------------------------------------------------------------------
  runtime.store         = std::make_shared<core::VersionedEntityStore>(runtime.repository, runtime.notifier);
  runtime.change_sets   = std::make_shared<core::ChangeSetManager>(runtime.repository, runtime.notifier);
  runtime.edit_sessions = std::make_shared<core::EditSessionManager>(runtime.repository, runtime.notifier);
  runtime.traversal     = std::make_shared<core::GraphTraversal>(runtime.store);
  runtime.edge_kinds    = graph::StaticEdgeKindRegistry::FromConfig(config.graph());

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.store         = runtime.store;
  ctx.change_sets   = runtime.change_sets;
  ctx.edit_sessions = runtime.edit_sessions;
  ctx.traversal     = runtime.traversal;
  ctx.edge_kinds    = runtime.edge_kinds;

  runtime.node_service        = std::make_shared<service::NodeService>(ctx);
  runtime.application_service = std::make_shared<service::ApplicationService>(ctx);

  return runtime;
}

} // namespace infragraph::factory
