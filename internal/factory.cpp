#include "factory.hpp"

#include <stdexcept>

#include "internal/core/session_manager.hpp"
#include "internal/core/session_registry.hpp"
#include "internal/db/memory/memory_session_store.hpp"
#include "internal/driver/grpc_browser_driver.hpp"
#include "internal/events/logging_event_sink.hpp"
#include "internal/grpc/admin_server.hpp"
#include "internal/grpc/session_server.hpp"
#include "internal/heartbeat/heartbeat_monitor.hpp"
#include "internal/notify/logging_owner_notifier.hpp"
#include "internal/observability/logging.hpp"
#include "internal/recovery/recovery_coordinator.hpp"
#include "internal/service/admin_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/service/session_service.hpp"
#include "internal/util/errors.hpp"
#if SESSIONKEEPER_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_session_store.hpp"
#endif
#if SESSIONKEEPER_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_session_store.hpp"
#endif

namespace sessionkeeper::factory {

std::shared_ptr<db::SessionStore> BuildStore(const sessionkeeper::runtime::config::DatabaseConfig& database) {
  if (database.has_sqlite()) {
#if SESSIONKEEPER_DB_SQLITE
    if (database.sqlite().path().empty()) {
      throw util::InvalidArgument("config: database.sqlite.path is required");
    }
    const int busy_timeout_ms = database.sqlite().busy_timeout_ms() > 0 ? static_cast<int>(database.sqlite().busy_timeout_ms()) : 5000;
    auto      sqlite_db       = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path(), busy_timeout_ms);
    auto      store           = std::make_shared<db::sqlite::SqliteSessionStore>(std::move(sqlite_db));
    store->BootstrapSchema();
    SESSIONKEEPER_LOG_INFO("session store ready", {observability::StringField("backend", "sqlite"),
                                                   observability::StringField("path", database.sqlite().path())});
    return store;
#else
    throw util::InvalidArgument("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if SESSIONKEEPER_DB_POSTGRES
    const auto& pg              = database.postgres();
    const auto  max_connections = pg.max_connections() > 0 ? pg.max_connections() : 16;
    const int   timeout_ms      = pg.statement_timeout_ms() > 0 ? static_cast<int>(pg.statement_timeout_ms()) : 5000;
    auto        pool            = std::make_shared<db::postgres::PgPool>(pg.connection_uri(), max_connections, timeout_ms);
    auto        store           = std::make_shared<db::postgres::PgSessionStore>(std::move(pool));
    store->BootstrapSchema();
    SESSIONKEEPER_LOG_INFO("session store ready", {observability::StringField("backend", "postgres")});
    return store;
#else
    throw util::InvalidArgument("postgres backend requested but not enabled at build time");
#endif
  }

  if (database.has_memory()) {
    SESSIONKEEPER_LOG_INFO("session store ready", {observability::StringField("backend", "memory")});
  } else {
    SESSIONKEEPER_LOG_WARN("no database configured; sessions will not survive a restart",
                           {observability::StringField("backend", "memory")});
  }
  return std::make_shared<db::memory::MemorySessionStore>();
}

/*
    Build full application dependency graph
*/
Application Build(const sessionkeeper::runtime::config::RuntimeConfig& config) {
  Application app;
  app.options = config::ResolveOptions(config);

  // ------------------------------------------------------------------
  // Collaborators
  // ------------------------------------------------------------------
  app.store = BuildStore(config.database());

  auto channel = ::grpc::CreateChannel(app.options.driver.endpoint, ::grpc::InsecureChannelCredentials());
  app.driver   = std::make_shared<driver::GrpcBrowserDriver>(std::move(channel), app.options.driver.release_timeout);

  auto events   = std::make_shared<events::LoggingEventSink>();
  auto notifier = std::make_shared<notify::LoggingOwnerNotifier>();

  // ------------------------------------------------------------------
  // Engine
  // ------------------------------------------------------------------
  app.registry    = std::make_shared<core::SessionRegistry>();
  app.manager     = std::make_shared<core::SessionManager>(app.store, app.driver, app.registry, events, app.options.sessions);
  app.monitor     = std::make_shared<heartbeat::HeartbeatMonitor>(app.store, app.driver, app.registry, events, app.options.heartbeat);
  app.coordinator = std::make_shared<recovery::RecoveryCoordinator>(app.store, app.driver, app.registry, events, notifier,
                                                                    app.options.recovery);

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.manager     = app.manager;
  ctx.coordinator = app.coordinator;

  auto session_service = std::make_shared<service::SessionService>(ctx);
  auto admin_service   = std::make_shared<service::AdminService>(ctx);

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  app.grpc_services.push_back(std::make_unique<grpc::SessionServer>(session_service));
  app.grpc_services.push_back(std::make_unique<grpc::AdminServer>(admin_service));

  return app;
}

} // namespace sessionkeeper::factory
