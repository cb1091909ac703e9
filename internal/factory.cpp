#include "factory.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/audit/audit_log.hpp"
#include "internal/core/node_registry.hpp"
#include "internal/grpc/node_admin_server.hpp"
#include "internal/kv/api/kv_store.hpp"
#include "internal/kv/memory/memory_kv_store.hpp"
#include "internal/kv/sqlite/sqlite_db.hpp"
#include "internal/kv/sqlite/sqlite_kv_store.hpp"
#include "internal/monitor/fleet_monitor.hpp"
#include "internal/monitor/probe_pool.hpp"
#include "internal/observability/logging.hpp"
#include "internal/probe/health_prober.hpp"
#include "internal/probe/httplib_client.hpp"
#include "internal/probe/node_daemon_client.hpp"
#include "internal/registry/instance_store.hpp"
#include "internal/registry/node_record_store.hpp"
#include "internal/service/service_context.hpp"
#if FLEET_DB_POSTGRES
#include "internal/kv/postgres/pg_kv_store.hpp"
#include "internal/kv/postgres/pg_pool.hpp"
#endif

namespace fleet::factory {

namespace {

std::shared_ptr<kv::KeyValueStore> BuildKeyValueStore(const fleet::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
    const auto& sqlite = database.sqlite();
    if (sqlite.path().empty()) {
      throw std::runtime_error("database.sqlite.path is required");
    }
    auto db    = std::make_shared<kv::sqlite::SqliteDB>(sqlite.path(), sqlite.wal_mode());
    auto store = std::make_shared<kv::sqlite::SqliteKeyValueStore>(std::move(db));
    store->Bootstrap();
    FLEET_LOG_INFO("using sqlite key-value store", {observability::StringField("path", sqlite.path())});
    return store;
  }

  if (database.has_postgres()) {
#if FLEET_DB_POSTGRES
    const auto& postgres = database.postgres();
    auto        pool     = std::make_shared<kv::postgres::PgPool>(postgres.connection_uri(),
                                                           postgres.max_connections() > 0 ? postgres.max_connections() : 16);
    auto store = std::make_shared<kv::postgres::PgKeyValueStore>(std::move(pool));
    store->Bootstrap();
    FLEET_LOG_INFO("using postgres key-value store");
    return store;
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  FLEET_LOG_WARN("using in-memory key-value store; registry state is lost on exit");
  return std::make_shared<kv::memory::MemoryKeyValueStore>();
}

} // namespace

/*
    Build full application dependency graph
*/
Application Build(const fleet::runtime::config::RuntimeConfig& config, std::shared_ptr<probe::HttpClient> http) {
  Application app;

  // ------------------------------------------------------------------
  // Persistence
  // ------------------------------------------------------------------
  app.kv         = BuildKeyValueStore(config);
  auto nodes     = std::make_shared<registry::NodeRecordStore>(app.kv);
  auto instances = std::make_shared<registry::InstanceStore>(app.kv);

  // ------------------------------------------------------------------
  // Probing
  // ------------------------------------------------------------------
  const auto& probe_config = config.probe();

  probe::ProbeOptions options;
  if (!probe_config.username().empty()) options.username = probe_config.username();
  if (probe_config.timeout_ms() > 0) options.timeout = std::chrono::milliseconds(probe_config.timeout_ms());

  if (!http) http = std::make_shared<probe::HttplibClient>();
  auto daemon = std::make_shared<probe::NodeDaemonClient>(std::move(http), options);
  auto prober = std::make_shared<probe::HealthProber>(daemon, nodes);

  app.probe_pool = std::make_shared<monitor::ProbePool>(probe_config.max_concurrency() > 0 ? probe_config.max_concurrency() : 16);
  auto fleet_monitor = std::make_shared<monitor::FleetMonitor>(nodes, prober, daemon, app.probe_pool,
                                                               std::chrono::milliseconds(probe_config.refresh_deadline_ms()));

  // ------------------------------------------------------------------
  // Registry + services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.registry  = std::make_shared<core::NodeRegistry>(nodes, instances, prober, daemon);
  ctx.monitor   = fleet_monitor;
  ctx.nodes     = nodes;
  ctx.instances = instances;
  ctx.prober    = prober;
  ctx.daemon    = daemon;
  if (config.audit().enabled()) {
    const auto days = config.audit().retention_days() > 0 ? config.audit().retention_days() : 30;
    ctx.audit       = std::make_shared<audit::AuditLog>(app.kv, std::chrono::hours(24 * days));
  }

  app.admin_service = std::make_shared<service::NodeAdminService>(ctx);

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  app.grpc_services.push_back(std::make_unique<grpc::NodeAdminServer>(app.admin_service));

  FLEET_LOG_INFO("application built", {observability::IntField("probe_workers", static_cast<std::int64_t>(app.probe_pool->size())),
                                       observability::IntField("probe_timeout_ms", options.timeout.count()),
                                       observability::BoolField("audit", config.audit().enabled())});
  return app;
}

} // namespace fleet::factory
