#include "factory.hpp"

#include <chrono>
#include <stdexcept>
#include <string>

#include "internal/audience/audience_resolver.hpp"
#include "internal/campaign/campaign_manager.hpp"
#include "internal/cleanup/draft_cleanup.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/migrations.hpp"
#include "internal/delivery/delivery_engine.hpp"
#include "internal/delivery/delivery_queue.hpp"
#include "internal/delivery/delivery_worker.hpp"
#include "internal/grpc/admin_server.hpp"
#include "internal/grpc/campaign_server.hpp"
#include "internal/grpc/segment_server.hpp"
#include "internal/observability/logging.hpp"
#include "internal/push/dry_run_transport.hpp"
#include "internal/push/grpc_push_transport.hpp"
#include "internal/scheduler/campaign_scheduler.hpp"
#include "internal/scheduler/scheduler_loop.hpp"
#include "internal/segment/segment_catalog.hpp"
#include "internal/service/admin_service.hpp"
#include "internal/service/campaign_service.hpp"
#include "internal/service/segment_service.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"
#if ALO_WITH_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if ALO_WITH_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace alo::factory {

using alo::runtime::config::RuntimeConfig;

namespace {

#if ALO_WITH_SQLITE
class SqliteMigrationExecutor final : public db::sql::MigrationExecutor {
 public:
  explicit SqliteMigrationExecutor(std::shared_ptr<db::sqlite::SqliteDB> db) : db_(std::move(db)) {
  }

  void ExecuteSQL(const std::string& sql) override {
    db_->Exec(sql);
  }

 private:
  std::shared_ptr<db::sqlite::SqliteDB> db_;
};
#endif

#if ALO_WITH_POSTGRES
class PgMigrationExecutor final : public db::sql::MigrationExecutor {
 public:
  explicit PgMigrationExecutor(pqxx::work& tx) : tx_(tx) {
  }

  void ExecuteSQL(const std::string& sql) override {
    tx_.exec(sql);
  }

 private:
  pqxx::work& tx_;
};
#endif

} // namespace

Application::Application()                                 = default;
Application::~Application()                                = default;
Application::Application(Application&&) noexcept            = default;
Application& Application::operator=(Application&&) noexcept = default;

void Application::StartBackground() {
  for (auto& loop : loops) loop->Start();
  if (delivery_worker) delivery_worker->Start();
}

void Application::StopBackground() {
  for (auto& loop : loops) loop->Stop();
  if (delivery_worker) delivery_worker->Stop();
}

std::shared_ptr<db::Repository> BuildRepository(const RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if ALO_WITH_SQLITE
    if (database.sqlite().path().empty()) {
      throw std::runtime_error("database.sqlite.path is required");
    }
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path(), database.sqlite().wal_mode());
    SqliteMigrationExecutor executor(sqlite_db);
    db::sql::RunMigrations(executor, db::sql::SqliteSchema());
    ALO_LOG_INFO("repository ready", {observability::StringField("backend", "sqlite"), observability::StringField("path", database.sqlite().path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if ALO_WITH_POSTGRES
    auto pool = std::make_shared<db::postgres::PgPool>(database.postgres().connection_uri(), database.postgres().max_connections());
    {
      auto       conn = pool->Acquire();
      pqxx::work tx(*conn);
      PgMigrationExecutor executor(tx);
      db::sql::RunMigrations(executor, db::sql::PostgresSchema());
      tx.commit();
    }
    ALO_LOG_INFO("repository ready", {observability::StringField("backend", "postgres")});
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  ALO_LOG_WARN("using in-memory repository; state is lost on exit");
  return std::make_shared<db::memory::MemoryRepository>();
}

std::shared_ptr<push::PushTransport> BuildTransport(const RuntimeConfig& config) {
  const auto& push_config = config.push();
  if (push_config.has_grpc_gateway()) {
    const auto& gateway = push_config.grpc_gateway();
    if (gateway.target().empty()) {
      throw std::runtime_error("push.grpc_gateway.target is required");
    }

    push::GrpcPushOptions options;
    options.target      = gateway.target();
    options.timeout     = std::chrono::milliseconds(gateway.timeout_ms());
    options.ttl_seconds = gateway.ttl_seconds();
    ALO_LOG_INFO("push transport", {observability::StringField("kind", "grpc_gateway"), observability::StringField("target", options.target)});
    return std::make_shared<push::GrpcPushTransport>(std::move(options));
  }

  ALO_LOG_INFO("push transport", {observability::StringField("kind", "dry_run")});
  return std::make_shared<push::DryRunTransport>();
}

/*
    Build full application dependency graph
*/
Application Build(const RuntimeConfig& config) {
  Application app;

  const auto policy = segment::ParseDuplicateTypePolicy(config.segments().duplicate_type_policy());

  // ------------------------------------------------------------------
  // Core components
  // ------------------------------------------------------------------
  auto repository = BuildRepository(config);
  auto catalog    = std::make_shared<segment::SegmentCatalog>(repository, std::chrono::milliseconds(config.segments().value_cache_ttl_ms()));
  auto resolver   = std::make_shared<audience::AudienceResolver>(repository, catalog);
  app.queue       = std::make_shared<delivery::DeliveryQueue>();

  auto manager   = std::make_shared<campaign::CampaignManager>(repository, catalog, app.queue, policy);
  auto sweeper   = std::make_shared<scheduler::CampaignScheduler>(repository, app.queue, config.scheduler().sweep_batch());
  auto janitor   = std::make_shared<cleanup::DraftCleanup>(repository);

  // ------------------------------------------------------------------
  // Delivery
  // ------------------------------------------------------------------
  const auto& delivery_config = config.delivery();

  delivery::DeliveryOptions options;
  options.worker_id       = delivery_config.worker_id().empty() ? "worker-" + util::NewId().substr(0, 8) : delivery_config.worker_id();
  options.batch_size      = delivery_config.batch_size();
  options.max_concurrency = delivery_config.max_concurrency();
  options.claim_lease     = std::chrono::milliseconds(delivery_config.claim_lease_ms());
  options.retry.max_attempts    = delivery_config.retry().max_attempts();
  options.retry.base_backoff_ms = delivery_config.retry().base_backoff_ms();
  options.retry.max_backoff_ms  = delivery_config.retry().max_backoff_ms();
  options.duplicate_policy      = policy;

  app.transport = BuildTransport(config);
  app.engine    = std::make_shared<delivery::DeliveryEngine>(repository, catalog, resolver, app.transport, options);
  if (!delivery_config.disabled()) {
    app.delivery_worker = std::make_shared<delivery::DeliveryWorker>(app.queue, app.engine, repository, delivery_config.workers(),
                                                                     std::chrono::milliseconds(delivery_config.poll_interval_ms()));
  }

  // ------------------------------------------------------------------
  // Periodic loops
  // ------------------------------------------------------------------
  if (!config.scheduler().disabled()) {
    app.loops.push_back(std::make_unique<scheduler::PeriodicLoop>("scheduler", std::chrono::milliseconds(config.scheduler().interval_ms()),
                                                                  [sweeper] { sweeper->Sweep(util::Now()); }));
  }
  if (!config.cleanup().disabled()) {
    const uint32_t retention_days = config.cleanup().retention_days();
    app.loops.push_back(std::make_unique<scheduler::PeriodicLoop>("draft-cleanup", std::chrono::milliseconds(config.cleanup().interval_ms()),
                                                                  [janitor, retention_days] { janitor->CleanupDrafts(retention_days); }));
  }

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  auto& ctx                = app.context;
  ctx.repository           = repository;
  ctx.catalog              = catalog;
  ctx.resolver             = resolver;
  ctx.manager              = manager;
  ctx.scheduler            = sweeper;
  ctx.cleanup              = janitor;
  ctx.duplicate_policy     = policy;
  ctx.draft_retention_days = config.cleanup().retention_days();

  auto segment_service  = std::make_shared<service::SegmentService>(ctx);
  auto campaign_service = std::make_shared<service::CampaignService>(ctx);
  auto admin_service    = std::make_shared<service::AdminService>(ctx);

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  app.grpc_services.push_back(std::make_unique<grpc::SegmentServer>(segment_service));
  app.grpc_services.push_back(std::make_unique<grpc::CampaignServer>(campaign_service));
  app.grpc_services.push_back(std::make_unique<grpc::AdminServer>(admin_service));

  return app;
}

} // namespace alo::factory
