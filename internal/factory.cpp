#include "factory.hpp"

#include <chrono>
#include <unordered_map>

#include "internal/cache/cache_policy.hpp"
#include "internal/conflict/conflict_resolver.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/grpc/control_server.hpp"
#include "internal/observability/logging.hpp"
#include "internal/remote/grpc_remote_client.hpp"
#include "internal/service/control_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/sync/backoff_policy.hpp"

namespace offsync::factory {

using observability::IntField;
using observability::StringField;

std::shared_ptr<db::Repository> BuildRepository(const offsync::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path(), database.sqlite().relaxed_sync());
    OFFSYNC_LOG_INFO("Opened sqlite store", {StringField("path", database.sqlite().path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
  }

  OFFSYNC_LOG_WARN("Using in-memory store; operations will not survive a restart");
  return std::make_shared<db::memory::MemoryRepository>();
}

EngineParts BuildEngine(const offsync::runtime::config::RuntimeConfig& config, std::shared_ptr<db::Repository> repository,
                        std::shared_ptr<remote::RemoteClient> remote, std::shared_ptr<util::Clock> clock) {
  const auto& sync_config = config.sync();

  EngineParts parts;
  parts.repository   = std::move(repository);
  parts.connectivity = std::make_shared<engine::Connectivity>(!sync_config.start_offline());

  std::unordered_map<std::string, int32_t> priorities(config.priorities().begin(), config.priorities().end());
  parts.queue     = std::make_shared<queue::QueueManager>(parts.repository, clock, std::move(priorities));
  parts.scheduler = std::make_shared<sync::RetryScheduler>(clock);

  sync::BackoffPolicy::Options backoff;
  backoff.base_ms   = sync_config.base_backoff_ms();
  backoff.max_ms    = sync_config.max_backoff_ms();
  backoff.jitter_ms = sync_config.jitter_ms();

  sync::SyncOptions options;
  options.max_attempts         = sync_config.max_attempts();
  options.request_timeout_ms   = sync_config.request_timeout_ms();
  options.max_parallel_targets = sync_config.max_parallel_targets();

  parts.processor = std::make_shared<sync::SyncProcessor>(parts.queue, remote, std::make_shared<conflict::ConflictResolver>(),
                                                          sync::BackoffPolicy(backoff), parts.scheduler, clock, options);

  auto connectivity = parts.connectivity;
  auto is_online    = [connectivity] { return connectivity->IsOnline(); };

  auto policy     = std::make_shared<cache::CachePolicy>(cache::CachePolicy::FromConfig(config.cache()));
  parts.refresher = std::make_shared<cache::CacheRefresher>(parts.repository, remote, clock, is_online, sync_config.request_timeout_ms());
  parts.cache     = std::make_shared<cache::SnapshotCache>(parts.repository, remote, policy, parts.refresher, clock, is_online,
                                                       sync_config.request_timeout_ms());

  engine::EngineOptions engine_options;
  engine_options.prune_interval_ms = config.cache().prune_interval_ms();

  parts.engine = std::make_shared<engine::SyncEngine>(parts.queue, parts.processor, parts.scheduler, parts.cache, parts.connectivity,
                                                      std::move(clock), engine_options);
  return parts;
}

Application Build(const offsync::runtime::config::RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Core components
  // ------------------------------------------------------------------
  auto repository = BuildRepository(config);
  auto remote     = remote::GrpcRemoteClient::Connect(config.remote().endpoint());
  auto clock      = std::make_shared<util::WallClock>();

  app.parts = BuildEngine(config, std::move(repository), std::move(remote), std::move(clock));
  app.parts.engine->Start();

  // ------------------------------------------------------------------
  // Background workers
  // ------------------------------------------------------------------
  app.sync_worker = std::make_shared<sync::SyncWorker>(app.parts.scheduler, app.parts.engine,
                                                       std::chrono::milliseconds(config.sync().poll_interval_ms()));
  app.sync_worker->Start();
  app.parts.refresher->Start();

  // ------------------------------------------------------------------
  // Control service
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.engine = app.parts.engine;

  auto control_service = std::make_shared<service::ControlService>(ctx);
  app.grpc_services.push_back(std::make_unique<grpc::ControlServer>(control_service));

  OFFSYNC_LOG_INFO("Engine started", {StringField("remote", config.remote().endpoint()),
                                      IntField("max_attempts", static_cast<int64_t>(config.sync().max_attempts()))});
  return app;
}

void Application::Stop() {
  if (sync_worker) sync_worker->Stop();
  if (parts.refresher) parts.refresher->Stop();
}

} // namespace offsync::factory
