#pragma once

#include <memory>
#include <vector>

#include <grpcpp/impl/service_type.h>

#include "config/config.pb.h"

#include "internal/cache/cache_refresher.hpp"
#include "internal/cache/snapshot_cache.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/engine/connectivity.hpp"
#include "internal/engine/sync_engine.hpp"
#include "internal/queue/queue_manager.hpp"
#include "internal/remote/remote_client.hpp"
#include "internal/sync/retry_scheduler.hpp"
#include "internal/sync/sync_processor.hpp"
#include "internal/sync/sync_worker.hpp"
#include "internal/util/time.hpp"

namespace offsync::factory {

/*
  Engine components wired together, without threads or network listeners.
*/
struct EngineParts {
  std::shared_ptr<db::Repository>        repository;
  std::shared_ptr<queue::QueueManager>   queue;
  std::shared_ptr<sync::RetryScheduler>  scheduler;
  std::shared_ptr<sync::SyncProcessor>   processor;
  std::shared_ptr<cache::CacheRefresher> refresher;
  std::shared_ptr<cache::SnapshotCache>  cache;
  std::shared_ptr<engine::Connectivity>  connectivity;
  std::shared_ptr<engine::SyncEngine>    engine;
};

/*
  Everything the daemon keeps alive for the lifetime of the process.
*/
struct Application {
  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;

  EngineParts                       parts;
  std::shared_ptr<sync::SyncWorker> sync_worker;

  // Stops background workers; safe to call twice.
  void Stop();
};

// Opens the configured backend. Only place that knows concrete DB types.
std::shared_ptr<db::Repository> BuildRepository(const offsync::runtime::config::RuntimeConfig& config);

EngineParts BuildEngine(const offsync::runtime::config::RuntimeConfig& config, std::shared_ptr<db::Repository> repository,
                        std::shared_ptr<remote::RemoteClient> remote, std::shared_ptr<util::Clock> clock);

/*
  Composition root: repository, remote client, engine, workers and the
  control service. Workers are started.
*/
Application Build(const offsync::runtime::config::RuntimeConfig& config);

} // namespace offsync::factory
