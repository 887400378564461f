#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "internal/cache/snapshot_cache.hpp"
#include "internal/engine/connectivity.hpp"
#include "internal/queue/queue_manager.hpp"
#include "internal/sync/retry_scheduler.hpp"
#include "internal/sync/sync_processor.hpp"
#include "internal/util/time.hpp"

namespace offsync::engine {

struct EngineOptions {
  uint64_t prune_interval_ms = 60 * 1000;
};

struct Status {
  size_t pending_count     = 0;
  size_t failed_count      = 0;
  size_t conflicted_count  = 0;
  size_t unpersisted_count = 0;
  bool   is_processing     = false;
  bool   is_online         = false;

  std::vector<queue::PendingOperation> operations;
};

/*
  Facade over the queue, the sync processor and the snapshot cache.

  This is the status surface and the set of manual controls. Nothing here
  talks to the network on the caller's thread except SyncNow() and cache
  misses in Read().
*/
class SyncEngine {
 public:
  SyncEngine(std::shared_ptr<queue::QueueManager> queue, std::shared_ptr<sync::SyncProcessor> processor,
             std::shared_ptr<sync::RetryScheduler> scheduler, std::shared_ptr<cache::SnapshotCache> cache,
             std::shared_ptr<Connectivity> connectivity, std::shared_ptr<util::Clock> clock, EngineOptions options);

  // Resets operations interrupted by a crash and wakes the worker.
  void Start();

  std::string Enqueue(const queue::EnqueueRequest& request);

  cache::ReadResult Read(const std::string& collection, const std::string& key);

  Status GetStatus(bool include_operations);

  // Runs a drain pass on the calling thread. False when offline or coalesced.
  bool SyncNow();

  void RetryOperation(const std::string& id);

  void CancelOperation(const std::string& id);

  void ResolveConflict(const std::string& id, queue::ConflictChoice choice, const std::optional<offsync::model::Document>& payload,
                       bool merge_non_conflicting);

  size_t ClearQueue();

  size_t RefreshCache();

  size_t ClearCache(const std::optional<std::string>& collection);

  void SetOnline(bool online);
  bool IsOnline() const;

  // One worker wakeup: drain when online, prune when due.
  void BackgroundCycle();

 private:
  void Wake();

  std::shared_ptr<queue::QueueManager>  queue_;
  std::shared_ptr<sync::SyncProcessor>  processor_;
  std::shared_ptr<sync::RetryScheduler> scheduler_;
  std::shared_ptr<cache::SnapshotCache> cache_;
  std::shared_ptr<Connectivity>         connectivity_;
  std::shared_ptr<util::Clock>          clock_;
  EngineOptions                         options_;

  std::mutex prune_mutex_;
  uint64_t   last_prune_ms_ = 0;
};

} // namespace offsync::engine
