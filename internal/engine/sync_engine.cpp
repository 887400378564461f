#include "sync_engine.hpp"

#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/util/errors.hpp"

namespace offsync::engine {

using offsync::model::OperationStatus;
using observability::BoolField;

SyncEngine::SyncEngine(std::shared_ptr<queue::QueueManager> queue, std::shared_ptr<sync::SyncProcessor> processor,
                       std::shared_ptr<sync::RetryScheduler> scheduler, std::shared_ptr<cache::SnapshotCache> cache,
                       std::shared_ptr<Connectivity> connectivity, std::shared_ptr<util::Clock> clock, EngineOptions options)
    : queue_(std::move(queue)),
      processor_(std::move(processor)),
      scheduler_(std::move(scheduler)),
      cache_(std::move(cache)),
      connectivity_(std::move(connectivity)),
      clock_(std::move(clock)),
      options_(options) {
}

void SyncEngine::Start() {
  queue_->RecoverInFlight();
  last_prune_ms_ = clock_->NowMs();
  Wake();
}

std::string SyncEngine::Enqueue(const queue::EnqueueRequest& request) {
  auto id = queue_->Enqueue(request);
  Wake();
  return id;
}

cache::ReadResult SyncEngine::Read(const std::string& collection, const std::string& key) {
  return cache_->Read(collection, key);
}

Status SyncEngine::GetStatus(bool include_operations) {
  Status status;
  auto   operations = queue_->ListPending();

  for (const auto& op : operations) {
    if (!op.persisted) {
      status.unpersisted_count++;
    }
    switch (op.record.status) {
      case OperationStatus::kPending:
      case OperationStatus::kInFlight:
      case OperationStatus::kRetrying:
        status.pending_count++;
        break;
      case OperationStatus::kAbandoned:
      case OperationStatus::kRejected:
        status.failed_count++;
        break;
      case OperationStatus::kConflicted:
        status.conflicted_count++;
        break;
      default:
        break;
    }
  }

  auto& metrics = observability::Metrics::Instance();
  metrics.SetQueueDepth("pending", status.pending_count);
  metrics.SetQueueDepth("failed", status.failed_count);
  metrics.SetQueueDepth("conflicted", status.conflicted_count);
  metrics.SetQueueDepth("unpersisted", status.unpersisted_count);

  status.is_processing = processor_->IsProcessing();
  status.is_online     = connectivity_->IsOnline();
  if (include_operations) {
    status.operations = std::move(operations);
  }
  return status;
}

bool SyncEngine::SyncNow() {
  if (!connectivity_->IsOnline()) {
    OFFSYNC_LOG_INFO("Manual sync skipped while offline");
    return false;
  }
  return processor_->Drain();
}

void SyncEngine::RetryOperation(const std::string& id) {
  queue_->Retry(id);
  Wake();
}

void SyncEngine::CancelOperation(const std::string& id) {
  if (queue_->Cancel(id)) return;

  if (queue_->Get(id)) {
    throw util::InvalidState("operation " + id + " is in flight");
  }
  throw util::NotFound("operation " + id + " not found");
}

void SyncEngine::ResolveConflict(const std::string& id, queue::ConflictChoice choice,
                                 const std::optional<offsync::model::Document>& payload, bool merge_non_conflicting) {
  queue_->ResolveConflict(id, choice, payload, merge_non_conflicting);
  Wake();
}

size_t SyncEngine::ClearQueue() {
  return queue_->Clear();
}

size_t SyncEngine::RefreshCache() {
  if (!connectivity_->IsOnline()) {
    return 0;
  }
  return cache_->Refresh();
}

size_t SyncEngine::ClearCache(const std::optional<std::string>& collection) {
  return collection ? cache_->ClearCollection(*collection) : cache_->ClearAll();
}

void SyncEngine::SetOnline(bool online) {
  const bool was_online = connectivity_->Set(online);
  if (was_online == online) return;

  OFFSYNC_LOG_INFO("Connectivity changed", {BoolField("online", online)});
  if (online) {
    Wake();
  } else {
    processor_->Cancel();
  }
}

bool SyncEngine::IsOnline() const {
  return connectivity_->IsOnline();
}

void SyncEngine::BackgroundCycle() {
  if (connectivity_->IsOnline()) {
    processor_->Drain();
    // refreshes the queue depth gauge
    GetStatus(false);
  }

  const auto now = clock_->NowMs();
  {
    std::lock_guard lock(prune_mutex_);
    if (now < last_prune_ms_ + options_.prune_interval_ms) return;
    last_prune_ms_ = now;
  }
  cache_->Prune();
}

void SyncEngine::Wake() {
  if (connectivity_->IsOnline()) {
    scheduler_->Trigger();
  }
}

} // namespace offsync::engine
