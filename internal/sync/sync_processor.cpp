#include "sync_processor.hpp"

#include <algorithm>
#include <chrono>
#include <thread>
#include <unordered_map>

#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/util/errors.hpp"

namespace offsync::sync {

using db::model::ErrorKind;
using db::model::OperationRecord;
using offsync::model::OperationStatus;
using observability::IntField;
using observability::StringField;

namespace {

void RecordPassMetrics(const PassStats& stats, double duration_ms) {
  observability::PassCounts counts;
  counts.delivered  = stats.delivered;
  counts.retrying   = stats.retrying;
  counts.conflicted = stats.conflicted;
  counts.rejected   = stats.rejected;
  counts.abandoned  = stats.abandoned;
  observability::Metrics::Instance().RecordPass(counts, duration_ms);
}

void Accumulate(PassStats& total, const PassStats& part) {
  total.delivered += part.delivered;
  total.retrying += part.retrying;
  total.abandoned += part.abandoned;
  total.rejected += part.rejected;
  total.conflicted += part.conflicted;
  total.discarded += part.discarded;
  total.blocked += part.blocked;
  total.errors += part.errors;
}

queue::ServerState ToServerState(const conflict::RemoteState& remote) {
  queue::ServerState state;
  state.snapshot = remote.snapshot;
  state.version  = remote.version;
  state.deleted  = remote.deleted;
  return state;
}

} // namespace

SyncProcessor::SyncProcessor(std::shared_ptr<queue::QueueManager> queue, std::shared_ptr<remote::RemoteClient> remote,
                             std::shared_ptr<conflict::ConflictResolver> resolver, BackoffPolicy backoff,
                             std::shared_ptr<RetryScheduler> scheduler, std::shared_ptr<util::Clock> clock, SyncOptions options)
    : queue_(std::move(queue)),
      remote_(std::move(remote)),
      resolver_(std::move(resolver)),
      backoff_(std::move(backoff)),
      scheduler_(std::move(scheduler)),
      clock_(std::move(clock)),
      options_(options) {
  if (options_.max_parallel_targets == 0) options_.max_parallel_targets = 1;
}

bool SyncProcessor::Drain() {
  {
    std::lock_guard lock(state_mutex_);
    if (processing_) {
      run_again_ = true;
      return false;
    }
    processing_       = true;
    cancel_requested_ = false;
  }

  for (;;) {
    const auto started = std::chrono::steady_clock::now();
    auto       stats   = RunPass();
    RecordPassMetrics(stats, std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started).count());

    std::lock_guard lock(state_mutex_);
    last_pass_ = stats;
    if (!run_again_ || cancel_requested_) {
      processing_ = false;
      run_again_  = false;
      return true;
    }
    run_again_ = false;
  }
}

bool SyncProcessor::IsProcessing() const {
  std::lock_guard lock(state_mutex_);
  return processing_;
}

void SyncProcessor::Cancel() {
  cancel_requested_ = true;
}

PassStats SyncProcessor::LastPass() const {
  std::lock_guard lock(state_mutex_);
  return last_pass_;
}

PassStats SyncProcessor::RunPass() {
  PassStats stats;

  // no delivery is running between passes, so anything still in flight was interrupted
  try {
    queue_->RecoverInFlight();
    queue_->FlushUnpersisted();
  } catch (const std::exception& e) {
    OFFSYNC_LOG_ERROR("Sync pass preparation failed", {StringField("error", e.what())});
    stats.errors++;
  }

  std::vector<queue::PendingOperation> pending;
  try {
    pending = queue_->ListPending();
  } catch (const std::exception& e) {
    OFFSYNC_LOG_ERROR("Sync pass could not read the operation log", {StringField("error", e.what())});
    stats.errors++;
    return stats;
  }

  std::vector<Group>                      groups;
  std::unordered_map<std::string, size_t> group_index;
  for (auto& operation : pending) {
    auto key       = operation.record.GroupKey();
    auto [it, add] = group_index.try_emplace(key, groups.size());
    if (add) {
      groups.push_back(Group{key, {}});
    }
    groups[it->second].operations.push_back(std::move(operation));
  }

  const auto          now = clock_->NowMs();
  std::vector<size_t> ready;
  for (size_t i = 0; i < groups.size(); ++i) {
    const auto& head = groups[i].operations.front();
    if (!head.persisted || !offsync::model::IsDeliverable(head.record.status)) {
      stats.blocked++;
      continue;
    }
    if (head.record.status == OperationStatus::kRetrying && head.record.next_attempt_at_ms > now) {
      scheduler_->Schedule(head.record.id, head.record.next_attempt_at_ms);
      continue;
    }
    ready.push_back(i);
  }

  if (ready.empty()) {
    return stats;
  }

  const size_t           workers = std::min<size_t>(options_.max_parallel_targets, ready.size());
  std::atomic<size_t>    next{0};
  std::vector<PassStats> per_worker(workers);

  auto work = [&](size_t worker) {
    for (;;) {
      if (cancel_requested_) return;
      const size_t i = next.fetch_add(1);
      if (i >= ready.size()) return;
      DrainGroup(groups[ready[i]], per_worker[worker]);
    }
  };

  if (workers == 1) {
    work(0);
  } else {
    std::vector<std::thread> threads;
    threads.reserve(workers);
    for (size_t w = 0; w < workers; ++w) {
      threads.emplace_back(work, w);
    }
    for (auto& thread : threads) {
      thread.join();
    }
  }

  for (const auto& part : per_worker) {
    Accumulate(stats, part);
  }

  OFFSYNC_LOG_INFO("Sync pass finished",
                   {IntField("groups", static_cast<int64_t>(ready.size())), IntField("delivered", static_cast<int64_t>(stats.delivered)),
                    IntField("retrying", static_cast<int64_t>(stats.retrying)), IntField("conflicted", static_cast<int64_t>(stats.conflicted)),
                    IntField("abandoned", static_cast<int64_t>(stats.abandoned)), IntField("rejected", static_cast<int64_t>(stats.rejected)),
                    IntField("errors", static_cast<int64_t>(stats.errors))});
  return stats;
}

void SyncProcessor::DrainGroup(const Group& group, PassStats& stats) {
  for (const auto& pending : group.operations) {
    if (cancel_requested_) return;

    const auto& op = pending.record;
    if (!pending.persisted || !offsync::model::IsDeliverable(op.status)) return;
    if (op.status == OperationStatus::kRetrying && op.next_attempt_at_ms > clock_->NowMs()) {
      scheduler_->Schedule(op.id, op.next_attempt_at_ms);
      return;
    }

    if (!DeliverOne(op.id, stats)) return;
  }
}

bool SyncProcessor::DeliverOne(const std::string& id, PassStats& stats) {
  OperationRecord op;
  try {
    op = queue_->MarkAttemptStart(id);
  } catch (const util::NotFound&) {
    // cancelled since the pass started
    return true;
  } catch (const std::exception& e) {
    OFFSYNC_LOG_ERROR("Could not start delivery", {StringField("operation_id", id), StringField("error", e.what())});
    stats.errors++;
    return false;
  }

  const auto timeout = std::chrono::milliseconds(options_.request_timeout_ms);

  try {
    for (;;) {
      remote::MutationResult result;
      try {
        result = remote_->ApplyMutation(BuildRequest(op), timeout);
      } catch (const std::exception& e) {
        result.outcome = remote::Outcome::kTransportError;
        result.message = e.what();
      }

      switch (result.outcome) {
        case remote::Outcome::kApplied: {
          queue::Confirmation confirmation;
          confirmation.target_id = result.target_id;
          confirmation.snapshot  = result.snapshot;
          confirmation.version   = result.version;
          queue_->MarkSucceeded(op.id, confirmation);
          stats.delivered++;
          return true;
        }
        case remote::Outcome::kTransportError:
          RecordRetryable(op, result.message, ErrorKind::kTransport, stats);
          return false;
        case remote::Outcome::kValidationError:
          queue_->MarkFailed(op.id, result.message, ErrorKind::kValidation, OperationStatus::kRejected, 0);
          stats.rejected++;
          return false;
        case remote::Outcome::kFatalError:
          queue_->MarkFailed(op.id, result.message, ErrorKind::kFatal, OperationStatus::kAbandoned, 0);
          stats.abandoned++;
          return false;
        case remote::Outcome::kConflict:
        case remote::Outcome::kRemoteDeleted:
          break;
      }

      conflict::RemoteState remote;
      remote.deleted  = result.outcome == remote::Outcome::kRemoteDeleted;
      remote.snapshot = result.snapshot.value_or(offsync::model::Document{});
      remote.version  = result.version;

      // a status-only conflict carries no server state; read it before resolving
      if (result.outcome == remote::Outcome::kConflict && !result.snapshot) {
        std::string error;
        if (!FetchConflictingState(op, result, remote, error)) {
          RecordRetryable(op, error, ErrorKind::kTransport, stats);
          return false;
        }
      }

      auto resolution = resolver_->Resolve(op, remote);
      switch (resolution.kind) {
        case conflict::Resolution::Kind::kDiscard:
          queue_->Discard(op.id, resolution.reason, ToServerState(remote));
          stats.discarded++;
          return true;

        case conflict::Resolution::Kind::kRequireUserDecision:
          queue_->MarkConflicted(op.id, resolution.conflict);
          stats.conflicted++;
          return false;

        case conflict::Resolution::Kind::kAccept:
          if (op.attempts >= options_.max_attempts) {
            queue_->MarkFailed(op.id, "merged retries kept conflicting", ErrorKind::kConflict, OperationStatus::kAbandoned, 0);
            stats.abandoned++;
            return false;
          }
          queue_->Reschedule(op.id, resolution.send_as, resolution.merged, ToServerState(remote), result.target_id);
          if (cancel_requested_) return false;
          op = queue_->MarkAttemptStart(op.id);
          OFFSYNC_LOG_INFO("Re-sending merged operation",
                           {StringField("operation_id", op.id), IntField("remote_version", static_cast<int64_t>(remote.version))});
          break;
      }
    }
  } catch (const std::exception& e) {
    // the outcome could not be recorded; the next pass resets the operation
    OFFSYNC_LOG_ERROR("Could not record delivery outcome", {StringField("operation_id", op.id), StringField("error", e.what())});
    stats.errors++;
    return false;
  }
}

bool SyncProcessor::FetchConflictingState(const OperationRecord& op, const remote::MutationResult& result, conflict::RemoteState& state,
                                          std::string& error) {
  const auto key = result.target_id ? result.target_id : op.target_id;
  if (!key || key->empty()) {
    error = "conflict reply without server state";
    return false;
  }

  auto fetched = remote_->FetchSnapshot(op.collection, *key, std::chrono::milliseconds(options_.request_timeout_ms));
  switch (fetched.status) {
    case remote::FetchStatus::kFound:
      state.snapshot = std::move(fetched.snapshot);
      state.version  = fetched.version;
      state.deleted  = false;
      return true;
    case remote::FetchStatus::kNotFound:
      state.snapshot.Clear();
      state.version = fetched.version;
      state.deleted = true;
      return true;
    case remote::FetchStatus::kUnavailable:
    case remote::FetchStatus::kFailed:
      break;
  }
  error = "conflicting state unavailable: " + fetched.message;
  OFFSYNC_LOG_WARN("Could not read conflicting server state", {StringField("operation_id", op.id), StringField("error", fetched.message)});
  return false;
}

void SyncProcessor::RecordRetryable(const OperationRecord& op, const std::string& error, ErrorKind kind, PassStats& stats) {
  if (op.attempts >= options_.max_attempts) {
    queue_->MarkFailed(op.id, error, kind, OperationStatus::kAbandoned, 0);
    stats.abandoned++;
    return;
  }

  const auto next_attempt_at = clock_->NowMs() + backoff_.DelayMs(op.attempts);
  queue_->MarkFailed(op.id, error, kind, OperationStatus::kRetrying, next_attempt_at);
  scheduler_->Schedule(op.id, next_attempt_at);
  stats.retrying++;
}

remote::MutationRequest SyncProcessor::BuildRequest(const OperationRecord& op) const {
  remote::MutationRequest request;
  request.collection      = op.collection;
  request.kind            = op.kind;
  request.target_id       = op.target_id;
  request.payload         = op.payload;
  request.base_version    = op.base_version;
  request.idempotency_key = op.id;
  return request;
}

} // namespace offsync::sync
