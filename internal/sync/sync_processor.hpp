#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "internal/conflict/conflict_resolver.hpp"
#include "internal/queue/queue_manager.hpp"
#include "internal/remote/remote_client.hpp"
#include "internal/sync/backoff_policy.hpp"
#include "internal/sync/retry_scheduler.hpp"
#include "internal/util/time.hpp"

namespace offsync::sync {

struct SyncOptions {
  uint32_t max_attempts         = 5;
  uint64_t request_timeout_ms   = 15000;
  uint32_t max_parallel_targets = 4;
};

struct PassStats {
  size_t delivered  = 0;
  size_t retrying   = 0;
  size_t abandoned  = 0;
  size_t rejected   = 0;
  size_t conflicted = 0;
  size_t discarded  = 0;
  size_t blocked    = 0;
  size_t errors     = 0;
};

/*
  Drains the operation log against the remote store.

  One pass at a time. Operations of one (collection, target) are delivered
  strictly in order; distinct targets run in parallel up to
  max_parallel_targets. A group whose head needs a user decision stays
  blocked. A pass never throws; per-operation failures are recorded on the
  operation and logged.
*/
class SyncProcessor {
 public:
  SyncProcessor(std::shared_ptr<queue::QueueManager> queue, std::shared_ptr<remote::RemoteClient> remote,
                std::shared_ptr<conflict::ConflictResolver> resolver, BackoffPolicy backoff, std::shared_ptr<RetryScheduler> scheduler,
                std::shared_ptr<util::Clock> clock, SyncOptions options);

  /*
    Runs a pass. If one is already running, the request is coalesced into a
    single follow-up pass and false is returned.
  */
  bool Drain();

  bool IsProcessing() const;

  // Stops the running pass from starting new deliveries. In-flight calls complete.
  void Cancel();

  PassStats LastPass() const;

 private:
  struct Group {
    std::string                     key;
    std::vector<queue::PendingOperation> operations;
  };

  PassStats RunPass();

  void DrainGroup(const Group& group, PassStats& stats);

  // True when the operation left the log and the group may continue.
  bool DeliverOne(const std::string& id, PassStats& stats);

  // Fills `state` from the remote after a conflict reply that carried none.
  bool FetchConflictingState(const db::model::OperationRecord& op, const remote::MutationResult& result, conflict::RemoteState& state,
                             std::string& error);

  void RecordRetryable(const db::model::OperationRecord& op, const std::string& error, db::model::ErrorKind kind, PassStats& stats);

  remote::MutationRequest BuildRequest(const db::model::OperationRecord& op) const;

  std::shared_ptr<queue::QueueManager>        queue_;
  std::shared_ptr<remote::RemoteClient>       remote_;
  std::shared_ptr<conflict::ConflictResolver> resolver_;
  BackoffPolicy                               backoff_;
  std::shared_ptr<RetryScheduler>             scheduler_;
  std::shared_ptr<util::Clock>                clock_;
  SyncOptions                                 options_;

  mutable std::mutex state_mutex_;
  bool               processing_ = false;
  bool               run_again_  = false;
  PassStats          last_pass_;

  std::atomic<bool> cancel_requested_{false};
};

} // namespace offsync::sync
