#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/model/document.hpp"
#include "internal/util/time.hpp"
#include "offsync/v1/types.pb.h"

namespace offsync::queue {

struct EnqueueRequest {
  db::model::OperationKind   kind = db::model::OperationKind::kUpdate;
  std::string                collection;
  std::optional<std::string> target_id;
  offsync::model::Document   payload;
  std::optional<uint64_t>    base_version;
};

struct PendingOperation {
  db::model::OperationRecord record;
  // false while the operation only lives in memory (storage was unavailable)
  bool persisted = true;
};

// Authoritative server state of one record, as learned from the remote.
struct ServerState {
  offsync::model::Document snapshot;
  uint64_t                 version = 0;
  bool                     deleted = false;
};

// What the remote confirmed for a successful delivery.
struct Confirmation {
  std::optional<std::string>              target_id;
  std::optional<offsync::model::Document> snapshot;
  uint64_t                                version = 0;
};

enum class ConflictChoice {
  kAcceptLocal,
  kAcceptRemote,
  kManual,
  kCancel,
};

/*
  Owns the operation log.

  Every mutation of the log goes through here and is committed before the
  call returns; the optimistic cache patch of an operation is written in the
  same transaction as the operation itself.

  Thread-safe; calls are serialized.
*/
class QueueManager {
 public:
  // priorities: collection -> priority, lower delivers first.
  QueueManager(std::shared_ptr<db::Repository> repository, std::shared_ptr<util::Clock> clock,
               std::unordered_map<std::string, int32_t> priorities);

  // Returns the new operation id. Throws util::InvalidArgument on a malformed request.
  std::string Enqueue(const EnqueueRequest& request);

  // Removes any operation that is not in flight. False for unknown or in-flight ids.
  bool Cancel(const std::string& id);

  // Delivery-ordered snapshot, unpersisted operations included.
  std::vector<PendingOperation> ListPending();

  std::optional<db::model::OperationRecord> Get(const std::string& id);

  // ---------------------------------------------------------------------
  // Delivery lifecycle (sync processor)
  // ---------------------------------------------------------------------

  db::model::OperationRecord MarkAttemptStart(const std::string& id);

  void MarkSucceeded(const std::string& id, const Confirmation& confirmation);

  // next_status is kRetrying, kAbandoned or kRejected.
  void MarkFailed(const std::string& id, const std::string& error, db::model::ErrorKind kind, offsync::model::OperationStatus next_status,
                  uint64_t next_attempt_at_ms);

  void MarkConflicted(const std::string& id, const offsync::v1::ConflictInfo& conflict);

  // Rewrites an in-flight operation after a merge; it goes back to pending.
  // target_id adopts the remote id of a create that collided with an existing record.
  db::model::OperationRecord Reschedule(const std::string& id, db::model::OperationKind kind, const offsync::model::Document& payload,
                                        const ServerState& base, const std::optional<std::string>& target_id = std::nullopt);

  // Removes the operation and aligns the cache with the server state.
  void Discard(const std::string& id, const std::string& reason, const std::optional<ServerState>& server);

  // ---------------------------------------------------------------------
  // Manual controls
  // ---------------------------------------------------------------------

  // Throws util::InvalidState for conflicted, in-flight or not yet persisted operations.
  void Retry(const std::string& id);

  void ResolveConflict(const std::string& id, ConflictChoice choice, const std::optional<offsync::model::Document>& manual_payload,
                       bool merge_non_conflicting);

  // Drops every operation that is not in flight. Returns how many were removed.
  size_t Clear();

  // in_flight -> retrying, ready now. Returns how many were reset.
  size_t RecoverInFlight();

  // Re-appends operations accepted while storage was down. Returns how many landed.
  size_t FlushUnpersisted();

  size_t UnpersistedCount() const;

 private:
  int32_t PriorityFor(const std::string& collection) const;

  void AppendLocked(db::Transaction& tx, const db::model::OperationRecord& record);

  db::model::OperationRecord LoadLocked(db::Transaction& tx, const std::string& id);

  void TransitionLocked(db::model::OperationRecord& record, offsync::model::OperationStatus to);

  // Operations other than `exclude_id` whose optimistic effect lands on (collection, key).
  std::vector<db::model::OperationRecord> TouchingLocked(db::Transaction& tx, const std::string& collection, const std::string& key,
                                                         const std::string& exclude_id);

  // Server state with every remaining operation on (collection, key) re-applied on top.
  void RecomputeCacheLocked(db::Transaction& tx, const std::string& collection, const std::string& key, const std::string& exclude_id,
                            const ServerState& server);

  // Restores the removed operation's base snapshot, or drops the entry, unless another operation still touches it.
  void RollbackCacheLocked(db::Transaction& tx, const db::model::OperationRecord& removed);

  // Moves a create's local entry and every operation targeting its local key to `target_id`.
  void RetargetLocked(db::Transaction& tx, db::model::OperationRecord& op, const std::string& target_id);

  // Later operations were derived from the provisional version; move them onto the confirmed one.
  void RebaseFollowersLocked(db::Transaction& tx, const db::model::OperationRecord& confirmed_op, const ServerState& server);

  std::shared_ptr<db::Repository>          repository_;
  std::shared_ptr<util::Clock>             clock_;
  std::unordered_map<std::string, int32_t> priorities_;

  mutable std::mutex                      mutex_;
  uint64_t                                next_sequence_ = 1;
  uint64_t                                last_enqueued_at_ms_ = 0;
  std::vector<db::model::OperationRecord> unpersisted_;
};

} // namespace offsync::queue
