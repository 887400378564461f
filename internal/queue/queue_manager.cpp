#include "queue_manager.hpp"

#include <algorithm>
#include <set>
#include <utility>

#include "internal/db/api/db_errors.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace offsync::queue {

using db::ThrowIfDbError;
using db::model::CacheRecord;
using db::model::ErrorKind;
using db::model::OperationKind;
using db::model::OperationRecord;
using offsync::model::OperationStatus;
using observability::IntField;
using observability::StringField;

namespace {

constexpr int32_t kDefaultPriority = 999;

std::string_view KindName(OperationKind kind) {
  switch (kind) {
    case OperationKind::kCreate:
      return "create";
    case OperationKind::kUpdate:
      return "update";
    case OperationKind::kDelete:
      return "delete";
  }
  return "unknown";
}

void Validate(const EnqueueRequest& request) {
  if (request.collection.empty()) {
    throw util::InvalidArgument("collection is required");
  }
  if (request.kind != OperationKind::kCreate && (!request.target_id || request.target_id->empty())) {
    throw util::InvalidArgument(std::string(KindName(request.kind)) + " requires a target id");
  }
  if (request.kind != OperationKind::kDelete && request.payload.fields().empty()) {
    throw util::InvalidArgument(std::string(KindName(request.kind)) + " requires a payload");
  }
}

// Optimistic effect of one operation on a cache entry.
void ApplyOptimistic(CacheRecord& entry, const OperationRecord& op, uint64_t now_ms) {
  if (op.kind == OperationKind::kDelete) {
    entry.deleted = true;
  } else {
    entry.data    = entry.deleted ? op.payload : offsync::model::Overlay(entry.data, op.payload);
    entry.deleted = false;
  }
  entry.version       = op.base_version ? *op.base_version + 1 : 0;
  entry.provisional   = true;
  entry.fetched_at_ms = now_ms;
}

bool Touches(const OperationRecord& op, const std::string& collection, const std::string& key) {
  return op.collection == collection && op.CacheKey() == key;
}

} // namespace

QueueManager::QueueManager(std::shared_ptr<db::Repository> repository, std::shared_ptr<util::Clock> clock,
                           std::unordered_map<std::string, int32_t> priorities)
    : repository_(std::move(repository)), clock_(std::move(clock)), priorities_(std::move(priorities)) {
  auto tx        = repository_->Begin();
  next_sequence_ = repository_->MaxSequence(*tx) + 1;
  for (const auto& record : repository_->ListOperations(*tx)) {
    last_enqueued_at_ms_ = std::max(last_enqueued_at_ms_, record.enqueued_at_ms);
  }
  tx->Commit();
}

int32_t QueueManager::PriorityFor(const std::string& collection) const {
  auto it = priorities_.find(collection);
  return it == priorities_.end() ? kDefaultPriority : it->second;
}

// ------------------------------------------------------------------
// Enqueue / cancel / list
// ------------------------------------------------------------------

std::string QueueManager::Enqueue(const EnqueueRequest& request) {
  Validate(request);

  std::lock_guard lock(mutex_);

  OperationRecord record;
  record.id         = util::NewId();
  record.kind       = request.kind;
  record.collection = request.collection;
  record.target_id  = request.target_id;
  if (request.kind != OperationKind::kDelete) {
    record.payload = request.payload;
  }
  record.base_version   = request.base_version;
  // the wall clock may step back; enqueue time must not
  record.enqueued_at_ms = std::max(clock_->NowMs(), last_enqueued_at_ms_);
  record.sequence       = next_sequence_++;
  last_enqueued_at_ms_  = record.enqueued_at_ms;
  record.priority       = PriorityFor(request.collection);
  record.status         = OperationStatus::kPending;

  try {
    auto tx = repository_->Begin();

    if (record.kind != OperationKind::kCreate) {
      const auto key      = record.CacheKey();
      const auto touching = TouchingLocked(*tx, record.collection, key, record.id);
      if (!touching.empty()) {
        // server state the previous local edit will produce
        const auto& last = touching.back();
        if (last.base_snapshot && last.kind != OperationKind::kDelete) {
          record.base_snapshot = offsync::model::Overlay(*last.base_snapshot, last.payload);
        }
      } else if (auto existing = repository_->GetCache(*tx, record.collection, key); existing && !existing->provisional && !existing->deleted) {
        record.base_snapshot = existing->data;
      }
    }

    AppendLocked(*tx, record);
    tx->Commit();
  } catch (const util::StorageUnavailable& e) {
    OFFSYNC_LOG_WARN("Operation kept in memory only; it will be lost if the process exits before storage recovers",
                     {StringField("operation_id", record.id), StringField("collection", record.collection), StringField("error", e.what())});
    unpersisted_.push_back(record);
    return record.id;
  }

  OFFSYNC_LOG_DEBUG("Operation enqueued", {StringField("operation_id", record.id), StringField("kind", KindName(record.kind)),
                                           StringField("collection", record.collection), StringField("key", record.CacheKey())});
  return record.id;
}

bool QueueManager::Cancel(const std::string& id) {
  std::lock_guard lock(mutex_);

  auto it = std::find_if(unpersisted_.begin(), unpersisted_.end(), [&](const OperationRecord& r) { return r.id == id; });
  if (it != unpersisted_.end()) {
    unpersisted_.erase(it);
    return true;
  }

  auto tx     = repository_->Begin();
  auto record = repository_->GetOperation(*tx, id);
  if (!record || record->status == OperationStatus::kInFlight) {
    return false;
  }

  ThrowIfDbError(repository_->RemoveOperation(*tx, id), "cancel operation");
  RollbackCacheLocked(*tx, *record);
  tx->Commit();

  OFFSYNC_LOG_INFO("Operation cancelled", {StringField("operation_id", id), StringField("status", ToString(record->status))});
  return true;
}

std::vector<PendingOperation> QueueManager::ListPending() {
  std::lock_guard lock(mutex_);

  auto tx      = repository_->BeginRead();
  auto records = repository_->ListOperations(*tx);
  tx->Commit();

  std::vector<PendingOperation> out;
  out.reserve(records.size() + unpersisted_.size());
  for (auto& record : records) {
    out.push_back({std::move(record), true});
  }
  for (const auto& record : unpersisted_) {
    out.push_back({record, false});
  }

  std::stable_sort(out.begin(), out.end(),
                   [](const PendingOperation& a, const PendingOperation& b) { return db::model::DeliversBefore(a.record, b.record); });
  return out;
}

std::optional<OperationRecord> QueueManager::Get(const std::string& id) {
  std::lock_guard lock(mutex_);

  for (const auto& record : unpersisted_) {
    if (record.id == id) return record;
  }

  auto tx     = repository_->BeginRead();
  auto record = repository_->GetOperation(*tx, id);
  tx->Commit();
  return record;
}

size_t QueueManager::UnpersistedCount() const {
  std::lock_guard lock(mutex_);
  return unpersisted_.size();
}

// ------------------------------------------------------------------
// Delivery lifecycle
// ------------------------------------------------------------------

OperationRecord QueueManager::MarkAttemptStart(const std::string& id) {
  std::lock_guard lock(mutex_);

  auto tx     = repository_->Begin();
  auto record = LoadLocked(*tx, id);
  TransitionLocked(record, OperationStatus::kInFlight);
  record.attempts++;
  ThrowIfDbError(repository_->UpdateOperation(*tx, record), "start attempt");
  tx->Commit();
  return record;
}

void QueueManager::MarkSucceeded(const std::string& id, const Confirmation& confirmation) {
  std::lock_guard lock(mutex_);

  auto tx = repository_->Begin();
  auto op = LoadLocked(*tx, id);
  if (op.status != OperationStatus::kInFlight) {
    throw util::InvalidState("operation " + id + " is not in flight");
  }
  ThrowIfDbError(repository_->RemoveOperation(*tx, id), "remove delivered operation");

  if (op.kind == OperationKind::kCreate && confirmation.target_id && !confirmation.target_id->empty()) {
    // the record now lives under the id the remote assigned
    RetargetLocked(*tx, op, *confirmation.target_id);
  }

  ServerState server;
  server.version = confirmation.version;
  if (op.kind == OperationKind::kDelete) {
    server.deleted = true;
  } else if (confirmation.snapshot) {
    server.snapshot = *confirmation.snapshot;
  } else {
    server.snapshot = offsync::model::Overlay(op.base_snapshot.value_or(offsync::model::Document{}), op.payload);
  }

  if (!server.deleted) {
    RebaseFollowersLocked(*tx, op, server);
  }
  RecomputeCacheLocked(*tx, op.collection, op.CacheKey(), op.id, server);
  tx->Commit();

  OFFSYNC_LOG_INFO("Operation delivered", {StringField("operation_id", id), StringField("collection", op.collection),
                                           StringField("key", op.CacheKey()), IntField("version", static_cast<int64_t>(server.version)),
                                           IntField("attempts", op.attempts)});
}

void QueueManager::MarkFailed(const std::string& id, const std::string& error, ErrorKind kind, OperationStatus next_status,
                              uint64_t next_attempt_at_ms) {
  if (next_status != OperationStatus::kRetrying && next_status != OperationStatus::kAbandoned && next_status != OperationStatus::kRejected) {
    throw util::InvalidArgument("failure status must be retrying, abandoned or rejected");
  }

  std::lock_guard lock(mutex_);

  auto tx     = repository_->Begin();
  auto record = LoadLocked(*tx, id);
  TransitionLocked(record, next_status);
  record.last_error         = error;
  record.error_kind         = kind;
  record.next_attempt_at_ms = next_status == OperationStatus::kRetrying ? next_attempt_at_ms : 0;
  ThrowIfDbError(repository_->UpdateOperation(*tx, record), "record failure");
  tx->Commit();

  if (next_status == OperationStatus::kRetrying) {
    OFFSYNC_LOG_WARN("Delivery failed; retry scheduled", {StringField("operation_id", id), StringField("error", error),
                                                          IntField("attempts", record.attempts),
                                                          IntField("next_attempt_at_ms", static_cast<int64_t>(next_attempt_at_ms))});
  } else {
    OFFSYNC_LOG_ERROR("Delivery failed permanently", {StringField("operation_id", id), StringField("error", error),
                                                      StringField("status", ToString(next_status)), IntField("attempts", record.attempts)});
  }
}

void QueueManager::MarkConflicted(const std::string& id, const offsync::v1::ConflictInfo& conflict) {
  std::lock_guard lock(mutex_);

  auto tx     = repository_->Begin();
  auto record = LoadLocked(*tx, id);
  TransitionLocked(record, OperationStatus::kConflicted);
  record.conflict           = conflict;
  record.last_error         = "conflict: " + conflict.reason();
  record.error_kind         = ErrorKind::kConflict;
  record.next_attempt_at_ms = 0;
  ThrowIfDbError(repository_->UpdateOperation(*tx, record), "record conflict");
  tx->Commit();

  OFFSYNC_LOG_WARN("Operation needs a conflict decision", {StringField("operation_id", id), StringField("reason", conflict.reason()),
                                                           IntField("conflicting_fields", conflict.fields_size())});
}

OperationRecord QueueManager::Reschedule(const std::string& id, OperationKind kind, const offsync::model::Document& payload,
                                         const ServerState& base, const std::optional<std::string>& target_id) {
  std::lock_guard lock(mutex_);

  auto tx     = repository_->Begin();
  auto record = LoadLocked(*tx, id);
  if (record.status != OperationStatus::kInFlight) {
    throw util::InvalidState("operation " + id + " is not in flight");
  }
  if (target_id && !target_id->empty() && !record.target_id) {
    RetargetLocked(*tx, record, *target_id);
  }
  TransitionLocked(record, OperationStatus::kPending);
  record.kind    = kind;
  record.payload = kind == OperationKind::kDelete ? offsync::model::Document{} : payload;
  if (base.deleted) {
    record.base_version.reset();
    record.base_snapshot.reset();
  } else {
    record.base_version  = base.version;
    record.base_snapshot = base.snapshot;
  }
  record.conflict.reset();
  record.next_attempt_at_ms = 0;
  ThrowIfDbError(repository_->UpdateOperation(*tx, record), "reschedule operation");
  RecomputeCacheLocked(*tx, record.collection, record.CacheKey(), "", base);
  tx->Commit();
  return record;
}

void QueueManager::Discard(const std::string& id, const std::string& reason, const std::optional<ServerState>& server) {
  std::lock_guard lock(mutex_);

  auto tx     = repository_->Begin();
  auto record = LoadLocked(*tx, id);
  ThrowIfDbError(repository_->RemoveOperation(*tx, id), "discard operation");
  if (server) {
    RecomputeCacheLocked(*tx, record.collection, record.CacheKey(), id, *server);
  } else {
    RollbackCacheLocked(*tx, record);
  }
  tx->Commit();

  OFFSYNC_LOG_INFO("Operation discarded", {StringField("operation_id", id), StringField("reason", reason)});
}

// ------------------------------------------------------------------
// Manual controls
// ------------------------------------------------------------------

void QueueManager::Retry(const std::string& id) {
  std::lock_guard lock(mutex_);

  for (const auto& record : unpersisted_) {
    if (record.id == id) throw util::InvalidState("operation " + id + " is not persisted yet");
  }

  auto tx     = repository_->Begin();
  auto record = LoadLocked(*tx, id);
  if (record.status == OperationStatus::kConflicted) {
    throw util::InvalidState("operation " + id + " is conflicted; resolve the conflict instead");
  }
  if (record.status == OperationStatus::kInFlight) {
    throw util::InvalidState("operation " + id + " is in flight");
  }

  TransitionLocked(record, OperationStatus::kPending);
  record.attempts           = 0;
  record.next_attempt_at_ms = 0;
  record.last_error.clear();
  record.error_kind = ErrorKind::kNone;
  ThrowIfDbError(repository_->UpdateOperation(*tx, record), "retry operation");
  tx->Commit();

  OFFSYNC_LOG_INFO("Operation queued for retry", {StringField("operation_id", id)});
}

void QueueManager::ResolveConflict(const std::string& id, ConflictChoice choice, const std::optional<offsync::model::Document>& manual_payload,
                                   bool merge_non_conflicting) {
  std::lock_guard lock(mutex_);

  auto tx     = repository_->Begin();
  auto record = LoadLocked(*tx, id);
  if (record.status != OperationStatus::kConflicted || !record.conflict) {
    throw util::InvalidState("operation " + id + " has no pending conflict");
  }

  const auto& info = *record.conflict;
  ServerState remote;
  remote.snapshot = info.remote_snapshot();
  remote.version  = info.remote_version();
  remote.deleted  = info.remote_deleted();

  switch (choice) {
    case ConflictChoice::kAcceptRemote:
      ThrowIfDbError(repository_->RemoveOperation(*tx, id), "accept remote");
      RecomputeCacheLocked(*tx, record.collection, record.CacheKey(), id, remote);
      break;

    case ConflictChoice::kCancel: {
      ThrowIfDbError(repository_->RemoveOperation(*tx, id), "cancel conflicted operation");
      if (TouchingLocked(*tx, record.collection, record.CacheKey(), id).empty()) {
        ThrowIfDbError(repository_->DeleteCache(*tx, record.collection, record.CacheKey()), "invalidate entry");
      }
      break;
    }

    case ConflictChoice::kAcceptLocal:
    case ConflictChoice::kManual: {
      if (choice == ConflictChoice::kManual && !manual_payload) {
        throw util::InvalidArgument("manual resolution requires a payload");
      }
      auto payload = choice == ConflictChoice::kManual ? *manual_payload : record.payload;
      if (merge_non_conflicting && !remote.deleted) {
        payload = offsync::model::Overlay(remote.snapshot, payload);
      }

      if (remote.deleted) {
        record.kind = OperationKind::kCreate;
      } else if (record.kind == OperationKind::kCreate || (record.kind == OperationKind::kDelete && choice == ConflictChoice::kManual)) {
        record.kind = OperationKind::kUpdate;
      }

      record.payload = record.kind == OperationKind::kDelete ? offsync::model::Document{} : payload;
      if (remote.deleted) {
        record.base_version.reset();
        record.base_snapshot.reset();
      } else {
        record.base_version  = remote.version;
        record.base_snapshot = remote.snapshot;
      }

      TransitionLocked(record, OperationStatus::kPending);
      record.attempts           = 0;
      record.next_attempt_at_ms = 0;
      record.conflict.reset();
      record.last_error.clear();
      record.error_kind = ErrorKind::kNone;
      ThrowIfDbError(repository_->UpdateOperation(*tx, record), "requeue resolved operation");
      RecomputeCacheLocked(*tx, record.collection, record.CacheKey(), "", remote);
      break;
    }
  }
  tx->Commit();

  OFFSYNC_LOG_INFO("Conflict resolved", {StringField("operation_id", id), IntField("choice", static_cast<int>(choice))});
}

size_t QueueManager::Clear() {
  std::lock_guard lock(mutex_);

  size_t removed_count = unpersisted_.size();
  unpersisted_.clear();

  auto tx      = repository_->Begin();
  auto records = repository_->ListOperations(*tx);

  std::vector<OperationRecord> removed;
  for (const auto& record : records) {
    if (record.status == OperationStatus::kInFlight) continue;
    ThrowIfDbError(repository_->RemoveOperation(*tx, record.id), "clear queue");
    removed.push_back(record);
  }

  // the earliest removed operation per entry holds the oldest server state
  std::set<std::pair<std::string, std::string>> rolled_back;
  for (const auto& record : removed) {
    if (rolled_back.insert({record.collection, record.CacheKey()}).second) {
      RollbackCacheLocked(*tx, record);
    }
  }
  tx->Commit();

  removed_count += removed.size();
  OFFSYNC_LOG_INFO("Queue cleared", {IntField("removed", static_cast<int64_t>(removed_count))});
  return removed_count;
}

size_t QueueManager::RecoverInFlight() {
  std::lock_guard lock(mutex_);

  auto   tx        = repository_->Begin();
  size_t recovered = 0;
  for (auto& record : repository_->ListOperations(*tx)) {
    if (record.status != OperationStatus::kInFlight) continue;
    TransitionLocked(record, OperationStatus::kRetrying);
    record.next_attempt_at_ms = 0;
    ThrowIfDbError(repository_->UpdateOperation(*tx, record), "recover in-flight operation");
    ++recovered;
  }
  next_sequence_ = std::max(next_sequence_, repository_->MaxSequence(*tx) + 1);
  tx->Commit();

  if (recovered > 0) {
    OFFSYNC_LOG_WARN("Recovered interrupted deliveries", {IntField("operations", static_cast<int64_t>(recovered))});
  }
  return recovered;
}

size_t QueueManager::FlushUnpersisted() {
  std::lock_guard lock(mutex_);

  size_t flushed = 0;
  while (!unpersisted_.empty()) {
    try {
      auto tx = repository_->Begin();
      AppendLocked(*tx, unpersisted_.front());
      tx->Commit();
    } catch (const util::StorageUnavailable& e) {
      OFFSYNC_LOG_WARN("Storage still unavailable; operations remain in memory",
                       {IntField("unpersisted", static_cast<int64_t>(unpersisted_.size())), StringField("error", e.what())});
      break;
    }
    unpersisted_.erase(unpersisted_.begin());
    ++flushed;
  }

  if (flushed > 0) {
    OFFSYNC_LOG_INFO("Persisted operations accepted while storage was down", {IntField("operations", static_cast<int64_t>(flushed))});
  }
  return flushed;
}

// ------------------------------------------------------------------
// Helpers (mutex_ held)
// ------------------------------------------------------------------

void QueueManager::AppendLocked(db::Transaction& tx, const OperationRecord& record) {
  ThrowIfDbError(repository_->AppendOperation(tx, record), "append operation");

  const auto key = record.CacheKey();
  auto       entry = repository_->GetCache(tx, record.collection, key).value_or(CacheRecord{record.collection, key});
  ApplyOptimistic(entry, record, clock_->NowMs());
  ThrowIfDbError(repository_->PutCache(tx, entry), "apply optimistic update");
}

OperationRecord QueueManager::LoadLocked(db::Transaction& tx, const std::string& id) {
  auto record = repository_->GetOperation(tx, id);
  if (!record) {
    throw util::NotFound("operation " + id + " not found");
  }
  return *record;
}

void QueueManager::TransitionLocked(OperationRecord& record, OperationStatus to) {
  if (!offsync::model::CanTransition(record.status, to)) {
    throw util::InvalidState("operation " + record.id + " cannot move from " + std::string(ToString(record.status)) + " to " +
                             std::string(ToString(to)));
  }
  record.status = to;
}

std::vector<OperationRecord> QueueManager::TouchingLocked(db::Transaction& tx, const std::string& collection, const std::string& key,
                                                          const std::string& exclude_id) {
  std::vector<OperationRecord> out;
  for (auto& record : repository_->ListOperations(tx)) {
    if (record.id != exclude_id && Touches(record, collection, key)) {
      out.push_back(std::move(record));
    }
  }
  for (const auto& record : unpersisted_) {
    if (record.id != exclude_id && Touches(record, collection, key)) {
      out.push_back(record);
    }
  }
  std::stable_sort(out.begin(), out.end(), db::model::DeliversBefore);
  return out;
}

void QueueManager::RecomputeCacheLocked(db::Transaction& tx, const std::string& collection, const std::string& key,
                                        const std::string& exclude_id, const ServerState& server) {
  const auto now = clock_->NowMs();

  CacheRecord entry;
  entry.collection    = collection;
  entry.key           = key;
  entry.data          = server.snapshot;
  entry.version       = server.version;
  entry.fetched_at_ms = now;
  entry.deleted       = server.deleted;

  for (const auto& op : TouchingLocked(tx, collection, key, exclude_id)) {
    ApplyOptimistic(entry, op, now);
  }

  if (entry.deleted && !entry.provisional) {
    ThrowIfDbError(repository_->DeleteCache(tx, collection, key), "drop deleted entry");
  } else {
    ThrowIfDbError(repository_->PutCache(tx, entry), "write confirmed entry");
  }
}

void QueueManager::RollbackCacheLocked(db::Transaction& tx, const OperationRecord& removed) {
  const auto key = removed.CacheKey();
  if (!TouchingLocked(tx, removed.collection, key, removed.id).empty()) {
    return;
  }

  if (removed.base_snapshot && removed.base_version) {
    CacheRecord entry;
    entry.collection    = removed.collection;
    entry.key           = key;
    entry.data          = *removed.base_snapshot;
    entry.version       = *removed.base_version;
    entry.fetched_at_ms = removed.enqueued_at_ms;
    ThrowIfDbError(repository_->PutCache(tx, entry), "restore base snapshot");
  } else {
    ThrowIfDbError(repository_->DeleteCache(tx, removed.collection, key), "drop optimistic entry");
  }
}

void QueueManager::RetargetLocked(db::Transaction& tx, OperationRecord& op, const std::string& target_id) {
  const auto local_key = op.CacheKey();
  op.target_id         = target_id;
  if (local_key == target_id) {
    return;
  }

  ThrowIfDbError(repository_->DeleteCache(tx, op.collection, local_key), "move created entry");
  for (auto& follower : repository_->ListOperations(tx)) {
    if (follower.id != op.id && follower.collection == op.collection && follower.target_id == local_key) {
      follower.target_id = target_id;
      ThrowIfDbError(repository_->UpdateOperation(tx, follower), "retarget operation");
    }
  }
  for (auto& follower : unpersisted_) {
    if (follower.collection == op.collection && follower.target_id == local_key) {
      follower.target_id = target_id;
    }
  }
}

void QueueManager::RebaseFollowersLocked(db::Transaction& tx, const OperationRecord& confirmed_op, const ServerState& server) {
  for (auto follower : TouchingLocked(tx, confirmed_op.collection, confirmed_op.CacheKey(), confirmed_op.id)) {
    bool chained = false;
    if (confirmed_op.base_version) {
      // derived from the same base, or from the provisional base + 1
      chained = follower.base_version &&
                (*follower.base_version == *confirmed_op.base_version || *follower.base_version == *confirmed_op.base_version + 1);
    } else {
      chained = !follower.base_version || *follower.base_version == 0;
    }
    if (!chained) continue;

    follower.base_version  = server.version;
    follower.base_snapshot = server.snapshot;

    auto pending = std::find_if(unpersisted_.begin(), unpersisted_.end(), [&](const OperationRecord& r) { return r.id == follower.id; });
    if (pending != unpersisted_.end()) {
      *pending = follower;
    } else {
      ThrowIfDbError(repository_->UpdateOperation(tx, follower), "rebase operation");
    }
  }
}

} // namespace offsync::queue
