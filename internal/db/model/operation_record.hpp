#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/model/document.hpp"
#include "internal/model/state_machine.hpp"
#include "offsync/v1/types.pb.h"

namespace offsync::db::model {

enum class OperationKind : std::uint8_t {
  kCreate = 1,
  kUpdate = 2,
  kDelete = 3,
};

enum class ErrorKind : std::uint8_t {
  kNone       = 0,
  kTransport  = 1,
  kConflict   = 2,
  kValidation = 3,
  kFatal      = 4,
  kStorage    = 5,
};

/*
  Persistent operation log row.

  IMPORTANT:
  - The log is the single source of truth for what has not yet reached
    the server.
  - id doubles as the idempotency key on the wire.
  - Rows are always replaced whole, never patched column by column.
*/
struct OperationRecord {
  std::string   id;
  OperationKind kind = OperationKind::kUpdate;
  std::string   collection;

  // absent for create until the remote assigns one
  std::optional<std::string> target_id;

  offsync::model::Document payload;

  // version the mutation was derived from; absent for records unknown locally
  std::optional<uint64_t> base_version;

  // snapshot the mutation was derived from, used to tell remote edits apart
  std::optional<offsync::model::Document> base_snapshot;

  uint64_t enqueued_at_ms = 0;

  // enqueue counter; final ordering tie-break
  uint64_t sequence = 0;

  uint32_t    attempts = 0;
  std::string last_error;
  ErrorKind   error_kind = ErrorKind::kNone;
  int32_t     priority   = 0;

  offsync::model::OperationStatus status = offsync::model::OperationStatus::kPending;

  // earliest time the next attempt may start (0 = now)
  uint64_t next_attempt_at_ms = 0;

  std::optional<offsync::v1::ConflictInfo> conflict;

  // Local key until the remote assigns one; later operations may target it.
  std::string CacheKey() const {
    return target_id ? *target_id : id;
  }

  // Ordering group: operations sharing it are delivered strictly in order.
  std::string GroupKey() const {
    return collection + ":" + CacheKey();
  }
};

// Delivery order: (priority, enqueued_at, sequence).
inline bool DeliversBefore(const OperationRecord& a, const OperationRecord& b) {
  if (a.priority != b.priority) return a.priority < b.priority;
  if (a.enqueued_at_ms != b.enqueued_at_ms) return a.enqueued_at_ms < b.enqueued_at_ms;
  return a.sequence < b.sequence;
}

} // namespace offsync::db::model
