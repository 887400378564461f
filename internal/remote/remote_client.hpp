#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

#include "internal/db/model/operation_record.hpp"
#include "internal/model/document.hpp"

namespace offsync::remote {

enum class Outcome {
  kApplied,
  kConflict,
  kRemoteDeleted,
  kTransportError,
  kValidationError,
  kFatalError,
};

struct MutationRequest {
  std::string                collection;
  db::model::OperationKind   kind = db::model::OperationKind::kUpdate;
  std::optional<std::string> target_id;
  offsync::model::Document   payload;
  std::optional<uint64_t>    base_version;
  // operation id; the remote applies a key at most once
  std::string idempotency_key;
};

struct MutationResult {
  Outcome                    outcome = Outcome::kFatalError;
  std::optional<std::string> target_id;
  // server state after the mutation (applied) or the conflicting state (conflict)
  std::optional<offsync::model::Document> snapshot;
  uint64_t                                version = 0;
  std::string                             message;
};

enum class FetchStatus {
  kFound,
  kNotFound,
  kUnavailable,
  kFailed,
};

struct SnapshotResult {
  FetchStatus              status = FetchStatus::kFailed;
  offsync::model::Document snapshot;
  uint64_t                 version = 0;
  std::string              message;
};

std::string_view ToString(Outcome outcome);

/*
  Remote mutation API as seen by the engine.

  Implementations report failures through the result, never by throwing,
  and must give up once `timeout` has elapsed (reported as kTransportError
  or kUnavailable).
*/
class RemoteClient {
 public:
  virtual ~RemoteClient() = default;

  virtual MutationResult ApplyMutation(const MutationRequest& request, std::chrono::milliseconds timeout) = 0;

  virtual SnapshotResult FetchSnapshot(const std::string& collection, const std::string& key, std::chrono::milliseconds timeout) = 0;
};

} // namespace offsync::remote
