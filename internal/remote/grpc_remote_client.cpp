#include "grpc_remote_client.hpp"

#include <grpcpp/client_context.h>
#include <grpcpp/create_channel.h>
#include <grpcpp/security/credentials.h>

#include "offsync/v1.hpp"

namespace offsync::remote {

namespace {

offsync::v1::OperationKind ToProto(db::model::OperationKind kind) {
  switch (kind) {
    case db::model::OperationKind::kCreate:
      return offsync::v1::OPERATION_KIND_CREATE;
    case db::model::OperationKind::kUpdate:
      return offsync::v1::OPERATION_KIND_UPDATE;
    case db::model::OperationKind::kDelete:
      return offsync::v1::OPERATION_KIND_DELETE;
  }
  return offsync::v1::OPERATION_KIND_UNSPECIFIED;
}

void SetDeadline(::grpc::ClientContext* ctx, std::chrono::milliseconds timeout) {
  ctx->set_deadline(std::chrono::system_clock::now() + timeout);
}

} // namespace

std::string_view ToString(Outcome outcome) {
  switch (outcome) {
    case Outcome::kApplied:
      return "applied";
    case Outcome::kConflict:
      return "conflict";
    case Outcome::kRemoteDeleted:
      return "remote_deleted";
    case Outcome::kTransportError:
      return "transport_error";
    case Outcome::kValidationError:
      return "validation_error";
    case Outcome::kFatalError:
      return "fatal_error";
  }
  return "unknown";
}

Outcome OutcomeFromStatus(const ::grpc::Status& status) {
  switch (status.error_code()) {
    case ::grpc::StatusCode::OK:
      return Outcome::kApplied;
    case ::grpc::StatusCode::DEADLINE_EXCEEDED:
    case ::grpc::StatusCode::UNAVAILABLE:
    case ::grpc::StatusCode::CANCELLED:
    case ::grpc::StatusCode::RESOURCE_EXHAUSTED:
      return Outcome::kTransportError;
    case ::grpc::StatusCode::INVALID_ARGUMENT:
    case ::grpc::StatusCode::FAILED_PRECONDITION:
      return Outcome::kValidationError;
    case ::grpc::StatusCode::NOT_FOUND:
      return Outcome::kRemoteDeleted;
    case ::grpc::StatusCode::ABORTED:
      return Outcome::kConflict;
    default:
      return Outcome::kFatalError;
  }
}

GrpcRemoteClient::GrpcRemoteClient(std::shared_ptr<::grpc::Channel> channel) : stub_(offsync::v1::RemoteMutationService::NewStub(channel)) {
}

std::shared_ptr<GrpcRemoteClient> GrpcRemoteClient::Connect(const std::string& endpoint) {
  return std::make_shared<GrpcRemoteClient>(::grpc::CreateChannel(endpoint, ::grpc::InsecureChannelCredentials()));
}

MutationResult GrpcRemoteClient::ApplyMutation(const MutationRequest& request, std::chrono::milliseconds timeout) {
  offsync::v1::ApplyMutationRequest req;
  req.set_collection(request.collection);
  req.set_kind(ToProto(request.kind));
  if (request.target_id) req.set_target_id(*request.target_id);
  *req.mutable_payload() = request.payload;
  if (request.base_version) {
    req.set_has_base_version(true);
    req.set_base_version(*request.base_version);
  }
  req.set_idempotency_key(request.idempotency_key);

  ::grpc::ClientContext               ctx;
  offsync::v1::ApplyMutationResponse resp;
  SetDeadline(&ctx, timeout);
  const auto status = stub_->ApplyMutation(&ctx, req, &resp);

  MutationResult result;
  result.outcome = OutcomeFromStatus(status);
  result.message = status.error_message();

  if (status.ok()) {
    switch (resp.outcome()) {
      case offsync::v1::MUTATION_OUTCOME_CONFLICT:
        result.outcome = Outcome::kConflict;
        break;
      case offsync::v1::MUTATION_OUTCOME_REMOTE_DELETED:
        result.outcome = Outcome::kRemoteDeleted;
        break;
      default:
        result.outcome = Outcome::kApplied;
        break;
    }
    result.message = resp.message();
    if (!resp.target_id().empty()) result.target_id = resp.target_id();
    if (resp.has_snapshot()) result.snapshot = resp.snapshot();
    result.version = resp.version();
  }
  // a non-OK status carries no response body; ABORTED leaves the snapshot unset
  return result;
}

SnapshotResult GrpcRemoteClient::FetchSnapshot(const std::string& collection, const std::string& key, std::chrono::milliseconds timeout) {
  offsync::v1::FetchSnapshotRequest req;
  req.set_collection(collection);
  req.set_key(key);

  ::grpc::ClientContext               ctx;
  offsync::v1::FetchSnapshotResponse resp;
  SetDeadline(&ctx, timeout);
  const auto status = stub_->FetchSnapshot(&ctx, req, &resp);

  SnapshotResult result;
  if (status.ok()) {
    result.status = resp.found() ? FetchStatus::kFound : FetchStatus::kNotFound;
    result.snapshot = resp.snapshot();
    result.version  = resp.version();
    return result;
  }

  switch (OutcomeFromStatus(status)) {
    case Outcome::kTransportError:
      result.status = FetchStatus::kUnavailable;
      break;
    case Outcome::kRemoteDeleted:
      result.status = FetchStatus::kNotFound;
      break;
    default:
      result.status = FetchStatus::kFailed;
      break;
  }
  result.message = status.error_message();
  return result;
}

} // namespace offsync::remote
