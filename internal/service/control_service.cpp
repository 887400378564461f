#include "control_service.hpp"

#include <optional>
#include <string>

#include "internal/engine/sync_engine.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "offsync/v1.hpp"

namespace offsync::service {

using namespace offsync::v1;
using db::model::OperationKind;

namespace {

std::optional<OperationKind> FromProto(offsync::v1::OperationKind kind) {
  switch (kind) {
    case OPERATION_KIND_CREATE:
      return OperationKind::kCreate;
    case OPERATION_KIND_UPDATE:
      return OperationKind::kUpdate;
    case OPERATION_KIND_DELETE:
      return OperationKind::kDelete;
    default:
      return std::nullopt;
  }
}

offsync::v1::OperationKind ToProto(OperationKind kind) {
  switch (kind) {
    case OperationKind::kCreate:
      return OPERATION_KIND_CREATE;
    case OperationKind::kUpdate:
      return OPERATION_KIND_UPDATE;
    case OperationKind::kDelete:
      return OPERATION_KIND_DELETE;
  }
  return OPERATION_KIND_UNSPECIFIED;
}

queue::ConflictChoice FromProto(offsync::v1::ConflictChoice choice) {
  switch (choice) {
    case CONFLICT_CHOICE_ACCEPT_LOCAL:
      return queue::ConflictChoice::kAcceptLocal;
    case CONFLICT_CHOICE_ACCEPT_REMOTE:
      return queue::ConflictChoice::kAcceptRemote;
    case CONFLICT_CHOICE_MANUAL:
      return queue::ConflictChoice::kManual;
    case CONFLICT_CHOICE_CANCEL:
      return queue::ConflictChoice::kCancel;
    default:
      throw util::InvalidArgument("conflict choice is required");
  }
}

void ToView(const queue::PendingOperation& pending, OperationView* view) {
  const auto& op = pending.record;
  view->set_id(op.id);
  view->set_kind(ToProto(op.kind));
  view->set_collection(op.collection);
  view->set_target_id(op.target_id.value_or(""));
  *view->mutable_payload() = op.payload;
  view->set_has_base_version(op.base_version.has_value());
  view->set_base_version(op.base_version.value_or(0));
  view->set_enqueued_at_ms(op.enqueued_at_ms);
  view->set_attempts(op.attempts);
  view->set_last_error(op.last_error);
  view->set_priority(op.priority);
  view->set_status(static_cast<offsync::v1::OperationStatus>(op.status));
  view->set_next_attempt_at_ms(op.next_attempt_at_ms);
  view->set_persisted(pending.persisted);
  if (op.conflict) {
    *view->mutable_conflict() = *op.conflict;
  }
}

} // namespace

ControlService::ControlService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

StatusResponse ControlService::Status(const StatusRequest& req) {
  auto status = ctx_.engine->GetStatus(req.include_operations());

  StatusResponse resp;
  resp.set_pending_count(status.pending_count);
  resp.set_failed_count(status.failed_count);
  resp.set_conflicted_count(status.conflicted_count);
  resp.set_unpersisted_count(status.unpersisted_count);
  resp.set_is_processing(status.is_processing);
  resp.set_is_online(status.is_online);
  for (const auto& op : status.operations) {
    ToView(op, resp.add_operations());
  }
  return resp;
}

EnqueueResponse ControlService::Enqueue(const EnqueueRequest& req) {
  auto kind = FromProto(req.kind());
  if (!kind) {
    throw util::InvalidArgument("operation kind is required");
  }

  queue::EnqueueRequest request;
  request.kind       = *kind;
  request.collection = req.collection();
  if (!req.target_id().empty()) {
    request.target_id = req.target_id();
  }
  request.payload = req.payload();
  if (req.has_base_version()) {
    request.base_version = req.base_version();
  }

  EnqueueResponse resp;
  resp.set_id(ctx_.engine->Enqueue(request));
  return resp;
}

ReadResponse ControlService::Read(const ReadRequest& req) {
  auto result = ctx_.engine->Read(req.collection(), req.key());

  ReadResponse resp;
  resp.set_found(result.found);
  if (result.found) {
    *resp.mutable_data() = result.data;
  }
  resp.set_version(result.version);
  resp.set_provisional(result.provisional);
  resp.set_stale(result.stale);
  resp.set_from_cache(result.from_cache);
  return resp;
}

void ControlService::SyncNow() {
  if (!ctx_.engine->IsOnline()) {
    throw util::InvalidState("engine is offline");
  }
  ctx_.engine->SyncNow();
}

void ControlService::RetryOperation(const OperationRequest& req) {
  ctx_.engine->RetryOperation(req.id());
}

void ControlService::CancelOperation(const OperationRequest& req) {
  ctx_.engine->CancelOperation(req.id());
}

void ControlService::ResolveConflict(const ResolveConflictRequest& req) {
  std::optional<offsync::model::Document> payload;
  if (req.has_payload()) {
    payload = req.payload();
  }
  ctx_.engine->ResolveConflict(req.id(), FromProto(req.choice()), payload, req.merge_non_conflicting());
}

void ControlService::ClearQueue() {
  const auto removed = ctx_.engine->ClearQueue();
  OFFSYNC_LOG_INFO("Queue cleared on request", {observability::IntField("operations", static_cast<int64_t>(removed))});
}

void ControlService::RefreshCache() {
  ctx_.engine->RefreshCache();
}

void ControlService::ClearCache(const ClearCacheRequest& req) {
  std::optional<std::string> collection;
  if (!req.collection().empty()) {
    collection = req.collection();
  }
  ctx_.engine->ClearCache(collection);
}

void ControlService::SetOnline(const SetOnlineRequest& req) {
  ctx_.engine->SetOnline(req.online());
}

}
