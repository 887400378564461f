#include "control_server.hpp"

#include "grpc_error.hpp"
#include "internal/observability/logging.hpp"
#include "offsync/v1.hpp"

namespace offsync::grpc {

using namespace offsync::v1;
using google::protobuf::Empty;

namespace {

// Runs one handler and maps exceptions to a status.
template <typename Fn>
::grpc::Status Handle(const char* route, Fn&& fn) {
  try {
    fn();
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    OFFSYNC_LOG_WARN("RPC failed", {observability::StringField("route", route), observability::StringField("error", e.what())});
    return ToStatus(e);
  }
}

} // namespace

ControlServer::ControlServer(std::shared_ptr<offsync::service::ControlService> svc) : service_(std::move(svc)) {
}

::grpc::Status ControlServer::Status(::grpc::ServerContext*, const StatusRequest* req, StatusResponse* resp) {
  return Handle("SyncControlService.Status", [&] { *resp = service_->Status(*req); });
}

::grpc::Status ControlServer::Enqueue(::grpc::ServerContext*, const EnqueueRequest* req, EnqueueResponse* resp) {
  return Handle("SyncControlService.Enqueue", [&] { *resp = service_->Enqueue(*req); });
}

::grpc::Status ControlServer::Read(::grpc::ServerContext*, const ReadRequest* req, ReadResponse* resp) {
  return Handle("SyncControlService.Read", [&] { *resp = service_->Read(*req); });
}

::grpc::Status ControlServer::SyncNow(::grpc::ServerContext*, const Empty*, Empty*) {
  return Handle("SyncControlService.SyncNow", [&] { service_->SyncNow(); });
}

::grpc::Status ControlServer::RetryOperation(::grpc::ServerContext*, const OperationRequest* req, Empty*) {
  return Handle("SyncControlService.RetryOperation", [&] { service_->RetryOperation(*req); });
}

::grpc::Status ControlServer::CancelOperation(::grpc::ServerContext*, const OperationRequest* req, Empty*) {
  return Handle("SyncControlService.CancelOperation", [&] { service_->CancelOperation(*req); });
}

::grpc::Status ControlServer::ResolveConflict(::grpc::ServerContext*, const ResolveConflictRequest* req, Empty*) {
  return Handle("SyncControlService.ResolveConflict", [&] { service_->ResolveConflict(*req); });
}

::grpc::Status ControlServer::ClearQueue(::grpc::ServerContext*, const Empty*, Empty*) {
  return Handle("SyncControlService.ClearQueue", [&] { service_->ClearQueue(); });
}

::grpc::Status ControlServer::RefreshCache(::grpc::ServerContext*, const Empty*, Empty*) {
  return Handle("SyncControlService.RefreshCache", [&] { service_->RefreshCache(); });
}

::grpc::Status ControlServer::ClearCache(::grpc::ServerContext*, const ClearCacheRequest* req, Empty*) {
  return Handle("SyncControlService.ClearCache", [&] { service_->ClearCache(*req); });
}

::grpc::Status ControlServer::SetOnline(::grpc::ServerContext*, const SetOnlineRequest* req, Empty*) {
  return Handle("SyncControlService.SetOnline", [&] { service_->SetOnline(*req); });
}

} // namespace offsync::grpc
