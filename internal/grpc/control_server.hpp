#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "offsync/v1/sync_control_service.grpc.pb.h"
#include "internal/service/control_service.hpp"

namespace offsync::grpc {

class ControlServer final : public offsync::v1::SyncControlService::Service {
public:
  explicit ControlServer(std::shared_ptr<offsync::service::ControlService> svc);

  ::grpc::Status Status(::grpc::ServerContext*, const offsync::v1::StatusRequest*, offsync::v1::StatusResponse*) override;

  ::grpc::Status Enqueue(::grpc::ServerContext*, const offsync::v1::EnqueueRequest*, offsync::v1::EnqueueResponse*) override;

  ::grpc::Status Read(::grpc::ServerContext*, const offsync::v1::ReadRequest*, offsync::v1::ReadResponse*) override;

  ::grpc::Status SyncNow(::grpc::ServerContext*, const google::protobuf::Empty*, google::protobuf::Empty*) override;

  ::grpc::Status RetryOperation(::grpc::ServerContext*, const offsync::v1::OperationRequest*, google::protobuf::Empty*) override;

  ::grpc::Status CancelOperation(::grpc::ServerContext*, const offsync::v1::OperationRequest*, google::protobuf::Empty*) override;

  ::grpc::Status ResolveConflict(::grpc::ServerContext*, const offsync::v1::ResolveConflictRequest*, google::protobuf::Empty*) override;

  ::grpc::Status ClearQueue(::grpc::ServerContext*, const google::protobuf::Empty*, google::protobuf::Empty*) override;

  ::grpc::Status RefreshCache(::grpc::ServerContext*, const google::protobuf::Empty*, google::protobuf::Empty*) override;

  ::grpc::Status ClearCache(::grpc::ServerContext*, const offsync::v1::ClearCacheRequest*, google::protobuf::Empty*) override;

  ::grpc::Status SetOnline(::grpc::ServerContext*, const offsync::v1::SetOnlineRequest*, google::protobuf::Empty*) override;

private:
  std::shared_ptr<offsync::service::ControlService> service_;
};

}
