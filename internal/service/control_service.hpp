#pragma once

#include <google/protobuf/empty.pb.h>

#include "offsync/v1/sync_control_service.pb.h"
#include "service_context.hpp"

namespace offsync::service {

/*
  Proto-facing side of the sync engine: converts requests, calls the
  engine, converts results. Errors propagate as util exceptions.
*/
class ControlService {
public:
  explicit ControlService(ServiceContext ctx);

  offsync::v1::StatusResponse Status(const offsync::v1::StatusRequest& req);

  offsync::v1::EnqueueResponse Enqueue(const offsync::v1::EnqueueRequest& req);

  offsync::v1::ReadResponse Read(const offsync::v1::ReadRequest& req);

  void SyncNow();

  void RetryOperation(const offsync::v1::OperationRequest& req);

  void CancelOperation(const offsync::v1::OperationRequest& req);

  void ResolveConflict(const offsync::v1::ResolveConflictRequest& req);

  void ClearQueue();

  void RefreshCache();

  void ClearCache(const offsync::v1::ClearCacheRequest& req);

  void SetOnline(const offsync::v1::SetOnlineRequest& req);

private:
  ServiceContext ctx_;
};

}
