#pragma once

#include <grpcpp/channel.h>

#include <memory>
#include <string>

#include "internal/remote/remote_client.hpp"
#include "offsync/v1/remote_mutation_service.grpc.pb.h"

namespace offsync::remote {

/*
  RemoteClient over offsync.v1.RemoteMutationService.

  Status mapping:
    DEADLINE_EXCEEDED, UNAVAILABLE, CANCELLED, RESOURCE_EXHAUSTED -> transport
    INVALID_ARGUMENT, FAILED_PRECONDITION                        -> validation
    NOT_FOUND                                                    -> remote deleted
    ABORTED                                                      -> conflict
    anything else                                                -> fatal
*/
class GrpcRemoteClient final : public RemoteClient {
 public:
  explicit GrpcRemoteClient(std::shared_ptr<::grpc::Channel> channel);

  // Insecure channel to `endpoint` (host:port).
  static std::shared_ptr<GrpcRemoteClient> Connect(const std::string& endpoint);

  MutationResult ApplyMutation(const MutationRequest& request, std::chrono::milliseconds timeout) override;

  SnapshotResult FetchSnapshot(const std::string& collection, const std::string& key, std::chrono::milliseconds timeout) override;

 private:
  std::unique_ptr<offsync::v1::RemoteMutationService::Stub> stub_;
};

// Exposed for tests.
Outcome OutcomeFromStatus(const ::grpc::Status& status);

} // namespace offsync::remote
