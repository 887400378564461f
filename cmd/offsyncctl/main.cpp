#include <grpcpp/grpcpp.h>
#include <google/protobuf/util/json_util.h>

#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>

#include "offsync/v1.hpp"

using namespace offsync::v1;
using google::protobuf::Empty;

static void Usage() {
  std::cout << "Usage:\n"
            << "  offsyncctl <addr> status [--ops]\n"
            << "  offsyncctl <addr> create <collection> <json>\n"
            << "  offsyncctl <addr> update <collection> <id> <json> [base_version]\n"
            << "  offsyncctl <addr> delete <collection> <id> [base_version]\n"
            << "  offsyncctl <addr> read <collection> <id>\n"
            << "  offsyncctl <addr> sync\n"
            << "  offsyncctl <addr> retry <op_id>\n"
            << "  offsyncctl <addr> cancel <op_id>\n"
            << "  offsyncctl <addr> resolve <op_id> <local|remote|manual|cancel> [json] [--merge]\n"
            << "  offsyncctl <addr> clear-queue\n"
            << "  offsyncctl <addr> refresh-cache\n"
            << "  offsyncctl <addr> clear-cache [collection]\n"
            << "  offsyncctl <addr> online|offline\n";
}

static google::protobuf::Struct ParseJson(const std::string& json) {
  google::protobuf::Struct doc;
  auto                     status = google::protobuf::util::JsonStringToMessage(json, &doc);
  if (!status.ok()) {
    std::cerr << "invalid json: " << status.message() << "\n";
    std::exit(1);
  }
  return doc;
}

static std::string ToJson(const google::protobuf::Message& message) {
  std::string                               out;
  google::protobuf::util::JsonPrintOptions options;
  options.preserve_proto_field_names = true;
  if (!google::protobuf::util::MessageToJsonString(message, &out, options).ok()) {
    return "<unprintable>";
  }
  return out;
}

static std::optional<ConflictChoice> ParseChoice(const std::string& value) {
  if (value == "local") return CONFLICT_CHOICE_ACCEPT_LOCAL;
  if (value == "remote") return CONFLICT_CHOICE_ACCEPT_REMOTE;
  if (value == "manual") return CONFLICT_CHOICE_MANUAL;
  if (value == "cancel") return CONFLICT_CHOICE_CANCEL;
  return std::nullopt;
}

static int Report(const grpc::Status& status, const std::string& ok_message) {
  if (!status.ok()) {
    std::cerr << status.error_message() << "\n";
    return 2;
  }
  std::cout << ok_message << "\n";
  return 0;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());
  auto stub    = SyncControlService::NewStub(channel);

  grpc::ClientContext ctx;
  Empty               empty;

  // ------------------------------------------------------------

  if (cmd == "status") {
    StatusRequest req;
    req.set_include_operations(argc >= 4 && std::string(argv[3]) == "--ops");

    StatusResponse resp;

    auto status = stub->Status(&ctx, req, &resp);

    if (!status.ok()) {
      std::cerr << status.error_message() << "\n";
      return 2;
    }

    std::cout << "pending=" << resp.pending_count() << "\n";
    std::cout << "failed=" << resp.failed_count() << "\n";
    std::cout << "conflicted=" << resp.conflicted_count() << "\n";
    std::cout << "unpersisted=" << resp.unpersisted_count() << "\n";
    std::cout << "processing=" << (resp.is_processing() ? "true" : "false") << "\n";
    std::cout << "online=" << (resp.is_online() ? "true" : "false") << "\n";
    for (const auto& op : resp.operations()) {
      std::cout << ToJson(op) << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "create" || cmd == "update" || cmd == "delete") {
    EnqueueRequest req;
    int            next = 4;
    if (cmd == "create") {
      if (argc < 5) return 1;
      req.set_kind(OPERATION_KIND_CREATE);
      *req.mutable_payload() = ParseJson(argv[4]);
      next                   = 5;
    } else if (cmd == "update") {
      if (argc < 6) return 1;
      req.set_kind(OPERATION_KIND_UPDATE);
      req.set_target_id(argv[4]);
      *req.mutable_payload() = ParseJson(argv[5]);
      next                   = 6;
    } else {
      if (argc < 5) return 1;
      req.set_kind(OPERATION_KIND_DELETE);
      req.set_target_id(argv[4]);
      next = 5;
    }
    req.set_collection(argv[3]);
    if (argc > next) {
      req.set_has_base_version(true);
      req.set_base_version(std::stoull(argv[next]));
    }

    EnqueueResponse resp;

    auto status = stub->Enqueue(&ctx, req, &resp);

    return Report(status, "id=" + resp.id());
  }

  // ------------------------------------------------------------

  if (cmd == "read") {
    if (argc < 5) return 1;

    ReadRequest req;
    req.set_collection(argv[3]);
    req.set_key(argv[4]);

    ReadResponse resp;

    auto status = stub->Read(&ctx, req, &resp);

    if (!status.ok()) {
      std::cerr << status.error_message() << "\n";
      return 2;
    }

    if (!resp.found()) {
      std::cout << "not found\n";
      return 0;
    }
    std::cout << ToJson(resp.data()) << "\n";
    std::cout << "version=" << resp.version() << " provisional=" << resp.provisional() << " stale=" << resp.stale()
              << " from_cache=" << resp.from_cache() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "sync") {
    return Report(stub->SyncNow(&ctx, empty, &empty), "synced");
  }

  if (cmd == "retry" || cmd == "cancel") {
    if (argc < 4) return 1;

    OperationRequest req;
    req.set_id(argv[3]);

    if (cmd == "retry") {
      return Report(stub->RetryOperation(&ctx, req, &empty), "queued");
    }
    return Report(stub->CancelOperation(&ctx, req, &empty), "cancelled");
  }

  // ------------------------------------------------------------

  if (cmd == "resolve") {
    if (argc < 5) return 1;

    auto choice = ParseChoice(argv[4]);
    if (!choice) {
      std::cerr << "unsupported choice: " << argv[4] << "\n";
      return 1;
    }

    ResolveConflictRequest req;
    req.set_id(argv[3]);
    req.set_choice(*choice);
    for (int i = 5; i < argc; ++i) {
      std::string arg = argv[i];
      if (arg == "--merge") {
        req.set_merge_non_conflicting(true);
      } else {
        *req.mutable_payload() = ParseJson(arg);
      }
    }

    return Report(stub->ResolveConflict(&ctx, req, &empty), "resolved");
  }

  // ------------------------------------------------------------

  if (cmd == "clear-queue") {
    return Report(stub->ClearQueue(&ctx, empty, &empty), "cleared");
  }

  if (cmd == "refresh-cache") {
    return Report(stub->RefreshCache(&ctx, empty, &empty), "refresh scheduled");
  }

  if (cmd == "clear-cache") {
    ClearCacheRequest req;
    if (argc >= 4) req.set_collection(argv[3]);
    return Report(stub->ClearCache(&ctx, req, &empty), "cleared");
  }

  if (cmd == "online" || cmd == "offline") {
    SetOnlineRequest req;
    req.set_online(cmd == "online");
    return Report(stub->SetOnline(&ctx, req, &empty), cmd);
  }

  Usage();
  return 1;
}
