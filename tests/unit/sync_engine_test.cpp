#include "internal/engine/sync_engine.hpp"

#include <cassert>
#include <iostream>
#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/factory.hpp"
#include "internal/util/errors.hpp"
#include "tests/support/failing_repository.hpp"
#include "tests/support/fake_remote_client.hpp"

namespace {

using offsync::config::ConfigLoader;
using offsync::db::model::CacheRecord;
using offsync::db::model::OperationKind;
using offsync::factory::BuildEngine;
using offsync::factory::EngineParts;
using offsync::model::FromJson;
using offsync::model::OperationStatus;
using offsync::queue::ConflictChoice;
using offsync::queue::EnqueueRequest;
using offsync::remote::Outcome;
using offsync::runtime::config::RuntimeConfig;
using offsync::testing::FakeRemoteClient;
using offsync::util::ManualClock;

constexpr uint64_t kDay = 24 * 60 * 60 * 1000;

RuntimeConfig TestConfig(bool start_offline) {
  RuntimeConfig config;
  config.mutable_sync()->set_jitter_ms(0);
  config.mutable_sync()->set_start_offline(start_offline);
  config.mutable_cache()->set_prune_interval_ms(60'000);
  ConfigLoader::ApplyDefaults(config);
  ConfigLoader::Validate(config);
  return config;
}

struct Harness {
  std::shared_ptr<ManualClock>      clock  = std::make_shared<ManualClock>(10 * kDay);
  std::shared_ptr<FakeRemoteClient> remote = std::make_shared<FakeRemoteClient>();
  EngineParts                       parts;

  explicit Harness(bool start_offline = false, std::shared_ptr<offsync::db::Repository> repo = nullptr) {
    if (!repo) repo = std::make_shared<offsync::db::memory::MemoryRepository>();
    parts = BuildEngine(TestConfig(start_offline), repo, remote, clock);
    parts.engine->Start();
  }

  offsync::engine::SyncEngine& engine() {
    return *parts.engine;
  }

  void Seed(const std::string& collection, const std::string& key, const std::string& json, uint64_t version) {
    remote->Seed(collection, key, FromJson(json), version);

    CacheRecord entry;
    entry.collection    = collection;
    entry.key           = key;
    entry.data          = FromJson(json);
    entry.version       = version;
    entry.fetched_at_ms = clock->NowMs();
    auto tx             = parts.repository->Begin();
    assert(parts.repository->PutCache(*tx, entry));
    tx->Commit();
  }

  std::string Update(const std::string& collection, const std::string& key, const std::string& json, uint64_t base) {
    EnqueueRequest request;
    request.kind         = OperationKind::kUpdate;
    request.collection   = collection;
    request.target_id    = key;
    request.payload      = FromJson(json);
    request.base_version = base;
    return engine().Enqueue(request);
  }
};

template <typename E, typename F>
bool Throws(F&& fn) {
  try {
    fn();
  } catch (const E&) {
    return true;
  }
  return false;
}

void TestOfflineEditsSyncWhenBackOnline() {
  Harness h(true);
  h.Seed("orders", "o1", R"({"status":"new"})", 3);
  h.Seed("products", "p1", R"({"price":5})", 1);

  h.Update("products", "p1", R"({"price":6})", 1);
  h.Update("orders", "o1", R"({"status":"paid"})", 3);

  auto status = h.engine().GetStatus(true);
  assert(!status.is_online);
  assert(status.pending_count == 2);
  assert(status.operations.size() == 2);
  // orders outrank products
  assert(status.operations[0].record.collection == "orders");

  auto read = h.engine().Read("orders", "o1");
  assert(read.provisional);
  assert(read.data.fields().at("status").string_value() == "paid");

  assert(!h.engine().SyncNow());
  assert(h.remote->Calls().empty());
  assert(h.engine().RefreshCache() == 0);

  h.engine().SetOnline(true);
  assert(h.engine().IsOnline());
  assert(h.parts.scheduler->WaitForWork(std::chrono::milliseconds(0)));

  assert(h.engine().SyncNow());
  status = h.engine().GetStatus(false);
  assert(status.pending_count == 0);
  assert(status.operations.empty());
  assert(h.remote->Get("orders", "o1")->version == 4);
  assert(h.remote->Get("products", "p1")->version == 2);

  read = h.engine().Read("orders", "o1");
  assert(!read.provisional);
  assert(read.version == 4);
}

void TestConflictResolutionChoices() {
  Harness h;
  h.Seed("orders", "o1", R"({"status":"new"})", 1);
  h.Seed("orders", "o2", R"({"status":"new"})", 1);

  auto keep_local  = h.Update("orders", "o1", R"({"status":"shipped"})", 1);
  auto take_remote = h.Update("orders", "o2", R"({"status":"shipped"})", 1);
  h.remote->Edit("orders", "o1", FromJson(R"({"status":"cancelled"})"));
  h.remote->Edit("orders", "o2", FromJson(R"({"status":"cancelled"})"));

  h.engine().SyncNow();
  auto status = h.engine().GetStatus(false);
  assert(status.conflicted_count == 2);
  assert(status.pending_count == 0);

  assert(Throws<offsync::util::InvalidState>([&] { h.engine().RetryOperation(keep_local); }));
  assert(Throws<offsync::util::InvalidArgument>(
      [&] { h.engine().ResolveConflict(keep_local, ConflictChoice::kManual, std::nullopt, false); }));

  h.engine().ResolveConflict(take_remote, ConflictChoice::kAcceptRemote, std::nullopt, false);
  auto read = h.engine().Read("orders", "o2");
  assert(!read.provisional);
  assert(read.version == 2);
  assert(read.data.fields().at("status").string_value() == "cancelled");

  h.engine().ResolveConflict(keep_local, ConflictChoice::kAcceptLocal, std::nullopt, false);
  assert(h.parts.queue->Get(keep_local)->base_version == std::optional<uint64_t>(2));
  h.engine().SyncNow();

  assert(h.engine().GetStatus(false).conflicted_count == 0);
  auto remote = h.remote->Get("orders", "o1");
  assert(remote->version == 3);
  assert(remote->data.fields().at("status").string_value() == "shipped");

  assert(Throws<offsync::util::NotFound>(
      [&] { h.engine().ResolveConflict(keep_local, ConflictChoice::kAcceptLocal, std::nullopt, false); }));
}

void TestRetryAfterFatalFailure() {
  Harness h;
  h.Seed("orders", "o1", R"({"status":"new"})", 1);

  auto id = h.Update("orders", "o1", R"({"status":"paid"})", 1);
  h.remote->FailNext(Outcome::kFatalError);
  h.engine().SyncNow();

  auto status = h.engine().GetStatus(true);
  assert(status.failed_count == 1);
  assert(status.operations[0].record.status == OperationStatus::kAbandoned);
  assert(status.operations[0].record.error_kind == offsync::db::model::ErrorKind::kFatal);

  h.engine().RetryOperation(id);
  h.engine().SyncNow();
  assert(h.engine().GetStatus(false).failed_count == 0);
  assert(h.remote->Get("orders", "o1")->version == 2);
}

void TestCancelOperation() {
  Harness h;
  h.Seed("orders", "o1", R"({"status":"new"})", 1);

  auto cancelled = h.Update("orders", "o1", R"({"status":"paid"})", 1);
  h.engine().CancelOperation(cancelled);
  auto read = h.engine().Read("orders", "o1");
  assert(!read.provisional);
  assert(read.data.fields().at("status").string_value() == "new");

  assert(Throws<offsync::util::NotFound>([&] { h.engine().CancelOperation("no-such-op"); }));

  auto in_flight = h.Update("orders", "o1", R"({"status":"paid"})", 1);
  h.parts.queue->MarkAttemptStart(in_flight);
  assert(Throws<offsync::util::InvalidState>([&] { h.engine().CancelOperation(in_flight); }));

  // a restart puts the interrupted delivery back in line
  h.engine().Start();
  assert(h.parts.queue->Get(in_flight)->status == OperationStatus::kRetrying);
}

void TestClearQueueAndCache() {
  Harness h(true);
  h.Seed("orders", "o1", R"({"status":"new"})", 1);
  h.Seed("products", "p1", R"({"price":5})", 1);
  h.Seed("products", "p2", R"({"price":5})", 1);

  h.Update("orders", "o1", R"({"status":"paid"})", 1);
  h.Update("orders", "o1", R"({"status":"shipped"})", 2);

  assert(h.engine().ClearCache(std::string("products")) == 2);
  assert(h.engine().ClearCache(std::nullopt) == 0);

  assert(h.engine().ClearQueue() == 2);
  auto status = h.engine().GetStatus(false);
  assert(status.pending_count == 0);

  auto read = h.engine().Read("orders", "o1");
  assert(!read.provisional);
  assert(read.version == 1);
  assert(read.data.fields().at("status").string_value() == "new");
}

void TestBackgroundCyclePrunesOnInterval() {
  Harness h;
  h.Seed("orders", "o1", R"({"status":"new"})", 1);
  h.Seed("orders", "o2", R"({"status":"new"})", 1);

  // drains; the prune interval counts from Start()
  h.Update("orders", "o1", R"({"status":"paid"})", 1);
  h.engine().BackgroundCycle();
  assert(h.engine().GetStatus(false).pending_count == 0);

  h.clock->Advance(2 * kDay);
  h.engine().SetOnline(false);
  h.Update("orders", "o1", R"({"status":"shipped"})", 2);

  h.engine().BackgroundCycle();
  assert(h.engine().GetStatus(false).pending_count == 1);

  auto tx = h.parts.repository->Begin();
  assert(!h.parts.repository->GetCache(*tx, "orders", "o2").has_value());
  auto kept = h.parts.repository->GetCache(*tx, "orders", "o1");
  tx->Commit();
  assert(kept.has_value());
  assert(kept->provisional);
}

void TestStorageOutageKeepsOperationsInMemory() {
  auto repo = std::make_shared<offsync::testing::FailingRepository>();
  Harness h(false, repo);

  repo->SetFailing(true);
  EnqueueRequest request;
  request.kind       = OperationKind::kCreate;
  request.collection = "orders";
  request.payload    = FromJson(R"({"status":"draft"})");
  auto id            = h.engine().Enqueue(request);
  assert(!id.empty());
  assert(h.parts.queue->UnpersistedCount() == 1);

  repo->SetFailing(false);
  auto status = h.engine().GetStatus(true);
  assert(status.unpersisted_count == 1);
  assert(status.pending_count == 1);
  assert(!status.operations[0].persisted);

  h.engine().SyncNow();
  status = h.engine().GetStatus(false);
  assert(status.unpersisted_count == 0);
  assert(status.pending_count == 0);
  assert(h.remote->Get("orders", "srv-1").has_value());
}

} // namespace

int main() {
  TestOfflineEditsSyncWhenBackOnline();
  TestConflictResolutionChoices();
  TestRetryAfterFatalFailure();
  TestCancelOperation();
  TestClearQueueAndCache();
  TestBackgroundCyclePrunesOnInterval();
  TestStorageOutageKeepsOperationsInMemory();

  std::cout << "offsync_unit_sync_engine: pass\n";
  return 0;
}
