#include "internal/cache/snapshot_cache.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <unordered_map>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/queue/queue_manager.hpp"
#include "internal/util/errors.hpp"
#include "tests/support/fake_remote_client.hpp"

namespace {

using offsync::cache::CachePolicy;
using offsync::cache::CacheRefresher;
using offsync::cache::SnapshotCache;
using offsync::db::memory::MemoryRepository;
using offsync::db::model::CacheRecord;
using offsync::db::model::OperationKind;
using offsync::model::FromJson;
using offsync::testing::FakeRemoteClient;
using offsync::util::ManualClock;

constexpr uint64_t kMinute = 60 * 1000;
constexpr uint64_t kDay    = 24 * 60 * kMinute;

struct Harness {
  std::shared_ptr<MemoryRepository> repo   = std::make_shared<MemoryRepository>();
  std::shared_ptr<ManualClock>      clock  = std::make_shared<ManualClock>(10 * kDay);
  std::shared_ptr<FakeRemoteClient> remote = std::make_shared<FakeRemoteClient>();
  std::shared_ptr<std::atomic<bool>> online = std::make_shared<std::atomic<bool>>(true);
  std::shared_ptr<CacheRefresher>   refresher;
  std::shared_ptr<SnapshotCache>    cache;

  explicit Harness(std::shared_ptr<CachePolicy> policy = std::make_shared<CachePolicy>()) {
    auto is_online = [flag = online] { return flag->load(); };
    refresher      = std::make_shared<CacheRefresher>(repo, remote, clock, is_online, 1000);
    cache          = std::make_shared<SnapshotCache>(repo, remote, std::move(policy), refresher, clock, is_online, 1000);
  }

  void Put(const std::string& collection, const std::string& key, const std::string& json, uint64_t version, uint64_t age_ms,
           bool provisional = false) {
    CacheRecord entry;
    entry.collection    = collection;
    entry.key           = key;
    entry.data          = FromJson(json);
    entry.version       = version;
    entry.fetched_at_ms = clock->NowMs() - age_ms;
    entry.provisional   = provisional;
    auto tx             = repo->Begin();
    assert(repo->PutCache(*tx, entry));
    tx->Commit();
  }

  std::optional<CacheRecord> Cached(const std::string& collection, const std::string& key) {
    auto tx    = repo->Begin();
    auto entry = repo->GetCache(*tx, collection, key);
    tx->Commit();
    return entry;
  }
};

void TestFreshEntryServedWithoutRemote() {
  Harness h;
  h.Put("orders", "o1", R"({"status":"new"})", 3, 1 * kMinute);

  auto result = h.cache->Read("orders", "o1");
  assert(result.found);
  assert(result.from_cache);
  assert(!result.stale);
  assert(result.version == 3);
  assert(result.data.fields().at("status").string_value() == "new");
  assert(h.remote->FetchCalls() == 0);
  assert(h.refresher->PendingCount() == 0);
}

void TestStaleEntryServedAndRefreshed() {
  Harness h;
  h.Put("orders", "o1", R"({"status":"new"})", 3, 3 * kMinute);
  h.remote->Seed("orders", "o1", FromJson(R"({"status":"shipped"})"), 4);

  auto result = h.cache->Read("orders", "o1");
  assert(result.found);
  assert(result.stale);
  assert(result.version == 3);
  assert(h.refresher->PendingCount() == 1);

  // a second read does not queue the same entry twice
  h.cache->Read("orders", "o1");
  assert(h.refresher->PendingCount() == 1);

  assert(h.refresher->RunPending() == 1);
  auto entry = h.Cached("orders", "o1");
  assert(entry->version == 4);
  assert(entry->fetched_at_ms == h.clock->NowMs());

  result = h.cache->Read("orders", "o1");
  assert(!result.stale);
  assert(result.data.fields().at("status").string_value() == "shipped");
}

void TestExpiredEntryEvictedAndRefetched() {
  Harness h;
  h.Put("orders", "o1", R"({"status":"old"})", 1, kDay + 1);
  h.remote->Seed("orders", "o1", FromJson(R"({"status":"new"})"), 2);

  auto result = h.cache->Read("orders", "o1");
  assert(result.found);
  assert(!result.from_cache);
  assert(result.version == 2);
  assert(h.remote->FetchCalls() == 1);
  assert(h.Cached("orders", "o1")->version == 2);
}

void TestMissWhileOnlineAndOffline() {
  Harness h;
  h.remote->Seed("products", "p1", FromJson(R"({"name":"Bolt"})"), 5);

  h.online->store(false);
  auto offline = h.cache->Read("products", "p1");
  assert(!offline.found);
  assert(h.remote->FetchCalls() == 0);

  h.online->store(true);
  auto online = h.cache->Read("products", "p1");
  assert(online.found);
  assert(!online.from_cache);
  assert(online.version == 5);
  assert(h.Cached("products", "p1").has_value());

  auto missing = h.cache->Read("products", "nope");
  assert(!missing.found);
  assert(!h.Cached("products", "nope").has_value());

  h.remote->SetFetchUnavailable(true);
  auto unavailable = h.cache->Read("products", "p2");
  assert(!unavailable.found);

  bool threw = false;
  try {
    h.cache->Read("", "p1");
  } catch (const offsync::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}

void TestProvisionalEntriesAreLeftAlone() {
  Harness h;
  auto queue = std::make_shared<offsync::queue::QueueManager>(h.repo, h.clock, std::unordered_map<std::string, int32_t>{});
  h.Put("orders", "o1", R"({"status":"new"})", 3, 0);
  h.Put("orders", "o2", R"({"status":"new"})", 1, 0);

  offsync::queue::EnqueueRequest request;
  request.kind         = OperationKind::kUpdate;
  request.collection   = "orders";
  request.target_id    = "o1";
  request.payload      = FromJson(R"({"status":"shipped"})");
  request.base_version = 3;
  queue->Enqueue(request);

  // far past every window
  h.clock->Advance(2 * kDay);

  auto result = h.cache->Read("orders", "o1");
  assert(result.found);
  assert(result.provisional);
  assert(!result.stale);
  assert(result.version == 4);
  assert(result.data.fields().at("status").string_value() == "shipped");

  assert(h.cache->Prune() == 1);
  assert(h.Cached("orders", "o1").has_value());
  assert(!h.Cached("orders", "o2").has_value());

  assert(h.cache->Refresh() == 0);
  h.refresher->Schedule("orders", "o1");
  h.remote->Seed("orders", "o1", FromJson(R"({"status":"new"})"), 3);
  assert(h.refresher->RunPending() == 0);
  assert(h.Cached("orders", "o1")->provisional);

  assert(h.cache->ClearAll() == 0);
  assert(h.cache->ClearCollection("orders") == 0);
  assert(h.Cached("orders", "o1").has_value());
}

void TestPruneEvictsAndSchedules() {
  Harness h;
  h.Put("orders", "fresh", R"({"a":1})", 1, 0);
  h.Put("orders", "stale", R"({"a":1})", 1, 5 * kMinute);
  h.Put("orders", "expired", R"({"a":1})", 1, kDay + kMinute);
  h.Put("notifications", "n1", R"({"a":1})", 1, 2 * kMinute);

  assert(h.cache->Prune() == 1);
  assert(!h.Cached("orders", "expired").has_value());
  assert(h.Cached("orders", "stale").has_value());
  assert(h.refresher->PendingCount() == 2);
}

void TestPruneTrimsCollectionOverItsLimit() {
  auto policy = std::make_shared<CachePolicy>();
  policy->SetWindow("orders", {2 * kMinute, kDay, 10});
  Harness h(policy);

  // o0 is the newest fetch, o11 the oldest
  for (int i = 0; i < 12; ++i) {
    h.Put("orders", "o" + std::to_string(i), R"({"a":1})", 1, static_cast<uint64_t>(i + 1) * 1000);
  }
  // counts toward the limit but is never evicted
  h.Put("orders", "pending", R"({"a":2})", 2, 60 * 1000, true);
  h.Put("products", "p1", R"({"a":1})", 1, 60 * 1000);

  // 13 entries over a limit of 10: down to 8
  assert(h.cache->Prune() == 5);
  for (int i = 0; i < 7; ++i) assert(h.Cached("orders", "o" + std::to_string(i)).has_value());
  for (int i = 7; i < 12; ++i) assert(!h.Cached("orders", "o" + std::to_string(i)).has_value());
  assert(h.Cached("orders", "pending").has_value());
  assert(h.Cached("products", "p1").has_value());

  // within the limit now
  assert(h.cache->Prune() == 0);
}

void TestClearCollectionAndAll() {
  Harness h;
  h.Put("orders", "o1", R"({"a":1})", 1, 0);
  h.Put("orders", "o2", R"({"a":1})", 1, 0);
  h.Put("products", "p1", R"({"a":1})", 1, 0);
  h.Put("products", "p2", R"({"a":1})", 2, 0, true);

  assert(h.cache->ClearCollection("orders") == 2);
  assert(!h.Cached("orders", "o1").has_value());
  assert(h.Cached("products", "p1").has_value());

  assert(h.cache->ClearAll() == 1);
  assert(!h.Cached("products", "p1").has_value());
  assert(h.Cached("products", "p2").has_value());
}

void TestRefresherDropsVanishedEntries() {
  Harness h;
  h.Put("products", "p1", R"({"name":"Bolt"})", 1, 20 * kMinute);

  assert(h.cache->Refresh() == 1);
  assert(h.refresher->RunPending() == 1);
  assert(!h.Cached("products", "p1").has_value());

  // offline: nothing is fetched and nothing is written
  h.Put("products", "p2", R"({"name":"Nut"})", 1, 0);
  h.online->store(false);
  assert(!h.refresher->RefreshNow("products", "p2"));
  assert(h.Cached("products", "p2")->version == 1);
}

void TestBackgroundRefresher() {
  Harness h;
  h.remote->Seed("orders", "o1", FromJson(R"({"status":"paid"})"), 9);
  h.Put("orders", "o1", R"({"status":"new"})", 8, 0);

  h.refresher->Start();
  h.refresher->Schedule("orders", "o1");
  for (int i = 0; i < 500 && h.Cached("orders", "o1")->version != 9; ++i) {
    std::this_thread::sleep_for(std::chrono::milliseconds(2));
  }
  h.refresher->Stop();
  h.refresher->Stop();

  assert(h.Cached("orders", "o1")->version == 9);
}

} // namespace

int main() {
  TestFreshEntryServedWithoutRemote();
  TestStaleEntryServedAndRefreshed();
  TestExpiredEntryEvictedAndRefetched();
  TestMissWhileOnlineAndOffline();
  TestProvisionalEntriesAreLeftAlone();
  TestPruneEvictsAndSchedules();
  TestPruneTrimsCollectionOverItsLimit();
  TestClearCollectionAndAll();
  TestRefresherDropsVanishedEntries();
  TestBackgroundRefresher();

  std::cout << "offsync_unit_snapshot_cache: pass\n";
  return 0;
}
