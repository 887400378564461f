#include "internal/queue/queue_manager.hpp"

#include <cassert>
#include <iostream>
#include <memory>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"
#include "tests/support/failing_repository.hpp"

namespace {

using offsync::db::Repository;
using offsync::db::memory::MemoryRepository;
using offsync::db::model::CacheRecord;
using offsync::db::model::ErrorKind;
using offsync::db::model::OperationKind;
using offsync::model::FromJson;
using offsync::model::OperationStatus;
using offsync::queue::ConflictChoice;
using offsync::queue::Confirmation;
using offsync::queue::EnqueueRequest;
using offsync::queue::QueueManager;
using offsync::util::ManualClock;

const std::unordered_map<std::string, int32_t> kPriorities = {{"orders", 1}, {"companies", 2}, {"products", 3}};

void SeedCache(Repository& repo, const std::string& collection, const std::string& key, const std::string& json, uint64_t version) {
  CacheRecord entry;
  entry.collection    = collection;
  entry.key           = key;
  entry.data          = FromJson(json);
  entry.version       = version;
  entry.fetched_at_ms = 1;
  auto tx             = repo.Begin();
  assert(repo.PutCache(*tx, entry));
  tx->Commit();
}

std::optional<CacheRecord> ReadCache(Repository& repo, const std::string& collection, const std::string& key) {
  auto tx    = repo.Begin();
  auto entry = repo.GetCache(*tx, collection, key);
  tx->Commit();
  return entry;
}

EnqueueRequest Update(const std::string& collection, const std::string& target, const std::string& json, std::optional<uint64_t> base) {
  EnqueueRequest request;
  request.kind         = OperationKind::kUpdate;
  request.collection   = collection;
  request.target_id    = target;
  request.payload      = FromJson(json);
  request.base_version = base;
  return request;
}

EnqueueRequest Create(const std::string& collection, const std::string& json) {
  EnqueueRequest request;
  request.kind       = OperationKind::kCreate;
  request.collection = collection;
  request.payload    = FromJson(json);
  return request;
}

void TestEnqueueAppliesOptimisticPatch() {
  auto repo  = std::make_shared<MemoryRepository>();
  auto clock = std::make_shared<ManualClock>(5000);
  SeedCache(*repo, "orders", "o1", R"({"status":"new","total":10})", 3);

  QueueManager queue(repo, clock, kPriorities);
  auto         id = queue.Enqueue(Update("orders", "o1", R"({"status":"shipped"})", 3));

  auto entry = ReadCache(*repo, "orders", "o1");
  assert(entry.has_value());
  assert(entry->provisional);
  assert(entry->version == 4);
  assert(entry->data.fields().at("status").string_value() == "shipped");
  assert(entry->data.fields().at("total").number_value() == 10);

  auto op = queue.Get(id);
  assert(op.has_value());
  assert(op->status == OperationStatus::kPending);
  assert(op->priority == 1);
  assert(op->base_snapshot.has_value());
  assert(op->base_snapshot->fields().at("status").string_value() == "new");
}

void TestEnqueueValidation() {
  auto         repo = std::make_shared<MemoryRepository>();
  QueueManager queue(repo, std::make_shared<ManualClock>(0), kPriorities);

  bool threw = false;
  try {
    auto request = Update("orders", "o1", R"({"a":1})", std::nullopt);
    request.target_id.reset();
    queue.Enqueue(request);
  } catch (const offsync::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    queue.Enqueue(Update("", "o1", R"({"a":1})", std::nullopt));
  } catch (const offsync::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
  assert(queue.ListPending().empty());
}

void TestDeliveryOrder() {
  auto         repo  = std::make_shared<MemoryRepository>();
  auto         clock = std::make_shared<ManualClock>(1000);
  QueueManager queue(repo, clock, kPriorities);

  auto product = queue.Enqueue(Update("products", "p1", R"({"a":1})", std::nullopt));
  auto misc    = queue.Enqueue(Update("feedback", "f1", R"({"a":1})", std::nullopt));
  auto first   = queue.Enqueue(Update("orders", "o1", R"({"a":1})", std::nullopt));
  auto second  = queue.Enqueue(Update("orders", "o1", R"({"a":2})", std::nullopt));
  clock->Advance(10);
  auto later = queue.Enqueue(Update("orders", "o2", R"({"a":1})", std::nullopt));

  auto pending = queue.ListPending();
  assert(pending.size() == 5);
  assert(pending[0].record.id == first);
  assert(pending[1].record.id == second);
  assert(pending[2].record.id == later);
  assert(pending[3].record.id == product);
  assert(pending[4].record.id == misc);
  assert(pending[4].record.priority == 999);
}

void TestCancelRestoresBaseSnapshot() {
  auto repo  = std::make_shared<MemoryRepository>();
  auto clock = std::make_shared<ManualClock>(1000);
  SeedCache(*repo, "orders", "o1", R"({"status":"new"})", 3);

  QueueManager queue(repo, clock, kPriorities);
  auto         id = queue.Enqueue(Update("orders", "o1", R"({"status":"shipped"})", 3));
  assert(queue.Cancel(id));
  assert(!queue.Cancel(id));

  auto entry = ReadCache(*repo, "orders", "o1");
  assert(entry.has_value());
  assert(!entry->provisional);
  assert(entry->version == 3);
  assert(entry->data.fields().at("status").string_value() == "new");

  auto created = queue.Enqueue(Create("companies", R"({"name":"Acme"})"));
  assert(ReadCache(*repo, "companies", created).has_value());
  assert(queue.Cancel(created));
  assert(!ReadCache(*repo, "companies", created).has_value());
}

void TestInFlightCannotBeCancelled() {
  auto         repo = std::make_shared<MemoryRepository>();
  QueueManager queue(repo, std::make_shared<ManualClock>(0), kPriorities);

  auto id = queue.Enqueue(Update("orders", "o1", R"({"a":1})", std::nullopt));
  queue.MarkAttemptStart(id);
  assert(!queue.Cancel(id));
  assert(queue.Clear() == 0);
  assert(queue.Get(id)->status == OperationStatus::kInFlight);
}

void TestCreateSuccessMovesEntryAndFollowers() {
  auto         repo = std::make_shared<MemoryRepository>();
  QueueManager queue(repo, std::make_shared<ManualClock>(100), kPriorities);

  auto create = queue.Enqueue(Create("companies", R"({"name":"Acme"})"));
  auto follow = queue.Enqueue(Update("companies", create, R"({"city":"Oslo"})", std::nullopt));

  queue.MarkAttemptStart(create);
  Confirmation confirmation;
  confirmation.target_id = "c-77";
  confirmation.snapshot  = FromJson(R"({"name":"Acme","id":"c-77"})");
  confirmation.version   = 1;
  queue.MarkSucceeded(create, confirmation);

  assert(!queue.Get(create).has_value());
  auto follower = queue.Get(follow);
  assert(follower.has_value());
  assert(follower->target_id == std::optional<std::string>("c-77"));
  assert(follower->base_version == std::optional<uint64_t>(1));

  assert(!ReadCache(*repo, "companies", create).has_value());
  auto entry = ReadCache(*repo, "companies", "c-77");
  assert(entry.has_value());
  assert(entry->provisional);
  assert(entry->data.fields().at("city").string_value() == "Oslo");
  assert(entry->data.fields().at("id").string_value() == "c-77");
}

void TestFailureBookkeeping() {
  auto         repo = std::make_shared<MemoryRepository>();
  QueueManager queue(repo, std::make_shared<ManualClock>(0), kPriorities);

  auto id = queue.Enqueue(Update("orders", "o1", R"({"a":1})", std::nullopt));
  queue.MarkAttemptStart(id);
  queue.MarkFailed(id, "timeout", ErrorKind::kTransport, OperationStatus::kRetrying, 2000);

  auto op = queue.Get(id);
  assert(op->status == OperationStatus::kRetrying);
  assert(op->attempts == 1);
  assert(op->last_error == "timeout");
  assert(op->next_attempt_at_ms == 2000);

  queue.MarkAttemptStart(id);
  queue.MarkFailed(id, "bad field", ErrorKind::kValidation, OperationStatus::kRejected, 0);
  assert(queue.Get(id)->status == OperationStatus::kRejected);

  queue.Retry(id);
  op = queue.Get(id);
  assert(op->status == OperationStatus::kPending);
  assert(op->attempts == 0);
  assert(op->last_error.empty());
}

void TestRecoverInFlightAfterRestart() {
  auto repo  = std::make_shared<MemoryRepository>();
  auto clock = std::make_shared<ManualClock>(0);

  std::string id;
  {
    QueueManager queue(repo, clock, kPriorities);
    id = queue.Enqueue(Update("orders", "o1", R"({"a":1})", std::nullopt));
    queue.MarkAttemptStart(id);
  }

  QueueManager restarted(repo, clock, kPriorities);
  assert(restarted.RecoverInFlight() == 1);
  auto op = restarted.Get(id);
  assert(op->status == OperationStatus::kRetrying);
  assert(op->attempts == 1);

  auto next = restarted.Enqueue(Update("orders", "o1", R"({"a":2})", std::nullopt));
  assert(restarted.Get(next)->sequence > op->sequence);
}

void TestResolveConflictAcceptRemote() {
  auto         repo = std::make_shared<MemoryRepository>();
  QueueManager queue(repo, std::make_shared<ManualClock>(0), kPriorities);
  SeedCache(*repo, "orders", "o1", R"({"status":"new"})", 3);

  auto id = queue.Enqueue(Update("orders", "o1", R"({"status":"shipped"})", 3));
  queue.MarkAttemptStart(id);

  offsync::v1::ConflictInfo info;
  info.set_reason("field_conflict");
  *info.mutable_remote_snapshot() = FromJson(R"({"status":"cancelled"})");
  info.set_remote_version(5);
  queue.MarkConflicted(id, info);

  bool threw = false;
  try {
    queue.Retry(id);
  } catch (const offsync::util::InvalidState&) {
    threw = true;
  }
  assert(threw);

  queue.ResolveConflict(id, ConflictChoice::kAcceptRemote, std::nullopt, false);
  assert(!queue.Get(id).has_value());

  auto entry = ReadCache(*repo, "orders", "o1");
  assert(!entry->provisional);
  assert(entry->version == 5);
  assert(entry->data.fields().at("status").string_value() == "cancelled");
}

void TestResolveConflictAcceptLocalRebases() {
  auto         repo = std::make_shared<MemoryRepository>();
  QueueManager queue(repo, std::make_shared<ManualClock>(0), kPriorities);

  auto id = queue.Enqueue(Update("orders", "o1", R"({"status":"shipped"})", 3));
  queue.MarkAttemptStart(id);

  offsync::v1::ConflictInfo info;
  info.set_reason("field_conflict");
  *info.mutable_remote_snapshot() = FromJson(R"({"status":"cancelled","note":"x"})");
  info.set_remote_version(5);
  queue.MarkConflicted(id, info);

  queue.ResolveConflict(id, ConflictChoice::kAcceptLocal, std::nullopt, true);
  auto op = queue.Get(id);
  assert(op->status == OperationStatus::kPending);
  assert(op->base_version == std::optional<uint64_t>(5));
  assert(op->payload.fields().at("status").string_value() == "shipped");
  assert(op->payload.fields().at("note").string_value() == "x");

  auto entry = ReadCache(*repo, "orders", "o1");
  assert(entry->provisional);
  assert(entry->version == 6);
}

void TestUnpersistedOperationsAreKeptAndFlushed() {
  auto repo  = std::make_shared<offsync::testing::FailingRepository>();
  auto clock = std::make_shared<ManualClock>(0);

  QueueManager queue(repo, clock, kPriorities);
  repo->SetFailing(true);
  auto id = queue.Enqueue(Update("orders", "o1", R"({"a":1})", std::nullopt));
  assert(queue.UnpersistedCount() == 1);

  // nothing to retry until it reaches storage
  bool threw = false;
  try {
    queue.Retry(id);
  } catch (const offsync::util::InvalidState&) {
    threw = true;
  }
  assert(threw);

  repo->SetFailing(false);
  auto pending = queue.ListPending();
  assert(pending.size() == 1);
  assert(!pending[0].persisted);

  assert(queue.FlushUnpersisted() == 1);
  assert(queue.UnpersistedCount() == 0);
  assert(queue.ListPending()[0].persisted);
  assert(queue.Get(id).has_value());
}

} // namespace

int main() {
  TestEnqueueAppliesOptimisticPatch();
  TestEnqueueValidation();
  TestDeliveryOrder();
  TestCancelRestoresBaseSnapshot();
  TestInFlightCannotBeCancelled();
  TestCreateSuccessMovesEntryAndFollowers();
  TestFailureBookkeeping();
  TestRecoverInFlightAfterRestart();
  TestResolveConflictAcceptRemote();
  TestResolveConflictAcceptLocalRebases();
  TestUnpersistedOperationsAreKeptAndFlushed();

  std::cout << "offsync_unit_queue_manager: pass\n";
  return 0;
}
