#include "memory_repository.hpp"

#include <algorithm>

#include "internal/db/sql/migrations.hpp"
#include "memory_tx.hpp"

namespace offsync::db::memory {

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this, MemoryTransaction::Mode::kWrite);
}

std::unique_ptr<db::Transaction> MemoryRepository::BeginRead() {
  return std::make_unique<MemoryTransaction>(*this, MemoryTransaction::Mode::kRead);
}

int MemoryRepository::SchemaVersion() {
  return sql::LatestSchemaVersion();
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Operation log
// ------------------------------------------------------------------

Result MemoryRepository::AppendOperation(Transaction& t, const model::OperationRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.operations.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, "operation " + r.id + " already exists");
  s.operations[r.id] = r;
  return Result::Ok();
}

std::optional<model::OperationRecord> MemoryRepository::GetOperation(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.operations.find(id);
  if (it == s.operations.end()) return std::nullopt;
  return it->second;
}

std::vector<model::OperationRecord> MemoryRepository::ListOperations(Transaction& t) {
  const auto&                         s = TX(t).View();
  std::vector<model::OperationRecord> records;
  records.reserve(s.operations.size());
  for (const auto& [_, record] : s.operations) {
    records.push_back(record);
  }
  std::sort(records.begin(), records.end(), model::DeliversBefore);
  return records;
}

Result MemoryRepository::UpdateOperation(Transaction& t, const model::OperationRecord& r) {
  auto& s  = TX(t).Mutable();
  auto  it = s.operations.find(r.id);
  if (it == s.operations.end()) return Result::Err(ErrorCode::NotFound, "operation " + r.id + " not found");
  it->second = r;
  return Result::Ok();
}

Result MemoryRepository::RemoveOperation(Transaction& t, const std::string& id) {
  auto& s = TX(t).Mutable();
  if (s.operations.erase(id) == 0) return Result::Err(ErrorCode::NotFound, "operation " + id + " not found");
  return Result::Ok();
}

Result MemoryRepository::ClearOperations(Transaction& t) {
  TX(t).Mutable().operations.clear();
  return Result::Ok();
}

uint64_t MemoryRepository::MaxSequence(Transaction& t) {
  uint64_t max_sequence = 0;
  for (const auto& [_, record] : TX(t).View().operations) {
    max_sequence = std::max(max_sequence, record.sequence);
  }
  return max_sequence;
}

// ------------------------------------------------------------------
// Cache
// ------------------------------------------------------------------

std::optional<model::CacheRecord> MemoryRepository::GetCache(Transaction& t, const std::string& collection, const std::string& key) {
  const auto& s  = TX(t).View();
  auto        it = s.cache.find({collection, key});
  if (it == s.cache.end()) return std::nullopt;
  return it->second;
}

std::vector<model::CacheRecord> MemoryRepository::ListCache(Transaction& t, const std::optional<std::string>& collection) {
  std::vector<model::CacheRecord> records;
  for (const auto& [key, record] : TX(t).View().cache) {
    if (collection && key.first != *collection) continue;
    records.push_back(record);
  }
  return records;
}

Result MemoryRepository::PutCache(Transaction& t, const model::CacheRecord& r) {
  TX(t).Mutable().cache[{r.collection, r.key}] = r;
  return Result::Ok();
}

Result MemoryRepository::DeleteCache(Transaction& t, const std::string& collection, const std::string& key) {
  TX(t).Mutable().cache.erase({collection, key});
  return Result::Ok();
}

Result MemoryRepository::DeleteCacheCollection(Transaction& t, const std::string& collection) {
  auto& cache = TX(t).Mutable().cache;
  std::erase_if(cache, [&](const auto& entry) { return entry.first.first == collection; });
  return Result::Ok();
}

Result MemoryRepository::PruneCacheOlderThan(Transaction& t, uint64_t cutoff_ms) {
  auto& cache = TX(t).Mutable().cache;
  std::erase_if(cache, [&](const auto& entry) { return !entry.second.provisional && entry.second.fetched_at_ms < cutoff_ms; });
  return Result::Ok();
}

// ------------------------------------------------------------------
// Both regions
// ------------------------------------------------------------------

Result MemoryRepository::ClearAll(Transaction& t) {
  auto& s = TX(t).Mutable();
  s.operations.clear();
  s.cache.clear();
  return Result::Ok();
}

} // namespace offsync::db::memory
