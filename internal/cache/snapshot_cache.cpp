#include "snapshot_cache.hpp"

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <map>
#include <vector>

#include "internal/db/api/db_errors.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace offsync::cache {

using db::model::CacheRecord;
using observability::IntField;
using observability::StringField;

namespace {

ReadResult FromEntry(const CacheRecord& entry, bool stale) {
  ReadResult result;
  result.found       = !entry.deleted;
  result.version     = entry.version;
  result.provisional = entry.provisional;
  result.stale       = stale;
  result.from_cache  = true;
  if (!entry.deleted) {
    result.data = entry.data;
  }
  return result;
}

} // namespace

SnapshotCache::SnapshotCache(std::shared_ptr<db::Repository> repository, std::shared_ptr<remote::RemoteClient> remote,
                             std::shared_ptr<CachePolicy> policy, std::shared_ptr<CacheRefresher> refresher,
                             std::shared_ptr<util::Clock> clock, std::function<bool()> is_online, uint64_t request_timeout_ms)
    : repository_(std::move(repository)),
      remote_(std::move(remote)),
      policy_(std::move(policy)),
      refresher_(std::move(refresher)),
      clock_(std::move(clock)),
      is_online_(std::move(is_online)),
      request_timeout_ms_(request_timeout_ms) {
}

ReadResult SnapshotCache::Read(const std::string& collection, const std::string& key) {
  if (collection.empty() || key.empty()) {
    throw util::InvalidArgument("collection and key are required");
  }

  const auto now = clock_->NowMs();

  std::optional<CacheRecord> entry;
  {
    auto tx = repository_->BeginRead();
    entry   = repository_->GetCache(*tx, collection, key);
    tx->Commit();
  }

  if (entry && !entry->provisional && policy_->IsExpired(*entry, now)) {
    EvictExpired(collection, key, now);
    entry.reset();
  }

  if (entry) {
    if (entry->provisional) {
      return FromEntry(*entry, false);
    }
    const bool stale = policy_->IsStale(*entry, now);
    if (stale) {
      refresher_->Schedule(collection, key);
    }
    return FromEntry(*entry, stale);
  }

  return FetchThrough(collection, key);
}

void SnapshotCache::EvictExpired(const std::string& collection, const std::string& key, uint64_t now_ms) {
  auto tx = repository_->Begin();
  // re-checked under the write lock: an enqueue or refresh may have won
  auto entry = repository_->GetCache(*tx, collection, key);
  if (entry && !entry->provisional && policy_->IsExpired(*entry, now_ms)) {
    db::ThrowIfDbError(repository_->DeleteCache(*tx, collection, key), "evict expired entry");
    OFFSYNC_LOG_DEBUG("Evicted expired cache entry", {StringField("collection", collection), StringField("key", key)});
  }
  tx->Commit();
}

ReadResult SnapshotCache::FetchThrough(const std::string& collection, const std::string& key) {
  ReadResult result;
  if (is_online_ && !is_online_()) {
    return result;
  }

  remote::SnapshotResult fetched;
  try {
    fetched = remote_->FetchSnapshot(collection, key, std::chrono::milliseconds(request_timeout_ms_));
  } catch (const std::exception& e) {
    fetched.status  = remote::FetchStatus::kFailed;
    fetched.message = e.what();
  }

  if (fetched.status != remote::FetchStatus::kFound) {
    if (fetched.status != remote::FetchStatus::kNotFound) {
      OFFSYNC_LOG_WARN("Read-through fetch failed",
                       {StringField("collection", collection), StringField("key", key), StringField("error", fetched.message)});
    }
    return result;
  }

  result.found   = true;
  result.data    = fetched.snapshot;
  result.version = fetched.version;

  auto tx       = repository_->Begin();
  auto existing = repository_->GetCache(*tx, collection, key);
  if (existing && existing->provisional) {
    // an operation was enqueued while the fetch ran; its view wins
    tx->Commit();
    return FromEntry(*existing, false);
  }

  CacheRecord entry;
  entry.collection    = collection;
  entry.key           = key;
  entry.data          = fetched.snapshot;
  entry.version       = fetched.version;
  entry.fetched_at_ms = clock_->NowMs();
  db::ThrowIfDbError(repository_->PutCache(*tx, entry), "store fetched entry");
  tx->Commit();

  return result;
}

size_t SnapshotCache::Prune() {
  const auto now       = clock_->NowMs();
  const auto max_ttl   = policy_->MaxHardExpiryMs();
  const auto cutoff_ms = now > max_ttl ? now - max_ttl : 0;

  size_t                   evicted    = 0;
  size_t                   over_limit = 0;
  std::vector<CacheRecord> stale;

  auto tx = repository_->Begin();

  for (const auto& entry : repository_->ListCache(*tx, std::nullopt)) {
    if (!entry.provisional && entry.fetched_at_ms < cutoff_ms) ++evicted;
  }
  // nothing outlives the longest window
  db::ThrowIfDbError(repository_->PruneCacheOlderThan(*tx, cutoff_ms), "prune cache");

  std::map<std::string, size_t>                   counts;
  std::map<std::string, std::vector<CacheRecord>> evictable;
  for (const auto& entry : repository_->ListCache(*tx, std::nullopt)) {
    if (!entry.provisional && policy_->IsExpired(entry, now)) {
      db::ThrowIfDbError(repository_->DeleteCache(*tx, entry.collection, entry.key), "evict expired entry");
      ++evicted;
      continue;
    }
    counts[entry.collection]++;
    if (!entry.provisional) evictable[entry.collection].push_back(entry);
  }

  for (auto& [collection, entries] : evictable) {
    const auto excess = std::min(policy_->ExcessEntries(collection, counts[collection]), entries.size());
    if (excess > 0) {
      // oldest fetch goes first
      std::stable_sort(entries.begin(), entries.end(),
                       [](const CacheRecord& a, const CacheRecord& b) { return a.fetched_at_ms < b.fetched_at_ms; });
      for (size_t i = 0; i < excess; ++i) {
        db::ThrowIfDbError(repository_->DeleteCache(*tx, collection, entries[i].key), "evict over-limit entry");
      }
      entries.erase(entries.begin(), entries.begin() + static_cast<std::ptrdiff_t>(excess));
      over_limit += excess;
    }

    for (const auto& entry : entries) {
      if (policy_->IsStale(entry, now)) stale.push_back(entry);
    }
  }
  tx->Commit();

  for (const auto& entry : stale) {
    refresher_->Schedule(entry.collection, entry.key);
  }

  evicted += over_limit;
  if (evicted > 0 || !stale.empty()) {
    OFFSYNC_LOG_INFO("Cache pruned", {IntField("evicted", static_cast<int64_t>(evicted)), IntField("over_limit", static_cast<int64_t>(over_limit)),
                                      IntField("stale", static_cast<int64_t>(stale.size()))});
  }
  return evicted;
}

size_t SnapshotCache::ClearAll() {
  return DropNonProvisional(std::nullopt);
}

size_t SnapshotCache::ClearCollection(const std::string& collection) {
  if (collection.empty()) {
    throw util::InvalidArgument("collection is required");
  }
  return DropNonProvisional(collection);
}

size_t SnapshotCache::DropNonProvisional(const std::optional<std::string>& collection) {
  auto tx      = repository_->Begin();
  auto entries = repository_->ListCache(*tx, collection);

  size_t dropped     = 0;
  bool   provisional = false;
  for (const auto& entry : entries) {
    if (entry.provisional) {
      provisional = true;
    } else {
      ++dropped;
    }
  }

  if (collection && !provisional) {
    db::ThrowIfDbError(repository_->DeleteCacheCollection(*tx, *collection), "clear cache collection");
  } else {
    for (const auto& entry : entries) {
      if (entry.provisional) continue;
      db::ThrowIfDbError(repository_->DeleteCache(*tx, entry.collection, entry.key), "clear cache entry");
    }
  }
  tx->Commit();

  OFFSYNC_LOG_INFO("Cache cleared", {StringField("collection", collection.value_or("*")), IntField("entries", static_cast<int64_t>(dropped))});
  return dropped;
}

size_t SnapshotCache::Refresh() {
  std::vector<CacheRecord> entries;
  {
    auto tx = repository_->BeginRead();
    entries = repository_->ListCache(*tx, std::nullopt);
    tx->Commit();
  }

  size_t scheduled = 0;
  for (const auto& entry : entries) {
    if (entry.provisional) continue;
    refresher_->Schedule(entry.collection, entry.key);
    ++scheduled;
  }
  return scheduled;
}

} // namespace offsync::cache
