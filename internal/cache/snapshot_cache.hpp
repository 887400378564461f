#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "internal/cache/cache_policy.hpp"
#include "internal/cache/cache_refresher.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/model/document.hpp"
#include "internal/remote/remote_client.hpp"
#include "internal/util/time.hpp"

namespace offsync::cache {

struct ReadResult {
  bool                     found = false;
  offsync::model::Document data;
  uint64_t                 version     = 0;
  bool                     provisional = false;
  bool                     stale       = false;
  // false when the answer came from the remote, or there was no answer at all
  bool from_cache = false;
};

/*
  Read-through, stale-while-revalidate view of the cache region.

  Provisional entries are always served as-is and are never evicted or
  refreshed here; they belong to the queue manager until confirmed.
*/
class SnapshotCache {
 public:
  SnapshotCache(std::shared_ptr<db::Repository> repository, std::shared_ptr<remote::RemoteClient> remote,
                std::shared_ptr<CachePolicy> policy, std::shared_ptr<CacheRefresher> refresher, std::shared_ptr<util::Clock> clock,
                std::function<bool()> is_online, uint64_t request_timeout_ms);

  ReadResult Read(const std::string& collection, const std::string& key);

  // Evicts expired entries and schedules stale ones for refresh. Returns evictions.
  size_t Prune();

  // Drop non-provisional entries regardless of their windows. Return how many.
  size_t ClearAll();
  size_t ClearCollection(const std::string& collection);

  // Schedules every non-provisional entry for refresh. Returns how many.
  size_t Refresh();

  const CachePolicy& policy() const {
    return *policy_;
  }

 private:
  ReadResult FetchThrough(const std::string& collection, const std::string& key);

  void EvictExpired(const std::string& collection, const std::string& key, uint64_t now_ms);

  size_t DropNonProvisional(const std::optional<std::string>& collection);

  std::shared_ptr<db::Repository>       repository_;
  std::shared_ptr<remote::RemoteClient> remote_;
  std::shared_ptr<CachePolicy>          policy_;
  std::shared_ptr<CacheRefresher>       refresher_;
  std::shared_ptr<util::Clock>          clock_;
  std::function<bool()>                 is_online_;
  uint64_t                              request_timeout_ms_;
};

} // namespace offsync::cache
