#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_map>

#include "config/config.pb.h"
#include "internal/db/model/cache_record.hpp"

namespace offsync::cache {

struct Window {
  uint64_t freshness_ms   = 0;
  uint64_t hard_expiry_ms = 0;
  uint64_t max_entries    = 1000;
};

/*
  Per-collection freshness windows and hard expiries.

    stale   = now - fetched_at > freshness      (served, refreshed in background)
    expired = now - fetched_at > hard_expiry    (evicted)

  A collection holding more than max_entries is pruned down to 80% of
  the limit, oldest first.
*/
class CachePolicy {
 public:
  // Built-in table for the known collections.
  CachePolicy();

  // Built-in table overlaid with the configured defaults and collections.
  static CachePolicy FromConfig(const offsync::runtime::config::CacheConfig& config);

  void SetWindow(const std::string& collection, Window window);
  void SetDefault(Window window);

  Window WindowFor(const std::string& collection) const;

  // Longest hard expiry of any collection.
  uint64_t MaxHardExpiryMs() const;

  bool IsStale(const db::model::CacheRecord& entry, uint64_t now_ms) const;
  bool IsExpired(const db::model::CacheRecord& entry, uint64_t now_ms) const;

  // Entries to evict from a collection holding `count`; 0 within the limit.
  size_t ExcessEntries(const std::string& collection, size_t count) const;

 private:
  Window                                  default_;
  std::unordered_map<std::string, Window> windows_;
};

} // namespace offsync::cache
