#include "cache_policy.hpp"

#include <algorithm>

namespace offsync::cache {

namespace {

constexpr uint64_t kMinute              = 60 * 1000;
constexpr uint64_t kDefaultHardExpiryMs = 24 * 60 * kMinute;

} // namespace

CachePolicy::CachePolicy() : default_{5 * kMinute, kDefaultHardExpiryMs, 1000} {
  windows_ = {
      {"orders", {2 * kMinute, kDefaultHardExpiryMs, 5000}},
      {"companies", {15 * kMinute, kDefaultHardExpiryMs, 2000}},
      {"products", {10 * kMinute, kDefaultHardExpiryMs, 10000}},
      {"dashboard-stats", {5 * kMinute, kDefaultHardExpiryMs, 100}},
      {"user-settings", {30 * kMinute, kDefaultHardExpiryMs, 50}},
      {"notifications", {1 * kMinute, kDefaultHardExpiryMs, 500}},
      {"maintenance", {5 * kMinute, kDefaultHardExpiryMs, 1000}},
      {"feedback", {10 * kMinute, kDefaultHardExpiryMs, 1000}},
  };
}

CachePolicy CachePolicy::FromConfig(const offsync::runtime::config::CacheConfig& config) {
  CachePolicy policy;

  Window fallback = policy.default_;
  if (config.default_freshness_ms() > 0) fallback.freshness_ms = config.default_freshness_ms();
  if (config.default_hard_expiry_ms() > 0) fallback.hard_expiry_ms = config.default_hard_expiry_ms();
  if (config.default_max_entries() > 0) fallback.max_entries = config.default_max_entries();
  policy.SetDefault(fallback);

  // built-in collections follow a configured default hard expiry
  for (auto& [_, window] : policy.windows_) {
    window.hard_expiry_ms = fallback.hard_expiry_ms;
  }

  for (const auto& [collection, configured] : config.collections()) {
    Window window = policy.WindowFor(collection);
    if (configured.freshness_ms() > 0) window.freshness_ms = configured.freshness_ms();
    if (configured.hard_expiry_ms() > 0) window.hard_expiry_ms = configured.hard_expiry_ms();
    if (configured.max_entries() > 0) window.max_entries = configured.max_entries();
    policy.SetWindow(collection, window);
  }
  return policy;
}

void CachePolicy::SetWindow(const std::string& collection, Window window) {
  windows_[collection] = window;
}

void CachePolicy::SetDefault(Window window) {
  default_ = window;
}

Window CachePolicy::WindowFor(const std::string& collection) const {
  auto it = windows_.find(collection);
  return it == windows_.end() ? default_ : it->second;
}

uint64_t CachePolicy::MaxHardExpiryMs() const {
  uint64_t max_expiry = default_.hard_expiry_ms;
  for (const auto& [_, window] : windows_) {
    max_expiry = std::max(max_expiry, window.hard_expiry_ms);
  }
  return max_expiry;
}

bool CachePolicy::IsStale(const db::model::CacheRecord& entry, uint64_t now_ms) const {
  return now_ms > entry.fetched_at_ms && now_ms - entry.fetched_at_ms > WindowFor(entry.collection).freshness_ms;
}

bool CachePolicy::IsExpired(const db::model::CacheRecord& entry, uint64_t now_ms) const {
  return now_ms > entry.fetched_at_ms && now_ms - entry.fetched_at_ms > WindowFor(entry.collection).hard_expiry_ms;
}

size_t CachePolicy::ExcessEntries(const std::string& collection, size_t count) const {
  const auto limit = WindowFor(collection).max_entries;
  if (count <= limit) return 0;
  return count - static_cast<size_t>(limit * 8 / 10);
}

} // namespace offsync::cache
