#include "internal/cache/cache_policy.hpp"

#include <cassert>
#include <iostream>

namespace {

using offsync::cache::CachePolicy;
using offsync::db::model::CacheRecord;

constexpr uint64_t kMinute = 60 * 1000;

CacheRecord Entry(const std::string& collection, uint64_t fetched_at_ms) {
  CacheRecord entry;
  entry.collection    = collection;
  entry.key           = "k";
  entry.fetched_at_ms = fetched_at_ms;
  return entry;
}

void TestBuiltInWindows() {
  CachePolicy policy;
  assert(policy.WindowFor("orders").freshness_ms == 2 * kMinute);
  assert(policy.WindowFor("companies").freshness_ms == 15 * kMinute);
  assert(policy.WindowFor("notifications").freshness_ms == 1 * kMinute);
  assert(policy.WindowFor("unknown").freshness_ms == 5 * kMinute);
  assert(policy.WindowFor("orders").hard_expiry_ms == 24 * 60 * kMinute);
}

void TestStalenessBoundary() {
  CachePolicy policy;
  const auto  fetched = 1'000'000;
  auto        entry   = Entry("orders", fetched);

  assert(!policy.IsStale(entry, fetched + 2 * kMinute));
  assert(policy.IsStale(entry, fetched + 2 * kMinute + 1));
  assert(!policy.IsStale(entry, fetched - 5));
}

void TestExpiryBoundary() {
  CachePolicy policy;
  auto        entry = Entry("products", 0);
  const auto  hard  = policy.WindowFor("products").hard_expiry_ms;

  assert(!policy.IsExpired(entry, hard));
  assert(policy.IsExpired(entry, hard + 1));
}

void TestEntryLimits() {
  CachePolicy policy;
  assert(policy.WindowFor("orders").max_entries == 5000);
  assert(policy.WindowFor("user-settings").max_entries == 50);
  assert(policy.WindowFor("unknown").max_entries == 1000);

  assert(policy.ExcessEntries("orders", 5000) == 0);
  // over the limit: back down to 80% of it
  assert(policy.ExcessEntries("orders", 5001) == 1001);
  assert(policy.ExcessEntries("unknown", 1001) == 201);

  offsync::runtime::config::CacheConfig config;
  config.set_default_max_entries(200);
  (*config.mutable_collections())["orders"].set_max_entries(20);
  auto configured = CachePolicy::FromConfig(config);
  assert(configured.WindowFor("orders").max_entries == 20);
  assert(configured.WindowFor("orders").freshness_ms == 2 * kMinute);
  assert(configured.WindowFor("products").max_entries == 10000);
  assert(configured.WindowFor("unknown").max_entries == 200);
  assert(configured.ExcessEntries("orders", 25) == 9);
}

void TestConfigOverrides() {
  offsync::runtime::config::CacheConfig config;
  config.set_default_freshness_ms(1000);
  config.set_default_hard_expiry_ms(10000);
  (*config.mutable_collections())["orders"].set_freshness_ms(500);
  (*config.mutable_collections())["audit"].set_hard_expiry_ms(50000);

  auto policy = CachePolicy::FromConfig(config);
  assert(policy.WindowFor("orders").freshness_ms == 500);
  assert(policy.WindowFor("orders").hard_expiry_ms == 10000);
  assert(policy.WindowFor("companies").freshness_ms == 15 * kMinute);
  assert(policy.WindowFor("audit").freshness_ms == 1000);
  assert(policy.WindowFor("elsewhere").hard_expiry_ms == 10000);
  assert(policy.MaxHardExpiryMs() == 50000);
}

} // namespace

int main() {
  TestBuiltInWindows();
  TestStalenessBoundary();
  TestExpiryBoundary();
  TestEntryLimits();
  TestConfigOverrides();

  std::cout << "offsync_unit_cache_policy: pass\n";
  return 0;
}
