#include "backoff_policy.hpp"

#include <algorithm>
#include <memory>

namespace offsync::sync {

namespace {

BackoffPolicy::JitterSource DefaultJitter() {
  struct State {
    std::mutex      mutex;
    std::mt19937_64 rng{std::random_device{}()};
  };
  auto state = std::make_shared<State>();

  return [state](uint64_t max_jitter_ms) -> uint64_t {
    if (max_jitter_ms == 0) return 0;
    std::uniform_int_distribution<uint64_t> dist(0, max_jitter_ms);
    std::lock_guard                         lock(state->mutex);
    return dist(state->rng);
  };
}

} // namespace

BackoffPolicy::BackoffPolicy(Options options) : BackoffPolicy(options, DefaultJitter()) {
}

BackoffPolicy::BackoffPolicy(Options options, JitterSource jitter) : options_(options), jitter_(std::move(jitter)) {
}

uint64_t BackoffPolicy::BaseDelayMs(uint32_t attempts) const {
  const uint32_t exponent = attempts == 0 ? 0 : attempts - 1;

  // stop doubling once the cap is reached; also keeps the shift in range
  uint64_t delay = options_.base_ms;
  for (uint32_t i = 0; i < exponent && delay < options_.max_ms; ++i) {
    delay *= 2;
  }
  return std::min(delay, options_.max_ms);
}

uint64_t BackoffPolicy::DelayMs(uint32_t attempts) const {
  const uint64_t jitter = jitter_ ? std::min(jitter_(options_.jitter_ms), options_.jitter_ms) : 0;
  return BaseDelayMs(attempts) + jitter;
}

} // namespace offsync::sync
