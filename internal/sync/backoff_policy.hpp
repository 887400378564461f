#pragma once

#include <cstdint>
#include <functional>
#include <mutex>
#include <random>

namespace offsync::sync {

/*
  Exponential backoff with additive jitter.

    delay(n) = min(base * 2^(n-1), cap) + uniform[0, jitter]

  n is the number of attempts already made (1 after the first failure).
*/
class BackoffPolicy {
 public:
  struct Options {
    uint64_t base_ms   = 1000;
    uint64_t max_ms    = 30000;
    uint64_t jitter_ms = 250;
  };

  // Returns a value in [0, max_jitter_ms].
  using JitterSource = std::function<uint64_t(uint64_t max_jitter_ms)>;

  explicit BackoffPolicy(Options options);
  BackoffPolicy(Options options, JitterSource jitter);

  // Delay without jitter.
  uint64_t BaseDelayMs(uint32_t attempts) const;

  uint64_t DelayMs(uint32_t attempts) const;

  const Options& options() const {
    return options_;
  }

 private:
  Options      options_;
  JitterSource jitter_;
};

} // namespace offsync::sync
