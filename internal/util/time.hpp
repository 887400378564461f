#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>

namespace offsync::util {

/*
  Time utilities — single place to control clock source.

  Everything that schedules work (backoff, staleness, ready-at queues) reads
  time through a Clock so tests can drive it without sleeping.
*/

using SystemClock = std::chrono::system_clock;
using TimePoint   = SystemClock::time_point;

TimePoint Now();

uint64_t ToUnixMillis(TimePoint tp);

class Clock {
 public:
  virtual ~Clock() = default;

  // Milliseconds since the unix epoch.
  virtual uint64_t NowMs() const = 0;
};

class WallClock final : public Clock {
 public:
  uint64_t NowMs() const override;
};

/*
  Manually advanced clock for tests.
*/
class ManualClock final : public Clock {
 public:
  explicit ManualClock(uint64_t start_ms = 0) : now_ms_(start_ms) {
  }

  uint64_t NowMs() const override {
    return now_ms_.load();
  }

  void Set(uint64_t now_ms) {
    now_ms_.store(now_ms);
  }

  void Advance(uint64_t delta_ms) {
    now_ms_.fetch_add(delta_ms);
  }

 private:
  std::atomic<uint64_t> now_ms_;
};

} // namespace offsync::util
