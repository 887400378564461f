#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <queue>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/util/time.hpp"

namespace offsync::sync {

/*
  Ready-at queue for operations waiting out a backoff, plus the wakeup
  channel of the sync worker.

  Time comes from the injected clock so tests can drive it.
*/
class RetryScheduler {
 public:
  explicit RetryScheduler(std::shared_ptr<util::Clock> clock);

  // Re-scheduling an id replaces its previous ready-at.
  void Schedule(const std::string& id, uint64_t ready_at_ms);

  std::optional<uint64_t> NextReadyAt();

  // Removes and returns every id whose ready-at is <= now_ms.
  std::vector<std::string> PopReady(uint64_t now_ms);

  size_t Size() const;

  // Wakes the worker now (manual sync, enqueue, going online).
  void Trigger();

  /*
    Blocks until an entry becomes ready, Trigger() is called or max_wait
    elapses. Returns false once shut down.
  */
  bool WaitForWork(std::chrono::milliseconds max_wait);

  void Shutdown();

 private:
  struct Entry {
    uint64_t    ready_at_ms;
    std::string id;

    bool operator>(const Entry& other) const {
      return ready_at_ms > other.ready_at_ms;
    }
  };

  // Drops heap entries superseded by a later Schedule() of the same id.
  void DropStaleLocked();

  std::shared_ptr<util::Clock> clock_;

  mutable std::mutex                                               mutex_;
  std::condition_variable                                          cv_;
  std::priority_queue<Entry, std::vector<Entry>, std::greater<>>   queue_;
  std::unordered_map<std::string, uint64_t>                        scheduled_;
  bool                                                             triggered_ = false;
  bool                                                             shutdown_  = false;
};

} // namespace offsync::sync
