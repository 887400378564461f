#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <thread>

#include "retry_scheduler.hpp"

namespace offsync::engine {
class SyncEngine;
}

namespace offsync::sync {

/*
  Background thread that runs drain passes.

  Wakes when a retry becomes ready, on Trigger() (enqueue, manual sync,
  going online) or every poll interval, whichever comes first.
*/
class SyncWorker {
 public:
  SyncWorker(std::shared_ptr<RetryScheduler> scheduler, std::shared_ptr<offsync::engine::SyncEngine> engine,
             std::chrono::milliseconds poll_interval);
  ~SyncWorker();

  void Start();
  void Stop();

 private:
  void Run();

  std::shared_ptr<RetryScheduler>              scheduler_;
  std::shared_ptr<offsync::engine::SyncEngine> engine_;
  std::chrono::milliseconds                    poll_interval_;

  std::thread       thread_;
  std::atomic<bool> running_{false};
};

} // namespace offsync::sync
