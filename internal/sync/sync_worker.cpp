#include "sync_worker.hpp"

#include "internal/engine/sync_engine.hpp"
#include "internal/observability/logging.hpp"

namespace offsync::sync {

SyncWorker::SyncWorker(std::shared_ptr<RetryScheduler> scheduler, std::shared_ptr<offsync::engine::SyncEngine> engine,
                       std::chrono::milliseconds poll_interval)
    : scheduler_(std::move(scheduler)), engine_(std::move(engine)), poll_interval_(poll_interval) {
}

SyncWorker::~SyncWorker() {
  Stop();
}

void SyncWorker::Start() {
  running_ = true;
  thread_  = std::thread(&SyncWorker::Run, this);
}

void SyncWorker::Stop() {
  scheduler_->Shutdown();
  running_ = false;
  if (thread_.joinable()) thread_.join();
}

void SyncWorker::Run() {
  while (running_) {
    if (!scheduler_->WaitForWork(poll_interval_)) break;

    try {
      engine_->BackgroundCycle();
    } catch (const std::exception& e) {
      OFFSYNC_LOG_ERROR("Background sync cycle failed", {observability::StringField("error", e.what())});
    }
  }
}

} // namespace offsync::sync
