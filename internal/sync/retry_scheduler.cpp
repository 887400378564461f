#include "retry_scheduler.hpp"

#include <algorithm>

namespace offsync::sync {

RetryScheduler::RetryScheduler(std::shared_ptr<util::Clock> clock) : clock_(std::move(clock)) {
}

void RetryScheduler::Schedule(const std::string& id, uint64_t ready_at_ms) {
  {
    std::lock_guard lock(mutex_);
    auto [it, inserted] = scheduled_.try_emplace(id, ready_at_ms);
    if (!inserted) {
      if (it->second == ready_at_ms) return;
      it->second = ready_at_ms;
    }
    queue_.push({ready_at_ms, id});
  }
  cv_.notify_one();
}

void RetryScheduler::DropStaleLocked() {
  while (!queue_.empty()) {
    const auto& top = queue_.top();
    auto        it  = scheduled_.find(top.id);
    if (it != scheduled_.end() && it->second == top.ready_at_ms) return;
    queue_.pop();
  }
}

std::optional<uint64_t> RetryScheduler::NextReadyAt() {
  std::lock_guard lock(mutex_);
  DropStaleLocked();
  if (queue_.empty()) return std::nullopt;
  return queue_.top().ready_at_ms;
}

std::vector<std::string> RetryScheduler::PopReady(uint64_t now_ms) {
  std::lock_guard          lock(mutex_);
  std::vector<std::string> ready;
  DropStaleLocked();
  while (!queue_.empty() && queue_.top().ready_at_ms <= now_ms) {
    ready.push_back(queue_.top().id);
    scheduled_.erase(queue_.top().id);
    queue_.pop();
    DropStaleLocked();
  }
  return ready;
}

size_t RetryScheduler::Size() const {
  std::lock_guard lock(mutex_);
  return scheduled_.size();
}

void RetryScheduler::Trigger() {
  {
    std::lock_guard lock(mutex_);
    triggered_ = true;
  }
  cv_.notify_all();
}

bool RetryScheduler::WaitForWork(std::chrono::milliseconds max_wait) {
  std::unique_lock lock(mutex_);

  DropStaleLocked();
  auto wait = max_wait;
  if (!queue_.empty()) {
    const auto now      = clock_->NowMs();
    const auto ready_at = queue_.top().ready_at_ms;
    wait                = std::min(wait, std::chrono::milliseconds(ready_at > now ? ready_at - now : 0));
  }

  cv_.wait_for(lock, wait, [&] { return shutdown_ || triggered_; });

  if (shutdown_) return false;

  // the caller runs a pass now; it re-schedules whatever is still waiting
  triggered_     = false;
  const auto now = clock_->NowMs();
  DropStaleLocked();
  while (!queue_.empty() && queue_.top().ready_at_ms <= now) {
    scheduled_.erase(queue_.top().id);
    queue_.pop();
    DropStaleLocked();
  }
  return true;
}

void RetryScheduler::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();
}

} // namespace offsync::sync
