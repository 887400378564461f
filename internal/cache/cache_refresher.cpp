#include "cache_refresher.hpp"

#include "internal/db/api/db_errors.hpp"
#include "internal/observability/logging.hpp"

namespace offsync::cache {

using observability::StringField;

CacheRefresher::CacheRefresher(std::shared_ptr<db::Repository> repository, std::shared_ptr<remote::RemoteClient> remote,
                               std::shared_ptr<util::Clock> clock, std::function<bool()> is_online, uint64_t request_timeout_ms)
    : repository_(std::move(repository)),
      remote_(std::move(remote)),
      clock_(std::move(clock)),
      is_online_(std::move(is_online)),
      request_timeout_ms_(request_timeout_ms) {
}

CacheRefresher::~CacheRefresher() {
  Stop();
}

void CacheRefresher::Schedule(const std::string& collection, const std::string& key) {
  {
    std::lock_guard lock(mutex_);
    Task task{collection, key};
    if (!queued_.insert(task).second) return;
    queue_.push_back(std::move(task));
  }
  cv_.notify_one();
}

bool CacheRefresher::RefreshNow(const std::string& collection, const std::string& key) {
  if (is_online_ && !is_online_()) {
    return false;
  }

  remote::SnapshotResult fetched;
  try {
    fetched = remote_->FetchSnapshot(collection, key, std::chrono::milliseconds(request_timeout_ms_));
  } catch (const std::exception& e) {
    fetched.status  = remote::FetchStatus::kFailed;
    fetched.message = e.what();
  }

  if (fetched.status == remote::FetchStatus::kUnavailable || fetched.status == remote::FetchStatus::kFailed) {
    OFFSYNC_LOG_DEBUG("Cache refresh skipped", {StringField("collection", collection), StringField("key", key),
                                                StringField("error", fetched.message)});
    return false;
  }

  try {
    auto tx       = repository_->Begin();
    auto existing = repository_->GetCache(*tx, collection, key);
    if (existing && existing->provisional) {
      // a pending operation owns this entry now
      return false;
    }

    if (fetched.status == remote::FetchStatus::kFound) {
      db::model::CacheRecord entry;
      entry.collection    = collection;
      entry.key           = key;
      entry.data          = fetched.snapshot;
      entry.version       = fetched.version;
      entry.fetched_at_ms = clock_->NowMs();
      db::ThrowIfDbError(repository_->PutCache(*tx, entry), "store refreshed entry");
    } else if (existing) {
      db::ThrowIfDbError(repository_->DeleteCache(*tx, collection, key), "drop vanished entry");
    } else {
      return false;
    }
    tx->Commit();
  } catch (const std::exception& e) {
    OFFSYNC_LOG_WARN("Cache refresh could not be stored",
                     {StringField("collection", collection), StringField("key", key), StringField("error", e.what())});
    return false;
  }
  return true;
}

size_t CacheRefresher::RunPending() {
  size_t written = 0;
  for (;;) {
    Task task;
    {
      std::lock_guard lock(mutex_);
      if (queue_.empty()) break;
      task = queue_.front();
      queue_.pop_front();
      queued_.erase(task);
    }
    if (RefreshNow(task.first, task.second)) ++written;
  }
  return written;
}

size_t CacheRefresher::PendingCount() const {
  std::lock_guard lock(mutex_);
  return queue_.size();
}

std::optional<CacheRefresher::Task> CacheRefresher::Dequeue() {
  std::unique_lock lock(mutex_);

  cv_.wait(lock, [&] { return shutdown_ || !queue_.empty(); });

  if (shutdown_) return std::nullopt;

  Task task = queue_.front();
  queue_.pop_front();
  queued_.erase(task);
  return task;
}

void CacheRefresher::Start() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = false;
  }
  running_ = true;
  thread_  = std::thread(&CacheRefresher::Run, this);
}

void CacheRefresher::Stop() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();
  running_ = false;
  if (thread_.joinable()) thread_.join();
}

void CacheRefresher::Run() {
  while (running_) {
    auto task = Dequeue();
    if (!task) break;
    RefreshNow(task->first, task->second);
  }
}

} // namespace offsync::cache
