#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <utility>

#include "internal/db/api/repository.hpp"
#include "internal/remote/remote_client.hpp"
#include "internal/util/time.hpp"

namespace offsync::cache {

/*
  Background re-fetch of cache entries.

  Tasks are de-duplicated per (collection, key). A refreshed snapshot is
  written as one whole entry, and never over an entry that became
  provisional while the fetch was running.
*/
class CacheRefresher {
 public:
  CacheRefresher(std::shared_ptr<db::Repository> repository, std::shared_ptr<remote::RemoteClient> remote,
                 std::shared_ptr<util::Clock> clock, std::function<bool()> is_online, uint64_t request_timeout_ms);
  ~CacheRefresher();

  void Schedule(const std::string& collection, const std::string& key);

  // Fetches and stores one entry now. False when nothing was written.
  bool RefreshNow(const std::string& collection, const std::string& key);

  // Processes queued tasks on the calling thread. Returns how many were written.
  size_t RunPending();

  size_t PendingCount() const;

  void Start();
  void Stop();

 private:
  using Task = std::pair<std::string, std::string>;

  // blocking wait
  std::optional<Task> Dequeue();

  void Run();

  std::shared_ptr<db::Repository>       repository_;
  std::shared_ptr<remote::RemoteClient> remote_;
  std::shared_ptr<util::Clock>          clock_;
  std::function<bool()>                 is_online_;
  uint64_t                              request_timeout_ms_;

  mutable std::mutex      mutex_;
  std::condition_variable cv_;
  std::deque<Task>        queue_;
  std::set<Task>          queued_;
  bool                    shutdown_ = false;

  std::thread       thread_;
  std::atomic<bool> running_{false};
};

} // namespace offsync::cache
