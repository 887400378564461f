#pragma once

#include <atomic>

namespace offsync::engine {

// Last known network reachability, shared by the engine and the cache.
class Connectivity {
 public:
  explicit Connectivity(bool online = true) : online_(online) {
  }

  bool IsOnline() const {
    return online_.load();
  }

  // Returns the previous state.
  bool Set(bool online) {
    return online_.exchange(online);
  }

 private:
  std::atomic<bool> online_;
};

} // namespace offsync::engine
