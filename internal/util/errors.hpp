#pragma once

#include <stdexcept>
#include <string>

namespace offsync::util {

/*
  Central error types.

  These get translated later to gRPC status codes.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

/*
  Local durability failure (disk full, corruption, locked database).

  Callers must treat this as a hard stop for the affected operation and
  never as a reason to drop it.
*/
class StorageUnavailable : public std::runtime_error {
 public:
  explicit StorageUnavailable(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace offsync::util
