#pragma once

#include <string>

#include "internal/db/api/result.hpp"
#include "internal/util/errors.hpp"

namespace offsync::db {

/*
  Raises the typed error matching a failed repository Result.

  Everything that is not a lookup or state problem is a local durability
  failure.
*/
inline void ThrowIfDbError(const Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context : context + ": " + result.message;
  switch (result.code) {
    case ErrorCode::NotFound:
      throw util::NotFound(message);
    case ErrorCode::AlreadyExists:
    case ErrorCode::Conflict:
    case ErrorCode::ConstraintViolation:
      throw util::InvalidState(message);
    default:
      throw util::StorageUnavailable(message);
  }
}

} // namespace offsync::db
