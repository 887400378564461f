#pragma once

#include <cstdint>
#include <string>

#include "internal/model/document.hpp"

namespace offsync::db::model {

/*
  Read-through cache row, keyed by (collection, key).

  provisional = an unconfirmed local operation affects this entry.
  deleted     = provisional tombstone left by a pending delete.
*/
struct CacheRecord {
  std::string              collection;
  std::string              key;
  offsync::model::Document data;
  uint64_t                 version     = 0;
  uint64_t                 fetched_at_ms = 0;
  bool                     provisional = false;
  bool                     deleted     = false;
};

} // namespace offsync::db::model
