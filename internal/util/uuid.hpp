#pragma once

#include <array>
#include <cstdint>
#include <random>
#include <string>

namespace offsync::util {

/*
  UUID helpers

  Operation ids are RFC4122 v4 UUIDs in canonical string form; the same
  string is sent to the remote store as the idempotency key.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);

// Shorthand for ToString(GenerateUUID()).
std::string NewId();

} // namespace offsync::util
