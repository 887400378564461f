#pragma once

#include <cstdint>
#include <string_view>

namespace offsync::model {

enum class OperationStatus : std::uint8_t {
  kUnspecified = 0,
  kPending     = 1,
  kInFlight    = 2,
  kRetrying    = 3,
  kAbandoned   = 4,
  kConflicted  = 5,
  kRejected    = 6,
};

// Statuses the sync processor never picks up on its own.
constexpr bool NeedsUserAction(OperationStatus status) {
  return status == OperationStatus::kAbandoned || status == OperationStatus::kConflicted || status == OperationStatus::kRejected;
}

constexpr bool IsDeliverable(OperationStatus status) {
  return status == OperationStatus::kPending || status == OperationStatus::kRetrying;
}

/*
  Operation lifecycle.

    pending/retrying -> in_flight
    in_flight        -> retrying | abandoned | conflicted | rejected
    in_flight        -> pending                (crash recovery only)
    abandoned/rejected/conflicted -> pending   (explicit user action)

  Success, cancel and clear remove the record and are not transitions.
*/
constexpr bool CanTransition(OperationStatus from, OperationStatus to) {
  if (to == OperationStatus::kUnspecified) {
    return false;
  }
  if (from == to) {
    return to != OperationStatus::kInFlight;
  }

  switch (from) {
    case OperationStatus::kPending:
    case OperationStatus::kRetrying:
      return to == OperationStatus::kInFlight || to == OperationStatus::kPending;
    case OperationStatus::kInFlight:
      return to != OperationStatus::kUnspecified;
    case OperationStatus::kAbandoned:
    case OperationStatus::kConflicted:
    case OperationStatus::kRejected:
      return to == OperationStatus::kPending;
    case OperationStatus::kUnspecified:
      return to == OperationStatus::kPending;
  }
  return false;
}

constexpr std::string_view ToString(OperationStatus status) {
  switch (status) {
    case OperationStatus::kPending:
      return "pending";
    case OperationStatus::kInFlight:
      return "in_flight";
    case OperationStatus::kRetrying:
      return "retrying";
    case OperationStatus::kAbandoned:
      return "abandoned";
    case OperationStatus::kConflicted:
      return "conflicted";
    case OperationStatus::kRejected:
      return "rejected";
    case OperationStatus::kUnspecified:
      break;
  }
  return "unspecified";
}

} // namespace offsync::model
