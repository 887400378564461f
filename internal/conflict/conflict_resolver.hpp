#pragma once

#include <string>
#include <string_view>

#include "internal/db/model/operation_record.hpp"
#include "internal/model/document.hpp"
#include "offsync/v1/types.pb.h"

namespace offsync::conflict {

// Server state reported with a conflict or remote-deleted outcome.
struct RemoteState {
  bool                     deleted = false;
  offsync::model::Document snapshot;
  uint64_t                 version = 0;
};

struct Resolution {
  enum class Kind {
    kAccept,
    kDiscard,
    kRequireUserDecision,
  };

  Kind kind = Kind::kRequireUserDecision;

  // kAccept: what to send next, based on the remote version
  db::model::OperationKind send_as = db::model::OperationKind::kUpdate;
  offsync::model::Document merged;

  // kDiscard
  std::string reason;

  // kRequireUserDecision
  offsync::v1::ConflictInfo conflict;
};

/*
  Server-first merge policy.

  Fields the local operation did not touch come from the remote snapshot.
  A local field overrides the remote one unless the remote changed that
  same field to a different value since the operation's base; such fields
  are reported and the decision goes to the user. Deletes never merge.

  Stateless; safe to share between threads.
*/
class ConflictResolver {
 public:
  Resolution Resolve(const db::model::OperationRecord& op, const RemoteState& remote) const;

  // id and timestamp fields are owned by the server and never conflict.
  static bool IsBookkeepingField(std::string_view field);

  static constexpr std::string_view kReasonFieldConflict  = "field_conflict";
  static constexpr std::string_view kReasonRemoteUpdated  = "remote_updated";
  static constexpr std::string_view kReasonRemoteDeleted  = "remote_deleted";
  static constexpr std::string_view kReasonAlreadyDeleted = "already_deleted";
};

} // namespace offsync::conflict
