#include "conflict_resolver.hpp"

#include <algorithm>
#include <array>
#include <optional>
#include <vector>

namespace offsync::conflict {

using db::model::OperationKind;
using offsync::model::Document;
using offsync::model::Value;
using offsync::model::ValueEquals;

namespace {

constexpr std::array<std::string_view, 5> kBookkeepingFields = {"id", "createdAt", "updatedAt", "created_at", "updated_at"};

const Value* FieldOf(const Document& doc, const std::string& field) {
  auto it = doc.fields().find(field);
  return it == doc.fields().end() ? nullptr : &it->second;
}

Value NullValue() {
  Value v;
  v.set_null_value(google::protobuf::NULL_VALUE);
  return v;
}

offsync::v1::ConflictInfo BaseInfo(std::string_view reason, const RemoteState& remote) {
  offsync::v1::ConflictInfo info;
  info.set_reason(std::string(reason));
  *info.mutable_remote_snapshot() = remote.snapshot;
  info.set_remote_version(remote.version);
  info.set_remote_deleted(remote.deleted);
  return info;
}

// Did the remote change `field` since the base the operation was derived from?
bool RemoteChanged(const std::string& field, const Value* remote_value, const Value& local_value, const std::optional<Document>& base) {
  if (!base) {
    // nothing to compare against: any remote value that differs counts
    return remote_value && !ValueEquals(*remote_value, local_value);
  }

  const Value* base_value = FieldOf(*base, field);
  if (!remote_value || !base_value) {
    return remote_value != base_value;
  }
  return !ValueEquals(*remote_value, *base_value);
}

void AddDiff(offsync::v1::ConflictInfo& info, const std::string& field, const Value& local, const Value* remote, const std::optional<Document>& base) {
  auto* diff = info.add_fields();
  diff->set_field(field);
  *diff->mutable_local()  = local;
  *diff->mutable_remote() = remote ? *remote : NullValue();
  if (base) {
    const Value* base_value = FieldOf(*base, field);
    *diff->mutable_base() = base_value ? *base_value : NullValue();
  }
}

// Remote-side edits since the base, for showing what a delete would throw away.
void AddRemoteEdits(offsync::v1::ConflictInfo& info, const RemoteState& remote, const std::optional<Document>& base) {
  if (!base) return;

  std::vector<std::string> fields;
  for (const auto& [field, _] : remote.snapshot.fields()) fields.push_back(field);
  std::sort(fields.begin(), fields.end());

  for (const auto& field : fields) {
    if (ConflictResolver::IsBookkeepingField(field)) continue;
    const Value* remote_value = FieldOf(remote.snapshot, field);
    const Value* base_value   = FieldOf(*base, field);
    if (base_value && ValueEquals(*remote_value, *base_value)) continue;
    AddDiff(info, field, NullValue(), remote_value, base);
  }
}

} // namespace

bool ConflictResolver::IsBookkeepingField(std::string_view field) {
  return std::find(kBookkeepingFields.begin(), kBookkeepingFields.end(), field) != kBookkeepingFields.end();
}

Resolution ConflictResolver::Resolve(const db::model::OperationRecord& op, const RemoteState& remote) const {
  Resolution resolution;

  if (op.kind == OperationKind::kDelete) {
    if (remote.deleted) {
      resolution.kind   = Resolution::Kind::kDiscard;
      resolution.reason = std::string(kReasonAlreadyDeleted);
      return resolution;
    }
    resolution.kind     = Resolution::Kind::kRequireUserDecision;
    resolution.conflict = BaseInfo(kReasonRemoteUpdated, remote);
    AddRemoteEdits(resolution.conflict, remote, op.base_snapshot);
    return resolution;
  }

  if (remote.deleted) {
    resolution.kind     = Resolution::Kind::kRequireUserDecision;
    resolution.conflict = BaseInfo(kReasonRemoteDeleted, remote);
    return resolution;
  }

  // a create that collided with an existing record merges as an update with no base
  const std::optional<Document> base = op.kind == OperationKind::kCreate ? std::nullopt : op.base_snapshot;

  std::vector<std::string> fields;
  for (const auto& [field, _] : op.payload.fields()) fields.push_back(field);
  std::sort(fields.begin(), fields.end());

  Document                  merged   = remote.snapshot;
  offsync::v1::ConflictInfo conflict = BaseInfo(kReasonFieldConflict, remote);

  for (const auto& field : fields) {
    if (IsBookkeepingField(field)) continue;

    const Value& local_value  = op.payload.fields().at(field);
    const Value* remote_value = FieldOf(remote.snapshot, field);

    if (remote_value && ValueEquals(*remote_value, local_value)) continue;

    if (RemoteChanged(field, remote_value, local_value, base)) {
      AddDiff(conflict, field, local_value, remote_value, base);
      continue;
    }
    (*merged.mutable_fields())[field] = local_value;
  }

  if (conflict.fields_size() > 0) {
    resolution.kind     = Resolution::Kind::kRequireUserDecision;
    resolution.conflict = std::move(conflict);
    return resolution;
  }

  resolution.kind    = Resolution::Kind::kAccept;
  resolution.send_as = OperationKind::kUpdate;
  resolution.merged  = std::move(merged);
  return resolution;
}

} // namespace offsync::conflict
