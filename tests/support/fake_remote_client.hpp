#pragma once

#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "internal/model/document.hpp"
#include "internal/remote/remote_client.hpp"

namespace offsync::testing {

/*
  In-process remote store with versioned records.

  Applies mutations with optimistic version checks, remembers results per
  idempotency key and can be scripted to fail the next calls.
*/
class FakeRemoteClient final : public remote::RemoteClient {
 public:
  struct Record {
    offsync::model::Document data;
    uint64_t                 version = 0;
    bool                     deleted = false;
  };

  void Seed(const std::string& collection, const std::string& key, const offsync::model::Document& data, uint64_t version) {
    std::lock_guard lock(mutex_);
    records_[{collection, key}] = Record{data, version, false};
  }

  // Remote-side edit that bumps the version, as another client would.
  void Edit(const std::string& collection, const std::string& key, const offsync::model::Document& patch) {
    std::lock_guard lock(mutex_);
    auto&           record = records_[{collection, key}];
    record.data            = offsync::model::Overlay(record.data, patch);
    record.version++;
  }

  void RemoteDelete(const std::string& collection, const std::string& key) {
    std::lock_guard lock(mutex_);
    auto&           record = records_[{collection, key}];
    record.deleted         = true;
    record.version++;
  }

  // The next calls return `outcome` without touching any record.
  void FailNext(remote::Outcome outcome, size_t times = 1) {
    std::lock_guard lock(mutex_);
    for (size_t i = 0; i < times; ++i) scripted_.push_back(outcome);
  }

  // The next mutation is applied but its reply is lost on the way back.
  void LoseNextReply() {
    std::lock_guard lock(mutex_);
    lose_replies_++;
  }

  void SetFetchUnavailable(bool unavailable) {
    std::lock_guard lock(mutex_);
    fetch_unavailable_ = unavailable;
  }

  std::optional<Record> Get(const std::string& collection, const std::string& key) {
    std::lock_guard lock(mutex_);
    auto            it = records_.find({collection, key});
    if (it == records_.end()) return std::nullopt;
    return it->second;
  }

  std::vector<remote::MutationRequest> Calls() {
    std::lock_guard lock(mutex_);
    return calls_;
  }

  size_t FetchCalls() {
    std::lock_guard lock(mutex_);
    return fetch_calls_;
  }

  size_t AppliedCount() {
    std::lock_guard lock(mutex_);
    return applied_;
  }

  remote::MutationResult ApplyMutation(const remote::MutationRequest& request, std::chrono::milliseconds) override {
    std::lock_guard lock(mutex_);
    calls_.push_back(request);

    remote::MutationResult result;
    if (!scripted_.empty()) {
      result.outcome = scripted_.front();
      result.message = "scripted " + std::string(remote::ToString(result.outcome));
      scripted_.pop_front();
      return result;
    }

    if (auto it = results_.find(request.idempotency_key); it != results_.end()) {
      return it->second;
    }

    result = ApplyLocked(request);
    if (lose_replies_ > 0) {
      lose_replies_--;
      remote::MutationResult lost;
      lost.outcome = remote::Outcome::kTransportError;
      lost.message = "reply lost";
      return lost;
    }
    return result;
  }

  remote::SnapshotResult FetchSnapshot(const std::string& collection, const std::string& key, std::chrono::milliseconds) override {
    std::lock_guard lock(mutex_);
    fetch_calls_++;

    remote::SnapshotResult result;
    if (fetch_unavailable_) {
      result.status  = remote::FetchStatus::kUnavailable;
      result.message = "offline";
      return result;
    }
    auto it = records_.find({collection, key});
    if (it == records_.end() || it->second.deleted) {
      result.status = remote::FetchStatus::kNotFound;
      return result;
    }
    result.status   = remote::FetchStatus::kFound;
    result.snapshot = it->second.data;
    result.version  = it->second.version;
    return result;
  }

 private:
  remote::MutationResult ApplyLocked(const remote::MutationRequest& request) {
    remote::MutationResult result;

    using db::model::OperationKind;
    const std::string key = request.kind == OperationKind::kCreate && !request.target_id
                                ? "srv-" + std::to_string(next_id_++)
                                : request.target_id.value_or("");
    auto it = records_.find({request.collection, key});

    switch (request.kind) {
      case OperationKind::kCreate:
        if (it != records_.end() && !it->second.deleted) {
          return Conflict(it->second, key);
        }
        records_[{request.collection, key}] = Record{request.payload, 1, false};
        return Applied(request.idempotency_key, records_[{request.collection, key}], key);

      case OperationKind::kUpdate:
        if (it == records_.end() || it->second.deleted) {
          result.outcome = remote::Outcome::kRemoteDeleted;
          result.version = it == records_.end() ? 0 : it->second.version;
          return result;
        }
        if (request.base_version && *request.base_version != it->second.version) {
          return Conflict(it->second, key);
        }
        it->second.data = offsync::model::Overlay(it->second.data, request.payload);
        it->second.version++;
        return Applied(request.idempotency_key, it->second, key);

      case OperationKind::kDelete:
        if (it == records_.end() || it->second.deleted) {
          result.outcome = remote::Outcome::kRemoteDeleted;
          return result;
        }
        if (request.base_version && *request.base_version != it->second.version) {
          return Conflict(it->second, key);
        }
        it->second.deleted = true;
        it->second.version++;
        return Applied(request.idempotency_key, it->second, key);
    }
    return result;
  }

  remote::MutationResult Applied(const std::string& idempotency_key, const Record& record, const std::string& key) {
    remote::MutationResult result;
    result.outcome = remote::Outcome::kApplied;
    result.target_id = key;
    if (!record.deleted) result.snapshot = record.data;
    result.version            = record.version;
    results_[idempotency_key] = result;
    applied_++;
    return result;
  }

  static remote::MutationResult Conflict(const Record& record, const std::string& key) {
    remote::MutationResult result;
    result.outcome   = remote::Outcome::kConflict;
    result.target_id = key;
    result.snapshot  = record.data;
    result.version   = record.version;
    return result;
  }

  std::mutex                                                   mutex_;
  std::map<std::pair<std::string, std::string>, Record>        records_;
  std::map<std::string, remote::MutationResult>                results_;
  std::deque<remote::Outcome>                                  scripted_;
  std::vector<remote::MutationRequest>                         calls_;
  bool                                                         fetch_unavailable_ = false;
  size_t                                                       fetch_calls_       = 0;
  size_t                                                       applied_           = 0;
  size_t                                                       lose_replies_      = 0;
  int                                                          next_id_           = 1;
};

} // namespace offsync::testing
