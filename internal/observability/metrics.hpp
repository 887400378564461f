#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace offsync::runtime::config {
class RuntimeConfig;
}

namespace offsync::observability {

enum class OtlpTransport {
  kGrpc,
  kHttpProtobuf,
};

struct OtlpConfig {
  std::string   service_name{"offsyncd"};
  std::string   endpoint{};
  OtlpTransport transport{OtlpTransport::kGrpc};
  bool          insecure{true};
  std::uint64_t collection_interval_ms{10000};
};

// Both return false when no exporter was installed. Must run before the first Metrics::Instance().
bool InitializeMetrics(const OtlpConfig& config = {});
bool InitializeMetrics(const offsync::runtime::config::RuntimeConfig& config);
void ShutdownMetrics();

// Outcome counts of one sync pass.
struct PassCounts {
  std::uint64_t delivered  = 0;
  std::uint64_t retrying   = 0;
  std::uint64_t conflicted = 0;
  std::uint64_t rejected   = 0;
  std::uint64_t abandoned  = 0;
};

class Metrics {
 public:
  static Metrics& Instance();

  void RecordPass(const PassCounts& counts, double duration_ms);
  // queue depth per status: pending, failed, conflicted, unpersisted
  void SetQueueDepth(std::string_view status, std::uint64_t count);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeMetrics(const OtlpConfig&) {
  return false;
}

inline bool InitializeMetrics(const offsync::runtime::config::RuntimeConfig&) {
  return false;
}

inline void ShutdownMetrics() {
}

inline Metrics::Metrics() {
}

inline Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

inline void Metrics::RecordPass(const PassCounts&, double) {
}

inline void Metrics::SetQueueDepth(std::string_view, std::uint64_t) {
}
#endif

} // namespace offsync::observability
