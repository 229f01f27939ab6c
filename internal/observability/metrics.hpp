#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace flowsched::runtime::config {
class RuntimeConfig;
}

namespace flowsched::observability {

enum class OtlpTransport {
  kGrpc,
  kHttpProtobuf,
};

struct OtlpConfig {
  std::string   service_name{"flowsched"};
  std::string   endpoint{};
  OtlpTransport transport{OtlpTransport::kGrpc};
  bool          insecure{true};
};

/*
  Scheduler metrics exported over OTLP.

  Without ENABLE_OTEL every call below is an inline no-op and
  InitializeMetrics() reports false.
*/
bool InitializeMetrics(const flowsched::runtime::config::RuntimeConfig& config);
void ShutdownMetrics();

class Metrics {
 public:
  static Metrics& Instance();

  // flowsched.schedule.candidates
  void AddCandidates(std::uint64_t count);
  // flowsched.schedule.runs_materialized
  void AddMaterialized(std::uint64_t count);
  // flowsched.schedule.latency_ms, labelled by outcome
  void ObserveScheduleLatencyMs(double latency_ms, bool success);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeMetrics(const flowsched::runtime::config::RuntimeConfig&) {
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

inline void Metrics::AddCandidates(std::uint64_t) {
}

inline void Metrics::AddMaterialized(std::uint64_t) {
}

inline void Metrics::ObserveScheduleLatencyMs(double, bool) {
}
#endif

} // namespace flowsched::observability
