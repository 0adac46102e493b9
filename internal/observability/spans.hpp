#pragma once

#include <cstdint>
#include <memory>
#include <string_view>

namespace wfrun::runtime::config {
class ObservabilityConfig;
}

namespace wfrun::observability {

// How a RunEngine operation ended.
enum class Outcome {
  kOk,
  kLockConflict,
  kNotFound,
  kRejected,
  kFailed,
};

constexpr const char* ToString(Outcome outcome) {
  switch (outcome) {
    case Outcome::kOk:
      return "ok";
    case Outcome::kLockConflict:
      return "lock_conflict";
    case Outcome::kNotFound:
      return "not_found";
    case Outcome::kRejected:
      return "rejected";
    case Outcome::kFailed:
      return "failed";
  }
  return "unknown";
}

// Both return false and install nothing when disabled in config.
// OTLP endpoints left empty fall back to the exporters' OTEL_* defaults.
bool InitializeTracing(const wfrun::runtime::config::ObservabilityConfig& config);
bool InitializeMetrics(const wfrun::runtime::config::ObservabilityConfig& config);
void ShutdownTracing();
void ShutdownMetrics();

/*
  Span around one RunEngine operation, active while the operation runs so
  log lines can carry its ids. run_id 0 means the operation is not about
  a single run.
*/
class OperationSpan {
 public:
  OperationSpan(std::string_view operation, int64_t run_id);
  ~OperationSpan();

  OperationSpan(const OperationSpan&)            = delete;
  OperationSpan& operator=(const OperationSpan&) = delete;

  // Rejected and failed outcomes mark the span as an error.
  void End(Outcome outcome, std::string_view error = {});

 private:
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

class Metrics {
 public:
  static Metrics& Instance();

  void RecordOperation(std::string_view operation, Outcome outcome, double latency_ms);
  void RecordRunCreated(std::string_view project_key);
  void RecordNodeAdvance(std::string_view status);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeTracing(const wfrun::runtime::config::ObservabilityConfig&) {
  return false;
}

inline bool InitializeMetrics(const wfrun::runtime::config::ObservabilityConfig&) {
  return false;
}

inline void ShutdownTracing() {
}

inline void ShutdownMetrics() {
}

inline OperationSpan::OperationSpan(std::string_view, int64_t) {
}

inline OperationSpan::~OperationSpan() {
}

inline void OperationSpan::End(Outcome, std::string_view) {
}

inline Metrics::Metrics() {
}

inline Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

inline void Metrics::RecordOperation(std::string_view, Outcome, double) {
}

inline void Metrics::RecordRunCreated(std::string_view) {
}

inline void Metrics::RecordNodeAdvance(std::string_view) {
}
#endif

} // namespace wfrun::observability
