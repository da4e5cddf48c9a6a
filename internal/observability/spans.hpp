#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace streamctl::runtime::config {
class RuntimeConfig;
class ObservabilityConfig;
} // namespace streamctl::runtime::config

namespace streamctl::observability {

bool InitializeTracing(const streamctl::runtime::config::RuntimeConfig& config);
void ShutdownTracing();
bool InitializeMetrics(const streamctl::runtime::config::RuntimeConfig& config);
void ShutdownMetrics();

// Stream id of the innermost RequestSpan open on this thread, empty when none.
std::string_view CurrentStreamId();

/*
  One service request against one stream. Opens a trace span named after
  the route (when tracing is enabled) tagged with the stream id, and
  publishes the stream id to CurrentStreamId() so log lines written on
  this thread carry it. Spans nest; closing one restores the outer id.
*/
class RequestSpan {
 public:
  RequestSpan(std::string_view route, std::string_view stream_id);
  ~RequestSpan();

  RequestSpan(const RequestSpan&)            = delete;
  RequestSpan& operator=(const RequestSpan&) = delete;

  // Marks the span failed with the error text.
  void Fail(std::string_view error);

 private:
  std::string outer_stream_id_;
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

class Metrics {
 public:
  static Metrics& Instance();

  void RecordRequest(std::string_view route, bool success);
  void ObserveRequestLatencyMs(std::string_view route, double latency_ms);
  void ObserveStopDurationMs(std::string_view mode, double duration_ms);
  void SetManagedStreams(std::string_view state, std::int64_t count);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifdef ENABLE_OTEL
namespace detail {
// Endpoint for one OTLP signal ("traces" or "metrics"): config, then the
// signal-specific OTEL_* variable, then the generic one, then the local collector.
std::string ResolveOtlpEndpoint(const streamctl::runtime::config::ObservabilityConfig& config, std::string_view signal);
} // namespace detail
#else
inline bool InitializeMetrics(const streamctl::runtime::config::RuntimeConfig&) {
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

inline void Metrics::RecordRequest(std::string_view, bool) {
}

inline void Metrics::ObserveRequestLatencyMs(std::string_view, double) {
}

inline void Metrics::ObserveStopDurationMs(std::string_view, double) {
}

inline void Metrics::SetManagedStreams(std::string_view, std::int64_t) {
}
#endif

} // namespace streamctl::observability
