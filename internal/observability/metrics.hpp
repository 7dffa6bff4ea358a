#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace eventlog::runtime::config {
class RuntimeConfig;
}

namespace eventlog::observability {

enum class OtlpTransport {
  kGrpc,
  kHttpProtobuf,
};

struct OtlpConfig {
  std::string   service_name{"eventlog-watcher"};
  std::string   endpoint{};
  OtlpTransport transport{OtlpTransport::kGrpc};
  bool          insecure{true};
};

bool InitializeMetrics(const eventlog::runtime::config::RuntimeConfig& config);
void ShutdownMetrics();

/*
  Watch loop instruments.

  Notification outcomes: "dispatched", "malformed", "unwatched",
  "not_found", "fetch_error".
*/
class Metrics {
 public:
  static Metrics& Instance();

  void RecordNotification(std::string_view outcome);
  void RecordDeliveries(std::uint64_t count);
  void RecordCallbackFailure();
  void ObserveFetchLatencyMs(double latency_ms);
  void RecordReconnect(bool success);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeMetrics(const eventlog::runtime::config::RuntimeConfig&) {
  return false;
}

inline void ShutdownMetrics() {
}

inline Metrics::Metrics() = default;

inline Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

inline void Metrics::RecordNotification(std::string_view) {
}

inline void Metrics::RecordDeliveries(std::uint64_t) {
}

inline void Metrics::RecordCallbackFailure() {
}

inline void Metrics::ObserveFetchLatencyMs(double) {
}

inline void Metrics::RecordReconnect(bool) {
}
#endif

} // namespace eventlog::observability
