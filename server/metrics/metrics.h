#pragma once

#include <array>
#include <atomic>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>

namespace agentfw {

// Latency histogram with fixed buckets (in milliseconds).
// Prometheus-compatible: cumulative counts per bucket + _sum + _count.
struct LatencyHistogram {
  // Upper bounds in milliseconds: 10, 50, 100, 250, 500, 1000, 2500, 5000, +Inf
  static constexpr std::array<double, 8> kBuckets{
      10.0, 50.0, 100.0, 250.0, 500.0, 1000.0, 2500.0, 5000.0};
  std::array<std::atomic<uint64_t>, 9> counts{}; // 8 finite + 1 +Inf
  std::atomic<uint64_t> sum_ms{0};
  std::atomic<uint64_t> total{0};

  void Record(double ms);
};

class MetricsRegistry {
public:
  // Outcome labels: forwarded, unknown_route, unauthorized, kill_switch,
  // rate_limited, secret_detected, upstream_error.
  void RecordOutcome(const std::string &outcome, const std::string &provider);
  uint64_t OutcomeCount(const std::string &outcome) const;

  void RecordRedaction(const std::string &provider);
  void RecordStreamAssembled();
  void RecordDroppedTask();

  // Full pipeline duration including the upstream call.
  void RecordLatency(double request_ms);
  // Upstream round trip only.
  void RecordUpstreamLatency(double upstream_ms);

  void IncrementConnections();
  void DecrementConnections();

  std::string RenderPrometheus() const;

private:
  mutable std::mutex outcome_mutex_;
  // key: outcome + '\x1f' + provider
  std::map<std::string, uint64_t> outcomes_;
  mutable std::mutex redaction_mutex_;
  std::map<std::string, uint64_t> redactions_;

  std::atomic<uint64_t> streams_assembled_{0};
  std::atomic<uint64_t> dropped_tasks_{0};

  LatencyHistogram request_latency_;
  LatencyHistogram upstream_latency_;

  std::atomic<int> active_connections_{0};
};

MetricsRegistry &GlobalMetrics();

} // namespace agentfw
