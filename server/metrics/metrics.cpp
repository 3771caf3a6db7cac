#include "server/metrics/metrics.h"

#include <algorithm>
#include <sstream>

namespace agentfw {

namespace {
MetricsRegistry g_metrics;
constexpr char kSep = '\x1f';

void RenderHistogram(std::ostringstream &out, const std::string &name,
                     const std::string &help, const LatencyHistogram &hist) {
  out << "# HELP " << name << " " << help << "\n";
  out << "# TYPE " << name << " histogram\n";
  for (std::size_t i = 0; i < LatencyHistogram::kBuckets.size(); ++i) {
    out << name << "_bucket{le=\"" << LatencyHistogram::kBuckets[i] << "\"} "
        << hist.counts[i].load() << "\n";
  }
  out << name << "_bucket{le=\"+Inf\"} "
      << hist.counts[LatencyHistogram::kBuckets.size()].load() << "\n";
  out << name << "_sum " << hist.sum_ms.load() << "\n";
  out << name << "_count " << hist.total.load() << "\n";
}
}  // namespace

MetricsRegistry &GlobalMetrics() { return g_metrics; }

void LatencyHistogram::Record(double ms) {
  total.fetch_add(1, std::memory_order_relaxed);
  sum_ms.fetch_add(static_cast<uint64_t>(std::max(0.0, ms)), std::memory_order_relaxed);
  // All buckets are cumulative: increment every bucket >= ms.
  for (std::size_t i = 0; i < kBuckets.size(); ++i) {
    if (ms <= kBuckets[i]) {
      counts[i].fetch_add(1, std::memory_order_relaxed);
    }
  }
  counts[kBuckets.size()].fetch_add(1, std::memory_order_relaxed);
}

void MetricsRegistry::RecordOutcome(const std::string& outcome,
                                    const std::string& provider) {
  std::lock_guard<std::mutex> lock(outcome_mutex_);
  outcomes_[outcome + kSep + provider] += 1;
}

uint64_t MetricsRegistry::OutcomeCount(const std::string& outcome) const {
  std::lock_guard<std::mutex> lock(outcome_mutex_);
  uint64_t total = 0;
  for (const auto& entry : outcomes_) {
    if (entry.first.compare(0, outcome.size(), outcome) == 0 &&
        entry.first.size() > outcome.size() &&
        entry.first[outcome.size()] == kSep) {
      total += entry.second;
    }
  }
  return total;
}

void MetricsRegistry::RecordRedaction(const std::string& provider) {
  std::lock_guard<std::mutex> lock(redaction_mutex_);
  redactions_[provider] += 1;
}

void MetricsRegistry::RecordStreamAssembled() {
  streams_assembled_.fetch_add(1, std::memory_order_relaxed);
}

void MetricsRegistry::RecordDroppedTask() {
  dropped_tasks_.fetch_add(1, std::memory_order_relaxed);
}

void MetricsRegistry::RecordLatency(double request_ms) {
  request_latency_.Record(request_ms);
}

void MetricsRegistry::RecordUpstreamLatency(double upstream_ms) {
  upstream_latency_.Record(upstream_ms);
}

void MetricsRegistry::IncrementConnections() {
  active_connections_.fetch_add(1, std::memory_order_relaxed);
}

void MetricsRegistry::DecrementConnections() {
  active_connections_.fetch_sub(1, std::memory_order_relaxed);
}

std::string MetricsRegistry::RenderPrometheus() const {
  std::ostringstream out;

  out << "# HELP agentfw_requests_total Proxied requests by pipeline outcome\n";
  out << "# TYPE agentfw_requests_total counter\n";
  {
    std::lock_guard<std::mutex> lock(outcome_mutex_);
    for (const auto& entry : outcomes_) {
      auto sep = entry.first.find(kSep);
      out << "agentfw_requests_total{outcome=\"" << entry.first.substr(0, sep)
          << "\",provider=\"" << entry.first.substr(sep + 1) << "\"} "
          << entry.second << "\n";
    }
  }

  out << "# HELP agentfw_response_redactions_total Responses delivered with secrets redacted\n";
  out << "# TYPE agentfw_response_redactions_total counter\n";
  {
    std::lock_guard<std::mutex> lock(redaction_mutex_);
    for (const auto& entry : redactions_) {
      out << "agentfw_response_redactions_total{provider=\"" << entry.first
          << "\"} " << entry.second << "\n";
    }
  }

  out << "# HELP agentfw_streams_assembled_total Event-stream responses rebuilt into one completion\n";
  out << "# TYPE agentfw_streams_assembled_total counter\n";
  out << "agentfw_streams_assembled_total " << streams_assembled_.load() << "\n";

  out << "# HELP agentfw_background_tasks_dropped_total Side effects dropped on a full queue\n";
  out << "# TYPE agentfw_background_tasks_dropped_total counter\n";
  out << "agentfw_background_tasks_dropped_total " << dropped_tasks_.load() << "\n";

  out << "# HELP agentfw_active_connections Client connections being served\n";
  out << "# TYPE agentfw_active_connections gauge\n";
  out << "agentfw_active_connections " << active_connections_.load() << "\n";

  RenderHistogram(out, "agentfw_request_duration_ms",
                  "End-to-end request latency in milliseconds", request_latency_);
  RenderHistogram(out, "agentfw_upstream_duration_ms",
                  "Upstream provider round trip in milliseconds", upstream_latency_);
  return out.str();
}

}  // namespace agentfw
