#pragma once

#include "gateway/errors.h"

#include <array>
#include <atomic>
#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>

namespace vertexbridge {

// Latency histogram with fixed buckets (in milliseconds).
// Prometheus-compatible: cumulative counts per bucket + _sum + _count.
struct LatencyHistogram {
  // Upper bounds in milliseconds: 50, 100, 250, 500, 1000, 2500, 5000,
  // 10000, 30000, +Inf
  static constexpr std::array<double, 9> kBuckets{
      50.0, 100.0, 250.0, 500.0, 1000.0, 2500.0, 5000.0, 10000.0, 30000.0};
  std::array<std::atomic<uint64_t>, 10> counts{}; // 9 finite + 1 +Inf
  std::atomic<uint64_t> sum_ms{0};
  std::atomic<uint64_t> total{0};

  void Record(double ms);
};

class MetricsRegistry {
public:
  void SetBackend(const std::string &backend);

  // Every chat request that reaches the service, before admission.
  void RecordRequest();

  void RecordSuccess(const std::string &model, int prompt_tokens,
                     int completion_tokens);
  void RecordError(ErrorKind kind);
  void RecordRateLimited();
  void RecordContextTrim(std::size_t dropped_messages, bool degraded);
  void RecordStreamCompleted(std::size_t delta_events);
  void RecordStreamAborted();
  void RecordStreamFailed();

  // Call with full request duration in milliseconds.
  void RecordLatency(double request_ms);

  void IncrementConnections();
  void DecrementConnections();

  uint64_t TotalRequests() const { return total_requests_.load(); }
  uint64_t SuccessCount() const { return successful_requests_.load(); }
  uint64_t ErrorCount(ErrorKind kind) const;
  uint64_t RateLimitedCount() const { return rate_limited_.load(); }

  std::string RenderPrometheus() const;

private:
  mutable std::mutex backend_mutex_;
  std::string backend_{"vertex"};

  std::atomic<uint64_t> total_requests_{0};
  std::atomic<uint64_t> successful_requests_{0};
  std::atomic<uint64_t> total_prompt_tokens_{0};
  std::atomic<uint64_t> total_completion_tokens_{0};
  std::atomic<uint64_t> rate_limited_{0};
  std::atomic<uint64_t> context_trims_{0};
  std::atomic<uint64_t> context_dropped_messages_{0};
  std::atomic<uint64_t> context_degraded_{0};
  std::atomic<uint64_t> streams_completed_{0};
  std::atomic<uint64_t> streams_aborted_{0};
  std::atomic<uint64_t> streams_failed_{0};
  std::atomic<uint64_t> stream_delta_events_{0};

  mutable std::mutex error_mutex_;
  std::unordered_map<std::string, uint64_t> errors_by_kind_;

  mutable std::mutex model_mutex_;
  std::unordered_map<std::string, uint64_t> model_requests_;

  LatencyHistogram request_latency_;

  std::atomic<int> active_connections_{0};
};

MetricsRegistry &GlobalMetrics();

} // namespace vertexbridge
