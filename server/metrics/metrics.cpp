#include "server/metrics/metrics.h"

#include <algorithm>
#include <iomanip>
#include <map>
#include <sstream>

namespace vertexbridge {

namespace {
MetricsRegistry g_metrics;

void Counter(std::ostringstream &out, const char *name, const char *help,
             const std::string &backend, uint64_t value) {
  out << "# HELP " << name << " " << help << "\n";
  out << "# TYPE " << name << " counter\n";
  out << name << "{backend=\"" << backend << "\"} " << value << "\n";
}
} // namespace

void LatencyHistogram::Record(double ms) {
  total.fetch_add(1, std::memory_order_relaxed);
  sum_ms.fetch_add(static_cast<uint64_t>(std::max(0.0, ms)),
                   std::memory_order_relaxed);
  // All buckets are cumulative: increment every bucket >= ms.
  for (std::size_t i = 0; i < kBuckets.size(); ++i) {
    if (ms <= kBuckets[i]) {
      counts[i].fetch_add(1, std::memory_order_relaxed);
    }
  }
  counts[kBuckets.size()].fetch_add(1, std::memory_order_relaxed);
}

void MetricsRegistry::SetBackend(const std::string &backend) {
  std::lock_guard<std::mutex> lock(backend_mutex_);
  backend_ = backend;
}

void MetricsRegistry::RecordRequest() {
  total_requests_.fetch_add(1, std::memory_order_relaxed);
}

void MetricsRegistry::RecordSuccess(const std::string &model,
                                    int prompt_tokens,
                                    int completion_tokens) {
  successful_requests_.fetch_add(1, std::memory_order_relaxed);
  total_prompt_tokens_.fetch_add(static_cast<uint64_t>(std::max(0, prompt_tokens)),
                                 std::memory_order_relaxed);
  total_completion_tokens_.fetch_add(
      static_cast<uint64_t>(std::max(0, completion_tokens)),
      std::memory_order_relaxed);
  if (!model.empty()) {
    std::lock_guard<std::mutex> lock(model_mutex_);
    model_requests_[model] += 1;
  }
}

void MetricsRegistry::RecordError(ErrorKind kind) {
  std::lock_guard<std::mutex> lock(error_mutex_);
  errors_by_kind_[ErrorKindName(kind)] += 1;
}

uint64_t MetricsRegistry::ErrorCount(ErrorKind kind) const {
  std::lock_guard<std::mutex> lock(error_mutex_);
  auto it = errors_by_kind_.find(ErrorKindName(kind));
  return it == errors_by_kind_.end() ? 0 : it->second;
}

void MetricsRegistry::RecordRateLimited() {
  rate_limited_.fetch_add(1, std::memory_order_relaxed);
}

void MetricsRegistry::RecordContextTrim(std::size_t dropped_messages,
                                        bool degraded) {
  if (dropped_messages == 0 && !degraded) {
    return;
  }
  context_trims_.fetch_add(1, std::memory_order_relaxed);
  context_dropped_messages_.fetch_add(dropped_messages,
                                      std::memory_order_relaxed);
  if (degraded) {
    context_degraded_.fetch_add(1, std::memory_order_relaxed);
  }
}

void MetricsRegistry::RecordStreamCompleted(std::size_t delta_events) {
  streams_completed_.fetch_add(1, std::memory_order_relaxed);
  stream_delta_events_.fetch_add(delta_events, std::memory_order_relaxed);
}

void MetricsRegistry::RecordStreamAborted() {
  streams_aborted_.fetch_add(1, std::memory_order_relaxed);
}

void MetricsRegistry::RecordStreamFailed() {
  streams_failed_.fetch_add(1, std::memory_order_relaxed);
}

void MetricsRegistry::RecordLatency(double request_ms) {
  request_latency_.Record(request_ms);
}

void MetricsRegistry::IncrementConnections() {
  active_connections_.fetch_add(1, std::memory_order_relaxed);
}

void MetricsRegistry::DecrementConnections() {
  active_connections_.fetch_sub(1, std::memory_order_relaxed);
}

std::string MetricsRegistry::RenderPrometheus() const {
  std::string backend;
  {
    std::lock_guard<std::mutex> lock(backend_mutex_);
    backend = backend_;
  }
  std::ostringstream out;

  Counter(out, "vertexbridge_requests_total",
          "Chat requests received, including rejected and failed ones",
          backend, total_requests_.load());
  Counter(out, "vertexbridge_requests_succeeded_total",
          "Chat completions answered successfully", backend,
          successful_requests_.load());
  Counter(out, "vertexbridge_prompt_tokens_total",
          "Prompt tokens reported by the backend", backend,
          total_prompt_tokens_.load());
  Counter(out, "vertexbridge_completion_tokens_total",
          "Completion tokens reported by the backend", backend,
          total_completion_tokens_.load());
  Counter(out, "vertexbridge_rate_limited_total",
          "Requests rejected by the rate limiter", backend,
          rate_limited_.load());
  Counter(out, "vertexbridge_context_trims_total",
          "Requests whose history was trimmed", backend,
          context_trims_.load());
  Counter(out, "vertexbridge_context_dropped_messages_total",
          "Messages dropped by context trimming", backend,
          context_dropped_messages_.load());
  Counter(out, "vertexbridge_context_degraded_total",
          "Requests forwarded above the maximum context size", backend,
          context_degraded_.load());
  Counter(out, "vertexbridge_stream_delta_events_total",
          "Delta events relayed to streaming callers", backend,
          stream_delta_events_.load());

  out << "# HELP vertexbridge_errors_total Failed requests by error kind\n";
  out << "# TYPE vertexbridge_errors_total counter\n";
  {
    std::lock_guard<std::mutex> lock(error_mutex_);
    std::map<std::string, uint64_t> sorted(errors_by_kind_.begin(),
                                           errors_by_kind_.end());
    for (const auto &[kind, count] : sorted) {
      out << "vertexbridge_errors_total{backend=\"" << backend
          << "\",kind=\"" << kind << "\"} " << count << "\n";
    }
  }

  out << "# HELP vertexbridge_streams_total Streaming requests by terminal "
         "state\n";
  out << "# TYPE vertexbridge_streams_total counter\n";
  out << "vertexbridge_streams_total{backend=\"" << backend
      << "\",state=\"completed\"} " << streams_completed_.load() << "\n";
  out << "vertexbridge_streams_total{backend=\"" << backend
      << "\",state=\"aborted\"} " << streams_aborted_.load() << "\n";
  out << "vertexbridge_streams_total{backend=\"" << backend
      << "\",state=\"failed\"} " << streams_failed_.load() << "\n";

  out << "# HELP vertexbridge_model_requests_total Successful completions per "
         "model\n";
  out << "# TYPE vertexbridge_model_requests_total counter\n";
  {
    std::lock_guard<std::mutex> lock(model_mutex_);
    std::map<std::string, uint64_t> sorted(model_requests_.begin(),
                                           model_requests_.end());
    for (const auto &[model, count] : sorted) {
      out << "vertexbridge_model_requests_total{model=\"" << model
          << "\",backend=\"" << backend << "\"} " << count << "\n";
    }
  }

  out << "# HELP vertexbridge_request_duration_ms Request end-to-end latency "
         "in milliseconds\n";
  out << "# TYPE vertexbridge_request_duration_ms histogram\n";
  for (std::size_t i = 0; i < LatencyHistogram::kBuckets.size(); ++i) {
    out << "vertexbridge_request_duration_ms_bucket{backend=\"" << backend
        << "\",le=\"" << std::fixed << std::setprecision(0)
        << LatencyHistogram::kBuckets[i] << "\"} "
        << request_latency_.counts[i].load() << "\n";
  }
  out << "vertexbridge_request_duration_ms_bucket{backend=\"" << backend
      << "\",le=\"+Inf\"} "
      << request_latency_.counts[LatencyHistogram::kBuckets.size()].load()
      << "\n";
  out << "vertexbridge_request_duration_ms_sum{backend=\"" << backend << "\"} "
      << request_latency_.sum_ms.load() << "\n";
  out << "vertexbridge_request_duration_ms_count{backend=\"" << backend
      << "\"} " << request_latency_.total.load() << "\n";

  out << "# HELP vertexbridge_active_connections Current number of active "
         "HTTP connections\n";
  out << "# TYPE vertexbridge_active_connections gauge\n";
  out << "vertexbridge_active_connections " << active_connections_.load()
      << "\n";

  return out.str();
}

MetricsRegistry &GlobalMetrics() { return g_metrics; }

} // namespace vertexbridge
