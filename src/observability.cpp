#include "sextant/observability.hpp"

#include <bit>
#include <cstdio>

namespace sextant {

namespace {

// bit_width == floor(log2(x)) + 1 for x > 0.
inline size_t bucket_for_ms(uint64_t duration_ms) {
  if (duration_ms == 0) return 0;
  const size_t b = static_cast<size_t>(std::bit_width(duration_ms));
  return (b >= LatencyHistogram::kBuckets) ? LatencyHistogram::kBuckets - 1 : b;
}

void append_counter(std::string& out, const char* key, const std::atomic<uint64_t>& value, bool first = false) {
  if (!first) out += ',';
  out += '"';
  out += key;
  out += "\":";
  out += std::to_string(value.load(std::memory_order_relaxed));
}

}  // namespace

// ---------------------------------------------------------------------------
// LatencyHistogram
// ---------------------------------------------------------------------------

void LatencyHistogram::record(uint64_t duration_ms) {
  buckets_[bucket_for_ms(duration_ms)].fetch_add(1, std::memory_order_relaxed);
  count_.fetch_add(1, std::memory_order_relaxed);
  sum_ms_.fetch_add(duration_ms, std::memory_order_relaxed);
}

double LatencyHistogram::mean_ms() const {
  const uint64_t n = count_.load(std::memory_order_relaxed);
  if (n == 0) return 0.0;
  return static_cast<double>(sum_ms_.load(std::memory_order_relaxed)) / static_cast<double>(n);
}

double LatencyHistogram::percentile(double p) const {
  const uint64_t n = count_.load(std::memory_order_relaxed);
  if (n == 0) return 0.0;

  uint64_t counts[kBuckets];
  for (size_t i = 0; i < kBuckets; ++i) counts[i] = buckets_[i].load(std::memory_order_relaxed);

  const uint64_t target = static_cast<uint64_t>(p * static_cast<double>(n));
  uint64_t cumulative = 0;
  for (size_t i = 0; i < kBuckets; ++i) {
    cumulative += counts[i];
    if (cumulative >= target) {
      // Midpoint of [2^(i-1), 2^i); bucket 0 -> 0.5 ms.
      const double lo = (i == 0) ? 0.0 : static_cast<double>(1ULL << (i - 1));
      const double hi = static_cast<double>(1ULL << i);
      return (lo + hi) * 0.5;
    }
  }
  return static_cast<double>(1ULL << (kBuckets - 1));
}

std::string LatencyHistogram::to_json() const {
  std::string out;
  out.reserve(128);
  char buf[32];
  out += "{\"count\":";
  out += std::to_string(count());
  out += ",\"mean_ms\":";
  std::snprintf(buf, sizeof(buf), "%.2f", mean_ms());
  out += buf;
  out += ",\"p50_ms\":";
  std::snprintf(buf, sizeof(buf), "%.2f", percentile(0.50));
  out += buf;
  out += ",\"p95_ms\":";
  std::snprintf(buf, sizeof(buf), "%.2f", percentile(0.95));
  out += buf;
  out += '}';
  return out;
}

// ---------------------------------------------------------------------------
// Stats
// ---------------------------------------------------------------------------

std::string OrchestratorStats::to_json() const {
  std::string out = "{";
  append_counter(out, "messages_handled", messages_handled, true);
  append_counter(out, "jobs_dispatched", jobs_dispatched);
  append_counter(out, "results_processed", results_processed);
  append_counter(out, "results_discarded", results_discarded);
  append_counter(out, "runs_started", runs_started);
  append_counter(out, "runs_finished", runs_finished);
  append_counter(out, "runs_finished_with_issues", runs_finished_with_issues);
  append_counter(out, "runs_failed", runs_failed);
  append_counter(out, "runs_cancelled", runs_cancelled);
  append_counter(out, "send_failures", send_failures);
  out += ",\"job_latency\":";
  out += job_latency.to_json();
  out += '}';
  return out;
}

std::string EndpointStats::to_json() const {
  std::string out = "{";
  append_counter(out, "requests_received", requests_received, true);
  append_counter(out, "jobs_succeeded", jobs_succeeded);
  append_counter(out, "jobs_failed", jobs_failed);
  append_counter(out, "jobs_skipped", jobs_skipped);
  append_counter(out, "messages_ignored", messages_ignored);
  out += ",\"handler_latency\":";
  out += handler_latency.to_json();
  out += '}';
  return out;
}

}  // namespace sextant
