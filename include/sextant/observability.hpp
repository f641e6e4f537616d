#pragma once

// sextant/observability.hpp — Counters and job latency for orchestrator and workers.
//
// DESIGN:
//   Process-local atomics, exported as one JSON object by `sextant health` and
//   by the debug log line an orchestrator or endpoint emits on shutdown.
//   Nothing here blocks message handling.

#include <array>
#include <atomic>
#include <cstdint>
#include <string>

namespace sextant {

// ---------------------------------------------------------------------------
// LatencyHistogram — power-of-two bucket histogram
// ---------------------------------------------------------------------------
// Bucket i covers durations in [2^(i-1) ms, 2^i ms); bucket 0 is < 1 ms.
// Stage jobs take milliseconds to hours, so resolution is milliseconds.
class LatencyHistogram {
 public:
  static constexpr size_t kBuckets = 32;

  void record(uint64_t duration_ms);

  // p in [0.0, 1.0]. Returns milliseconds, 0.0 if no samples.
  double percentile(double p) const;

  uint64_t count() const { return count_.load(std::memory_order_relaxed); }
  double mean_ms() const;

  std::string to_json() const;

 private:
  std::array<std::atomic<uint64_t>, kBuckets> buckets_{};
  std::atomic<uint64_t> count_{0};
  std::atomic<uint64_t> sum_ms_{0};
};

// ---------------------------------------------------------------------------
// OrchestratorStats
// ---------------------------------------------------------------------------
struct OrchestratorStats {
  std::atomic<uint64_t> messages_handled{0};
  std::atomic<uint64_t> jobs_dispatched{0};
  std::atomic<uint64_t> results_processed{0};
  // Results for a job that is not the run's current job, or for a run in a
  // terminal state.
  std::atomic<uint64_t> results_discarded{0};
  std::atomic<uint64_t> runs_started{0};
  std::atomic<uint64_t> runs_finished{0};
  std::atomic<uint64_t> runs_finished_with_issues{0};
  std::atomic<uint64_t> runs_failed{0};
  std::atomic<uint64_t> runs_cancelled{0};
  std::atomic<uint64_t> send_failures{0};

  // Dispatch-to-result time per job.
  LatencyHistogram job_latency;

  std::string to_json() const;
};

// ---------------------------------------------------------------------------
// EndpointStats
// ---------------------------------------------------------------------------
struct EndpointStats {
  std::atomic<uint64_t> requests_received{0};
  std::atomic<uint64_t> jobs_succeeded{0};
  std::atomic<uint64_t> jobs_failed{0};
  // Requests for runs that had already ended; answered with an error.
  std::atomic<uint64_t> jobs_skipped{0};
  std::atomic<uint64_t> messages_ignored{0};

  LatencyHistogram handler_latency;

  std::string to_json() const;
};

}  // namespace sextant
