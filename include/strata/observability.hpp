#pragma once

// strata/observability.hpp — In-process pipeline counters.
//
// DESIGN:
//   Each poller owns one PipelineStats and logs its to_json() every
//   kStatsLogInterval cycles and once on shutdown. Counters are atomics so the engine
//   can bump them from any thread; nothing here blocks the analysis path.
//
// LatencyHistogram bucket i covers [2^(i-1) us, 2^i us); bucket 0 holds sub-microsecond
// samples. Bucket boundaries are fixed.

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>

namespace strata {

constexpr std::uint64_t kStatsLogInterval = 30;

class LatencyHistogram {
 public:
  static constexpr std::size_t kBuckets = 32;

  void record(std::uint64_t duration_ns);

  // Approximate percentile in microseconds, p in [0.0, 1.0]. 0.0 when empty.
  double percentile(double p) const;

  std::uint64_t count() const { return count_.load(std::memory_order_relaxed); }
  double mean_us() const;

  std::string to_json() const;

 private:
  std::array<std::atomic<std::uint64_t>, kBuckets> buckets_{};
  std::atomic<std::uint64_t> count_{0};
  std::atomic<std::uint64_t> sum_us_{0};
};

struct PipelineStats {
  std::atomic<std::uint64_t> artifacts_analyzed{0};
  std::atomic<std::uint64_t> containers_extracted{0};
  std::atomic<std::uint64_t> extraction_failures{0};
  std::atomic<std::uint64_t> jobs_analyzed{0};
  std::atomic<std::uint64_t> jobs_failed{0};
  std::atomic<std::uint64_t> jobs_reported{0};
  std::atomic<std::uint64_t> cycles{0};
  LatencyHistogram job_latency;

  std::string to_json() const;
};

// Records the lifetime of the scope into `hist` on every exit path.
struct ScopeTimer {
  using Clock = std::chrono::steady_clock;
  std::chrono::time_point<Clock> start{Clock::now()};
  LatencyHistogram& hist;
  explicit ScopeTimer(LatencyHistogram& h) : hist(h) {}
  ScopeTimer(const ScopeTimer&) = delete;
  ScopeTimer& operator=(const ScopeTimer&) = delete;
  ~ScopeTimer() {
    hist.record(static_cast<std::uint64_t>(
        std::chrono::duration_cast<std::chrono::nanoseconds>(Clock::now() - start).count()));
  }
};

}  // namespace strata
