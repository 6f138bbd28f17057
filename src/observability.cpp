#include "strata/observability.hpp"

#include <bit>
#include <cstdio>

namespace strata {

namespace {

// bit_width gives floor(log2(x)) + 1 for x > 0.
inline std::size_t bucket_for_us(std::uint64_t duration_us) {
  if (duration_us == 0) return 0;
  const auto b = static_cast<std::size_t>(std::bit_width(duration_us));
  return b >= LatencyHistogram::kBuckets ? LatencyHistogram::kBuckets - 1 : b;
}

void append_fixed(std::string& out, const char* key, double v, const char* fmt) {
  char buf[48];
  std::snprintf(buf, sizeof(buf), fmt, v);
  out += ",\"";
  out += key;
  out += "\":";
  out += buf;
}

}  // namespace

void LatencyHistogram::record(std::uint64_t duration_ns) {
  const std::uint64_t us = duration_ns / 1000u;
  buckets_[bucket_for_us(us)].fetch_add(1, std::memory_order_relaxed);
  count_.fetch_add(1, std::memory_order_relaxed);
  sum_us_.fetch_add(us, std::memory_order_relaxed);
}

double LatencyHistogram::mean_us() const {
  const std::uint64_t n = count_.load(std::memory_order_relaxed);
  if (n == 0) return 0.0;
  return static_cast<double>(sum_us_.load(std::memory_order_relaxed)) / static_cast<double>(n);
}

double LatencyHistogram::percentile(double p) const {
  const std::uint64_t n = count_.load(std::memory_order_relaxed);
  if (n == 0) return 0.0;

  const auto target = static_cast<std::uint64_t>(p * static_cast<double>(n));
  std::uint64_t cumulative = 0;
  for (std::size_t i = 0; i < kBuckets; ++i) {
    cumulative += buckets_[i].load(std::memory_order_relaxed);
    if (cumulative >= target && cumulative > 0) {
      const double lo = (i == 0) ? 0.0 : static_cast<double>(1ULL << (i - 1));
      const double hi = static_cast<double>(1ULL << i);
      return (lo + hi) * 0.5;
    }
  }
  return static_cast<double>(1ULL << (kBuckets - 1));
}

std::string LatencyHistogram::to_json() const {
  std::string out;
  out.reserve(192);
  out += "{\"count\":";
  out += std::to_string(count());
  append_fixed(out, "mean_ms", mean_us() / 1000.0, "%.3f");
  append_fixed(out, "p50_ms", percentile(0.50) / 1000.0, "%.3f");
  append_fixed(out, "p95_ms", percentile(0.95) / 1000.0, "%.3f");
  append_fixed(out, "p99_ms", percentile(0.99) / 1000.0, "%.3f");
  out += '}';
  return out;
}

std::string PipelineStats::to_json() const {
  auto field = [](const char* key, const std::atomic<std::uint64_t>& v) {
    return std::string("\"") + key + "\":" + std::to_string(v.load(std::memory_order_relaxed));
  };
  std::string out = "{";
  out += field("cycles", cycles) + ",";
  out += field("artifacts_analyzed", artifacts_analyzed) + ",";
  out += field("containers_extracted", containers_extracted) + ",";
  out += field("extraction_failures", extraction_failures) + ",";
  out += field("jobs_analyzed", jobs_analyzed) + ",";
  out += field("jobs_failed", jobs_failed) + ",";
  out += field("jobs_reported", jobs_reported) + ",";
  out += "\"job_latency\":" + job_latency.to_json();
  out += '}';
  return out;
}

}  // namespace strata
