#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <vector>

namespace vecsearch {

// Fixed-size ring of latency samples (milliseconds) with percentile queries
// over the most recent `buffer_size` entries.
class LatencyTracker {
public:
  explicit LatencyTracker(std::size_t buffer_size = 1000);

  void record(double latency_ms);

  // p in [0, 100]. 0 when nothing has been recorded.
  double percentile(double p) const;

  std::size_t count() const;
  double mean() const;

private:
  std::size_t buffer_size_;
  std::vector<double> samples_;
  mutable std::mutex mutex_;
  std::size_t index_ = 0;
  std::size_t count_ = 0;
};

struct LatencySummary {
  std::size_t samples = 0;
  double p50_ms = 0.0;
  double p95_ms = 0.0;
  double p99_ms = 0.0;
  double mean_ms = 0.0;
};

struct MetricsSnapshot {
  LatencySummary total;
  LatencySummary embed;
  LatencySummary cache_probe;
  LatencySummary index_search;
  LatencySummary rerank;

  std::uint64_t queries = 0;
  std::uint64_t cache_hits = 0;
  std::uint64_t cache_misses = 0;
  std::uint64_t reranked = 0;
  std::uint64_t rerank_skipped = 0;
  std::uint64_t degraded = 0;
  std::uint64_t cancelled = 0;
  std::uint64_t deadline_failures = 0;

  double mean_recall_proxy = 1.0;

  std::uint64_t compactions = 0;
  double last_compaction_ms = 0.0;
};

// MetricsRegistry
// ---------------
// In-process counters and stage latencies. Nothing is exported from here;
// a telemetry bridge reads snapshot().
class MetricsRegistry {
public:
  enum class Stage { TOTAL, EMBED, CACHE_PROBE, INDEX_SEARCH, RERANK };

  explicit MetricsRegistry(std::size_t buffer_size = 1000);

  void record_latency(Stage stage, double ms);
  void record_recall_proxy(double value);
  void record_compaction(double ms);

  void count_query() noexcept { queries_.fetch_add(1, std::memory_order_relaxed); }
  void count_cache_hit() noexcept { cache_hits_.fetch_add(1, std::memory_order_relaxed); }
  void count_cache_miss() noexcept { cache_misses_.fetch_add(1, std::memory_order_relaxed); }
  void count_reranked() noexcept { reranked_.fetch_add(1, std::memory_order_relaxed); }
  void count_rerank_skipped() noexcept { rerank_skipped_.fetch_add(1, std::memory_order_relaxed); }
  void count_degraded() noexcept { degraded_.fetch_add(1, std::memory_order_relaxed); }
  void count_cancelled() noexcept { cancelled_.fetch_add(1, std::memory_order_relaxed); }
  void count_deadline_failure() noexcept { deadline_failures_.fetch_add(1, std::memory_order_relaxed); }

  MetricsSnapshot snapshot() const;

private:
  static LatencySummary summarize(const LatencyTracker& t);
  LatencyTracker& tracker(Stage stage);

  LatencyTracker total_;
  LatencyTracker embed_;
  LatencyTracker cache_probe_;
  LatencyTracker index_search_;
  LatencyTracker rerank_;

  std::atomic<std::uint64_t> queries_{0};
  std::atomic<std::uint64_t> cache_hits_{0};
  std::atomic<std::uint64_t> cache_misses_{0};
  std::atomic<std::uint64_t> reranked_{0};
  std::atomic<std::uint64_t> rerank_skipped_{0};
  std::atomic<std::uint64_t> degraded_{0};
  std::atomic<std::uint64_t> cancelled_{0};
  std::atomic<std::uint64_t> deadline_failures_{0};

  mutable std::mutex mutex_;
  double recall_sum_ = 0.0;
  std::uint64_t recall_samples_ = 0;
  std::uint64_t compactions_ = 0;
  double last_compaction_ms_ = 0.0;
};

} // namespace vecsearch
