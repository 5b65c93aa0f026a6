#include "vecsearch/metrics.h"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <stdexcept>

namespace vecsearch {

LatencyTracker::LatencyTracker(std::size_t buffer_size) : buffer_size_(buffer_size), samples_(buffer_size) {
  if (buffer_size_ == 0) {
    throw std::invalid_argument("LatencyTracker buffer_size must be > 0");
  }
}

void LatencyTracker::record(double latency_ms) {
  std::lock_guard<std::mutex> lock(mutex_);
  samples_[index_ % buffer_size_] = latency_ms;
  index_++;
  count_ = std::min(count_ + 1, buffer_size_);
}

double LatencyTracker::percentile(double p) const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (count_ == 0) {
    return 0.0;
  }

  std::vector<double> sorted(samples_.begin(), samples_.begin() + static_cast<std::ptrdiff_t>(count_));
  std::sort(sorted.begin(), sorted.end());

  // Nearest-rank.
  const double rank = std::ceil(std::clamp(p, 0.0, 100.0) * static_cast<double>(count_) / 100.0);
  const std::size_t idx = rank < 1.0 ? 0 : std::min(static_cast<std::size_t>(rank) - 1, count_ - 1);
  return sorted[idx];
}

std::size_t LatencyTracker::count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return count_;
}

double LatencyTracker::mean() const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (count_ == 0) {
    return 0.0;
  }
  return std::accumulate(samples_.begin(), samples_.begin() + static_cast<std::ptrdiff_t>(count_), 0.0) /
         static_cast<double>(count_);
}

MetricsRegistry::MetricsRegistry(std::size_t buffer_size)
    : total_(buffer_size),
      embed_(buffer_size),
      cache_probe_(buffer_size),
      index_search_(buffer_size),
      rerank_(buffer_size) {}

LatencyTracker& MetricsRegistry::tracker(Stage stage) {
  switch (stage) {
    case Stage::TOTAL:
      return total_;
    case Stage::EMBED:
      return embed_;
    case Stage::CACHE_PROBE:
      return cache_probe_;
    case Stage::INDEX_SEARCH:
      return index_search_;
    case Stage::RERANK:
      return rerank_;
  }
  return total_;
}

void MetricsRegistry::record_latency(Stage stage, double ms) { tracker(stage).record(ms); }

void MetricsRegistry::record_recall_proxy(double value) {
  std::lock_guard<std::mutex> lock(mutex_);
  recall_sum_ += value;
  ++recall_samples_;
}

void MetricsRegistry::record_compaction(double ms) {
  std::lock_guard<std::mutex> lock(mutex_);
  ++compactions_;
  last_compaction_ms_ = ms;
}

LatencySummary MetricsRegistry::summarize(const LatencyTracker& t) {
  LatencySummary s;
  s.samples = t.count();
  s.p50_ms = t.percentile(50);
  s.p95_ms = t.percentile(95);
  s.p99_ms = t.percentile(99);
  s.mean_ms = t.mean();
  return s;
}

MetricsSnapshot MetricsRegistry::snapshot() const {
  MetricsSnapshot s;
  s.total = summarize(total_);
  s.embed = summarize(embed_);
  s.cache_probe = summarize(cache_probe_);
  s.index_search = summarize(index_search_);
  s.rerank = summarize(rerank_);

  s.queries = queries_.load(std::memory_order_relaxed);
  s.cache_hits = cache_hits_.load(std::memory_order_relaxed);
  s.cache_misses = cache_misses_.load(std::memory_order_relaxed);
  s.reranked = reranked_.load(std::memory_order_relaxed);
  s.rerank_skipped = rerank_skipped_.load(std::memory_order_relaxed);
  s.degraded = degraded_.load(std::memory_order_relaxed);
  s.cancelled = cancelled_.load(std::memory_order_relaxed);
  s.deadline_failures = deadline_failures_.load(std::memory_order_relaxed);

  std::lock_guard<std::mutex> lock(mutex_);
  s.mean_recall_proxy = recall_samples_ == 0 ? 1.0 : recall_sum_ / static_cast<double>(recall_samples_);
  s.compactions = compactions_;
  s.last_compaction_ms = last_compaction_ms_;
  return s;
}

} // namespace vecsearch
