#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "vecsearch/collection_manager.h"
#include "vecsearch/config.h"
#include "vecsearch/embedder.h"
#include "vecsearch/metrics.h"
#include "vecsearch/query_cache.h"
#include "vecsearch/reranker.h"
#include "vecsearch/search_control.h"
#include "vecsearch/types.h"

namespace vecsearch {

enum class QueryStage : std::uint8_t { START, EMBED, CACHE_PROBE, INDEX_SEARCH, RERANK, DONE };

const char* stage_name(QueryStage stage) noexcept;

struct SearchRequest {
  std::string collection;

  // Exactly one of these. Text goes through the embedder; text given
  // alongside a vector is only used by lexical rerankers.
  std::optional<Vector> vector;
  std::optional<std::string> text;

  std::size_t top_k = 10;
  Filter filter;
  std::optional<std::size_t> ef_search;

  // Set to false to skip reranking on a collection that has it enabled.
  bool allow_rerank = true;

  // Overrides OrchestratorConfig::deadline for this query.
  std::optional<std::chrono::milliseconds> deadline;

  // Caller-side abort. Checked at every node expansion.
  std::optional<CancellationToken> cancel;
};

struct StageTiming {
  QueryStage stage = QueryStage::START;
  double ms = 0.0;
};

struct SearchResponse {
  std::vector<SearchHit> hits;

  bool cache_hit = false;
  bool reranked = false;
  bool unrefined = false;       // rerank was due but skipped for lack of time
  bool budget_exceeded = false; // best effort: the deadline passed
  bool cancelled = false;
  bool ef_raised = false;

  std::size_t ef_used = 0;
  double recall_proxy = 1.0;

  std::vector<StageTiming> stages;
  double total_ms = 0.0;
  QueryStage final_stage = QueryStage::START;

  // Kept so refine_async() can finish an unrefined query later.
  Vector query_vector;
  std::vector<SearchHit> candidates;
  Fingerprint fingerprint = 0;
  std::uint64_t cache_generation = 0;

  bool degraded() const noexcept { return budget_exceeded || cancelled || unrefined; }
};

// SearchOrchestrator
// ------------------
// Runs one query through START -> EMBED -> CACHE_PROBE -> INDEX_SEARCH ->
// [RERANK] -> DONE under a wall-clock deadline.
//
// - A cache hit ends the query at CACHE_PROBE.
// - Under a tight remaining budget the index is searched with a smaller ef.
// - RERANK runs only if the collection enables it and the time left exceeds
//   the reranker's cost estimate; otherwise the ANN order is returned with
//   `unrefined` set.
// - Running out of time yields best-effort hits with `budget_exceeded` set.
//   DeadlineExceeded is thrown only when no hit at all was produced while the
//   collection has live records.
class SearchOrchestrator {
public:
  SearchOrchestrator(CollectionManager& manager, std::shared_ptr<QueryCache> cache, OrchestratorConfig config = {},
                     std::shared_ptr<MetricsRegistry> metrics = nullptr);

  const OrchestratorConfig& config() const noexcept { return config_; }

  void set_embedder(std::shared_ptr<Embedder> embedder);
  void set_reranker(std::shared_ptr<Reranker> reranker);

  SearchResponse search(const SearchRequest& request);

  // Reranks an unrefined response's candidate pool on another thread. The
  // refined hits are cached unless the collection was written meanwhile.
  // A response that is not unrefined resolves immediately to its own hits.
  std::future<std::vector<SearchHit>> refine_async(const SearchRequest& request, const SearchResponse& response);

  // Smoothed observed rerank cost per candidate, in microseconds.
  double observed_rerank_cost_us() const;

  // ef to use with `remaining` of a `deadline` budget left.
  static std::size_t adaptive_ef(std::size_t base_ef, std::size_t floor_ef, std::chrono::nanoseconds remaining,
                                 std::chrono::nanoseconds deadline, double comfortable_fraction);

private:
  void observe_rerank_cost(std::chrono::nanoseconds elapsed, std::size_t candidates);
  std::chrono::nanoseconds rerank_estimate(const Reranker& reranker, std::size_t candidates) const;

  CollectionManager& manager_;
  std::shared_ptr<QueryCache> cache_;
  OrchestratorConfig config_;
  std::shared_ptr<MetricsRegistry> metrics_;

  mutable std::mutex mutex_; // embedder_, reranker_, rerank_cost_us_
  std::shared_ptr<Embedder> embedder_;
  std::shared_ptr<Reranker> reranker_;
  double rerank_cost_us_ = 0.0;
};

} // namespace vecsearch
