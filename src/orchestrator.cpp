#include "vecsearch/orchestrator.h"

#include <algorithm>
#include <stdexcept>
#include <utility>

#include "vecsearch/errors.h"
#include "vecsearch/logging.h"

namespace vecsearch {

namespace {

using Clock = std::chrono::steady_clock;

constexpr double kRerankCostSmoothing = 0.2;

double ms_between(Clock::time_point a, Clock::time_point b) {
  return std::chrono::duration<double, std::milli>(b - a).count();
}

double to_ms(std::chrono::nanoseconds d) { return std::chrono::duration<double, std::milli>(d).count(); }

} // namespace

const char* stage_name(QueryStage stage) noexcept {
  switch (stage) {
    case QueryStage::START:
      return "start";
    case QueryStage::EMBED:
      return "embed";
    case QueryStage::CACHE_PROBE:
      return "cache_probe";
    case QueryStage::INDEX_SEARCH:
      return "index_search";
    case QueryStage::RERANK:
      return "rerank";
    case QueryStage::DONE:
      return "done";
  }
  return "unknown";
}

SearchOrchestrator::SearchOrchestrator(CollectionManager& manager, std::shared_ptr<QueryCache> cache,
                                       OrchestratorConfig config, std::shared_ptr<MetricsRegistry> metrics)
    : manager_(manager),
      cache_(std::move(cache)),
      config_(config),
      metrics_(metrics ? std::move(metrics) : std::make_shared<MetricsRegistry>()) {
  config_.validate();
}

void SearchOrchestrator::set_embedder(std::shared_ptr<Embedder> embedder) {
  std::lock_guard<std::mutex> lock(mutex_);
  embedder_ = std::move(embedder);
}

void SearchOrchestrator::set_reranker(std::shared_ptr<Reranker> reranker) {
  std::lock_guard<std::mutex> lock(mutex_);
  reranker_ = std::move(reranker);
  rerank_cost_us_ = 0.0;
}

double SearchOrchestrator::observed_rerank_cost_us() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return rerank_cost_us_;
}

void SearchOrchestrator::observe_rerank_cost(std::chrono::nanoseconds elapsed, std::size_t candidates) {
  if (candidates == 0) {
    return;
  }
  const double per_candidate =
      std::chrono::duration<double, std::micro>(elapsed).count() / static_cast<double>(candidates);
  std::lock_guard<std::mutex> lock(mutex_);
  rerank_cost_us_ = (rerank_cost_us_ == 0.0)
                        ? per_candidate
                        : (kRerankCostSmoothing * per_candidate + (1.0 - kRerankCostSmoothing) * rerank_cost_us_);
}

std::chrono::nanoseconds SearchOrchestrator::rerank_estimate(const Reranker& reranker, std::size_t candidates) const {
  const std::chrono::nanoseconds declared = reranker.estimated_cost(candidates);
  const auto observed = std::chrono::nanoseconds(
      static_cast<std::int64_t>(observed_rerank_cost_us() * 1000.0 * static_cast<double>(candidates)));
  return std::max(declared, observed);
}

std::size_t SearchOrchestrator::adaptive_ef(std::size_t base_ef, std::size_t floor_ef,
                                            std::chrono::nanoseconds remaining, std::chrono::nanoseconds deadline,
                                            double comfortable_fraction) {
  const double comfortable = comfortable_fraction * static_cast<double>(deadline.count());
  if (static_cast<double>(remaining.count()) >= comfortable) {
    return std::max(base_ef, floor_ef);
  }
  if (remaining.count() <= 0 || comfortable <= 0.0) {
    return floor_ef;
  }
  const double scaled = static_cast<double>(base_ef) * static_cast<double>(remaining.count()) / comfortable;
  return std::max(static_cast<std::size_t>(scaled), floor_ef);
}

SearchResponse SearchOrchestrator::search(const SearchRequest& request) {
  const auto start = Clock::now();
  const std::chrono::nanoseconds budget = request.deadline.value_or(config_.deadline);
  const auto deadline = start + budget;
  auto remaining = [&deadline]() { return std::chrono::duration_cast<std::chrono::nanoseconds>(deadline - Clock::now()); };

  metrics_->count_query();

  SearchResponse response;
  response.final_stage = QueryStage::START;

  if (request.top_k == 0) {
    throw InvalidParameter("top_k must be > 0");
  }
  const std::shared_ptr<Collection> collection = manager_.get(request.collection);

  std::shared_ptr<Embedder> embedder;
  std::shared_ptr<Reranker> reranker;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    embedder = embedder_;
    reranker = reranker_;
  }

  // EMBED
  if (request.vector) {
    response.query_vector = *request.vector;
  } else if (request.text) {
    if (!embedder) {
      throw InvalidParameter("text query on '" + request.collection + "' but no embedder is configured");
    }
    const auto t0 = Clock::now();
    response.query_vector = embedder->embed(*request.text, EmbedMode::QUERY);
    const auto t1 = Clock::now();
    const double ms = ms_between(t0, t1);
    response.stages.push_back(StageTiming{QueryStage::EMBED, ms});
    metrics_->record_latency(MetricsRegistry::Stage::EMBED, ms);
    if (t1 - t0 > config_.embed_budget) {
      logger()->warn("embedding took {:.1f} ms, over the {} ms sub-budget", ms, config_.embed_budget.count());
    }
  } else {
    throw InvalidParameter("search request needs a vector or a text");
  }
  response.final_stage = QueryStage::EMBED;

  if (response.query_vector.size() != collection->dimension()) {
    throw DimensionMismatch(collection->dimension(), response.query_vector.size());
  }

  const bool rerank_wanted = reranker && collection->rerank_enabled() && request.allow_rerank;

  // CACHE_PROBE
  QueryKey key;
  key.collection = collection->name();
  key.vector = response.query_vector.data();
  key.dim = response.query_vector.size();
  key.metric = collection->metric();
  key.filter = request.filter.canonical();
  key.top_k = request.top_k;
  key.ef_search = request.ef_search;
  key.rerank = rerank_wanted;
  if (rerank_wanted && request.text) {
    key.rerank_text = *request.text;
  }
  response.fingerprint = fingerprint(key);

  if (cache_) {
    const auto t0 = Clock::now();
    response.cache_generation = cache_->generation(collection->name());
    auto entry = cache_->get(response.fingerprint);
    const double ms = ms_between(t0, Clock::now());
    response.stages.push_back(StageTiming{QueryStage::CACHE_PROBE, ms});
    metrics_->record_latency(MetricsRegistry::Stage::CACHE_PROBE, ms);
    response.final_stage = QueryStage::CACHE_PROBE;

    if (entry) {
      metrics_->count_cache_hit();
      response.hits = std::move(entry->results);
      response.cache_hit = true;
      response.final_stage = QueryStage::DONE;
      response.total_ms = ms_between(start, Clock::now());
      response.budget_exceeded = Clock::now() > deadline;
      metrics_->record_latency(MetricsRegistry::Stage::TOTAL, response.total_ms);
      logger()->debug("query on '{}' served from cache in {:.2f} ms", collection->name(), response.total_ms);
      return response;
    }
    metrics_->count_cache_miss();
  }

  // INDEX_SEARCH
  const std::size_t fetch_k = rerank_wanted ? std::max(request.top_k, config_.rerank_depth) : request.top_k;
  const std::size_t base_ef = request.ef_search.value_or(collection->config().index.ef_search);

  SearchOptions options;
  options.top_k = fetch_k;
  options.filter = request.filter;
  if (request.ef_search && *request.ef_search < request.top_k) {
    // Passed through so the collection raises it and says so.
    options.ef_search = request.ef_search;
  } else {
    options.ef_search = adaptive_ef(base_ef, fetch_k, remaining(), budget, config_.comfortable_budget_fraction);
    if (*options.ef_search < base_ef) {
      logger()->debug("query on '{}': {:.1f} ms left, ef {} -> {}", collection->name(), to_ms(remaining()), base_ef,
                      *options.ef_search);
    }
  }
  options.control.deadline = deadline;
  if (request.cancel) {
    options.control.cancel = &*request.cancel;
  }

  CollectionSearchResult found;
  {
    const auto t0 = Clock::now();
    found = collection->search(response.query_vector, options);
    const double ms = ms_between(t0, Clock::now());
    response.stages.push_back(StageTiming{QueryStage::INDEX_SEARCH, ms});
    metrics_->record_latency(MetricsRegistry::Stage::INDEX_SEARCH, ms);
  }
  response.final_stage = QueryStage::INDEX_SEARCH;
  response.ef_used = found.ef_used;
  response.ef_raised = found.ef_raised;
  response.recall_proxy = found.stats.recall_proxy();
  response.cancelled = found.stats.cancelled;
  response.budget_exceeded = found.stats.deadline_hit;
  metrics_->record_recall_proxy(response.recall_proxy);

  if (found.hits.empty() && found.stats.deadline_hit && !found.stats.cancelled && collection->size() > 0) {
    metrics_->count_deadline_failure();
    logger()->warn("query on '{}' produced no hit within {} ms", collection->name(),
                   std::chrono::duration_cast<std::chrono::milliseconds>(budget).count());
    throw DeadlineExceeded("no result for '" + collection->name() + "' within " +
                           std::to_string(std::chrono::duration_cast<std::chrono::milliseconds>(budget).count()) +
                           " ms");
  }

  std::vector<SearchHit> candidates = std::move(found.hits);

  // RERANK
  if (rerank_wanted && !response.cancelled && !candidates.empty()) {
    const auto needed = rerank_estimate(*reranker, candidates.size());
    const auto left = remaining();
    if (left > needed) {
      RerankQuery q;
      q.text = request.text;
      q.vector = response.query_vector;
      q.lookup = [collection](const RecordId& id) { return collection->vector_of(id); };

      const auto t0 = Clock::now();
      std::vector<SearchHit> refined = reranker->rerank(q, candidates);
      const auto elapsed = Clock::now() - t0;
      observe_rerank_cost(std::chrono::duration_cast<std::chrono::nanoseconds>(elapsed), candidates.size());

      const double ms = std::chrono::duration<double, std::milli>(elapsed).count();
      response.stages.push_back(StageTiming{QueryStage::RERANK, ms});
      metrics_->record_latency(MetricsRegistry::Stage::RERANK, ms);
      metrics_->count_reranked();
      response.final_stage = QueryStage::RERANK;
      response.reranked = true;
      candidates = std::move(refined);
    } else {
      response.unrefined = true;
      response.candidates = candidates;
      metrics_->count_rerank_skipped();
      logger()->warn("query on '{}': rerank skipped, {:.1f} ms left but {} needs {:.1f} ms", collection->name(),
                     to_ms(left), reranker->name(), to_ms(needed));
    }
  }

  if (candidates.size() > request.top_k) {
    candidates.resize(request.top_k);
  }
  response.hits = std::move(candidates);

  // DONE
  response.final_stage = QueryStage::DONE;
  if (Clock::now() > deadline) {
    response.budget_exceeded = true;
  }
  response.total_ms = ms_between(start, Clock::now());
  metrics_->record_latency(MetricsRegistry::Stage::TOTAL, response.total_ms);

  if (response.degraded()) {
    metrics_->count_degraded();
  }
  if (response.cancelled) {
    metrics_->count_cancelled();
  }
  if (response.budget_exceeded) {
    logger()->warn("query on '{}' exceeded its {} ms budget ({:.1f} ms); returning best effort", collection->name(),
                   std::chrono::duration_cast<std::chrono::milliseconds>(budget).count(), response.total_ms);
  }

  const bool cacheable = !response.cancelled && (!response.degraded() || config_.cache_degraded_results);
  if (cache_ && cacheable) {
    cache_->put(response.fingerprint, collection->name(), response.hits, response.cache_generation);
  }

  logger()->debug("query on '{}': {} hits in {:.2f} ms (ef={}, reranked={}, unrefined={})", collection->name(),
                  response.hits.size(), response.total_ms, response.ef_used, response.reranked, response.unrefined);
  return response;
}

std::future<std::vector<SearchHit>> SearchOrchestrator::refine_async(const SearchRequest& request,
                                                                      const SearchResponse& response) {
  if (!response.unrefined) {
    std::promise<std::vector<SearchHit>> ready;
    ready.set_value(response.hits);
    return ready.get_future();
  }

  std::shared_ptr<Reranker> reranker;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    reranker = reranker_;
  }
  if (!reranker) {
    throw InvalidParameter("refine_async needs a reranker");
  }

  std::shared_ptr<Collection> collection = manager_.get(request.collection);

  RerankQuery query;
  query.text = request.text;
  query.vector = response.query_vector;
  query.lookup = [collection](const RecordId& id) { return collection->vector_of(id); };

  return std::async(std::launch::async, [this, reranker, collection, query = std::move(query),
                                         pool = response.candidates, top_k = request.top_k,
                                         fp = response.fingerprint, generation = response.cache_generation]() {
    const auto t0 = Clock::now();
    std::vector<SearchHit> refined = reranker->rerank(query, pool);
    const auto elapsed = Clock::now() - t0;
    observe_rerank_cost(std::chrono::duration_cast<std::chrono::nanoseconds>(elapsed), pool.size());
    metrics_->record_latency(MetricsRegistry::Stage::RERANK, std::chrono::duration<double, std::milli>(elapsed).count());

    if (refined.size() > top_k) {
      refined.resize(top_k);
    }
    if (cache_ && !cache_->put(fp, collection->name(), refined, generation)) {
      logger()->debug("refined result for '{}' not cached: collection changed", collection->name());
    }
    return refined;
  });
}

} // namespace vecsearch
