#include "vecsearch/engine.h"

#include <utility>

#include "vecsearch/logging.h"

namespace vecsearch {

namespace {

EngineConfig prepared(EngineConfig config) {
  config.cache.validate();
  config.orchestrator.validate();
  if (!config.log_level.empty() && !set_log_level(config.log_level)) {
    logger()->warn("unknown log level '{}'; keeping the current one", config.log_level);
  }
  return config;
}

} // namespace

Engine::Engine(EngineConfig config)
    : config_(prepared(std::move(config))),
      cache_(std::make_shared<QueryCache>(config_.cache)),
      metrics_(std::make_shared<MetricsRegistry>()),
      manager_(cache_),
      orchestrator_(manager_, cache_, config_.orchestrator, metrics_) {}

CollectionInfo Engine::create_collection(CollectionConfig config) { return manager_.create(std::move(config))->info(); }

CollectionInfo Engine::create_collection(const std::string& name, std::size_t dimension, Metric metric,
                                         IndexParams params, bool rerank_enabled) {
  CollectionConfig cfg;
  cfg.name = name;
  cfg.dimension = dimension;
  cfg.metric = metric;
  cfg.index = params;
  cfg.rerank_enabled = rerank_enabled;
  return create_collection(std::move(cfg));
}

void Engine::drop_collection(const std::string& name) { manager_.drop(name); }

CollectionInfo Engine::describe(const std::string& name) const { return manager_.describe(name); }

std::vector<std::string> Engine::list_collections() const { return manager_.list(); }

std::uint64_t Engine::upsert(const std::string& collection, const RecordId& id, const Vector& vec, Payload payload) {
  return manager_.get(collection)->upsert(id, vec, std::move(payload));
}

std::uint64_t Engine::upsert(const std::string& collection, const RecordId& id, const float* vec_data,
                             std::size_t dim, Payload payload) {
  return manager_.get(collection)->upsert(id, vec_data, dim, std::move(payload));
}

bool Engine::remove(const std::string& collection, const RecordId& id) { return manager_.get(collection)->remove(id); }

VectorRecord Engine::get(const std::string& collection, const RecordId& id) const {
  return manager_.get(collection)->get(id);
}

SearchResponse Engine::search(const SearchRequest& request) { return orchestrator_.search(request); }

SearchResponse Engine::search(const std::string& collection, const Vector& query, std::size_t top_k, Filter filter,
                              std::optional<std::size_t> ef_search) {
  SearchRequest request;
  request.collection = collection;
  request.vector = query;
  request.top_k = top_k;
  request.filter = std::move(filter);
  request.ef_search = ef_search;
  return orchestrator_.search(request);
}

std::future<std::vector<SearchHit>> Engine::refine_async(const SearchRequest& request,
                                                         const SearchResponse& response) {
  return orchestrator_.refine_async(request, response);
}

CompactionReport Engine::compact(const std::string& collection) {
  CompactionReport report = manager_.compact(collection);
  metrics_->record_compaction(report.duration_ms);
  return report;
}

void Engine::rebuild_index(const std::string& collection, std::optional<IndexParams> params) {
  manager_.rebuild(collection, std::move(params));
}

CollectionSnapshot Engine::snapshot(const std::string& collection) const { return manager_.snapshot(collection); }

CollectionInfo Engine::restore(const CollectionSnapshot& snapshot) { return manager_.restore(snapshot)->info(); }

void Engine::set_embedder(std::shared_ptr<Embedder> embedder) { orchestrator_.set_embedder(std::move(embedder)); }

void Engine::set_reranker(std::shared_ptr<Reranker> reranker) { orchestrator_.set_reranker(std::move(reranker)); }

MetricsSnapshot Engine::metrics() const { return metrics_->snapshot(); }

CacheStats Engine::cache_stats() const { return cache_->stats(); }

std::shared_ptr<Collection> Engine::collection(const std::string& name) const { return manager_.get(name); }

} // namespace vecsearch
