#pragma once

#include <future>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "vecsearch/collection_manager.h"
#include "vecsearch/config.h"
#include "vecsearch/embedder.h"
#include "vecsearch/metrics.h"
#include "vecsearch/orchestrator.h"
#include "vecsearch/query_cache.h"
#include "vecsearch/reranker.h"

namespace vecsearch {

// Engine
// ------
// Entry point for applications and the Python module. Owns the collections,
// the shared query cache, the orchestrator and the metrics registry.
class Engine {
public:
  explicit Engine(EngineConfig config = EngineConfig());

  Engine(const Engine&) = delete;
  Engine& operator=(const Engine&) = delete;

  const EngineConfig& config() const noexcept { return config_; }

  CollectionInfo create_collection(CollectionConfig config);
  CollectionInfo create_collection(const std::string& name, std::size_t dimension, Metric metric = Metric::COSINE,
                                   IndexParams params = IndexParams(), bool rerank_enabled = false);
  void drop_collection(const std::string& name);
  CollectionInfo describe(const std::string& name) const;
  std::vector<std::string> list_collections() const;

  std::uint64_t upsert(const std::string& collection, const RecordId& id, const Vector& vec, Payload payload = {});
  std::uint64_t upsert(const std::string& collection, const RecordId& id, const float* vec_data, std::size_t dim,
                       Payload payload = {});
  bool remove(const std::string& collection, const RecordId& id);
  VectorRecord get(const std::string& collection, const RecordId& id) const;

  SearchResponse search(const SearchRequest& request);
  SearchResponse search(const std::string& collection, const Vector& query, std::size_t top_k, Filter filter = Filter(),
                        std::optional<std::size_t> ef_search = std::nullopt);
  // The engine must outlive the returned future.
  std::future<std::vector<SearchHit>> refine_async(const SearchRequest& request, const SearchResponse& response);

  CompactionReport compact(const std::string& collection);
  void rebuild_index(const std::string& collection, std::optional<IndexParams> params = std::nullopt);
  CollectionSnapshot snapshot(const std::string& collection) const;
  CollectionInfo restore(const CollectionSnapshot& snapshot);

  void set_embedder(std::shared_ptr<Embedder> embedder);
  void set_reranker(std::shared_ptr<Reranker> reranker);

  MetricsSnapshot metrics() const;
  CacheStats cache_stats() const;

  // Direct handle for callers that need cursors or per-collection search.
  std::shared_ptr<Collection> collection(const std::string& name) const;

private:
  EngineConfig config_;
  std::shared_ptr<QueryCache> cache_;
  std::shared_ptr<MetricsRegistry> metrics_;
  CollectionManager manager_;
  SearchOrchestrator orchestrator_;
};

} // namespace vecsearch
