#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "vecsearch/config.h"
#include "vecsearch/distance.h"
#include "vecsearch/types.h"

namespace vecsearch {

using Fingerprint = std::uint64_t;

// Everything that determines a search result.
struct QueryKey {
  std::string collection;
  const float* vector = nullptr;
  std::size_t dim = 0;
  Metric metric = Metric::COSINE;
  std::string filter; // Filter::canonical()
  std::size_t top_k = 0;
  std::optional<std::size_t> ef_search;
  bool rerank = false;
  std::string rerank_text; // query text seen by a lexical reranker
};

// FNV-1a (64-bit) over the key. Cosine queries are L2-normalized first so
// scaled copies of a query share a fingerprint.
Fingerprint fingerprint(const QueryKey& key);

struct CacheEntry {
  Fingerprint fingerprint = 0;
  std::string collection;
  std::vector<SearchHit> results;
  std::chrono::steady_clock::time_point created_at;
  std::chrono::steady_clock::time_point last_access;
};

struct CacheStats {
  std::uint64_t hits = 0;
  std::uint64_t misses = 0;
  std::uint64_t insertions = 0;
  std::uint64_t evictions = 0;
  std::uint64_t expirations = 0;
  std::uint64_t invalidations = 0; // entries removed by invalidate()
  std::uint64_t rejected_puts = 0; // stale generation
  std::size_t size = 0;

  double hit_rate() const noexcept {
    const auto total = hits + misses;
    return total == 0 ? 0.0 : static_cast<double>(hits) / static_cast<double>(total);
  }
};

// QueryCache
// ----------
// Sharded LRU with TTL. Each shard owns a mutex, a recency list and an index
// into it. Writes to a collection call invalidate(), which drops all of that
// collection's entries and bumps its generation; a put carrying an older
// generation is refused, so a search that raced a write cannot store
// pre-write results.
class QueryCache {
public:
  using Clock = std::function<std::chrono::steady_clock::time_point()>;

  explicit QueryCache(CacheConfig config = {}, Clock clock = {});

  QueryCache(const QueryCache&) = delete;
  QueryCache& operator=(const QueryCache&) = delete;

  const CacheConfig& config() const noexcept { return config_; }

  // Read before searching and pass to put().
  std::uint64_t generation(const std::string& collection) const;

  std::optional<CacheEntry> get(Fingerprint fp);

  // Returns false (and stores nothing) if `generation` is stale.
  bool put(Fingerprint fp, const std::string& collection, std::vector<SearchHit> results,
           std::uint64_t generation);

  // Removes every entry of `collection`. Returns how many were removed.
  std::size_t invalidate(const std::string& collection);

  void clear();

  std::size_t size() const;
  CacheStats stats() const;

private:
  struct Shard {
    mutable std::mutex mutex;
    std::list<CacheEntry> lru; // front = most recently used
    std::unordered_map<Fingerprint, std::list<CacheEntry>::iterator> index;
  };

  Shard& shard_for(Fingerprint fp) noexcept { return *shards_[fp % shards_.size()]; }
  std::chrono::steady_clock::time_point now() const { return clock_ ? clock_() : std::chrono::steady_clock::now(); }
  std::size_t drop_collection_locked(const std::string& collection);

  CacheConfig config_;
  Clock clock_;
  std::size_t per_shard_capacity_;
  std::vector<std::unique_ptr<Shard>> shards_;

  // Held shared by put() and exclusively by invalidate(), so a sweep and a
  // put of the same collection never interleave. Taken before shard locks.
  mutable std::shared_mutex generation_mutex_;
  std::unordered_map<std::string, std::uint64_t> generations_;

  std::atomic<std::uint64_t> hits_{0};
  std::atomic<std::uint64_t> misses_{0};
  std::atomic<std::uint64_t> insertions_{0};
  std::atomic<std::uint64_t> evictions_{0};
  std::atomic<std::uint64_t> expirations_{0};
  std::atomic<std::uint64_t> invalidations_{0};
  std::atomic<std::uint64_t> rejected_puts_{0};
};

} // namespace vecsearch
