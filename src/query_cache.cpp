#include "vecsearch/query_cache.h"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace vecsearch {

namespace {

constexpr std::uint64_t kFnvOffset = 1469598103934665603ull;
constexpr std::uint64_t kFnvPrime = 1099511628211ull;

inline void fnv_mix(std::uint64_t& h, const void* data, std::size_t size) noexcept {
  const auto* p = static_cast<const unsigned char*>(data);
  for (std::size_t i = 0; i < size; ++i) {
    h ^= p[i];
    h *= kFnvPrime;
  }
}

inline void fnv_mix_u64(std::uint64_t& h, std::uint64_t v) noexcept { fnv_mix(h, &v, sizeof(v)); }

// Length-prefixed so ("ab", "c") and ("a", "bc") differ.
inline void fnv_mix_str(std::uint64_t& h, const std::string& s) noexcept {
  fnv_mix_u64(h, s.size());
  fnv_mix(h, s.data(), s.size());
}

} // namespace

Fingerprint fingerprint(const QueryKey& key) {
  if (!key.vector && key.dim != 0) {
    throw std::invalid_argument("query vector pointer is null");
  }

  std::uint64_t h = kFnvOffset;
  fnv_mix_str(h, key.collection);
  fnv_mix_u64(h, static_cast<std::uint64_t>(key.metric));
  fnv_mix_u64(h, key.dim);

  if (key.metric == Metric::COSINE && key.dim != 0) {
    Vector unit(key.vector, key.vector + key.dim);
    normalize(unit.data(), unit.size());
    for (float v : unit) {
      // -0.0f and 0.0f hash the same.
      const float x = (v == 0.0f) ? 0.0f : v;
      fnv_mix(h, &x, sizeof(x));
    }
  } else {
    for (std::size_t i = 0; i < key.dim; ++i) {
      const float x = (key.vector[i] == 0.0f) ? 0.0f : key.vector[i];
      fnv_mix(h, &x, sizeof(x));
    }
  }

  fnv_mix_str(h, key.filter);
  fnv_mix_u64(h, key.top_k);
  fnv_mix_u64(h, key.ef_search ? (*key.ef_search + 1) : 0);
  fnv_mix_u64(h, key.rerank ? 1 : 0);
  if (key.rerank) {
    fnv_mix_str(h, key.rerank_text);
  }
  return h;
}

QueryCache::QueryCache(CacheConfig config, Clock clock) : config_(config), clock_(std::move(clock)) {
  config_.validate();
  const std::size_t shards = std::min(config_.shards, config_.capacity);
  per_shard_capacity_ = (config_.capacity + shards - 1) / shards;
  shards_.reserve(shards);
  for (std::size_t i = 0; i < shards; ++i) {
    shards_.push_back(std::make_unique<Shard>());
  }
}

std::uint64_t QueryCache::generation(const std::string& collection) const {
  std::shared_lock<std::shared_mutex> lock(generation_mutex_);
  const auto it = generations_.find(collection);
  return it == generations_.end() ? 0 : it->second;
}

std::optional<CacheEntry> QueryCache::get(Fingerprint fp) {
  Shard& shard = shard_for(fp);
  const auto t = now();

  std::lock_guard<std::mutex> lock(shard.mutex);
  const auto it = shard.index.find(fp);
  if (it == shard.index.end()) {
    misses_.fetch_add(1, std::memory_order_relaxed);
    return std::nullopt;
  }

  auto entry = it->second;
  if (t - entry->created_at >= config_.ttl) {
    shard.lru.erase(entry);
    shard.index.erase(it);
    expirations_.fetch_add(1, std::memory_order_relaxed);
    misses_.fetch_add(1, std::memory_order_relaxed);
    return std::nullopt;
  }

  entry->last_access = t;
  shard.lru.splice(shard.lru.begin(), shard.lru, entry);
  hits_.fetch_add(1, std::memory_order_relaxed);
  return *entry;
}

bool QueryCache::put(Fingerprint fp, const std::string& collection, std::vector<SearchHit> results,
                     std::uint64_t generation) {
  std::shared_lock<std::shared_mutex> gen_lock(generation_mutex_);
  const auto git = generations_.find(collection);
  const std::uint64_t current = (git == generations_.end()) ? 0 : git->second;
  if (generation != current) {
    rejected_puts_.fetch_add(1, std::memory_order_relaxed);
    return false;
  }

  Shard& shard = shard_for(fp);
  const auto t = now();

  std::lock_guard<std::mutex> lock(shard.mutex);
  const auto it = shard.index.find(fp);
  if (it != shard.index.end()) {
    shard.lru.erase(it->second);
    shard.index.erase(it);
  } else if (shard.lru.size() >= per_shard_capacity_) {
    shard.index.erase(shard.lru.back().fingerprint);
    shard.lru.pop_back();
    evictions_.fetch_add(1, std::memory_order_relaxed);
  }

  shard.lru.push_front(CacheEntry{fp, collection, std::move(results), t, t});
  shard.index[fp] = shard.lru.begin();
  insertions_.fetch_add(1, std::memory_order_relaxed);
  return true;
}

std::size_t QueryCache::drop_collection_locked(const std::string& collection) {
  std::size_t removed = 0;
  for (auto& shard : shards_) {
    std::lock_guard<std::mutex> lock(shard->mutex);
    for (auto it = shard->lru.begin(); it != shard->lru.end();) {
      if (it->collection == collection) {
        shard->index.erase(it->fingerprint);
        it = shard->lru.erase(it);
        ++removed;
      } else {
        ++it;
      }
    }
  }
  return removed;
}

std::size_t QueryCache::invalidate(const std::string& collection) {
  std::unique_lock<std::shared_mutex> lock(generation_mutex_);
  ++generations_[collection];
  const std::size_t removed = drop_collection_locked(collection);
  invalidations_.fetch_add(removed, std::memory_order_relaxed);
  return removed;
}

void QueryCache::clear() {
  std::unique_lock<std::shared_mutex> lock(generation_mutex_);
  for (auto& g : generations_) {
    ++g.second;
  }
  for (auto& shard : shards_) {
    std::lock_guard<std::mutex> shard_lock(shard->mutex);
    shard->lru.clear();
    shard->index.clear();
  }
}

std::size_t QueryCache::size() const {
  std::size_t total = 0;
  for (const auto& shard : shards_) {
    std::lock_guard<std::mutex> lock(shard->mutex);
    total += shard->lru.size();
  }
  return total;
}

CacheStats QueryCache::stats() const {
  CacheStats s;
  s.hits = hits_.load(std::memory_order_relaxed);
  s.misses = misses_.load(std::memory_order_relaxed);
  s.insertions = insertions_.load(std::memory_order_relaxed);
  s.evictions = evictions_.load(std::memory_order_relaxed);
  s.expirations = expirations_.load(std::memory_order_relaxed);
  s.invalidations = invalidations_.load(std::memory_order_relaxed);
  s.rejected_puts = rejected_puts_.load(std::memory_order_relaxed);
  s.size = size();
  return s;
}

} // namespace vecsearch
