#include <cassert>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "vecsearch/query_cache.h"

namespace {

using Clock = std::chrono::steady_clock;

std::vector<vecsearch::SearchHit> hits_of(const std::string& id) {
  vecsearch::SearchHit h;
  h.id = id;
  h.score = 0.5f;
  h.rank = 1;
  return {h};
}

vecsearch::QueryKey key_for(const std::vector<float>& v) {
  vecsearch::QueryKey k;
  k.collection = "docs";
  k.vector = v.data();
  k.dim = v.size();
  k.metric = vecsearch::Metric::COSINE;
  k.top_k = 10;
  return k;
}

void fingerprints() {
  const std::vector<float> v{1.f, 2.f, 3.f};
  const std::vector<float> scaled{2.f, 4.f, 6.f};
  const auto base = vecsearch::fingerprint(key_for(v));

  // Cosine ignores magnitude.
  assert(vecsearch::fingerprint(key_for(scaled)) == base);

  auto dot = key_for(v);
  dot.metric = vecsearch::Metric::DOT;
  auto dot_scaled = key_for(scaled);
  dot_scaled.metric = vecsearch::Metric::DOT;
  assert(vecsearch::fingerprint(dot) != vecsearch::fingerprint(dot_scaled));
  assert(vecsearch::fingerprint(dot) != base);

  auto other = key_for(v);
  other.collection = "other";
  assert(vecsearch::fingerprint(other) != base);

  auto k5 = key_for(v);
  k5.top_k = 5;
  assert(vecsearch::fingerprint(k5) != base);

  auto ef = key_for(v);
  ef.ef_search = 0;
  assert(vecsearch::fingerprint(ef) != base);

  vecsearch::Filter f;
  f.equals("lang", std::string("en"));
  auto filtered = key_for(v);
  filtered.filter = f.canonical();
  assert(vecsearch::fingerprint(filtered) != base);

  auto rr = key_for(v);
  rr.rerank = true;
  auto rr_text = rr;
  rr_text.rerank_text = "quick fox";
  assert(vecsearch::fingerprint(rr) != base);
  assert(vecsearch::fingerprint(rr_text) != vecsearch::fingerprint(rr));

  // Text only matters when a reranker reads it.
  auto plain_text = key_for(v);
  plain_text.rerank_text = "quick fox";
  assert(vecsearch::fingerprint(plain_text) == base);
}

void hit_and_miss() {
  vecsearch::QueryCache cache;
  assert(!cache.get(42));
  assert(cache.put(42, "docs", hits_of("a"), cache.generation("docs")));

  const auto entry = cache.get(42);
  assert(entry);
  assert(entry->collection == "docs");
  assert(entry->results.size() == 1);
  assert(entry->results[0].id == "a");

  const auto s = cache.stats();
  assert(s.hits == 1);
  assert(s.misses == 1);
  assert(s.insertions == 1);
  assert(s.size == 1);
  assert(s.hit_rate() == 0.5);
}

void lru_eviction() {
  vecsearch::CacheConfig cfg;
  cfg.capacity = 2;
  cfg.shards = 1;
  vecsearch::QueryCache cache(cfg);

  cache.put(1, "docs", hits_of("a"), 0);
  cache.put(2, "docs", hits_of("b"), 0);
  assert(cache.get(1)); // 1 is now most recent
  cache.put(3, "docs", hits_of("c"), 0);

  assert(cache.size() == 2);
  assert(cache.get(1));
  assert(!cache.get(2));
  assert(cache.get(3));
  assert(cache.stats().evictions == 1);
}

void ttl_expiry() {
  auto now = std::make_shared<Clock::time_point>(Clock::now());
  vecsearch::CacheConfig cfg;
  cfg.ttl = std::chrono::milliseconds(100);
  vecsearch::QueryCache cache(cfg, [now] { return *now; });

  cache.put(7, "docs", hits_of("a"), 0);
  *now += std::chrono::milliseconds(99);
  assert(cache.get(7));

  // Reads do not extend the lifetime.
  *now += std::chrono::milliseconds(1);
  assert(!cache.get(7));
  assert(cache.stats().expirations == 1);
  assert(cache.size() == 0);
}

void invalidation_and_generations() {
  vecsearch::QueryCache cache;
  const auto g0 = cache.generation("docs");
  cache.put(1, "docs", hits_of("a"), g0);
  cache.put(2, "docs", hits_of("b"), g0);
  cache.put(3, "news", hits_of("c"), cache.generation("news"));

  assert(cache.invalidate("docs") == 2);
  assert(!cache.get(1));
  assert(!cache.get(2));
  assert(cache.get(3));
  assert(cache.generation("docs") == g0 + 1);
  assert(cache.generation("news") == 0);

  // A search that started before the write cannot store its results.
  assert(!cache.put(1, "docs", hits_of("stale"), g0));
  assert(!cache.get(1));
  assert(cache.put(1, "docs", hits_of("fresh"), cache.generation("docs")));
  assert(cache.get(1)->results[0].id == "fresh");

  const auto s = cache.stats();
  assert(s.invalidations == 2);
  assert(s.rejected_puts == 1);

  cache.clear();
  assert(cache.size() == 0);
  assert(!cache.put(9, "docs", hits_of("x"), g0 + 1));
}

void concurrent_use() {
  vecsearch::CacheConfig cfg;
  cfg.capacity = 64;
  vecsearch::QueryCache cache(cfg);

  std::vector<std::thread> threads;
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([&cache, t] {
      for (int i = 0; i < 500; ++i) {
        const auto fp = static_cast<vecsearch::Fingerprint>(t * 1000 + (i % 100));
        cache.put(fp, "docs", hits_of("x"), cache.generation("docs"));
        cache.get(fp);
        if (i % 97 == 0) {
          cache.invalidate("docs");
        }
      }
    });
  }
  for (auto& th : threads) {
    th.join();
  }
  // ceil(64 / 8) per shard.
  assert(cache.size() <= 64);
}

} // namespace

int main() {
  fingerprints();
  hit_and_miss();
  lru_eviction();
  ttl_expiry();
  invalidation_and_generations();
  concurrent_use();
  return 0;
}
