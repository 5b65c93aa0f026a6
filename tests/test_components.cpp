#include <cassert>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "vecsearch/config.h"
#include "vecsearch/distance.h"
#include "vecsearch/embedder.h"
#include "vecsearch/errors.h"
#include "vecsearch/metrics.h"
#include "vecsearch/reranker.h"
#include "vecsearch/text.h"

namespace {

class CountingEmbedder : public vecsearch::Embedder {
public:
  std::size_t dimension() const override { return 2; }
  vecsearch::Vector embed(const std::string& text, vecsearch::EmbedMode) override {
    ++calls;
    return {static_cast<float>(text.size()), 1.f};
  }
  int calls = 0;
};

vecsearch::SearchHit hit(const std::string& id, float score) {
  vecsearch::SearchHit h;
  h.id = id;
  h.score = score;
  h.score_source = "ann";
  return h;
}

void tokenizer() {
  const auto t = vecsearch::tokenize("Don't PANIC: it's 42_x, ok?");
  assert((t == std::vector<std::string>{"don't", "panic", "it's", "42_x", "ok"}));
  assert(vecsearch::tokenize("  ...  ").empty());

  const auto q = vecsearch::tokenize("a a");
  const auto d = vecsearch::tokenize("a a a b");
  assert(vecsearch::TokenOverlapReranker::count_phrase(q, d) == 2);
  assert(vecsearch::TokenOverlapReranker::count_phrase({}, d) == 0);
}

void hashing_embedder() {
  vecsearch::HashingEmbedder e(64);
  const auto a = e.embed("quick brown fox", vecsearch::EmbedMode::QUERY);
  const auto b = e.embed("Quick, brown fox!", vecsearch::EmbedMode::DOCUMENT);
  assert(a.size() == 64);
  assert(a == b);
  assert(std::fabs(vecsearch::l2_norm(a.data(), a.size()) - 1.0f) < 1e-5f);

  const auto empty = e.embed("", vecsearch::EmbedMode::QUERY);
  assert(vecsearch::l2_norm(empty.data(), empty.size()) == 0.0f);

  const auto batch = e.embed_batch({"quick brown fox", "zzz"}, vecsearch::EmbedMode::QUERY);
  assert(batch.size() == 2);
  assert(batch[0] == a);
}

void cached_embedder() {
  auto inner = std::make_shared<CountingEmbedder>();
  vecsearch::CachedEmbedder cache(inner, 2);

  cache.embed("one", vecsearch::EmbedMode::QUERY);
  cache.embed("one", vecsearch::EmbedMode::QUERY);
  assert(inner->calls == 1);
  assert(cache.hits() == 1 && cache.misses() == 1);

  // Mode is part of the key.
  cache.embed("one", vecsearch::EmbedMode::DOCUMENT);
  assert(inner->calls == 2);

  cache.embed("two", vecsearch::EmbedMode::QUERY); // evicts ("one", QUERY)
  assert(cache.size() == 2);
  cache.embed("one", vecsearch::EmbedMode::QUERY);
  assert(inner->calls == 4);

  bool threw = false;
  try {
    vecsearch::CachedEmbedder bad(inner, 0);
  } catch (const vecsearch::InvalidParameter&) {
    threw = true;
  }
  assert(threw);
}

void ranking() {
  std::vector<vecsearch::SearchHit> hits{hit("b", 0.5f), hit("c", 0.9f), hit("a", 0.5f)};
  vecsearch::rank_hits(hits);
  assert(hits[0].id == "c" && hits[1].id == "a" && hits[2].id == "b");
  assert(hits[0].rank == 1 && hits[2].rank == 3);
}

void vector_cosine_reranker() {
  vecsearch::VectorCosineReranker rr;
  vecsearch::RerankQuery q;
  q.vector = {1.f, 0.f};
  q.lookup = [](const vecsearch::RecordId& id) -> std::optional<vecsearch::Vector> {
    if (id == "near") {
      return vecsearch::Vector{1.f, 0.1f};
    }
    if (id == "far") {
      return vecsearch::Vector{0.f, 1.f};
    }
    return std::nullopt;
  };

  const auto out = rr.rerank(q, {hit("far", 0.9f), hit("gone", 0.8f), hit("near", 0.1f)});
  assert(out.size() == 2);
  assert(out[0].id == "near");
  assert(out[0].score_source == "vector_cosine");
  assert(out[0].baseline_score == 0.1f);
  assert(out[1].id == "far");
  assert(rr.estimated_cost(10) == std::chrono::microseconds(20));
}

void token_overlap_reranker() {
  vecsearch::TokenOverlapReranker rr;
  vecsearch::RerankQuery q;
  q.text = "red apple";

  auto with_text = [](const std::string& id, float score, const std::string& text) {
    auto h = hit(id, score);
    h.payload["text"] = text;
    return h;
  };
  const auto out = rr.rerank(q, {with_text("x", 0.9f, "green pear"), with_text("y", 0.2f, "a red apple pie"),
                                 with_text("z", 0.5f, "apple")});
  assert(out[0].id == "y");
  assert(out[1].id == "z");
  assert(out[2].id == "x");
  assert(std::get<std::int64_t>(out[0].payload.at("rerank_phrase_hits")) == 1);
  assert(std::get<std::int64_t>(out[1].payload.at("rerank_overlap")) == 1);
  assert(out[0].score_source == "cross_encoder");

  vecsearch::TokenOverlapReranker::Options opts;
  opts.latency = std::chrono::microseconds(500);
  opts.per_candidate = std::chrono::microseconds(10);
  assert(vecsearch::TokenOverlapReranker(opts).estimated_cost(5) == std::chrono::microseconds(550));
}

void latency_tracker() {
  vecsearch::LatencyTracker t(4);
  assert(t.percentile(50) == 0.0);
  for (double v : {10.0, 20.0, 30.0, 40.0, 50.0}) {
    t.record(v);
  }
  // Only the last four samples are kept.
  assert(t.count() == 4);
  assert(t.percentile(50) == 30.0);
  assert(t.percentile(100) == 50.0);
  assert(t.percentile(0) == 20.0);
  assert(t.mean() == 35.0);

  vecsearch::MetricsRegistry m;
  m.record_recall_proxy(1.0);
  m.record_recall_proxy(0.5);
  m.record_compaction(12.5);
  m.count_query();
  const auto s = m.snapshot();
  assert(s.queries == 1);
  assert(s.mean_recall_proxy == 0.75);
  assert(s.compactions == 1);
  assert(s.last_compaction_ms == 12.5);
}

void configuration() {
  assert(vecsearch::parse_bool(" YES ", false));
  assert(!vecsearch::parse_bool("off", true));
  assert(vecsearch::parse_bool("maybe", true));
  assert(!vecsearch::parse_bool(nullptr, false));

  vecsearch::IndexParams p;
  p.validate();
  p.M = 1;
  bool threw = false;
  try {
    p.validate();
  } catch (const vecsearch::InvalidParameter&) {
    threw = true;
  }
  assert(threw);

  setenv("VECSEARCH_DEADLINE_MS", "75", 1);
  setenv("VECSEARCH_CACHE_CAPACITY", "-3", 1);
  setenv("VECSEARCH_CACHE_DEGRADED", "true", 1);
  setenv("VECSEARCH_LOG_LEVEL", " Debug ", 1);
  const auto cfg = vecsearch::EngineConfig::from_env();
  assert(cfg.orchestrator.deadline == std::chrono::milliseconds(75));
  assert(cfg.orchestrator.embed_budget <= cfg.orchestrator.deadline);
  assert(cfg.cache.capacity == vecsearch::config::kDefaultCacheCapacity);
  assert(cfg.orchestrator.cache_degraded_results);
  assert(cfg.log_level == "debug");
  unsetenv("VECSEARCH_DEADLINE_MS");
  unsetenv("VECSEARCH_CACHE_CAPACITY");
  unsetenv("VECSEARCH_CACHE_DEGRADED");
  unsetenv("VECSEARCH_LOG_LEVEL");
}

} // namespace

int main() {
  tokenizer();
  hashing_embedder();
  cached_embedder();
  ranking();
  vector_cosine_reranker();
  token_overlap_reranker();
  latency_tracker();
  configuration();
  return 0;
}
