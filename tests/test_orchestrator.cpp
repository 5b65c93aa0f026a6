#include <cassert>
#include <chrono>
#include <cstdint>
#include <memory>
#include <random>
#include <string>
#include <thread>
#include <vector>

#include "vecsearch/embedder.h"
#include "vecsearch/engine.h"
#include "vecsearch/errors.h"
#include "vecsearch/metrics.h"
#include "vecsearch/reranker.h"

namespace {

using namespace std::chrono_literals;

constexpr std::size_t kDim = 32;

template <typename E, typename F>
bool throws(F&& f) {
  try {
    f();
  } catch (const E&) {
    return true;
  }
  return false;
}

class SlowEmbedder : public vecsearch::Embedder {
public:
  SlowEmbedder(std::size_t dim, std::chrono::milliseconds delay) : inner_(dim), delay_(delay) {}

  std::size_t dimension() const override { return inner_.dimension(); }
  vecsearch::Vector embed(const std::string& text, vecsearch::EmbedMode mode) override {
    std::this_thread::sleep_for(delay_);
    return inner_.embed(text, mode);
  }

private:
  vecsearch::HashingEmbedder inner_;
  std::chrono::milliseconds delay_;
};

// Claims to be cheap, then takes its time.
class SlowReranker : public vecsearch::Reranker {
public:
  explicit SlowReranker(std::chrono::milliseconds delay) : delay_(delay) {}

  std::string name() const override { return "slow"; }
  std::chrono::microseconds estimated_cost(std::size_t) const override { return 1us; }
  std::vector<vecsearch::SearchHit> rerank(const vecsearch::RerankQuery&,
                                           std::vector<vecsearch::SearchHit> hits) const override {
    std::this_thread::sleep_for(delay_);
    for (auto& h : hits) {
      h.score_source = name();
    }
    return hits;
  }

private:
  std::chrono::milliseconds delay_;
};

vecsearch::EngineConfig quiet_config() {
  vecsearch::EngineConfig cfg;
  cfg.log_level = "error";
  return cfg;
}

// 100 filler documents plus one that contains "quick brown fox".
void load_docs(vecsearch::Engine& engine, const std::string& name, bool rerank) {
  vecsearch::IndexParams params;
  params.M = 8;
  params.ef_construction = 100;
  engine.create_collection(name, kDim, vecsearch::Metric::COSINE, params, rerank);

  const std::vector<std::string> words = {"alpha", "beta", "gamma", "delta", "omega",
                                          "river", "stone", "cloud", "paper", "light"};
  vecsearch::HashingEmbedder embedder(kDim);
  std::mt19937_64 rng(17);
  std::uniform_int_distribution<std::size_t> pick(0, words.size() - 1);

  for (int i = 0; i < 100; ++i) {
    std::string text;
    for (int w = 0; w < 5; ++w) {
      text += (w ? " " : "") + words[pick(rng)];
    }
    vecsearch::Payload p;
    p["text"] = text;
    engine.upsert(name, "doc" + std::to_string(i), embedder.embed(text, vecsearch::EmbedMode::DOCUMENT), p);
  }
  vecsearch::Payload fox;
  fox["text"] = std::string("the quick brown fox jumps");
  engine.upsert(name, "fox", embedder.embed("the quick brown fox jumps", vecsearch::EmbedMode::DOCUMENT), fox);
}

vecsearch::SearchRequest text_query(const std::string& collection, const std::string& text) {
  vecsearch::SearchRequest req;
  req.collection = collection;
  req.text = text;
  req.top_k = 5;
  return req;
}

void adaptive_ef() {
  using O = vecsearch::SearchOrchestrator;
  assert(O::adaptive_ef(64, 10, 80ms, 100ms, 0.5) == 64);
  assert(O::adaptive_ef(64, 10, 50ms, 100ms, 0.5) == 64);
  assert(O::adaptive_ef(64, 10, 25ms, 100ms, 0.5) == 32);
  assert(O::adaptive_ef(64, 10, 1ms, 100ms, 0.5) == 10);
  assert(O::adaptive_ef(64, 10, -5ms, 100ms, 0.5) == 10);
  assert(O::adaptive_ef(5, 10, 80ms, 100ms, 0.5) == 10);
}

void request_validation() {
  vecsearch::Engine engine(quiet_config());
  engine.create_collection("v", 4);
  engine.upsert("v", "a", vecsearch::Vector{1.f, 0.f, 0.f, 0.f});

  vecsearch::SearchRequest req;
  req.collection = "v";
  assert(throws<vecsearch::InvalidParameter>([&] { engine.search(req); }));

  req.text = "no embedder yet";
  assert(throws<vecsearch::InvalidParameter>([&] { engine.search(req); }));

  req.text.reset();
  req.vector = vecsearch::Vector{1.f, 0.f};
  assert(throws<vecsearch::DimensionMismatch>([&] { engine.search(req); }));

  req.vector = vecsearch::Vector{1.f, 0.f, 0.f, 0.f};
  req.top_k = 0;
  assert(throws<vecsearch::InvalidParameter>([&] { engine.search(req); }));

  req.top_k = 1;
  req.collection = "missing";
  assert(throws<vecsearch::NotFound>([&] { engine.search(req); }));

  // Unknown ids inside a filter are just an empty result.
  vecsearch::Filter nobody;
  nobody.equals("owner", std::string("nobody"));
  assert(engine.search("v", vecsearch::Vector{1.f, 0.f, 0.f, 0.f}, 3, nobody).hits.empty());
}

void cache_round_trip() {
  vecsearch::Engine engine(quiet_config());
  engine.create_collection("docs", 4);
  engine.upsert("docs", "a", vecsearch::Vector{1.f, 0.f, 0.f, 0.f});
  engine.upsert("docs", "b", vecsearch::Vector{0.f, 1.f, 0.f, 0.f});
  engine.upsert("docs", "c", vecsearch::Vector{0.9f, 0.1f, 0.f, 0.f});

  const vecsearch::Vector q{1.f, 0.f, 0.f, 0.f};
  const auto first = engine.search("docs", q, 2);
  assert(!first.cache_hit);
  assert(first.final_stage == vecsearch::QueryStage::DONE);
  assert(first.hits.size() == 2);
  assert(first.hits[0].id == "a" && first.hits[1].id == "c");

  const auto second = engine.search("docs", q, 2);
  assert(second.cache_hit);
  assert(second.hits.size() == first.hits.size());
  for (std::size_t i = 0; i < first.hits.size(); ++i) {
    assert(second.hits[i].id == first.hits[i].id);
    assert(second.hits[i].score == first.hits[i].score);
    assert(second.hits[i].rank == first.hits[i].rank);
  }

  // A scaled query hits the same cosine entry.
  assert(engine.search("docs", vecsearch::Vector{3.f, 0.f, 0.f, 0.f}, 2).cache_hit);

  engine.upsert("docs", "d", vecsearch::Vector{1.f, 0.f, 0.f, 0.f});
  const auto third = engine.search("docs", q, 2);
  assert(!third.cache_hit);
  assert(third.hits[0].id == "a" && third.hits[1].id == "d");

  engine.remove("docs", "d");
  assert(!engine.search("docs", q, 2).cache_hit);

  const auto m = engine.metrics();
  assert(m.queries == 5);
  assert(m.cache_hits == 2);
  assert(m.cache_misses == 3);
  assert(m.total.samples == 5);
  assert(engine.cache_stats().hits == 2);
}

void text_queries_and_rerank() {
  vecsearch::Engine engine(quiet_config());
  engine.set_embedder(std::make_shared<vecsearch::CachedEmbedder>(std::make_shared<vecsearch::HashingEmbedder>(kDim)));
  engine.set_reranker(std::make_shared<vecsearch::TokenOverlapReranker>());
  load_docs(engine, "docs", true);
  load_docs(engine, "plain", false);

  const auto resp = engine.search(text_query("docs", "quick brown fox"));
  assert(resp.reranked);
  assert(!resp.unrefined);
  assert(resp.final_stage == vecsearch::QueryStage::DONE);
  assert(resp.hits.size() == 5);
  assert(resp.hits[0].id == "fox");
  assert(resp.hits[0].score_source == "cross_encoder");
  assert(std::get<std::int64_t>(resp.hits[0].payload.at("rerank_phrase_hits")) == 1);
  assert(std::get<std::int64_t>(resp.hits[0].payload.at("rerank_overlap")) == 3);
  for (std::size_t i = 0; i < resp.hits.size(); ++i) {
    assert(resp.hits[i].rank == i + 1);
  }

  bool saw_embed = false;
  bool saw_rerank = false;
  for (const auto& st : resp.stages) {
    saw_embed = saw_embed || st.stage == vecsearch::QueryStage::EMBED;
    saw_rerank = saw_rerank || st.stage == vecsearch::QueryStage::RERANK;
  }
  assert(saw_embed && saw_rerank);

  // Opting out, or a collection without rerank, keeps the ANN scores.
  auto no_rerank = text_query("docs", "quick brown fox");
  no_rerank.allow_rerank = false;
  const auto plain = engine.search(no_rerank);
  assert(!plain.reranked && !plain.unrefined);
  assert(plain.hits[0].score_source == "ann");
  assert(!engine.search(text_query("plain", "quick brown fox")).reranked);

  const auto m = engine.metrics();
  assert(m.reranked == 1);
  assert(m.embed.samples == 3);
}

void rerank_skipped_then_refined() {
  vecsearch::Engine engine(quiet_config());
  engine.set_embedder(std::make_shared<vecsearch::HashingEmbedder>(kDim));
  vecsearch::TokenOverlapReranker::Options slow;
  slow.per_candidate = 10ms; // 50 candidates: far over the 200 ms budget
  engine.set_reranker(std::make_shared<vecsearch::TokenOverlapReranker>(slow));
  load_docs(engine, "docs", true);

  const auto req = text_query("docs", "quick brown fox");
  const auto resp = engine.search(req);
  assert(resp.unrefined);
  assert(!resp.reranked);
  assert(resp.degraded());
  assert(resp.hits.size() == 5);
  assert(resp.hits[0].score_source == "ann");
  assert(resp.candidates.size() >= resp.hits.size());

  // Degraded answers are not cached.
  const auto again = engine.search(req);
  assert(!again.cache_hit);
  assert(again.unrefined);

  const auto refined = engine.refine_async(req, again).get();
  assert(refined.size() == 5);
  assert(refined[0].id == "fox");
  assert(refined[0].score_source == "cross_encoder");

  // The refined answer now serves the same query.
  const auto cached = engine.search(req);
  assert(cached.cache_hit);
  assert(cached.hits[0].id == "fox");
  assert(cached.hits[0].score_source == "cross_encoder");

  // A refinement that raced a write is returned but not cached.
  engine.upsert("docs", "late", vecsearch::HashingEmbedder(kDim).embed("late arrival", vecsearch::EmbedMode::DOCUMENT));
  const auto stale = engine.search(req);
  assert(stale.unrefined);
  engine.upsert("docs", "later", vecsearch::HashingEmbedder(kDim).embed("later still", vecsearch::EmbedMode::DOCUMENT));
  assert(!engine.refine_async(req, stale).get().empty());
  assert(!engine.search(req).cache_hit);

  // Nothing to refine: resolves to the response's own hits.
  auto vec_req = req;
  vec_req.text.reset();
  vec_req.vector = stale.query_vector;
  vec_req.allow_rerank = false;
  const auto plain = engine.search(vec_req);
  assert(engine.refine_async(vec_req, plain).get().size() == plain.hits.size());

  assert(engine.metrics().rerank_skipped >= 3);
}

void observed_rerank_cost_drives_skips() {
  vecsearch::Engine engine(quiet_config());
  engine.set_reranker(std::make_shared<SlowReranker>(30ms));
  load_docs(engine, "docs", true);

  vecsearch::SearchRequest req;
  req.collection = "docs";
  req.vector = vecsearch::HashingEmbedder(kDim).embed("alpha beta", vecsearch::EmbedMode::QUERY);
  req.top_k = 5;
  req.deadline = 1000ms;
  assert(engine.search(req).reranked);

  // 30 ms observed across the pool; a 20 ms budget cannot fit another pass.
  req.vector = vecsearch::HashingEmbedder(kDim).embed("gamma delta", vecsearch::EmbedMode::QUERY);
  req.deadline = 20ms;
  const auto resp = engine.search(req);
  assert(resp.unrefined);
  assert(!resp.hits.empty());
}

void deadline_behaviour() {
  vecsearch::Engine engine(quiet_config());
  engine.set_embedder(std::make_shared<SlowEmbedder>(kDim, 30ms));

  // Tiny collection: exact scan, stopped before the first row.
  engine.create_collection("tiny", kDim);
  vecsearch::HashingEmbedder e(kDim);
  engine.upsert("tiny", "a", e.embed("alpha", vecsearch::EmbedMode::DOCUMENT));
  engine.upsert("tiny", "b", e.embed("beta", vecsearch::EmbedMode::DOCUMENT));

  auto req = text_query("tiny", "alpha");
  req.deadline = 10ms;
  assert(throws<vecsearch::DeadlineExceeded>([&] { engine.search(req); }));
  assert(engine.metrics().deadline_failures == 1);

  // Larger collection: the graph entry point is still a usable answer.
  load_docs(engine, "docs", false);
  auto late = text_query("docs", "alpha beta");
  late.deadline = 10ms;
  const auto resp = engine.search(late);
  assert(resp.budget_exceeded);
  assert(resp.degraded());
  assert(!resp.hits.empty());
  assert(!engine.search(late).cache_hit);

  // A generous budget is not exceeded.
  auto relaxed = text_query("docs", "alpha beta");
  relaxed.deadline = 2000ms;
  assert(!engine.search(relaxed).budget_exceeded);

  // An empty collection has nothing to miss.
  engine.create_collection("empty", kDim);
  auto empty = text_query("empty", "alpha");
  empty.deadline = 10ms;
  assert(engine.search(empty).hits.empty());
}

void best_effort_after_rerank_overrun() {
  vecsearch::Engine engine(quiet_config());
  engine.set_reranker(std::make_shared<SlowReranker>(60ms));
  load_docs(engine, "docs", true);

  vecsearch::SearchRequest req;
  req.collection = "docs";
  req.vector = vecsearch::HashingEmbedder(kDim).embed("river stone", vecsearch::EmbedMode::QUERY);
  req.top_k = 5;
  req.deadline = 40ms;
  const auto resp = engine.search(req);
  assert(resp.reranked);
  assert(resp.budget_exceeded);
  assert(resp.hits.size() == 5);
  assert(!engine.search(req).cache_hit);
}

void cancellation() {
  vecsearch::Engine engine(quiet_config());
  load_docs(engine, "docs", false);

  vecsearch::CancellationToken token;
  token.cancel();

  vecsearch::SearchRequest req;
  req.collection = "docs";
  req.vector = vecsearch::HashingEmbedder(kDim).embed("alpha", vecsearch::EmbedMode::QUERY);
  req.top_k = 5;
  req.cancel = token;
  const auto resp = engine.search(req);
  assert(resp.cancelled);
  assert(resp.hits.size() <= 1);

  req.cancel.reset();
  const auto full = engine.search(req);
  assert(!full.cache_hit);
  assert(!full.cancelled);
  assert(full.hits.size() == 5);
  assert(engine.metrics().cancelled == 1);
}

void ef_raise_is_reported() {
  vecsearch::Engine engine(quiet_config());
  load_docs(engine, "docs", false);

  vecsearch::SearchRequest req;
  req.collection = "docs";
  req.vector = vecsearch::HashingEmbedder(kDim).embed("paper light", vecsearch::EmbedMode::QUERY);
  req.top_k = 10;
  req.ef_search = 3;
  const auto resp = engine.search(req);
  assert(resp.ef_raised);
  assert(resp.ef_used == 10);
  assert(resp.hits.size() == 10);
}

// Partial parameter change through the engine, as the Python binding does it.
void rebuild_with_new_params() {
  vecsearch::Engine engine(quiet_config());
  load_docs(engine, "docs", false);

  vecsearch::IndexParams params = engine.describe("docs").config.index;
  assert(params.M == 8);
  params.ef_search = 128;
  engine.rebuild_index("docs", params);

  const auto info = engine.describe("docs");
  assert(info.config.index.M == 8);
  assert(info.config.index.ef_construction == 100);
  assert(info.config.index.ef_search == 128);
  assert(!info.halted);

  vecsearch::SearchRequest req;
  req.collection = "docs";
  req.vector = vecsearch::HashingEmbedder(kDim).embed("quick brown fox", vecsearch::EmbedMode::QUERY);
  req.top_k = 5;
  const auto resp = engine.search(req);
  assert(resp.ef_used == 128);
  assert(!resp.ef_raised);
  assert(!resp.cancelled);
  assert(resp.hits.size() == 5);
}

vecsearch::Vector random_unit(std::mt19937_64& rng, std::size_t dim) {
  std::normal_distribution<float> n(0.0f, 1.0f);
  vecsearch::Vector v(dim);
  for (auto& x : v) {
    x = n(rng);
  }
  vecsearch::normalize(v.data(), dim);
  return v;
}

// 1000 x 384 at the default ef fits the default deadline, and a wider beam
// costs more time on average.
void latency_budget() {
  vecsearch::Engine engine(quiet_config());
  engine.create_collection("latency", 384, vecsearch::Metric::COSINE);

  std::mt19937_64 rng(21);
  for (int i = 0; i < 1000; ++i) {
    engine.upsert("latency", "r" + std::to_string(i), random_unit(rng, 384));
  }
  std::vector<vecsearch::Vector> queries;
  for (int i = 0; i < 200; ++i) {
    queries.push_back(random_unit(rng, 384));
  }

  for (const auto& q : queries) {
    vecsearch::SearchRequest req;
    req.collection = "latency";
    req.vector = q;
    req.top_k = 10;
    const auto resp = engine.search(req);
    assert(resp.hits.size() == 10);
    assert(!resp.cache_hit);
  }
  const auto m = engine.metrics();
  assert(m.total.samples == queries.size());
  assert(m.total.p95_ms <= static_cast<double>(engine.config().orchestrator.deadline.count()));

  auto collection = engine.collection("latency");
  auto mean_latency = [&](std::size_t ef) {
    vecsearch::LatencyTracker tracker(queries.size());
    for (const auto& q : queries) {
      vecsearch::SearchOptions opts;
      opts.top_k = 10;
      opts.ef_search = ef;
      const auto t0 = std::chrono::steady_clock::now();
      const auto result = collection->search(q, opts);
      tracker.record(std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - t0).count());
      assert(result.ef_used == ef);
    }
    return tracker.mean();
  };
  const double narrow = mean_latency(16);
  const double wide = mean_latency(512);
  assert(wide >= narrow);
}

} // namespace

int main() {
  adaptive_ef();
  request_validation();
  cache_round_trip();
  text_queries_and_rerank();
  rerank_skipped_then_refined();
  observed_rerank_cost_drives_skips();
  deadline_behaviour();
  best_effort_after_rerank_overrun();
  cancellation();
  ef_raise_is_reported();
  rebuild_with_new_params();
  latency_budget();
  return 0;
}
