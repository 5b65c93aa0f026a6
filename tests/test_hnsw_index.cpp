#include <cassert>
#include <chrono>
#include <cstdint>
#include <random>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "vecsearch/bruteforce_index.h"
#include "vecsearch/errors.h"
#include "vecsearch/hnsw_index.h"
#include "vecsearch/record_store.h"

namespace {

vecsearch::Vector random_vector(std::mt19937_64& rng, std::size_t dim) {
  std::normal_distribution<float> n(0.0f, 1.0f);
  vecsearch::Vector v(dim);
  for (auto& x : v) {
    x = n(rng);
  }
  return v;
}

vecsearch::IndexParams small_params() {
  vecsearch::IndexParams p;
  p.M = 8;
  p.ef_construction = 100;
  p.ef_search = 50;
  return p;
}

// Fills `store` and links every row.
void populate(vecsearch::RecordStore& store, vecsearch::HnswIndex& index, std::size_t n, std::uint64_t seed) {
  std::mt19937_64 rng(seed);
  for (std::size_t i = 0; i < n; ++i) {
    vecsearch::Payload p;
    p["group"] = static_cast<std::int64_t>(i % 4);
    const auto r = store.upsert("r" + std::to_string(i), random_vector(rng, store.dim()), p);
    index.insert(r.slot);
  }
}

double recall_at(const vecsearch::HnswIndex& index, const vecsearch::BruteForceIndex& exact,
                 const std::vector<vecsearch::Vector>& queries, std::size_t k, std::size_t ef) {
  std::size_t hit = 0;
  std::size_t total = 0;
  for (const auto& q : queries) {
    std::set<vecsearch::Slot> truth;
    for (const auto& c : exact.search(q.data(), k)) {
      truth.insert(c.slot);
    }
    for (const auto& c : index.search(q.data(), k, ef)) {
      hit += truth.count(c.slot);
    }
    total += truth.size();
  }
  return static_cast<double>(hit) / static_cast<double>(total);
}

void empty_graph() {
  vecsearch::RecordStore store(4, vecsearch::Metric::COSINE);
  vecsearch::HnswIndex index(store, small_params());
  const float q[] = {1.f, 0.f, 0.f, 0.f};
  assert(index.search(q, 5, 10).empty());
  assert(index.entry_point() == vecsearch::kNoSlot);
  assert(index.max_level() == -1);
  index.verify();
}

void single_node() {
  vecsearch::RecordStore store(2, vecsearch::Metric::EUCLIDEAN);
  vecsearch::HnswIndex index(store, small_params());
  const auto r = store.upsert("only", vecsearch::Vector{1.f, 2.f}, {});
  index.insert(r.slot);
  index.insert(r.slot); // no-op

  assert(index.size() == 1);
  assert(index.entry_point() == r.slot);
  const float q[] = {0.f, 0.f};
  const auto out = index.search(q, 3, 10);
  assert(out.size() == 1);
  assert(out[0].slot == r.slot);

  bool threw = false;
  try {
    index.insert(99);
  } catch (const vecsearch::InvalidParameter&) {
    threw = true;
  }
  assert(threw);
}

void structure_and_recall() {
  vecsearch::RecordStore store(16, vecsearch::Metric::EUCLIDEAN);
  vecsearch::HnswIndex index(store, small_params(), 7);
  populate(store, index, 600, 1);

  index.verify();
  const auto stats = index.stats();
  assert(stats.nodes == 600);
  assert(stats.edges > 600);
  assert(stats.max_level >= 1);
  assert(stats.max_level == index.max_level());

  vecsearch::BruteForceIndex exact(store);
  std::mt19937_64 rng(99);
  std::vector<vecsearch::Vector> queries;
  for (int i = 0; i < 40; ++i) {
    queries.push_back(random_vector(rng, 16));
  }

  // Results are sorted closest first.
  const auto sample = index.search(queries[0].data(), 10, 64);
  assert(sample.size() == 10);
  for (std::size_t i = 1; i < sample.size(); ++i) {
    assert(sample[i - 1].distance <= sample[i].distance);
  }

  // Wider beams never lose recall and end close to exact.
  const double r10 = recall_at(index, exact, queries, 10, 10);
  const double r40 = recall_at(index, exact, queries, 10, 40);
  const double r160 = recall_at(index, exact, queries, 10, 160);
  assert(r40 >= r10);
  assert(r160 >= r40);
  assert(r160 >= 0.95);
}

std::size_t overlap(const std::vector<vecsearch::Candidate>& found, const std::set<vecsearch::Slot>& truth) {
  std::size_t n = 0;
  for (const auto& c : found) {
    n += truth.count(c.slot);
  }
  return n;
}

// Per query, each wider beam finds at least as many true neighbors as the
// narrower one before it.
void recall_never_drops_with_wider_beam() {
  vecsearch::RecordStore store(384, vecsearch::Metric::COSINE);
  vecsearch::HnswIndex index(store, vecsearch::IndexParams(), 42);
  populate(store, index, 1000, 2024);

  vecsearch::BruteForceIndex exact(store);
  std::mt19937_64 rng(4048);
  const std::vector<std::size_t> beams = {10, 16, 32, 64, 128};

  for (int q = 0; q < 200; ++q) {
    const auto query = random_vector(rng, 384);
    std::set<vecsearch::Slot> truth;
    for (const auto& c : exact.search(query.data(), 10)) {
      truth.insert(c.slot);
    }

    std::size_t previous = 0;
    for (const std::size_t ef : beams) {
      const std::size_t found = overlap(index.search(query.data(), 10, ef), truth);
      assert(found >= previous);
      previous = found;
    }
  }
}

void self_query_finds_itself() {
  vecsearch::RecordStore store(8, vecsearch::Metric::COSINE);
  vecsearch::HnswIndex index(store, small_params());
  populate(store, index, 300, 3);

  const auto view = store.read();
  std::size_t found = 0;
  for (vecsearch::Slot s = 0; s < 300; s += 10) {
    const auto out = index.search(view.vector(s), 1, 64);
    found += (!out.empty() && out[0].slot == s) ? 1 : 0;
  }
  assert(found >= 29);
}

void tombstones_and_filters() {
  vecsearch::RecordStore store(8, vecsearch::Metric::EUCLIDEAN);
  vecsearch::HnswIndex index(store, small_params());
  populate(store, index, 200, 5);

  for (int i = 0; i < 200; i += 2) {
    store.remove("r" + std::to_string(i));
  }

  std::mt19937_64 rng(11);
  const auto q = random_vector(rng, 8);

  vecsearch::SearchStats st;
  const auto live = index.search(q.data(), 20, 80, {}, {}, &st);
  assert(live.size() == 20);
  {
    const auto view = store.read();
    for (const auto& c : live) {
      assert(view.is_live(c.slot));
    }
  }
  assert(st.candidates_accepted < st.candidates_considered);
  assert(st.recall_proxy() < 1.0);

  const vecsearch::SlotPredicate group3 = [](const vecsearch::RecordStore::ReadView& view, vecsearch::Slot s) {
    return std::get<std::int64_t>(view.payload(s).at("group")) == 3;
  };
  const auto filtered = index.search(q.data(), 10, 100, group3);
  assert(!filtered.empty());
  const auto view = store.read();
  for (const auto& c : filtered) {
    assert(view.is_live(c.slot));
    assert(std::get<std::int64_t>(view.payload(c.slot).at("group")) == 3);
  }
}

void deterministic_for_a_seed() {
  vecsearch::RecordStore a(6, vecsearch::Metric::COSINE);
  vecsearch::RecordStore b(6, vecsearch::Metric::COSINE);
  vecsearch::HnswIndex ia(a, small_params(), 123);
  vecsearch::HnswIndex ib(b, small_params(), 123);
  populate(a, ia, 150, 8);
  populate(b, ib, 150, 8);

  const auto ga = ia.export_graph();
  const auto gb = ib.export_graph();
  assert(ga.size() == gb.size());
  for (std::size_t i = 0; i < ga.size(); ++i) {
    assert(ga[i].record_id == gb[i].record_id);
    assert(ga[i].level == gb[i].level);
    assert(ga[i].neighbors == gb[i].neighbors);
  }
}

void stop_conditions() {
  vecsearch::RecordStore store(8, vecsearch::Metric::EUCLIDEAN);
  vecsearch::HnswIndex index(store, small_params());
  populate(store, index, 200, 9);
  std::mt19937_64 rng(4);
  const auto q = random_vector(rng, 8);

  vecsearch::CancellationToken token;
  token.cancel();
  vecsearch::SearchControl cancelled;
  cancelled.cancel = &token;
  vecsearch::SearchStats st;
  const auto partial = index.search(q.data(), 10, 50, {}, cancelled, &st);
  assert(st.cancelled);
  assert(partial.size() <= 1);

  vecsearch::SearchControl late;
  late.deadline = std::chrono::steady_clock::now() - std::chrono::milliseconds(1);
  vecsearch::SearchStats st2;
  index.search(q.data(), 10, 50, {}, late, &st2);
  assert(st2.deadline_hit);
  assert(!st2.cancelled);
}

void compaction_keeps_graph_usable() {
  vecsearch::RecordStore store(8, vecsearch::Metric::EUCLIDEAN);
  vecsearch::HnswIndex index(store, small_params());
  populate(store, index, 300, 12);

  for (int i = 0; i < 300; i += 3) {
    store.remove("r" + std::to_string(i));
  }
  index.compact(store.compact());
  index.verify();
  assert(index.size() == 200);
  assert(index.stats().retired_nodes == 0);

  vecsearch::BruteForceIndex exact(store);
  std::mt19937_64 rng(21);
  std::vector<vecsearch::Vector> queries;
  for (int i = 0; i < 20; ++i) {
    queries.push_back(random_vector(rng, 8));
  }
  assert(recall_at(index, exact, queries, 10, 100) >= 0.9);
}

void import_reports_broken_references() {
  vecsearch::RecordStore store(4, vecsearch::Metric::COSINE);
  vecsearch::HnswIndex index(store, small_params());
  populate(store, index, 50, 2);

  auto nodes = index.export_graph();
  assert(nodes.size() == 50);

  vecsearch::RecordStore copy(4, vecsearch::Metric::COSINE);
  {
    const auto view = store.read();
    for (vecsearch::Slot s = 0; s < view.slot_count(); ++s) {
      copy.restore(view.record(s));
    }
  }
  vecsearch::HnswIndex restored(copy, small_params());
  assert(restored.import_graph(nodes).empty());
  restored.verify();
  assert(restored.size() == 50);

  nodes[0].neighbors[0].emplace_back("ghost", 0.5f);
  vecsearch::HnswIndex broken(copy, small_params());
  const auto problems = broken.import_graph(nodes);
  assert(problems.size() == 1);
  assert(problems[0].find("ghost") != std::string::npos);
}

void concurrent_insert_and_search() {
  vecsearch::RecordStore store(8, vecsearch::Metric::COSINE);
  vecsearch::HnswIndex index(store, small_params());

  std::vector<std::thread> writers;
  for (int t = 0; t < 4; ++t) {
    writers.emplace_back([&store, &index, t] {
      std::mt19937_64 rng(static_cast<std::uint64_t>(t) + 100);
      for (int i = 0; i < 100; ++i) {
        const auto r = store.upsert("t" + std::to_string(t) + "-" + std::to_string(i), random_vector(rng, 8), {});
        index.insert(r.slot);
      }
    });
  }
  std::thread reader([&index] {
    std::mt19937_64 rng(5);
    for (int i = 0; i < 200; ++i) {
      const auto q = random_vector(rng, 8);
      const auto out = index.search(q.data(), 5, 20);
      assert(out.size() <= 5);
    }
  });
  for (auto& w : writers) {
    w.join();
  }
  reader.join();

  assert(index.size() == 400);
  index.verify();
}

} // namespace

int main() {
  empty_graph();
  single_node();
  structure_and_recall();
  recall_never_drops_with_wider_beam();
  self_query_finds_itself();
  tombstones_and_filters();
  deterministic_for_a_seed();
  stop_conditions();
  compaction_keeps_graph_usable();
  import_reports_broken_references();
  concurrent_insert_and_search();
  return 0;
}
