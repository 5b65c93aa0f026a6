// vecsearch_bench: builds a random collection and reports ANN latency and
// recall@k against exact search for a range of ef values.
//
//   vecsearch_bench [--records N] [--dim D] [--queries Q] [--ef 16,64,256] [--seed S]

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <random>
#include <sstream>
#include <stdexcept>
#include <string>
#include <unordered_set>
#include <vector>

#include "vecsearch/collection.h"
#include "vecsearch/distance.h"
#include "vecsearch/logging.h"
#include "vecsearch/metrics.h"

namespace {

struct BenchOptions {
  std::size_t records = 1000;
  std::size_t dim = 384;
  std::size_t queries = 100;
  std::size_t top_k = 10;
  std::vector<std::size_t> ef = {16, 32, 64, 128, 256};
  std::uint64_t seed = 42;
};

std::vector<std::size_t> parse_list(const std::string& text) {
  std::vector<std::size_t> out;
  std::stringstream ss(text);
  std::string item;
  while (std::getline(ss, item, ',')) {
    if (!item.empty()) {
      out.push_back(static_cast<std::size_t>(std::stoul(item)));
    }
  }
  if (out.empty()) {
    throw std::invalid_argument("--ef needs at least one value");
  }
  return out;
}

BenchOptions parse_args(int argc, char** argv) {
  BenchOptions opt;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (i + 1 >= argc) {
      throw std::invalid_argument("missing value for " + arg);
    }
    const std::string value = argv[++i];
    if (arg == "--records") {
      opt.records = std::stoul(value);
    } else if (arg == "--dim") {
      opt.dim = std::stoul(value);
    } else if (arg == "--queries") {
      opt.queries = std::stoul(value);
    } else if (arg == "--top-k") {
      opt.top_k = std::stoul(value);
    } else if (arg == "--ef") {
      opt.ef = parse_list(value);
    } else if (arg == "--seed") {
      opt.seed = std::stoull(value);
    } else {
      throw std::invalid_argument("unknown option " + arg);
    }
  }
  return opt;
}

vecsearch::Vector random_unit(std::mt19937_64& rng, std::size_t dim) {
  std::normal_distribution<float> dist(0.0f, 1.0f);
  vecsearch::Vector v(dim);
  for (auto& x : v) {
    x = dist(rng);
  }
  vecsearch::normalize(v.data(), dim);
  return v;
}

int run(const BenchOptions& opt) {
  vecsearch::CollectionConfig cfg;
  cfg.name = "bench";
  cfg.dimension = opt.dim;
  cfg.metric = vecsearch::Metric::COSINE;
  cfg.seed = opt.seed;
  vecsearch::Collection collection(cfg);

  std::mt19937_64 rng(opt.seed);

  const auto build_start = std::chrono::steady_clock::now();
  for (std::size_t i = 0; i < opt.records; ++i) {
    collection.upsert("r" + std::to_string(i), random_unit(rng, opt.dim));
  }
  const double build_ms =
      std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - build_start).count();

  const auto info = collection.info();
  std::printf("built %zu records (dim %zu) in %.1f ms: %zu edges, max level %d\n", info.live_records, opt.dim,
              build_ms, info.graph_edges, info.max_level);

  std::vector<vecsearch::Vector> queries;
  std::vector<std::unordered_set<std::string>> truth;
  for (std::size_t q = 0; q < opt.queries; ++q) {
    queries.push_back(random_unit(rng, opt.dim));
    vecsearch::SearchOptions exact;
    exact.top_k = opt.top_k;
    exact.exact = true;
    std::unordered_set<std::string> ids;
    for (const auto& hit : collection.search(queries.back(), exact).hits) {
      ids.insert(hit.id);
    }
    truth.push_back(std::move(ids));
  }

  std::printf("%8s %10s %10s %10s %10s\n", "ef", "p50_ms", "p95_ms", "recall", "proxy");
  for (const std::size_t ef : opt.ef) {
    vecsearch::LatencyTracker latency(opt.queries);
    std::size_t found = 0;
    std::size_t expected = 0;
    double proxy = 0.0;

    for (std::size_t q = 0; q < queries.size(); ++q) {
      vecsearch::SearchOptions ann;
      ann.top_k = opt.top_k;
      ann.ef_search = ef;

      const auto start = std::chrono::steady_clock::now();
      const auto result = collection.search(queries[q], ann);
      latency.record(std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count());

      for (const auto& hit : result.hits) {
        found += truth[q].count(hit.id);
      }
      expected += truth[q].size();
      proxy += result.stats.recall_proxy();
    }

    const double recall = expected == 0 ? 1.0 : static_cast<double>(found) / static_cast<double>(expected);
    std::printf("%8zu %10.3f %10.3f %10.3f %10.3f\n", ef, latency.percentile(50), latency.percentile(95), recall,
                queries.empty() ? 1.0 : proxy / static_cast<double>(queries.size()));
  }
  return 0;
}

} // namespace

int main(int argc, char** argv) {
  vecsearch::set_log_level("warn");
  try {
    return run(parse_args(argc, argv));
  } catch (const std::exception& e) {
    vecsearch::logger()->error("vecsearch_bench: {}", e.what());
    return 1;
  }
}
